#include <agentbridge/registry.hpp>

namespace agentbridge
{

bool ProcessRegistry::register_execution(const std::string& execution_id,
                                         const std::string& owner_key,
                                         std::shared_ptr<Cancellable> handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (handles_.count(execution_id) != 0)
        return false;

    handles_[execution_id] = std::move(handle);
    owners_[execution_id] = owner_key;
    return true;
}

void ProcessRegistry::unregister(const std::string& execution_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.erase(execution_id);
    owners_.erase(execution_id);
}

bool ProcessRegistry::cancel(const std::string& execution_id)
{
    std::shared_ptr<Cancellable> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(execution_id);
        if (it == handles_.end())
            return false;
        handle = it->second;
    }

    // Signal outside the lock; cancel() may block briefly on the handle's own mutex
    if (handle)
        handle->cancel();
    return true;
}

size_t ProcessRegistry::cancel_by_owner(const std::string& owner_key)
{
    std::vector<std::shared_ptr<Cancellable>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, owner] : owners_)
        {
            if (owner != owner_key)
                continue;
            auto it = handles_.find(id);
            if (it != handles_.end() && it->second)
                targets.push_back(it->second);
        }
    }

    for (auto& handle : targets)
        handle->cancel();
    return targets.size();
}

size_t ProcessRegistry::cancel_all()
{
    std::vector<std::shared_ptr<Cancellable>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, handle] : handles_)
            if (handle)
                targets.push_back(handle);
    }

    for (auto& handle : targets)
        handle->cancel();
    return targets.size();
}

bool ProcessRegistry::contains(const std::string& execution_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.count(execution_id) != 0;
}

size_t ProcessRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

std::optional<std::string> ProcessRegistry::owner_of(const std::string& execution_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(execution_id);
    if (it == owners_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> ProcessRegistry::executions_for_owner(const std::string& owner_key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, owner] : owners_)
        if (owner == owner_key)
            ids.push_back(id);
    return ids;
}

} // namespace agentbridge
