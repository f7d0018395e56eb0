#ifndef AGENTBRIDGE_REGISTRY_HPP
#define AGENTBRIDGE_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentbridge
{

// Something an execution can be stopped through: a child process, a PTY session
class Cancellable
{
  public:
    virtual ~Cancellable() = default;

    // Request termination. Must be safe to call from any thread, more than once.
    virtual void cancel() = 0;
};

// Shared map of in-flight executions, keyed by execution id and grouped by owner key.
// One instance is shared by reference between every executor that should be
// cancellable together.
class ProcessRegistry
{
  public:
    ProcessRegistry() = default;

    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    // Returns false (and registers nothing) if the id is already live
    bool register_execution(const std::string& execution_id, const std::string& owner_key,
                            std::shared_ptr<Cancellable> handle);

    void unregister(const std::string& execution_id);

    // Cancel one execution; false if the id is unknown
    bool cancel(const std::string& execution_id);

    // Cancel every execution of an owner; returns how many were signalled
    size_t cancel_by_owner(const std::string& owner_key);

    size_t cancel_all();

    bool contains(const std::string& execution_id) const;
    size_t size() const;
    std::optional<std::string> owner_of(const std::string& execution_id) const;
    std::vector<std::string> executions_for_owner(const std::string& owner_key) const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Cancellable>> handles_;
    std::map<std::string, std::string> owners_;
};

// Deregisters on scope exit, however the scope is left
class ScopedRegistration
{
  public:
    ScopedRegistration(ProcessRegistry& registry, std::string execution_id)
        : registry_(registry), execution_id_(std::move(execution_id))
    {
    }

    ~ScopedRegistration()
    {
        registry_.unregister(execution_id_);
    }

    ScopedRegistration(const ScopedRegistration&) = delete;
    ScopedRegistration& operator=(const ScopedRegistration&) = delete;

  private:
    ProcessRegistry& registry_;
    std::string execution_id_;
};

} // namespace agentbridge

#endif // AGENTBRIDGE_REGISTRY_HPP
