#include <agentbridge/errors.hpp>
#include <agentbridge/pty.hpp>

namespace agentbridge
{

namespace
{

ExecutionResult failure(const std::string& message)
{
    ExecutionResult result;
    result.success = false;
    result.error = message;
    return result;
}

// Cancels an in-flight send() by interrupting the session it runs on
class SessionCancelHandle : public Cancellable
{
  public:
    void attach(const std::shared_ptr<PTYSession>& session)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = session;
        if (cancelled_)
            interrupt_locked();
    }

    void cancel() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        interrupt_locked();
    }

    bool cancelled() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

  private:
    void interrupt_locked()
    {
        if (auto session = session_.lock())
            session->interrupt();
    }

    mutable std::mutex mutex_;
    std::weak_ptr<PTYSession> session_;
    bool cancelled_ = false;
};

// Forgets the active call however execute() is left
class ActiveGuard
{
  public:
    ActiveGuard(std::mutex& mutex, std::map<std::string, std::string>& active, std::string id)
        : mutex_(mutex), active_(active), id_(std::move(id))
    {
    }

    ~ActiveGuard()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(id_);
    }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

  private:
    std::mutex& mutex_;
    std::map<std::string, std::string>& active_;
    std::string id_;
};

} // namespace

PTYExecutor::PTYExecutor(PTYPool& pool, ProcessRegistry& registry, PTYSessionConfig base_config,
                         Logger logger)
    : pool_(pool), registry_(registry), base_config_(std::move(base_config)),
      logger_(logger.with_tag("pty"))
{
}

PTYExecutor::~PTYExecutor()
{
    shut_down_ = true;
    cancel_all();
}

PTYSessionConfig PTYExecutor::config_for(const ExecutionRequest& request) const
{
    PTYSessionConfig config = base_config_;
    if (!request.working_directory.empty())
        config.working_directory = request.working_directory;
    if (!request.model.empty())
        config.model = request.model;
    if (!request.mode.empty())
        config.approval_mode = normalize_approval_mode(request.mode);
    if (request.sandbox_mode && !request.sandbox_mode->empty())
        config.sandbox_mode = *request.sandbox_mode;
    return config;
}

ExecutionResult PTYExecutor::execute(const ExecutionRequest& request,
                                     const MessageCallback& on_message)
{
    if (shut_down_)
        return failure("Executor is shut down");
    if (request.execution_id.empty())
        return failure("Execution id is required");

    const std::string key = request.owner_key.empty() ? request.execution_id : request.owner_key;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.count(request.execution_id) > 0)
            return failure("Execution " + request.execution_id + " is already running");
        active_[request.execution_id] = key;
    }
    ActiveGuard active_guard(mutex_, active_, request.execution_id);

    auto handle = std::make_shared<SessionCancelHandle>();
    if (!registry_.register_execution(request.execution_id, request.owner_key, handle))
        return failure("Execution " + request.execution_id + " is already running");
    ScopedRegistration registration(registry_, request.execution_id);

    std::shared_ptr<PTYSession> session;
    try
    {
        session = pool_.get_or_create(key, config_for(request));
    }
    catch (const AgentBridgeError& e)
    {
        logger_.error("No session for " + key + ": " + e.what());
        return failure(e.what());
    }

    handle->attach(session);
    if (handle->cancelled())
    {
        ExecutionResult result = failure("Cancelled");
        result.was_cancelled = true;
        return result;
    }

    try
    {
        ExecutionResult result = session->send(request.prompt, on_message);
        if (handle->cancelled() && !result.was_cancelled && !result.success)
        {
            result.was_cancelled = true;
            if (!result.error)
                result.error = "Cancelled";
        }
        return result;
    }
    catch (const AgentBridgeError& e)
    {
        logger_.warning("Send to session " + key + " failed: " + e.what());
        return failure(e.what());
    }
}

bool PTYExecutor::cancel(const std::string& execution_id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.count(execution_id) == 0)
            return false;
    }
    return registry_.cancel(execution_id);
}

size_t PTYExecutor::cancel_by_owner(const std::string& owner_key)
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, key] : active_)
        {
            if (key == owner_key)
                ids.push_back(id);
        }
    }

    size_t count = 0;
    for (const auto& id : ids)
    {
        if (registry_.cancel(id))
            ++count;
    }
    return count;
}

size_t PTYExecutor::cancel_all()
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : active_)
            ids.push_back(entry.first);
    }

    size_t count = 0;
    for (const auto& id : ids)
    {
        if (registry_.cancel(id))
            ++count;
    }
    return count;
}

void PTYExecutor::shutdown()
{
    shut_down_ = true;
    size_t count = cancel_all();
    if (count > 0)
        logger_.info("Shutdown cancelled " + std::to_string(count) + " execution(s)");
    pool_.shutdown();
}

bool PTYExecutor::stop_session(const std::string& owner_key)
{
    cancel_by_owner(owner_key);
    return pool_.remove_by_owner_prefix(owner_key) > 0;
}

size_t PTYExecutor::active_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace agentbridge
