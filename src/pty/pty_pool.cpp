#include <agentbridge/errors.hpp>
#include <agentbridge/pty.hpp>

namespace agentbridge
{

namespace
{

std::shared_ptr<PTYSession> default_factory(const std::string& key, const PTYSessionConfig& config,
                                            const Logger& logger)
{
    return std::make_shared<PTYSession>(key, config, logger);
}

bool is_reusable(const PTYSession& session)
{
    SessionState state = session.state();
    return session.is_alive() && (state == SessionState::Idle || state == SessionState::Busy ||
                                  state == SessionState::Starting);
}

} // namespace

PTYPool::PTYPool(PoolConfig config, SessionFactory factory, Logger logger)
    : config_(config), factory_(std::move(factory)), logger_(logger.with_tag("pty-pool"))
{
    if (!factory_)
    {
        Logger session_logger = logger;
        factory_ = [session_logger](const std::string& key, const PTYSessionConfig& session_config)
        { return default_factory(key, session_config, session_logger); };
    }
}

PTYPool::~PTYPool()
{
    shutdown();
}

bool PTYPool::matches_prefix(const std::string& key, const std::string& prefix)
{
    return key == prefix || key.compare(0, prefix.size() + 1, prefix + ":") == 0;
}

std::shared_ptr<PTYSession> PTYPool::get_or_create(const std::string& key,
                                                   const PTYSessionConfig& config)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(key);
    if (it != sessions_.end())
    {
        if (is_reusable(*it->second))
        {
            logger_.debug("Reusing session " + key);
            return it->second;
        }
        logger_.info("Dropping stale session " + key + " (" + to_string(it->second->state()) +
                     ")");
        it->second->terminate();
        sessions_.erase(it);
    }

    if (sessions_.size() >= config_.max_sessions)
    {
        auto oldest = sessions_.end();
        for (auto candidate = sessions_.begin(); candidate != sessions_.end(); ++candidate)
        {
            if (candidate->second->state() != SessionState::Idle)
                continue;
            if (oldest == sessions_.end() ||
                candidate->second->last_activity() < oldest->second->last_activity())
                oldest = candidate;
        }

        if (oldest == sessions_.end())
            throw PoolExhaustedError(config_.max_sessions);

        logger_.info("Evicting least recently active idle session " + oldest->first);
        oldest->second->terminate();
        sessions_.erase(oldest);
    }

    std::shared_ptr<PTYSession> session = factory_(key, config);
    if (!session)
        throw SessionStartError("Session factory returned no session for " + key);
    session->start();

    sessions_[key] = session;
    logger_.info("Created session " + key + " (total: " + std::to_string(sessions_.size()) + ")");
    return session;
}

std::shared_ptr<PTYSession> PTYPool::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end() || !it->second->is_alive())
        return nullptr;
    return it->second;
}

ExecutionResult PTYPool::send(const std::string& key, const std::string& text,
                              const PTYSessionConfig& config, const MessageCallback& on_message)
{
    std::shared_ptr<PTYSession> session = get_or_create(key, config);
    return session->send(text, on_message);
}

bool PTYPool::remove(const std::string& key)
{
    std::shared_ptr<PTYSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end())
            return false;
        session = it->second;
        sessions_.erase(it);
    }

    session->terminate();
    logger_.info("Removed session " + key);
    return true;
}

size_t PTYPool::remove_by_owner_prefix(const std::string& prefix)
{
    std::vector<std::shared_ptr<PTYSession>> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (matches_prefix(it->first, prefix))
            {
                removed.push_back(it->second);
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (const auto& session : removed)
    {
        session->terminate();
        logger_.info("Removed session " + session->key());
    }
    return removed.size();
}

bool PTYPool::interrupt(const std::string& key)
{
    std::shared_ptr<PTYSession> session = get(key);
    return session && session->interrupt();
}

size_t PTYPool::interrupt_by_owner_prefix(const std::string& prefix)
{
    std::vector<std::shared_ptr<PTYSession>> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, session] : sessions_)
        {
            if (matches_prefix(key, prefix))
                matched.push_back(session);
        }
    }

    size_t count = 0;
    for (const auto& session : matched)
    {
        if (session->interrupt())
            ++count;
    }
    return count;
}

size_t PTYPool::sweep()
{
    const auto now = Clock::now();
    std::vector<std::shared_ptr<PTYSession>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            const auto& session = it->second;
            bool dead = !session->is_alive();
            bool idle_expired = session->state() == SessionState::Idle &&
                                now - session->last_activity() > config_.idle_timeout;
            if (dead || idle_expired)
            {
                logger_.info("Sweeping " + std::string(dead ? "dead" : "idle") + " session " +
                             it->first);
                expired.push_back(session);
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (const auto& session : expired)
        session->terminate();
    return expired.size();
}

void PTYPool::start_sweeper()
{
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_.joinable())
        return;

    sweeper_stop_ = false;
    sweeper_ = std::thread(
        [this]()
        {
            std::unique_lock<std::mutex> guard(sweeper_mutex_);
            while (!sweeper_stop_)
            {
                if (sweeper_cv_.wait_for(guard, config_.cleanup_interval,
                                         [this]() { return sweeper_stop_; }))
                    break;

                guard.unlock();
                try
                {
                    size_t swept = sweep();
                    if (swept > 0)
                        logger_.info("Swept " + std::to_string(swept) + " session(s)");
                }
                catch (const std::exception& e)
                {
                    logger_.error(std::string("Sweep failed: ") + e.what());
                }
                guard.lock();
            }
        });
    logger_.info("Sweeper started (interval " + std::to_string(config_.cleanup_interval.count()) +
                 "s, idle timeout " + std::to_string(config_.idle_timeout.count()) + "s)");
}

void PTYPool::stop_sweeper()
{
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable())
        sweeper_.join();
}

void PTYPool::shutdown()
{
    stop_sweeper();

    std::map<std::string, std::shared_ptr<PTYSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (const auto& [key, session] : sessions)
        session->terminate();
    if (!sessions.empty())
        logger_.info("Stopped " + std::to_string(sessions.size()) + " session(s)");
}

size_t PTYPool::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> PTYPool::keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& entry : sessions_)
        keys.push_back(entry.first);
    return keys;
}

std::optional<SessionInfo> PTYPool::session_info(const std::string& key) const
{
    std::shared_ptr<PTYSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end())
            return std::nullopt;
        session = it->second;
    }
    return session->info();
}

std::vector<SessionInfo> PTYPool::session_info() const
{
    std::vector<std::shared_ptr<PTYSession>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_)
            snapshot.push_back(entry.second);
    }

    std::vector<SessionInfo> infos;
    for (const auto& session : snapshot)
        infos.push_back(session->info());
    return infos;
}

} // namespace agentbridge
