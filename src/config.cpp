#include <agentbridge/config.hpp>
#include <agentbridge/errors.hpp>
#include <cstdlib>
#include <fstream>

namespace agentbridge
{

namespace
{

// Parse a positive integer environment variable; invalid values are ignored with a warning
bool read_env_int(const char* name, long long& out, const Logger& logger)
{
    const char* env = std::getenv(name);
    if (env == nullptr || env[0] == '\0')
        return false;

    try
    {
        long long parsed = std::stoll(env);
        if (parsed > 0)
        {
            out = parsed;
            return true;
        }
        logger.warning(std::string("Ignoring non-positive ") + name + "=" + env);
    }
    catch (const std::exception&)
    {
        logger.warning(std::string("Ignoring invalid ") + name + "=" + env);
    }
    return false;
}

bool read_json_int(const nlohmann::json& j, const char* key, long long& out, const Logger& logger)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return false;

    if (!it->is_number())
    {
        logger.warning(std::string("Ignoring non-numeric config key ") + key);
        return false;
    }

    double value = it->get<double>();
    if (value <= 0)
    {
        logger.warning(std::string("Ignoring non-positive config key ") + key);
        return false;
    }
    out = static_cast<long long>(value);
    return true;
}

} // namespace

EngineConfig EngineConfig::from_environment(const Logger& logger)
{
    EngineConfig config;
    config.apply_environment(logger);
    return config;
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j, const Logger& logger)
{
    EngineConfig config;
    config.apply_json(j, logger);
    return config;
}

void EngineConfig::apply_environment(const Logger& logger)
{
    long long value = 0;

    if (read_env_int("SESSION_STARTUP_TIMEOUT", value, logger))
        timeouts.startup = std::chrono::seconds(value);
    if (read_env_int("SESSION_INACTIVITY_TIMEOUT", value, logger))
        timeouts.pty_inactivity = std::chrono::seconds(value);
    if (read_env_int("SESSION_IDLE_TIMEOUT", value, logger))
        pool.idle_timeout = std::chrono::seconds(value);
    if (read_env_int("SESSION_CLEANUP_INTERVAL", value, logger))
        pool.cleanup_interval = std::chrono::seconds(value);
    if (read_env_int("SESSION_MAX_COUNT", value, logger))
        pool.max_sessions = static_cast<size_t>(value);
    if (read_env_int("AGENTBRIDGE_READ_TIMEOUT", value, logger))
        timeouts.read_line = std::chrono::seconds(value);
    if (read_env_int("AGENTBRIDGE_PLAN_WRITE_GRACE", value, logger))
        timeouts.plan_write_grace = milliseconds(value);
    if (read_env_int("AGENTBRIDGE_TERMINATION_GRACE", value, logger))
        timeouts.termination_grace = milliseconds(value);
    if (read_env_int("AGENTBRIDGE_MAX_BUFFER_SIZE", value, logger))
        max_buffer_size = static_cast<size_t>(value);
}

void EngineConfig::apply_json(const nlohmann::json& j, const Logger& logger)
{
    if (!j.is_object())
    {
        logger.warning("Config document is not a JSON object; using defaults");
        return;
    }

    long long value = 0;

    if (read_json_int(j, "session_startup_timeout", value, logger))
        timeouts.startup = std::chrono::seconds(value);
    if (read_json_int(j, "session_inactivity_timeout", value, logger))
        timeouts.pty_inactivity = std::chrono::seconds(value);
    if (read_json_int(j, "session_idle_timeout", value, logger))
        pool.idle_timeout = std::chrono::seconds(value);
    if (read_json_int(j, "session_cleanup_interval", value, logger))
        pool.cleanup_interval = std::chrono::seconds(value);
    if (read_json_int(j, "max_sessions", value, logger))
        pool.max_sessions = static_cast<size_t>(value);
    if (read_json_int(j, "read_timeout", value, logger))
        timeouts.read_line = std::chrono::seconds(value);
    if (read_json_int(j, "read_tick_ms", value, logger))
        timeouts.read_tick = milliseconds(value);
    if (read_json_int(j, "plan_write_grace_ms", value, logger))
        timeouts.plan_write_grace = milliseconds(value);
    if (read_json_int(j, "termination_grace_ms", value, logger))
        timeouts.termination_grace = milliseconds(value);
    if (read_json_int(j, "stop_grace_ms", value, logger))
        timeouts.pty_stop_grace = milliseconds(value);
    if (read_json_int(j, "human_response_timeout", value, logger))
        timeouts.human_response = std::chrono::seconds(value);
    if (read_json_int(j, "max_buffer_size", value, logger))
        max_buffer_size = static_cast<size_t>(value);
}

EngineConfig load_config_file(const std::string& path, const Logger& logger)
{
    std::ifstream file(path);
    if (!file)
        throw AgentBridgeError("Failed to open config file: " + path);

    nlohmann::json document;
    try
    {
        file >> document;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw AgentBridgeError("Failed to parse config file " + path + ": " + e.what());
    }

    return EngineConfig::from_json(document, logger);
}

} // namespace agentbridge
