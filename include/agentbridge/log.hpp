#ifndef AGENTBRIDGE_LOG_HPP
#define AGENTBRIDGE_LOG_HPP

#include <functional>
#include <optional>
#include <string>

namespace agentbridge
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

const char* to_string(LogLevel level);

// Receives every log record at or above the logger's minimum level
using LogCallback = std::function<void(LogLevel, const std::string&)>;

// Small logging facade: routes to the configured callback, or to std::cerr when
// none is set. Copyable; components keep their own instance.
class Logger
{
  public:
    Logger() = default;
    explicit Logger(std::optional<LogCallback> callback, LogLevel min_level = LogLevel::Warning);

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }

    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }

    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }

    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    bool enabled(LogLevel level) const
    {
        return level >= min_level_;
    }

    // Returns a logger that prefixes every message with "[tag] "
    Logger with_tag(const std::string& tag) const;

  private:
    std::optional<LogCallback> callback_;
    LogLevel min_level_ = LogLevel::Warning;
    std::string tag_;
};

} // namespace agentbridge

#endif // AGENTBRIDGE_LOG_HPP
