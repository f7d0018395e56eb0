#include <agentbridge/log.hpp>
#include <iostream>

namespace agentbridge
{

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

Logger::Logger(std::optional<LogCallback> callback, LogLevel min_level)
    : callback_(std::move(callback)), min_level_(min_level)
{
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level))
        return;

    std::string text = tag_.empty() ? message : "[" + tag_ + "] " + message;

    if (callback_.has_value() && *callback_)
    {
        try
        {
            (*callback_)(level, text);
            return;
        }
        catch (const std::exception& e)
        {
            std::cerr << "agentbridge: log callback threw: " << e.what() << std::endl;
        }
    }

    std::cerr << "agentbridge " << to_string(level) << ": " << text << std::endl;
}

Logger Logger::with_tag(const std::string& tag) const
{
    Logger copy = *this;
    copy.tag_ = tag_.empty() ? tag : tag_ + " " + tag;
    return copy;
}

} // namespace agentbridge
