#include "line_reader.hpp"

namespace agentbridge
{
namespace internal
{

LineReader::LineReader(subprocess::ReadPipe& pipe, size_t max_line)
    : pipe_(pipe), max_line_(max_line)
{
}

bool LineReader::take_line(std::string& line)
{
    if (discarding_)
    {
        size_t end = pending_.find('\n');
        if (end == std::string::npos)
        {
            pending_.clear();
            return false;
        }
        pending_.erase(0, end + 1);
        discarding_ = false;
    }

    size_t pos = pending_.find('\n');
    if (pos == std::string::npos)
    {
        if (pending_.size() < max_line_)
            return false;
        // Hand out the head so the caller sees the oversize; drop the rest of the line
        line = pending_.substr(0, max_line_);
        pending_.clear();
        discarding_ = true;
        return true;
    }

    line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

ReadStatus LineReader::next_line(std::string& line, int timeout_ms)
{
    if (take_line(line))
        return ReadStatus::Line;

    if (eof_)
    {
        if (pending_.empty())
            return ReadStatus::Eof;
        // Final unterminated line
        line.swap(pending_);
        pending_.clear();
        return ReadStatus::Line;
    }

    if (!pipe_.is_open())
    {
        eof_ = true;
        return next_line(line, 0);
    }

    if (!pipe_.has_data(timeout_ms))
        return ReadStatus::Timeout;

    char buffer[4096];
    size_t n = pipe_.read(buffer, sizeof(buffer));
    if (n == 0)
        eof_ = true;
    else
        pending_.append(buffer, n);

    if (take_line(line))
        return ReadStatus::Line;
    if (eof_)
        return next_line(line, 0);
    return ReadStatus::Timeout;
}

} // namespace internal
} // namespace agentbridge
