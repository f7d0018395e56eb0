#ifndef AGENTBRIDGE_INTERNAL_LINE_READER_HPP
#define AGENTBRIDGE_INTERNAL_LINE_READER_HPP

#include "subprocess/process.hpp"

#include <string>

namespace agentbridge
{
namespace internal
{

enum class ReadStatus
{
    Line,    // A complete line (without its terminator) was produced
    Timeout, // Nothing complete arrived within the wait
    Eof      // Pipe closed and nothing is left
};

// Splits a pipe's byte stream into lines with a bounded wait per call.
// A line longer than max_line is cut: its first max_line bytes are handed out and
// the remainder up to the next newline is dropped, so callers that size max_line
// above their own cap see the oversize exactly once.
class LineReader
{
  public:
    explicit LineReader(subprocess::ReadPipe& pipe, size_t max_line = 256 * 1024);

    ReadStatus next_line(std::string& line, int timeout_ms);

    bool at_eof() const
    {
        return eof_ && pending_.empty();
    }

  private:
    bool take_line(std::string& line);

    subprocess::ReadPipe& pipe_;
    size_t max_line_;
    std::string pending_;
    bool eof_ = false;
    bool discarding_ = false;
};

} // namespace internal
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_LINE_READER_HPP
