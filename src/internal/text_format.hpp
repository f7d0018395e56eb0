#ifndef AGENTBRIDGE_INTERNAL_TEXT_FORMAT_HPP
#define AGENTBRIDGE_INTERNAL_TEXT_FORMAT_HPP

#include <agentbridge/types.hpp>
#include <string>

namespace agentbridge
{
namespace internal
{

// Join two text chunks. A paragraph break is inserted unless either side is empty,
// the left side ends with whitespace, or the right side starts with whitespace.
std::string concat_with_spacing(const std::string& left, const std::string& right);

// Append in place using the same rule
void append_with_spacing(std::string& target, const std::string& chunk);

// Cut to at most max_len bytes (never inside a UTF-8 sequence) and add "..." if cut
std::string truncate_text(const std::string& text, size_t max_len);

// Keep the tail of a long path visible: ".../dir/file.cpp"
std::string truncate_path(const std::string& path, size_t max_len = 45);

// Single-line command preview
std::string truncate_command(const std::string& command, size_t max_len = 50);

// One-line summary of a tool's input for status displays; empty if no rule applies
std::string summarize_tool_input(const std::string& tool_name, const json& input);

// "[Tool: name]" followed by one "  key: value" line per input key
std::string render_tool_call(const std::string& tool_name, const json& input);

// "[Tool Result: SUCCESS|ERROR]" followed by a preview of the content
std::string render_tool_result(const std::string& content, bool is_error);

// Text of a JSON value: strings verbatim, arrays of text blocks joined, others dumped
std::string json_to_text(const json& value);

// Remove ANSI escape sequences (CSI, OSC, two-byte escapes) from terminal output
std::string strip_ansi(const std::string& text);

std::string to_lower(std::string text);
bool contains_ignore_case(const std::string& haystack, const std::string& needle);
bool ends_with(const std::string& text, const std::string& suffix);
bool starts_with(const std::string& text, const std::string& prefix);

// Canonical 8-4-4-4-12 hex UUID, case-insensitive
bool is_uuid(const std::string& text);

} // namespace internal
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_TEXT_FORMAT_HPP
