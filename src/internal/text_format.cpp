#include "text_format.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <vector>

namespace agentbridge
{
namespace internal
{

namespace
{

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

enum class SummaryKind
{
    Path,
    Command,
    Pattern,
    Text,
    Url,
    Count,
    FirstQuestion
};

struct SummaryRule
{
    SummaryKind kind;
    std::vector<std::string> keys;
};

const std::map<std::string, SummaryRule>& summary_rules()
{
    static const std::map<std::string, SummaryRule> rules = {
        // Claude tool names
        {"Read", {SummaryKind::Path, {"file_path", "path"}}},
        {"Write", {SummaryKind::Path, {"file_path", "path"}}},
        {"Edit", {SummaryKind::Path, {"file_path", "path"}}},
        {"MultiEdit", {SummaryKind::Path, {"file_path", "path"}}},
        {"NotebookEdit", {SummaryKind::Path, {"notebook_path", "file_path"}}},
        {"Bash", {SummaryKind::Command, {"command"}}},
        {"Glob", {SummaryKind::Pattern, {"pattern"}}},
        {"Grep", {SummaryKind::Pattern, {"pattern"}}},
        {"WebFetch", {SummaryKind::Url, {"url"}}},
        {"WebSearch", {SummaryKind::Text, {"query"}}},
        {"Task", {SummaryKind::Text, {"description", "prompt"}}},
        {"TodoWrite", {SummaryKind::Count, {"todos"}}},
        {"AskUserQuestion", {SummaryKind::FirstQuestion, {"questions"}}},
        // Codex tool names
        {"read_file", {SummaryKind::Path, {"path", "file_path"}}},
        {"edit_file", {SummaryKind::Path, {"path", "file_path"}}},
        {"write_file", {SummaryKind::Path, {"path", "file_path"}}},
        {"shell", {SummaryKind::Command, {"command", "cmd"}}},
        {"run_command", {SummaryKind::Command, {"command", "cmd"}}},
        {"glob", {SummaryKind::Pattern, {"pattern"}}},
        {"find_files", {SummaryKind::Pattern, {"pattern"}}},
        {"grep", {SummaryKind::Pattern, {"pattern", "query"}}},
        {"search", {SummaryKind::Pattern, {"pattern", "query"}}},
        {"web_fetch", {SummaryKind::Url, {"url"}}},
        {"web_search", {SummaryKind::Text, {"query"}}},
        {"request_user_input", {SummaryKind::FirstQuestion, {"questions"}}},
    };
    return rules;
}

const json* first_present(const json& input, const std::vector<std::string>& keys)
{
    for (const auto& key : keys)
    {
        auto it = input.find(key);
        if (it != input.end())
            return &*it;
    }
    return nullptr;
}

std::string scalar_text(const json* value)
{
    if (value == nullptr)
        return "?";
    if (value->is_string())
        return value->get<std::string>();
    return value->dump();
}

std::string quoted(const std::string& text)
{
    return "`" + text + "`";
}

} // namespace

std::string concat_with_spacing(const std::string& left, const std::string& right)
{
    if (left.empty())
        return right;
    if (right.empty())
        return left;
    if (is_space(left.back()) || is_space(right.front()))
        return left + right;
    return left + "\n\n" + right;
}

void append_with_spacing(std::string& target, const std::string& chunk)
{
    if (chunk.empty())
        return;
    if (!target.empty() && !is_space(target.back()) && !is_space(chunk.front()))
        target += "\n\n";
    target += chunk;
}

std::string truncate_text(const std::string& text, size_t max_len)
{
    if (text.size() <= max_len)
        return text;

    size_t cut = max_len;
    // Step back over UTF-8 continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut) + "...";
}

std::string truncate_path(const std::string& path, size_t max_len)
{
    if (path.size() <= max_len || max_len <= 3)
        return path;
    size_t start = path.size() - (max_len - 3);
    while (start < path.size() && (static_cast<unsigned char>(path[start]) & 0xC0) == 0x80)
        ++start;
    return "..." + path.substr(start);
}

std::string truncate_command(const std::string& command, size_t max_len)
{
    std::string single = command;
    std::replace(single.begin(), single.end(), '\n', ' ');

    size_t first = single.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return "";
    size_t last = single.find_last_not_of(" \t\r");
    single = single.substr(first, last - first + 1);

    if (single.size() <= max_len || max_len <= 3)
        return single;
    return truncate_text(single, max_len - 3);
}

std::string summarize_tool_input(const std::string& tool_name, const json& input)
{
    const auto& rules = summary_rules();
    auto it = rules.find(tool_name);
    if (it == rules.end() || !input.is_object())
        return "";

    const SummaryRule& rule = it->second;
    const json* value = first_present(input, rule.keys);

    switch (rule.kind)
    {
    case SummaryKind::Path:
        return quoted(truncate_path(scalar_text(value), 45));
    case SummaryKind::Command:
        return quoted(truncate_command(scalar_text(value), 50));
    case SummaryKind::Pattern:
        return quoted(truncate_text(scalar_text(value), 40));
    case SummaryKind::Text:
        return quoted(truncate_text(scalar_text(value), 50));
    case SummaryKind::Url:
        return quoted(truncate_text(scalar_text(value), 40));
    case SummaryKind::Count:
    {
        size_t count = (value != nullptr && value->is_array()) ? value->size() : 0;
        return quoted(std::to_string(count) + " items");
    }
    case SummaryKind::FirstQuestion:
        if (value != nullptr && value->is_array() && !value->empty())
        {
            const json& first = value->front();
            if (first.is_object())
            {
                std::string question = first.value("question", "");
                if (!question.empty())
                    return quoted(truncate_text(question, 50));
            }
        }
        return "";
    }
    return "";
}

std::string render_tool_call(const std::string& tool_name, const json& input)
{
    std::string out = "[Tool: " + tool_name + "]\n";
    if (!input.is_object())
        return out;

    for (const auto& [key, value] : input.items())
    {
        std::string preview = value.is_string() ? truncate_text(value.get<std::string>(), 100)
                                                : value.dump();
        out += "  " + key + ": " + preview + "\n";
    }
    return out;
}

std::string render_tool_result(const std::string& content, bool is_error)
{
    return std::string("[Tool Result: ") + (is_error ? "ERROR" : "SUCCESS") + "]\n" +
           truncate_text(content, 500) + "\n";
}

std::string json_to_text(const json& value)
{
    if (value.is_null())
        return "";
    if (value.is_string())
        return value.get<std::string>();

    if (value.is_array())
    {
        std::string joined;
        for (const auto& item : value)
        {
            std::string part;
            if (item.is_string())
                part = item.get<std::string>();
            else if (item.is_object() && item.contains("text") && item["text"].is_string())
                part = item["text"].get<std::string>();
            else
                continue;

            if (!joined.empty())
                joined += "\n";
            joined += part;
        }
        if (!joined.empty() || value.empty())
            return joined;
    }

    return value.dump();
}

std::string strip_ansi(const std::string& text)
{
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c != '\x1b')
        {
            out.push_back(c);
            continue;
        }

        if (i + 1 >= text.size())
            break;

        char kind = text[i + 1];
        if (kind == '[')
        {
            // CSI: parameters then a final byte in 0x40..0x7E
            size_t j = i + 2;
            while (j < text.size() && !(text[j] >= 0x40 && text[j] <= 0x7E))
                ++j;
            i = j;
        }
        else if (kind == ']')
        {
            // OSC: terminated by BEL or ESC backslash
            size_t j = i + 2;
            while (j < text.size())
            {
                if (text[j] == '\x07')
                    break;
                if (text[j] == '\x1b' && j + 1 < text.size() && text[j + 1] == '\\')
                {
                    ++j;
                    break;
                }
                ++j;
            }
            i = j;
        }
        else
        {
            ++i; // Two-byte escape
        }
    }

    return out;
}

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle)
{
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool ends_with(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& text, const std::string& prefix)
{
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool is_uuid(const std::string& text)
{
    static const size_t group_lengths[] = {8, 4, 4, 4, 12};

    size_t pos = 0;
    for (size_t g = 0; g < 5; ++g)
    {
        if (g > 0)
        {
            if (pos >= text.size() || text[pos] != '-')
                return false;
            ++pos;
        }
        for (size_t k = 0; k < group_lengths[g]; ++k, ++pos)
        {
            if (pos >= text.size() || !std::isxdigit(static_cast<unsigned char>(text[pos])))
                return false;
        }
    }
    return pos == text.size();
}

} // namespace internal
} // namespace agentbridge
