/**
 * @file session_store.cpp
 * @brief In-memory and JSON file session stores
 */

#include <agentbridge/errors.hpp>
#include <agentbridge/ext/session_store.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace agentbridge
{
namespace ext
{

// ============================================================================
// InMemorySessionStore
// ============================================================================

std::optional<StoredSession> InMemorySessionStore::read_latest(const std::string& owner_key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(owner_key);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second;
}

void InMemorySessionStore::write(const std::string& owner_key, const std::string& session_id,
                                 const std::string& mode)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[owner_key] = StoredSession{session_id, mode};
}

// ============================================================================
// JsonFileSessionStore
// ============================================================================

JsonFileSessionStore::JsonFileSessionStore(std::string path) : path_(std::move(path))
{
    load();
}

std::optional<StoredSession> JsonFileSessionStore::read_latest(const std::string& owner_key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(owner_key);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second;
}

void JsonFileSessionStore::write(const std::string& owner_key, const std::string& session_id,
                                 const std::string& mode)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[owner_key] = StoredSession{session_id, mode};
    save();
}

void JsonFileSessionStore::load()
{
    if (!fs::exists(path_))
        return;

    std::ifstream file(path_);
    if (!file)
        throw AgentBridgeError("Failed to open session file: " + path_);

    json data;
    try
    {
        file >> data;
    }
    catch (const json::parse_error& e)
    {
        throw JSONDecodeError("Invalid session file " + path_ + ": " + e.what());
    }

    if (!data.is_object() || !data.contains("sessions") || !data["sessions"].is_object())
        return;

    for (const auto& [owner, entry] : data["sessions"].items())
    {
        if (!entry.is_object())
            continue;
        StoredSession session;
        session.id = entry.value("id", "");
        session.mode = entry.value("mode", "");
        if (!session.id.empty())
            sessions_[owner] = session;
    }
}

void JsonFileSessionStore::save() const
{
    json sessions = json::object();
    for (const auto& [owner, session] : sessions_)
        sessions[owner] = {{"id", session.id}, {"mode", session.mode}};
    json data = {{"sessions", sessions}};

    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
            throw AgentBridgeError("Failed to create session directory " +
                                   target.parent_path().string() + ": " + ec.message());
    }

    // Write beside the target, then rename over it
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp);
        if (!file)
            throw AgentBridgeError("Failed to open session file: " + temp.string());
        file << std::setw(2) << data << std::endl;
        if (!file)
            throw AgentBridgeError("Failed to write session file: " + temp.string());
    }

    fs::rename(temp, target, ec);
    if (ec)
    {
        std::string reason = ec.message();
        fs::remove(temp, ec);
        throw AgentBridgeError("Failed to replace session file " + path_ + ": " + reason);
    }
}

} // namespace ext
} // namespace agentbridge
