/**
 * @file session_store.hpp
 * @brief Persistence of the latest backend session per owner
 *
 * Stores, for each owner key, the external session id the backend reported last
 * together with the mode it ran in, so a later execution can resume it through
 * ExecutionRequest::resume_session_id.
 *
 * Values are opaque strings; no validation happens here. Resume ids are still
 * validated by the backend before use.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agentbridge
{
namespace ext
{

struct StoredSession
{
    std::string id;
    std::string mode;
};

/**
 * @brief Latest session per owner key
 *
 * Implementations must be safe to share between threads.
 */
class SessionStore
{
  public:
    virtual ~SessionStore() = default;

    virtual std::optional<StoredSession> read_latest(const std::string& owner_key) const = 0;
    virtual void write(const std::string& owner_key, const std::string& session_id,
                       const std::string& mode) = 0;
};

class InMemorySessionStore : public SessionStore
{
  public:
    std::optional<StoredSession> read_latest(const std::string& owner_key) const override;
    void write(const std::string& owner_key, const std::string& session_id,
               const std::string& mode) override;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, StoredSession> sessions_;
};

/**
 * @brief One JSON document on disk, rewritten atomically on every write
 *
 * Layout:
 * @code
 * {
 *   "sessions": {
 *     "<owner>": { "id": "...", "mode": "..." }
 *   }
 * }
 * @endcode
 *
 * A missing file reads as empty. A file that is not valid JSON throws
 * JSONDecodeError on construction instead of being overwritten.
 */
class JsonFileSessionStore : public SessionStore
{
  public:
    explicit JsonFileSessionStore(std::string path);

    std::optional<StoredSession> read_latest(const std::string& owner_key) const override;
    void write(const std::string& owner_key, const std::string& session_id,
               const std::string& mode) override;

    const std::string& path() const
    {
        return path_;
    }

  private:
    void load();
    void save() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, StoredSession> sessions_;
};

} // namespace ext
} // namespace agentbridge
