#ifndef AGENTBRIDGE_INTERNAL_APP_SERVER_EVENTS_HPP
#define AGENTBRIDGE_INTERNAL_APP_SERVER_EVENTS_HPP

#include <agentbridge/types.hpp>
#include <map>
#include <string>
#include <vector>

namespace agentbridge
{
namespace protocol
{

// Rewrites codex app-server notifications into the `codex exec --json` event shape so
// the regular Codex StreamDecoder produces the Message stream. Agent message deltas
// are buffered per item and flushed on item completion.
class AppServerEventTranslator
{
  public:
    std::vector<json> translate(const std::string& method, const json& params);

    // True once turn/completed (or a fatal error) has been translated
    bool turn_finished() const
    {
        return turn_finished_;
    }

    const std::string& thread_id() const
    {
        return thread_id_;
    }

    void reset();

  private:
    std::vector<json> translate_item(const json& item, bool completed);

    std::map<std::string, std::string> agent_deltas_; // item id -> text so far
    std::string thread_id_;
    bool turn_finished_ = false;
};

} // namespace protocol
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_APP_SERVER_EVENTS_HPP
