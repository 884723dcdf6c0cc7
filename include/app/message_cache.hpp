#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/retriever.hpp"
#include "proto/frag.hpp"
#include "proto/payload.hpp"

namespace app
{

struct CachedMessage
{
    RetrievedMessage                message;
    std::string                     conversation;
    frag::SessionState              state{frag::SessionState::Complete};
    std::optional<payload::Payload> payload{};  // set once Decoded
};

// In-memory store of retrieved messages, keyed by transaction id, so re-scans
// of overlapping history windows are idempotent. Thread-safe.
class MessageCache
{
  public:
    // "<a>_<b>" with the two ids sorted
    static std::string conversation_key(const std::string &a, const std::string &b);

    // Adds messages not seen before; returns how many were new
    std::size_t merge(const std::string                   &viewer,
                      const std::string                   &partner,
                      const std::vector<RetrievedMessage> &messages);

    std::optional<CachedMessage> find(const std::string &tx_id) const;
    std::vector<CachedMessage>   conversation(const std::string &a, const std::string &b) const;

    bool set_state(const std::string &tx_id, frag::SessionState s);
    bool set_payload(const std::string &tx_id, payload::Payload p);

    std::size_t size() const;

  private:
    mutable std::mutex                             mu_;
    std::unordered_map<std::string, CachedMessage> by_tx_;
};

}  // namespace app
