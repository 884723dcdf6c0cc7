#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "proto/envelope.hpp"
#include "util/constants.hpp"
#include "util/errc.hpp"

/*
TX:
send_image(payload)
  -> payload::encode -> hash -> memo cipher encrypt = ciphertext
     -> estimate single envelope size
        <= 7500: one SingleEnvelope, one ledger op
        >  7500: split(ciphertext) -> Session{sid, fragments}
                 -> one ChunkEnvelope per fragment, all in ONE atomic transaction

RX:
ledger history page(s)
  -> envelope::parse(record)  // malformed => skipped
     -> SingleEnvelope: complete message
     -> ChunkEnvelope:  SessionArena::feed  // per scan, keyed by sid
          -> assemble(sid): ok (concatenated ciphertext + hash) or incomplete_session
*/

namespace frag
{

enum class Strategy
{
    Single,
    Chunked
};

// Consumer-side lifecycle of one logical message
enum class SessionState
{
    Collecting,
    Complete,
    Decrypting,
    Verified,
    Corrupted,
    Decoded
};

const char *state_name(SessionState s);

struct Fragment
{
    std::uint32_t              index{0};
    std::string                data;
    std::optional<std::string> hash{};  // index 0 only
};

struct Session
{
    std::string           session_id;
    std::uint32_t         total{0};
    std::vector<Fragment> fragments;  // ascending index
};

// TX
Strategy    choose_strategy(std::size_t estimated_envelope_size,
                            std::size_t threshold = constants::SINGLE_VS_CHUNK_THRESHOLD);
std::string make_session_id();
std::size_t chunk_count(std::size_t length, std::size_t max_segment = constants::MAX_SEGMENT);
errc::Code  split(std::string_view ciphertext,
                  const std::string &hash,
                  std::size_t        max_segment,
                  Session           &out);
std::vector<envelope::ChunkEnvelope> to_envelopes(const Session &s, const std::string &to);

// Ledger provenance of a fragment
struct Origin
{
    std::string   tx_id;
    std::string   sender;
    std::uint64_t timestamp{0};
};

struct Assembled
{
    std::string   session_id;
    std::string   to;
    std::string   ciphertext;
    std::string   hash;  // empty if no fragment carried one
    std::uint32_t total{0};
    Origin        origin;  // of the index-0 fragment
};

// Fragment groups for ONE retrieval call. Not shared between scans.
class SessionArena
{
  public:
    // false if the fragment was dropped (inconsistent tot or recipient)
    bool feed(const envelope::ChunkEnvelope &c, const Origin &origin);

    // ok, or incomplete_session while any index in [0, tot) is missing
    errc::Code assemble(const std::string &session_id, Assembled &out) const;

    SessionState             state(const std::string &session_id) const;
    std::size_t              received(const std::string &session_id) const;
    std::uint32_t            total(const std::string &session_id) const;
    // provenance of the lowest index received so far
    std::optional<Origin>    origin(const std::string &session_id) const;
    std::vector<std::string> session_ids() const;  // first-seen order
    bool                     contains(const std::string &session_id) const
    {
        return groups_.count(session_id) != 0;
    }
    std::size_t size() const { return groups_.size(); }

  private:
    struct Part
    {
        std::string                data;
        std::optional<std::string> hash;
        Origin                     origin;
    };
    struct Group
    {
        std::uint32_t                  total = 0;
        std::string                    to;
        std::map<std::uint32_t, Part>  parts;  // ordered by index
    };
    std::unordered_map<std::string, Group> groups_;
    std::vector<std::string>               order_;
};

}  // namespace frag
