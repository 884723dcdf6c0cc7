#include <algorithm>
#include <chrono>
#include <limits>
#include <sodium.h>
#include <utility>

#include "crypto/digest.hpp"
#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

const char *state_name(SessionState s)
{
    switch (s)
    {
        case SessionState::Collecting:
            return "collecting";
        case SessionState::Complete:
            return "complete";
        case SessionState::Decrypting:
            return "decrypting";
        case SessionState::Verified:
            return "verified";
        case SessionState::Corrupted:
            return "corrupted";
        case SessionState::Decoded:
            return "decoded";
    }
    return "?";
}

Strategy choose_strategy(std::size_t estimated_envelope_size, std::size_t threshold)
{
    return estimated_envelope_size <= threshold ? Strategy::Single : Strategy::Chunked;
}

std::string make_session_id()
{
    static constexpr char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static constexpr int  SUFFIX_LEN = 7;

    digest::sodium_ready();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    std::string sid = std::to_string(ms);
    sid.push_back('-');
    for (int i = 0; i < SUFFIX_LEN; ++i)
        sid.push_back(ALPHABET[randombytes_uniform(36)]);
    return sid;
}

std::size_t chunk_count(std::size_t length, std::size_t max_segment)
{
    if (max_segment == 0)
        return 0;
    return (length + max_segment - 1) / max_segment;
}

static bool is_utf8_continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

errc::Code split(std::string_view ciphertext,
                 const std::string &hash,
                 std::size_t        max_segment,
                 Session           &out)
{
    if (max_segment < 1 || max_segment > constants::MAX_SEGMENT)
    {
        LOG_ERROR("split: invalid max_segment (%zu)", max_segment);
        return errc::Code::validation;
    }
    if (ciphertext.empty())
    {
        LOG_ERROR("split: empty ciphertext");
        return errc::Code::validation;
    }

    // slice bounds; a slice never ends inside a UTF-8 sequence
    std::vector<std::pair<std::size_t, std::size_t>> bounds;
    for (std::size_t start = 0; start < ciphertext.size();)
    {
        std::size_t end = std::min(start + max_segment, ciphertext.size());
        std::size_t cut = end;
        while (cut > start && cut < ciphertext.size() && is_utf8_continuation(ciphertext[cut]))
            --cut;
        if (cut > start)
            end = cut;
        bounds.emplace_back(start, end - start);
        start = end;
    }

    const std::size_t num_chunks = bounds.size();
    if (num_chunks > std::numeric_limits<std::uint32_t>::max())
    {
        LOG_ERROR("split: ciphertext too large (%zu bytes, needs %zu chunks)", ciphertext.size(),
                  num_chunks);
        return errc::Code::validation;
    }

    Session s;
    s.session_id = make_session_id();
    s.total      = static_cast<std::uint32_t>(num_chunks);
    s.fragments.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        Fragment f;
        f.index = static_cast<std::uint32_t>(i);
        f.data  = std::string(ciphertext.substr(bounds[i].first, bounds[i].second));
        if (i == 0)
            f.hash = hash;
        s.fragments.push_back(std::move(f));
    }

    TLOG_INFO(Chunk, "%zu chunks (session %s): total=%zu segment=%zu last=%zu", num_chunks,
              s.session_id.c_str(), ciphertext.size(), max_segment, s.fragments.back().data.size());
    out = std::move(s);
    return errc::Code::ok;
}

std::vector<envelope::ChunkEnvelope> to_envelopes(const Session &s, const std::string &to)
{
    std::vector<envelope::ChunkEnvelope> out;
    out.reserve(s.fragments.size());
    for (const auto &f : s.fragments)
    {
        envelope::ChunkEnvelope c;
        c.to         = to;
        c.session_id = s.session_id;
        c.index      = f.index;
        c.total      = s.total;
        c.hash       = f.hash;
        c.data       = f.data;
        out.push_back(std::move(c));
    }
    return out;
}

bool SessionArena::feed(const envelope::ChunkEnvelope &c, const Origin &origin)
{
    if (c.total == 0 || c.index >= c.total)
    {
        LOG_WARN("SessionArena::feed: invalid chunk (sid=%s idx=%u tot=%u)", c.session_id.c_str(),
                 c.index, c.total);
        return false;
    }

    auto it = groups_.find(c.session_id);
    if (it == groups_.end())
    {
        Group g;
        g.total = c.total;
        g.to    = c.to;
        it      = groups_.emplace(c.session_id, std::move(g)).first;
        order_.push_back(c.session_id);
    }
    Group &g = it->second;

    // first-seen tot/recipient define the session
    if (g.total != c.total || g.to != c.to)
    {
        LOG_WARN("SessionArena::feed: inconsistent chunk for sid=%s (tot %u vs %u), dropping",
                 c.session_id.c_str(), c.total, g.total);
        return false;
    }

    auto part = g.parts.find(c.index);
    if (part == g.parts.end())
    {
        g.parts.emplace(c.index, Part{c.data, c.hash, origin});
        return true;
    }

    // duplicate: a copy carrying the hash beats one without, else keep first-seen
    if (!part->second.hash && c.hash)
    {
        LOG_DEBUG("SessionArena::feed: replacing duplicate idx=%u with hashed copy (sid=%s)",
                  c.index, c.session_id.c_str());
        part->second = Part{c.data, c.hash, origin};
    }
    else
    {
        LOG_DEBUG("SessionArena::feed: duplicate chunk (sid=%s, idx=%u)", c.session_id.c_str(),
                  c.index);
    }
    return true;
}

errc::Code SessionArena::assemble(const std::string &session_id, Assembled &out) const
{
    auto it = groups_.find(session_id);
    if (it == groups_.end())
        return errc::Code::incomplete_session;
    const Group &g = it->second;

    // keys are unique and < total, so a full map covers exactly [0, total)
    if (g.parts.size() != g.total)
    {
        TLOG_DEBUG(Reassemble, "sid=%s pending: %zu/%u fragments", session_id.c_str(),
                   g.parts.size(), g.total);
        return errc::Code::incomplete_session;
    }

    std::size_t bytes = 0;
    for (const auto &kv : g.parts)
        bytes += kv.second.data.size();

    Assembled a;
    a.session_id = session_id;
    a.to         = g.to;
    a.total      = g.total;
    a.ciphertext.reserve(bytes);
    for (const auto &kv : g.parts)  // ascending index
    {
        a.ciphertext += kv.second.data;
        if (a.hash.empty() && kv.second.hash)
            a.hash = *kv.second.hash;
    }
    a.origin = g.parts.begin()->second.origin;

    TLOG_DEBUG(Reassemble, "sid=%s: %u chunks, %zu bytes, hash=%s", session_id.c_str(), g.total,
               a.ciphertext.size(), a.hash.empty() ? "no" : "yes");
    out = std::move(a);
    return errc::Code::ok;
}

SessionState SessionArena::state(const std::string &session_id) const
{
    auto it = groups_.find(session_id);
    if (it == groups_.end() || it->second.parts.size() != it->second.total)
        return SessionState::Collecting;
    return SessionState::Complete;
}

std::size_t SessionArena::received(const std::string &session_id) const
{
    auto it = groups_.find(session_id);
    return it == groups_.end() ? 0 : it->second.parts.size();
}

std::uint32_t SessionArena::total(const std::string &session_id) const
{
    auto it = groups_.find(session_id);
    return it == groups_.end() ? 0 : it->second.total;
}

std::optional<Origin> SessionArena::origin(const std::string &session_id) const
{
    auto it = groups_.find(session_id);
    if (it == groups_.end() || it->second.parts.empty())
        return std::nullopt;
    return it->second.parts.begin()->second.origin;
}

std::vector<std::string> SessionArena::session_ids() const
{
    return order_;
}

}  // namespace frag
