#include <algorithm>

#include "app/message_cache.hpp"
#include "util/log.hpp"

namespace app
{

std::string MessageCache::conversation_key(const std::string &a, const std::string &b)
{
    return a < b ? a + "_" + b : b + "_" + a;
}

std::size_t MessageCache::merge(const std::string                   &viewer,
                                const std::string                   &partner,
                                const std::vector<RetrievedMessage> &messages)
{
    const std::string           key = conversation_key(viewer, partner);
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t                 added = 0;
    for (const auto &m : messages)
    {
        if (by_tx_.count(m.tx_id))
            continue;
        CachedMessage c;
        c.message      = m;
        c.conversation = key;
        c.state        = frag::SessionState::Complete;
        by_tx_.emplace(m.tx_id, std::move(c));
        ++added;
    }
    if (added)
        LOG_DEBUG("MessageCache: %zu new message(s) for %s", added, key.c_str());
    return added;
}

std::optional<CachedMessage> MessageCache::find(const std::string &tx_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = by_tx_.find(tx_id);
    if (it == by_tx_.end())
        return std::nullopt;
    return it->second;
}

std::vector<CachedMessage> MessageCache::conversation(const std::string &a,
                                                      const std::string &b) const
{
    const std::string          key = conversation_key(a, b);
    std::vector<CachedMessage> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &kv : by_tx_)
        {
            if (kv.second.conversation == key)
                out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const CachedMessage &x, const CachedMessage &y) {
        if (x.message.timestamp != y.message.timestamp)
            return x.message.timestamp < y.message.timestamp;
        return x.message.tx_id < y.message.tx_id;
    });
    return out;
}

bool MessageCache::set_state(const std::string &tx_id, frag::SessionState s)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = by_tx_.find(tx_id);
    if (it == by_tx_.end())
        return false;
    it->second.state = s;
    return true;
}

bool MessageCache::set_payload(const std::string &tx_id, payload::Payload p)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = by_tx_.find(tx_id);
    if (it == by_tx_.end())
        return false;
    it->second.payload = std::move(p);
    it->second.state   = frag::SessionState::Decoded;
    return true;
}

std::size_t MessageCache::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return by_tx_.size();
}

}  // namespace app
