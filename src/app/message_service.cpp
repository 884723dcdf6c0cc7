#include <sodium.h>
#include <string>

#include "app/message_service.hpp"
#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace app
{

MessageService::MessageService(ledger::ILedger &l, memo::MemoCipher &cipher, ServiceSettings s)
    : ledger_(l), cipher_(cipher), settings_(std::move(s)),
      broadcaster_(l, settings_.channel, settings_.max_segment, settings_.threshold)
{
}

errc::Code MessageService::send_image(const payload::Payload &p, BroadcastResult &out)
{
    TLOG_INFO(Encrypt, "from=%s to=%s image=%zu caption=%s", p.from.c_str(), p.to.c_str(),
              p.image_data.size(), (p.caption && !p.caption->empty()) ? "yes" : "no");

    // 1) Compact encode
    payload::CompactPayload compact;
    if (auto rc = payload::encode(p, compact); rc != errc::Code::ok)
        return rc;

    // 2) Hash the plaintext, once, before encryption
    const std::string hash = payload::hash(compact);
    TLOG_DEBUG(Encrypt, "sha256=%.16s... over %zu bytes", hash.c_str(), compact.text.size());

    // 3) Encrypt as a memo
    std::string memo_text;
    memo_text.reserve(1 + compact.text.size());
    memo_text.push_back(memo::MEMO_MARKER);
    memo_text += compact.text;

    std::string ciphertext;
    if (auto rc = cipher_.encrypt(memo_text, p.from, p.to, ciphertext); rc != errc::Code::ok)
    {
        TLOG_ERROR(Encrypt, "memo encryption failed: %s", errc::name(rc));
        return rc;
    }
    TLOG_INFO(Encrypt, "encrypted size %zu", ciphertext.size());

    // 4) Broadcast (single or chunked)
    return broadcaster_.submit(p.from, p.to, ciphertext, hash, out);
}

errc::Code MessageService::fetch_conversation(const std::string &viewer,
                                              const std::string &partner,
                                              ScanResult        &out)
{
    // fresh arena for this call only
    Retriever  r(ledger_, settings_.channel, viewer, partner);
    errc::Code rc = r.scan(viewer, settings_.page_size, settings_.max_pages);
    if (partner != viewer)
    {
        const errc::Code rc2 = r.scan(partner, settings_.page_size, settings_.max_pages);
        if (rc == errc::Code::ok)
            rc = rc2;
    }

    out              = r.collect();
    const auto added = cache_.merge(viewer, partner, out.messages);
    TLOG_DEBUG(Scan, "%s<->%s: %zu new message(s) cached", viewer.c_str(), partner.c_str(), added);
    for (const auto &p : out.pending)
    {
        TLOG_INFO(Scan, "session %s pending: %zu/%u fragments", p.session_id.c_str(), p.received,
                  p.total);
    }
    return rc;
}

void MessageService::track(const std::string &tx_id, frag::SessionState s)
{
    if (!cache_.set_state(tx_id, s))
        LOG_DEBUG("message %s not cached; state %s not recorded", tx_id.c_str(),
                  frag::state_name(s));
}

static void wipe(std::string &s)
{
    if (!s.empty())
        sodium_memzero(s.data(), s.size());
    s.clear();
}

errc::Code MessageService::open_message(const RetrievedMessage &m,
                                        const std::string      &viewer,
                                        payload::Payload       &out)
{
    TLOG_INFO(Decrypt, "tx=%s viewer=%s size=%zu chunks=%u", m.tx_id.c_str(), viewer.c_str(),
              m.ciphertext.size(), m.chunks);
    track(m.tx_id, frag::SessionState::Decrypting);

    std::string plain;
    if (auto rc = cipher_.decrypt(m.ciphertext, viewer, plain); rc != errc::Code::ok)
    {
        TLOG_ERROR(Decrypt, "memo decryption failed: %s", errc::name(rc));
        track(m.tx_id, rc == errc::Code::integrity ? frag::SessionState::Corrupted
                                                   : frag::SessionState::Complete);
        return rc;
    }

    // strip memo marker
    payload::CompactPayload compact;
    if (!plain.empty() && plain.front() == memo::MEMO_MARKER)
        compact.text.assign(plain, 1, std::string::npos);
    else
        compact.text = plain;
    wipe(plain);

    if (auto rc = digest::verify(compact.text, m.hash); rc != errc::Code::ok)
    {
        wipe(compact.text);  // never surfaced
        track(m.tx_id, frag::SessionState::Corrupted);
        return rc;
    }
    track(m.tx_id, frag::SessionState::Verified);

    payload::Payload p;
    if (auto rc = payload::decode(compact, p); rc != errc::Code::ok)
    {
        track(m.tx_id, frag::SessionState::Corrupted);
        return rc;
    }

    if (!cache_.set_payload(m.tx_id, p))
        LOG_DEBUG("message %s not cached; payload kept by caller only", m.tx_id.c_str());
    TLOG_INFO(Decrypt, "decoded: from=%s to=%s image=%zu caption=%s", p.from.c_str(), p.to.c_str(),
              p.image_data.size(), p.caption ? "yes" : "no");
    out = std::move(p);
    return errc::Code::ok;
}

errc::Code locate(const ScanResult &scan, const std::string &id, RetrievedMessage &out)
{
    for (const auto &m : scan.messages)
    {
        if (m.tx_id == id || (!m.session_id.empty() && m.session_id == id))
        {
            out = m;
            return errc::Code::ok;
        }
    }
    for (const auto &p : scan.pending)
    {
        if (p.tx_id == id || p.session_id == id)
        {
            LOG_INFO("locate: %s is pending (%zu/%u fragments)", id.c_str(), p.received, p.total);
            return errc::Code::incomplete_session;
        }
    }
    LOG_WARN("locate: no message %s in the scanned window", id.c_str());
    return errc::Code::validation;
}

}  // namespace app
