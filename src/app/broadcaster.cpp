#include <vector>

#include "app/broadcaster.hpp"
#include "proto/envelope.hpp"
#include "util/log.hpp"

namespace app
{

Broadcaster::Broadcaster(ledger::ILedger &l,
                         std::string      channel,
                         std::size_t      max_segment,
                         std::size_t      threshold)
    : ledger_(l), channel_(std::move(channel)), max_segment_(max_segment), threshold_(threshold)
{
}

errc::Code Broadcaster::submit(const std::string &sender,
                               const std::string &to,
                               const std::string &ciphertext,
                               const std::string &hash,
                               BroadcastResult   &out)
{
    const std::size_t estimated = envelope::estimate_single_size(to, ciphertext, hash);
    const auto        strategy  = frag::choose_strategy(estimated, threshold_);
    TLOG_INFO(Broadcast, "strategy=%s encrypted=%zu estimated=%zu threshold=%zu to=%s",
              strategy == frag::Strategy::Single ? "single" : "chunked", ciphertext.size(),
              estimated, threshold_, to.c_str());

    if (strategy == frag::Strategy::Single)
        return submit_single(sender, to, ciphertext, hash, out);
    return submit_chunked(sender, to, ciphertext, hash, out);
}

errc::Code Broadcaster::submit_single(const std::string &sender,
                                      const std::string &to,
                                      const std::string &ciphertext,
                                      const std::string &hash,
                                      BroadcastResult   &out)
{
    ledger::Operation op;
    op.kind   = channel_;
    op.sender = sender;
    op.json   = envelope::serialize(envelope::SingleEnvelope{to, ciphertext, hash});
    if (op.json.empty())
    {
        TLOG_ERROR(Broadcast, "single envelope could not be serialized");
        return errc::Code::validation;
    }

    std::string tx_id;
    if (auto rc = ledger_.broadcast(op, tx_id); rc != errc::Code::ok)
    {
        TLOG_ERROR(Broadcast, "single operation failed: %s", errc::name(rc));
        return rc;
    }

    TLOG_INFO(Broadcast, "single operation sent (%zu bytes), tx=%s", op.json.size(), tx_id.c_str());
    out            = BroadcastResult{};
    out.tx_id      = std::move(tx_id);
    out.strategy   = frag::Strategy::Single;
    out.operations = 1;
    return errc::Code::ok;
}

errc::Code Broadcaster::submit_chunked(const std::string &sender,
                                       const std::string &to,
                                       const std::string &ciphertext,
                                       const std::string &hash,
                                       BroadcastResult   &out)
{
    frag::Session session;
    if (auto rc = frag::split(ciphertext, hash, max_segment_, session); rc != errc::Code::ok)
        return rc;

    std::vector<ledger::Operation> ops;
    ops.reserve(session.fragments.size());
    for (const auto &c : frag::to_envelopes(session, to))
    {
        ledger::Operation op;
        op.kind   = channel_;
        op.sender = sender;
        op.json   = envelope::serialize(c);
        if (op.json.empty())
        {
            TLOG_ERROR(Broadcast, "chunk %u could not be serialized", c.index);
            return errc::Code::validation;
        }
        ops.push_back(std::move(op));
    }

    // one transaction: every chunk lands or none does
    std::string tx_id;
    if (auto rc = ledger_.broadcast_atomic(ops, tx_id); rc != errc::Code::ok)
    {
        TLOG_ERROR(Broadcast, "batched broadcast of %zu chunks failed: %s", ops.size(),
                   errc::name(rc));
        return rc;
    }

    TLOG_INFO(Broadcast, "%zu chunks sent in one transaction, tx=%s sid=%s", ops.size(),
              tx_id.c_str(), session.session_id.c_str());
    out            = BroadcastResult{};
    out.tx_id      = std::move(tx_id);
    out.strategy   = frag::Strategy::Chunked;
    out.operations = ops.size();
    out.session_id = session.session_id;
    return errc::Code::ok;
}

}  // namespace app
