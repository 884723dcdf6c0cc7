#include <algorithm>
#include <type_traits>
#include <variant>

#include "app/retriever.hpp"
#include "proto/envelope.hpp"
#include "util/log.hpp"

namespace app
{

HistoryFeed::HistoryFeed(ledger::ILedger &l,
                         std::string      account,
                         std::string      kind,
                         std::size_t      page_size)
    : ledger_(l), account_(std::move(account)), kind_(std::move(kind)),
      page_size_(page_size == 0 ? 1 : page_size)
{
}

errc::Code HistoryFeed::next(std::vector<ledger::Record> &out)
{
    out.clear();
    if (exhausted_)
        return errc::Code::ok;

    ledger::Page page;
    if (auto rc = ledger_.history(account_, kind_, cursor_, page_size_, page);
        rc != errc::Code::ok)
    {
        TLOG_WARN(Scan, "history page for %s failed: %s", account_.c_str(), errc::name(rc));
        return errc::Code::retrieval;
    }
    out = std::move(page.records);
    if (page.next_cursor)
        cursor_ = page.next_cursor;
    else
        exhausted_ = true;
    return errc::Code::ok;
}

void HistoryFeed::restart()
{
    cursor_.reset();
    exhausted_ = false;
}

Retriever::Retriever(ledger::ILedger &l, std::string kind, std::string viewer, std::string partner)
    : ledger_(l), kind_(std::move(kind)), viewer_(std::move(viewer)), partner_(std::move(partner))
{
}

bool Retriever::relevant(const std::string &sender, const std::string &to) const
{
    // not an access check: the ledger is public, this only picks the conversation
    if (viewer_ == partner_)
        return false;
    return (sender == viewer_ && to == partner_) || (sender == partner_ && to == viewer_);
}

void Retriever::ingest(const std::vector<ledger::Record> &records)
{
    for (const auto &r : records)
    {
        ++records_;
        if (r.kind != kind_)
            continue;

        auto env = envelope::parse(r.json);
        if (!env)
        {
            ++skipped_;
            TLOG_WARN(Scan, "skipping unparseable record tx=%s seq=%llu", r.tx_id.c_str(),
                      (unsigned long long)r.seq);
            continue;
        }
        if (!relevant(r.sender, envelope::recipient(*env)))
            continue;

        std::visit(
            [&](auto &e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, envelope::SingleEnvelope>)
                {
                    if (!single_ids_.insert(r.tx_id).second)
                        return;  // already seen on an earlier page / rescan
                    RetrievedMessage m;
                    m.tx_id      = r.tx_id;
                    m.from       = r.sender;
                    m.to         = e.to;
                    m.timestamp  = r.timestamp;
                    m.ciphertext = std::move(e.ciphertext);
                    m.hash       = std::move(e.hash);
                    m.chunks     = 1;
                    singles_.push_back(std::move(m));
                }
                else
                {
                    frag::Origin o{r.tx_id, r.sender, r.timestamp};
                    if (!arena_.feed(e, o))
                        ++skipped_;
                }
            },
            *env);
    }
}

errc::Code Retriever::scan(const std::string &account, std::size_t page_size, std::size_t max_pages)
{
    HistoryFeed                 feed(ledger_, account, kind_, page_size);
    std::vector<ledger::Record> page;
    std::size_t                 pages = 0;
    while (!feed.exhausted() && pages < max_pages)
    {
        if (auto rc = feed.next(page); rc != errc::Code::ok)
            return rc;
        ++pages;
        ingest(page);
    }
    TLOG_DEBUG(Scan, "%s: %zu page(s), %zu records so far, %zu sessions", account.c_str(), pages,
               records_, arena_.size());
    return errc::Code::ok;
}

ScanResult Retriever::collect() const
{
    ScanResult out;
    out.records  = records_;
    out.skipped  = skipped_;
    out.messages = singles_;

    for (const auto &sid : arena_.session_ids())
    {
        frag::Assembled a;
        if (arena_.assemble(sid, a) == errc::Code::ok)
        {
            RetrievedMessage m;
            m.tx_id      = a.origin.tx_id;
            m.session_id = a.session_id;
            m.from       = a.origin.sender;
            m.to         = a.to;
            m.timestamp  = a.origin.timestamp;
            m.ciphertext = std::move(a.ciphertext);
            m.hash       = std::move(a.hash);
            m.chunks     = a.total;
            out.messages.push_back(std::move(m));
        }
        else
        {
            PendingSession p;
            p.session_id = sid;
            if (auto o = arena_.origin(sid))
            {
                p.tx_id = o->tx_id;
                p.from  = o->sender;
            }
            p.received = arena_.received(sid);
            p.total    = arena_.total(sid);
            out.pending.push_back(std::move(p));
        }
    }

    std::stable_sort(out.messages.begin(), out.messages.end(),
                     [](const RetrievedMessage &a, const RetrievedMessage &b) {
                         return a.timestamp < b.timestamp;
                     });

    TLOG_INFO(Scan, "%zu message(s), %zu pending session(s), %zu record(s) skipped",
              out.messages.size(), out.pending.size(), out.skipped);
    return out;
}

}  // namespace app
