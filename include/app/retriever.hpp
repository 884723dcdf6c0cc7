#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "ledger/iledger.hpp"
#include "proto/frag.hpp"
#include "util/errc.hpp"

namespace app
{

// One account's history for one kind as a lazy, finite, restartable page sequence
class HistoryFeed
{
  public:
    HistoryFeed(ledger::ILedger &l, std::string account, std::string kind, std::size_t page_size);

    // ok (records may be empty at the end) or retrieval; a failed page can be retried
    errc::Code next(std::vector<ledger::Record> &out);
    bool       exhausted() const { return exhausted_; }
    void       restart();

    const std::string &account() const { return account_; }

  private:
    ledger::ILedger             &ledger_;
    std::string                  account_;
    std::string                  kind_;
    std::size_t                  page_size_;
    std::optional<std::uint64_t> cursor_{};
    bool                         exhausted_{false};
};

// A complete message (single envelope, or reassembled session) still encrypted
struct RetrievedMessage
{
    std::string   tx_id;
    std::string   session_id;  // empty for single-envelope messages
    std::string   from;
    std::string   to;
    std::uint64_t timestamp{0};
    std::string   ciphertext;
    std::string   hash;
    std::uint32_t chunks{1};
};

// A session whose fragments did not all show up in the scanned window
struct PendingSession
{
    std::string   session_id;
    std::string   tx_id;  // of the lowest fragment seen
    std::string   from;
    std::size_t   received{0};
    std::uint32_t total{0};
};

struct ScanResult
{
    std::vector<RetrievedMessage> messages;  // oldest first
    std::vector<PendingSession>   pending;
    std::size_t                   records{0};  // records read
    std::size_t                   skipped{0};  // unparseable records
};

// Collects one conversation (viewer <-> partner) from ledger history.
// Owns the fragment arena, so each Retriever instance is one retrieval call.
class Retriever
{
  public:
    Retriever(ledger::ILedger &l, std::string kind, std::string viewer, std::string partner);

    // Walk up to max_pages of `account`'s history. retrieval if a page fetch failed;
    // what was gathered before the failure stays in the arena.
    errc::Code scan(const std::string &account, std::size_t page_size, std::size_t max_pages);

    // Feed one page of records (also used by scan)
    void ingest(const std::vector<ledger::Record> &records);

    bool       relevant(const std::string &sender, const std::string &to) const;
    ScanResult collect() const;

  private:
    ledger::ILedger                &ledger_;
    std::string                     kind_;
    std::string                     viewer_;
    std::string                     partner_;
    frag::SessionArena              arena_;
    std::vector<RetrievedMessage>   singles_;
    std::unordered_set<std::string> single_ids_;
    std::size_t                     records_{0};
    std::size_t                     skipped_{0};
};

}  // namespace app
