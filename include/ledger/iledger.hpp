#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "util/errc.hpp"

namespace ledger
{

// One ledger message as submitted (custom_json op)
struct Operation
{
    std::string kind;    // channel kind, e.g. "hive-messenger-img"
    std::string sender;  // signing account
    std::string json;    // envelope text
};

// One historical op as returned by history()
struct Record
{
    std::string   tx_id;
    std::uint64_t seq{0};  // position in the account's history
    std::uint64_t block{0};
    std::uint64_t timestamp{0};  // unix ms
    std::string   kind;
    std::string   sender;
    std::string   json;
};

struct Page
{
    std::vector<Record>          records;      // newest first
    std::optional<std::uint64_t> next_cursor;  // nullopt => history exhausted
};

// broadcast / broadcast_atomic: ok | user_cancelled | insufficient_budget | relay_rejected
// history:                      ok | retrieval
struct ILedger
{
    virtual errc::Code broadcast(const Operation &op, std::string &tx_id) = 0;
    // all ops commit in one transaction or none do
    virtual errc::Code broadcast_atomic(const std::vector<Operation> &ops, std::string &tx_id) = 0;
    // ops signed by `account` with this kind, newest first, starting at
    // `cursor` (nullopt = latest)
    virtual errc::Code  history(const std::string           &account,
                                const std::string           &kind,
                                std::optional<std::uint64_t> cursor,
                                std::size_t                  page_size,
                                Page                        &out) = 0;
    virtual std::string name() const { return ""; }
    virtual ~ILedger() = default;
};

// Shared by the ledger implementations

// relay_rejected if any op exceeds the per-message ceiling or ops is empty
errc::Code check_operations(const std::vector<Operation> &ops, std::size_t ceiling);

// 40 hex chars, unique per (block, ops)
std::string make_tx_id(std::uint64_t block, const std::vector<Operation> &ops);

// `newest_first` holds one account's records of one kind, seq descending
void paginate(const std::vector<Record>     &newest_first,
              std::optional<std::uint64_t>   cursor,
              std::size_t                    page_size,
              Page                          &out);

}  // namespace ledger
