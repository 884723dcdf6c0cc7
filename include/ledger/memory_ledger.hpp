#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ledger/iledger.hpp"
#include "util/constants.hpp"

namespace ledger
{

// In-process ledger for tests and local runs. Thread-safe.
class MemoryLedger final : public ILedger
{
  public:
    explicit MemoryLedger(std::size_t ceiling = constants::LEDGER_MESSAGE_CEILING)
        : ceiling_(ceiling)
    {
    }

    errc::Code  broadcast(const Operation &op, std::string &tx_id) override;
    errc::Code  broadcast_atomic(const std::vector<Operation> &ops, std::string &tx_id) override;
    errc::Code  history(const std::string           &account,
                        const std::string           &kind,
                        std::optional<std::uint64_t> cursor,
                        std::size_t                  page_size,
                        Page                        &out) override;
    std::string name() const override { return "memory"; }

    // Bytes an account may still broadcast; unset => unlimited
    void set_budget(const std::string &account, std::size_t bytes);
    // Next broadcast / history call fails with this code (one-shot)
    void fail_next_broadcast(errc::Code c);
    void fail_next_history(errc::Code c);

    // Raw op, bypassing validation (foreign or malformed records)
    std::string inject(const Operation &op);

    std::size_t transaction_count() const;
    std::size_t operation_count() const;

  private:
    errc::Code commit_locked(const std::vector<Operation> &ops, std::string &tx_id);

    mutable std::mutex                                   mu_;
    std::size_t                                          ceiling_;
    std::uint64_t                                        block_{0};
    std::size_t                                          tx_count_{0};
    std::vector<Record>                                  records_;  // oldest first
    std::unordered_map<std::string, std::uint64_t>       next_seq_;
    std::unordered_map<std::string, std::size_t>         budget_;
    std::optional<errc::Code>                            fail_broadcast_{};
    std::optional<errc::Code>                            fail_history_{};
};

}  // namespace ledger
