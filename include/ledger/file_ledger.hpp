#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "ledger/iledger.hpp"
#include "util/constants.hpp"

namespace ledger
{

/*
Append-only JSON-lines ledger, one transaction per line:

  {"tx":"<40 hex>","block":<n>,"ts":<unix ms>,
   "ops":[{"kind":"...","sender":"...","json":"<envelope>"}, ...]}

A transaction is written with a single write() of one line, so readers see
either all of its ops or none. Unreadable lines are skipped on load.
*/
class FileLedger final : public ILedger
{
  public:
    explicit FileLedger(std::string path,
                        std::size_t ceiling = constants::LEDGER_MESSAGE_CEILING);

    errc::Code  broadcast(const Operation &op, std::string &tx_id) override;
    errc::Code  broadcast_atomic(const std::vector<Operation> &ops, std::string &tx_id) override;
    errc::Code  history(const std::string           &account,
                        const std::string           &kind,
                        std::optional<std::uint64_t> cursor,
                        std::size_t                  page_size,
                        Page                        &out) override;
    std::string name() const override { return "file"; }

    const std::string &path() const { return path_; }

  private:
    // all records in file order; false on I/O error (missing file => empty, true)
    bool load(std::vector<Record> &out, std::uint64_t &last_block) const;

    std::string path_;
    std::size_t ceiling_;
};

}  // namespace ledger
