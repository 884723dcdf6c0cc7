#pragma once
#include <cstddef>
#include <string>

#include "ledger/iledger.hpp"
#include "proto/frag.hpp"
#include "util/constants.hpp"
#include "util/errc.hpp"

namespace app
{

struct BroadcastResult
{
    std::string    tx_id;
    frag::Strategy strategy{frag::Strategy::Single};
    std::size_t    operations{0};
    std::string    session_id;  // chunked path only
};

// Puts one encrypted message on the ledger: a single envelope when the
// estimated envelope fits the threshold, else every chunk in one atomic tx.
class Broadcaster
{
  public:
    Broadcaster(ledger::ILedger &l,
                std::string      channel,
                std::size_t      max_segment = constants::MAX_SEGMENT,
                std::size_t      threshold   = constants::SINGLE_VS_CHUNK_THRESHOLD);

    errc::Code submit(const std::string &sender,
                      const std::string &to,
                      const std::string &ciphertext,
                      const std::string &hash,
                      BroadcastResult   &out);

    errc::Code submit_single(const std::string &sender,
                             const std::string &to,
                             const std::string &ciphertext,
                             const std::string &hash,
                             BroadcastResult   &out);

    errc::Code submit_chunked(const std::string &sender,
                              const std::string &to,
                              const std::string &ciphertext,
                              const std::string &hash,
                              BroadcastResult   &out);

  private:
    ledger::ILedger &ledger_;
    std::string      channel_;
    std::size_t      max_segment_;
    std::size_t      threshold_;
};

}  // namespace app
