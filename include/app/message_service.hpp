#pragma once
#include <cstddef>
#include <string>

#include "app/broadcaster.hpp"
#include "app/message_cache.hpp"
#include "app/retriever.hpp"
#include "crypto/memo_cipher.hpp"
#include "ledger/iledger.hpp"
#include "proto/payload.hpp"
#include "util/constants.hpp"
#include "util/errc.hpp"

namespace app
{

struct ServiceSettings
{
    std::string channel     = std::string(constants::CHANNEL_KIND);
    std::size_t max_segment = constants::MAX_SEGMENT;
    std::size_t threshold   = constants::SINGLE_VS_CHUNK_THRESHOLD;
    std::size_t page_size   = constants::DEFAULT_PAGE_SIZE;
    std::size_t max_pages   = constants::DEFAULT_MAX_PAGES;
};

class MessageService
{
  public:
    MessageService(ledger::ILedger &l, memo::MemoCipher &cipher, ServiceSettings s = {});

    // encode -> hash -> encrypt -> single or chunked broadcast.
    // ok | validation | user_cancelled | service_unavailable
    //    | insufficient_budget | relay_rejected
    errc::Code send_image(const payload::Payload &p, BroadcastResult &out);

    // Scan both participants' histories into one fresh arena and merge the
    // complete messages into the cache. retrieval if any page failed; `out`
    // still holds what was gathered.
    errc::Code fetch_conversation(const std::string &viewer,
                                  const std::string &partner,
                                  ScanResult        &out);

    // decrypt -> verify -> decode, on demand for one message.
    // ok | user_cancelled | wrong_recipient | service_unavailable | integrity | parse
    errc::Code open_message(const RetrievedMessage &m,
                            const std::string      &viewer,
                            payload::Payload       &out);

    MessageCache &cache() { return cache_; }

  private:
    void track(const std::string &tx_id, frag::SessionState s);

    ledger::ILedger  &ledger_;
    memo::MemoCipher &cipher_;
    ServiceSettings   settings_;
    Broadcaster       broadcaster_;
    MessageCache      cache_;
};

// Find a message in a scan result by transaction or session id.
// ok, incomplete_session if it is a pending session, validation if unknown.
errc::Code locate(const ScanResult &scan, const std::string &id, RetrievedMessage &out);

}  // namespace app
