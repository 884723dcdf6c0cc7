#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Ledger message kind for this protocol (custom_json id)
inline constexpr std::string_view CHANNEL_KIND = "hive-messenger-img";

inline constexpr int         ENVELOPE_VERSION          = 1;
inline constexpr std::size_t MAX_SEGMENT               = 7000;  // ciphertext slice per chunk
inline constexpr std::size_t SINGLE_VS_CHUNK_THRESHOLD = 7500;  // estimated envelope size
inline constexpr std::size_t LEDGER_MESSAGE_CEILING    = 8192;  // hard per-op limit
inline constexpr std::size_t MAX_IMAGE_BYTES           = 5 * 1024 * 1024;

inline constexpr std::size_t DEFAULT_PAGE_SIZE = 200;
inline constexpr std::size_t DEFAULT_MAX_PAGES = 5;

// Ledger file used by the CLI
[[maybe_unused]] static std::string ledger_path()
{
    if (const char *p = std::getenv("BLOBCAST_LEDGER"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string path = base + "/.cache/blobcast/ledger.jsonl";
    LOG_DEBUG("Using default ledger %s", path.c_str());
    return path;
}

}  // namespace constants
