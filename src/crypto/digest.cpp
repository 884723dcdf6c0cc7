#include <array>
#include <cctype>
#include <sodium.h>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(SHA256_SIZE == crypto_hash_sha256_BYTES, "sha256 size mismatch");

bool sodium_ready()
{
    static const bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string sha256_hex(std::string_view text)
{
    sodium_ready();
    std::array<unsigned char, SHA256_SIZE> h{};
    crypto_hash_sha256(h.data(), reinterpret_cast<const unsigned char *>(text.data()),
                       text.size());

    std::array<char, SHA256_HEX_SIZE + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), h.data(), h.size());
    return std::string(hex.data(), SHA256_HEX_SIZE);
}

bool hex_equal(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    if (a.empty())
        return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool is_sha256_hex(std::string_view s)
{
    if (s.size() != SHA256_HEX_SIZE)
        return false;
    for (unsigned char c : s)
    {
        if (!std::isxdigit(c))
            return false;
    }
    return true;
}

errc::Code verify(std::string_view canonical_plaintext, std::string_view expected_hex)
{
    if (expected_hex.empty())
    {
        TLOG_WARN(Verify, "no integrity hash transmitted; refusing unverified content");
        return errc::Code::integrity;
    }
    const std::string actual = sha256_hex(canonical_plaintext);
    if (!hex_equal(actual, expected_hex))
    {
        TLOG_ERROR(Verify, "integrity check failed: expected=%.16s actual=%.16s",
                   std::string(expected_hex).c_str(), actual.c_str());
        return errc::Code::integrity;
    }
    TLOG_DEBUG(Verify, "integrity verified (%.16s...)", actual.c_str());
    return errc::Code::ok;
}

}  // namespace digest
