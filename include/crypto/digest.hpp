#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "util/errc.hpp"

namespace digest
{

constexpr std::size_t SHA256_SIZE     = 32;  // crypto_hash_sha256_BYTES
constexpr std::size_t SHA256_HEX_SIZE = 64;

// libsodium init, idempotent; false if the library could not start
bool sodium_ready();

// Lowercase hex SHA-256 of the text's bytes
std::string sha256_hex(std::string_view text);

// Constant-time comparison of two hex digests (case-sensitive)
bool hex_equal(std::string_view a, std::string_view b);

bool is_sha256_hex(std::string_view s);

// Integrity check after decryption: recompute over the canonical plaintext
// and compare with the digest carried on the wire.
// ok, or integrity when the digest is missing or differs.
errc::Code verify(std::string_view canonical_plaintext, std::string_view expected_hex);

}  // namespace digest
