#include <cstdlib>
#include <cstring>
#include <sodium.h>
#include <vector>

#include "crypto/digest.hpp"
#include "crypto/memo_cipher.hpp"
#include "util/log.hpp"

namespace memo
{

static_assert(PK_SIZE == crypto_box_PUBLICKEYBYTES, "public key size mismatch");
static_assert(SK_SIZE == crypto_box_SECRETKEYBYTES, "secret key size mismatch");
static_assert(NONCE_SIZE == crypto_box_NONCEBYTES, "nonce size mismatch");
static_assert(MAC_SIZE == crypto_box_MACBYTES, "mac size mismatch");
static_assert(SECRET_SIZE == crypto_box_SEEDBYTES, "seed size mismatch");

static constexpr std::size_t HEADER_SIZE = PK_SIZE + PK_SIZE + NONCE_SIZE;

static std::string to_memo(const unsigned char *raw, std::size_t len)
{
    const std::size_t b64_len = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string       b64(b64_len, '\0');
    sodium_bin2base64(b64.data(), b64.size(), raw, len, sodium_base64_VARIANT_ORIGINAL);
    b64.resize(std::strlen(b64.c_str()));

    std::string out;
    out.reserve(1 + b64.size());
    out.push_back(MEMO_MARKER);
    out += b64;
    return out;
}

// '#' + base64 -> raw bytes; false if either part is missing or malformed
static bool from_memo(std::string_view memo_text, std::vector<std::uint8_t> &raw)
{
    if (memo_text.empty() || memo_text.front() != MEMO_MARKER)
    {
        TLOG_WARN(Decrypt, "ciphertext without memo marker");
        return false;
    }
    memo_text.remove_prefix(1);

    raw.assign(memo_text.size() / 4 * 3 + 3, 0);
    std::size_t raw_len = 0;
    if (sodium_base642bin(raw.data(), raw.size(), memo_text.data(), memo_text.size(), nullptr,
                          &raw_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        TLOG_WARN(Decrypt, "memo body is not base64 (%zu chars)", memo_text.size());
        return false;
    }
    raw.resize(raw_len);
    return true;
}

errc::Code NoopMemoCipher::encrypt(std::string_view plaintext,
                                   const std::string & /*from*/,
                                   const std::string & /*to*/,
                                   std::string &out)
{
    if (!digest::sodium_ready())
        return errc::Code::service_unavailable;
    out = to_memo(reinterpret_cast<const unsigned char *>(plaintext.data()), plaintext.size());
    return errc::Code::ok;
}

errc::Code NoopMemoCipher::decrypt(std::string_view ciphertext,
                                   const std::string & /*me*/,
                                   std::string &out)
{
    if (!digest::sodium_ready())
        return errc::Code::service_unavailable;
    std::vector<std::uint8_t> raw;
    if (!from_memo(ciphertext, raw))
        return errc::Code::integrity;
    out.assign(raw.begin(), raw.end());
    return errc::Code::ok;
}

std::optional<SodiumMemoCipher> SodiumMemoCipher::FromHex(std::string_view hex)
{
    if (!digest::sodium_ready())
        return std::nullopt;
    std::array<std::uint8_t, SECRET_SIZE> secret;
    std::size_t                           out_len = 0;
    if (sodium_hex2bin(secret.data(), secret.size(), hex.data(), hex.size(), nullptr, &out_len,
                       nullptr) != 0 ||
        out_len != secret.size())
    {
        return std::nullopt;
    }
    SodiumMemoCipher c{secret};
    sodium_memzero(secret.data(), secret.size());
    return c;
}

std::optional<SodiumMemoCipher> SodiumMemoCipher::CheckAndInitFromEnv(const char *env_var)
{
    if (!env_var)
        return std::nullopt;
    const char *s = std::getenv(env_var);
    if (!s)
        return std::nullopt;
    return FromHex(std::string_view(s, std::strlen(s)));
}

void SodiumMemoCipher::derive(const std::string                 &identity,
                              std::array<std::uint8_t, PK_SIZE> &pk,
                              std::array<std::uint8_t, SK_SIZE> &sk) const
{
    // seed = BLAKE2b-256(identity; key = secret)
    std::array<std::uint8_t, crypto_box_SEEDBYTES> seed{};
    crypto_generichash(seed.data(), seed.size(),
                       reinterpret_cast<const unsigned char *>(identity.data()), identity.size(),
                       secret_.data(), secret_.size());
    crypto_box_seed_keypair(pk.data(), sk.data(), seed.data());
    sodium_memzero(seed.data(), seed.size());
}

std::array<std::uint8_t, PK_SIZE> SodiumMemoCipher::public_key(const std::string &identity) const
{
    std::array<std::uint8_t, PK_SIZE> pk{};
    std::array<std::uint8_t, SK_SIZE> sk{};
    derive(identity, pk, sk);
    sodium_memzero(sk.data(), sk.size());
    return pk;
}

errc::Code SodiumMemoCipher::encrypt(std::string_view   plaintext,
                                     const std::string &from,
                                     const std::string &to,
                                     std::string       &out)
{
    if (!digest::sodium_ready())
        return errc::Code::service_unavailable;

    std::array<std::uint8_t, PK_SIZE> from_pk{}, to_pk{};
    std::array<std::uint8_t, SK_SIZE> from_sk{}, unused_sk{};
    derive(from, from_pk, from_sk);
    derive(to, to_pk, unused_sk);
    sodium_memzero(unused_sk.data(), unused_sk.size());

    // [from_pk | to_pk | nonce | mac+c]
    std::vector<std::uint8_t> raw(HEADER_SIZE + MAC_SIZE + plaintext.size());
    std::memcpy(raw.data(), from_pk.data(), PK_SIZE);
    std::memcpy(raw.data() + PK_SIZE, to_pk.data(), PK_SIZE);
    unsigned char *nonce = raw.data() + 2 * PK_SIZE;
    randombytes_buf(nonce, NONCE_SIZE);

    const int rc = crypto_box_easy(raw.data() + HEADER_SIZE,
                                   reinterpret_cast<const unsigned char *>(plaintext.data()),
                                   plaintext.size(), nonce, to_pk.data(), from_sk.data());
    sodium_memzero(from_sk.data(), from_sk.size());
    if (rc != 0)
    {
        TLOG_ERROR(Encrypt, "crypto_box_easy failed");
        return errc::Code::service_unavailable;
    }

    out = to_memo(raw.data(), raw.size());
    return errc::Code::ok;
}

errc::Code SodiumMemoCipher::decrypt(std::string_view   ciphertext,
                                     const std::string &me,
                                     std::string       &out)
{
    if (!digest::sodium_ready())
        return errc::Code::service_unavailable;

    std::vector<std::uint8_t> raw;
    if (!from_memo(ciphertext, raw) || raw.size() < HEADER_SIZE + MAC_SIZE)
    {
        TLOG_WARN(Decrypt, "ciphertext is not a valid memo (%zu bytes)", raw.size());
        return errc::Code::integrity;
    }

    std::array<std::uint8_t, PK_SIZE> my_pk{};
    std::array<std::uint8_t, SK_SIZE> my_sk{};
    derive(me, my_pk, my_sk);

    const unsigned char *from_pk = raw.data();
    const unsigned char *to_pk   = raw.data() + PK_SIZE;
    const unsigned char *nonce   = raw.data() + 2 * PK_SIZE;

    // the other party's key
    const unsigned char *peer_pk = nullptr;
    if (sodium_memcmp(to_pk, my_pk.data(), PK_SIZE) == 0)
        peer_pk = from_pk;
    else if (sodium_memcmp(from_pk, my_pk.data(), PK_SIZE) == 0)
        peer_pk = to_pk;

    if (!peer_pk)
    {
        sodium_memzero(my_sk.data(), my_sk.size());
        TLOG_WARN(Decrypt, "memo not addressed to %s", me.c_str());
        return errc::Code::wrong_recipient;
    }

    const std::size_t clen = raw.size() - HEADER_SIZE;
    std::string       plain(clen - MAC_SIZE, '\0');
    const int         rc = crypto_box_open_easy(reinterpret_cast<unsigned char *>(plain.data()),
                                                raw.data() + HEADER_SIZE, clen, nonce, peer_pk,
                                                my_sk.data());
    sodium_memzero(my_sk.data(), my_sk.size());
    if (rc != 0)
    {
        TLOG_WARN(Decrypt, "memo authentication failed");
        return errc::Code::integrity;
    }
    out = std::move(plain);
    return errc::Code::ok;
}

}  // namespace memo
