#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "util/errc.hpp"

namespace memo
{

constexpr std::size_t SECRET_SIZE = 32;
constexpr std::size_t PK_SIZE     = 32;  // crypto_box_PUBLICKEYBYTES
constexpr std::size_t SK_SIZE     = 32;  // crypto_box_SECRETKEYBYTES
constexpr std::size_t NONCE_SIZE  = 24;  // crypto_box_NONCEBYTES
constexpr std::size_t MAC_SIZE    = 16;  // crypto_box_MACBYTES

// Memo marker: plaintext handed to the signing service starts with it, and
// ciphertext it returns starts with it too.
constexpr char MEMO_MARKER = '#';

// Signing/encryption service as seen by the pipeline. Opaque transforms.
//   encrypt: ok | user_cancelled | service_unavailable
//   decrypt: ok | user_cancelled | wrong_recipient | service_unavailable
//            | integrity (ciphertext damaged in transit)
class MemoCipher
{
  public:
    virtual ~MemoCipher() = default;

    virtual errc::Code encrypt(std::string_view   plaintext,
                               const std::string &from,
                               const std::string &to,
                               std::string       &out) = 0;

    virtual errc::Code decrypt(std::string_view   ciphertext,
                               const std::string &me,
                               std::string       &out) = 0;
};

// No key: the memo travels as '#' + base64(plaintext). Anyone can read it, and
// the text stays plain ASCII whatever the caption holds.
class NoopMemoCipher : public MemoCipher
{
  public:
    errc::Code encrypt(std::string_view   plaintext,
                       const std::string &from,
                       const std::string &to,
                       std::string       &out) override;

    errc::Code decrypt(std::string_view   ciphertext,
                       const std::string &me,
                       std::string       &out) override;
};

// libsodium crypto_box between per-identity X25519 keys derived from a shared
// secret. Development keyring: anyone holding the secret can read every memo.
//
// ciphertext = '#' + base64( from_pk | to_pk | nonce | box(plaintext) )
// Both parties can open it (box keys are symmetric under ECDH).
class SodiumMemoCipher : public MemoCipher
{
  public:
    explicit SodiumMemoCipher(const std::array<std::uint8_t, SECRET_SIZE> &secret)
        : secret_(secret)
    {
    }

    errc::Code encrypt(std::string_view   plaintext,
                       const std::string &from,
                       const std::string &to,
                       std::string       &out) override;

    errc::Code decrypt(std::string_view   ciphertext,
                       const std::string &me,
                       std::string       &out) override;

    std::array<std::uint8_t, PK_SIZE> public_key(const std::string &identity) const;

    static std::optional<SodiumMemoCipher> FromHex(std::string_view hex);
    static std::optional<SodiumMemoCipher> CheckAndInitFromEnv(const char *env_var);

  private:
    void derive(const std::string                 &identity,
                std::array<std::uint8_t, PK_SIZE> &pk,
                std::array<std::uint8_t, SK_SIZE> &sk) const;

    std::array<std::uint8_t, SECRET_SIZE> secret_{};
};

}  // namespace memo
