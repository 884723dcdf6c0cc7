#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/*
One ledger message. Two shapes, told apart by the presence of "sid":

  single: {"v":1,"to":<id>,"e":<ciphertext>,"h":<sha256 hex>}
  chunk:  {"v":1,"to":<id>,"sid":<token>,"idx":<n>,"tot":<n>,"h":<hex, idx 0 only>,"e":<slice>}
*/

namespace envelope
{

struct SingleEnvelope
{
    std::string to;
    std::string ciphertext;
    std::string hash;
};

struct ChunkEnvelope
{
    std::string                to;
    std::string                session_id;
    std::uint32_t              index{0};
    std::uint32_t              total{0};
    std::optional<std::string> hash{};
    std::string                data;
};

using Envelope = std::variant<SingleEnvelope, ChunkEnvelope>;

// Empty string if a field cannot be serialized (invalid UTF-8)
std::string serialize(const SingleEnvelope &e);
std::string serialize(const ChunkEnvelope &e);
std::string serialize(const Envelope &e);

// nullopt on malformed JSON, wrong version, missing/mistyped keys, idx >= tot
std::optional<Envelope> parse(std::string_view json_text);

// Serialized length of the single envelope this ciphertext would travel in
std::size_t estimate_single_size(const std::string &to,
                                 const std::string &ciphertext,
                                 const std::string &hash);

inline const std::string &recipient(const Envelope &e)
{
    return std::visit([](const auto &x) -> const std::string & { return x.to; }, e);
}

}  // namespace envelope
