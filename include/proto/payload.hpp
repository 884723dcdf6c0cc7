#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "util/errc.hpp"

/*
Compact payload (plaintext handed to the memo cipher, after a '#' marker):

  {"t":<to>,"f":<from>,"i":<image text>,"m":<caption, omitted if empty>,
   "n":<filename>,"c":<mime>,"ts":<unix ms>}

Key order is fixed and output carries no whitespace, so the text is canonical
and its SHA-256 is the integrity hash. The image text is sent as-is: it was
compressed upstream and is never compressed again here.
*/

namespace payload
{

struct Payload
{
    std::string                image_data;  // already-compressed image as text (base64)
    std::optional<std::string> caption{};
    std::string                filename;
    std::string                content_type;
    std::string                from;
    std::string                to;
    std::int64_t               timestamp{0};  // unix ms

    bool operator==(const Payload &o) const
    {
        return image_data == o.image_data && caption == o.caption && filename == o.filename &&
               content_type == o.content_type && from == o.from && to == o.to &&
               timestamp == o.timestamp;
    }
    bool operator!=(const Payload &o) const { return !(*this == o); }
};

// Canonical serialized compact form
struct CompactPayload
{
    std::string text;
};

// ok or validation (missing required field, invalid UTF-8)
errc::Code encode(const Payload &p, CompactPayload &out);

// ok or parse (bad JSON, missing key, wrong type)
errc::Code decode(const CompactPayload &c, Payload &out);

// SHA-256 hex over the canonical text
std::string hash(const CompactPayload &c);

// Field checks applied by encode
errc::Code validate(const Payload &p);

}  // namespace payload
