#include <nlohmann/json.hpp>

#include "crypto/digest.hpp"
#include "proto/payload.hpp"
#include "util/log.hpp"

namespace payload
{

using json = nlohmann::ordered_json;

// short keys on the wire
static constexpr const char K_TO[]      = "t";
static constexpr const char K_FROM[]    = "f";
static constexpr const char K_IMAGE[]   = "i";
static constexpr const char K_CAPTION[] = "m";
static constexpr const char K_NAME[]    = "n";
static constexpr const char K_TYPE[]    = "c";
static constexpr const char K_TS[]      = "ts";

errc::Code validate(const Payload &p)
{
    if (p.from.empty() || p.to.empty())
    {
        LOG_ERROR("validate: sender and recipient are required");
        return errc::Code::validation;
    }
    if (p.image_data.empty())
    {
        LOG_ERROR("validate: empty image data");
        return errc::Code::validation;
    }
    if (p.filename.empty() || p.content_type.empty())
    {
        LOG_ERROR("validate: filename and content type are required");
        return errc::Code::validation;
    }
    return errc::Code::ok;
}

errc::Code encode(const Payload &p, CompactPayload &out)
{
    if (auto rc = validate(p); rc != errc::Code::ok)
        return rc;

    json j;
    j[K_TO]    = p.to;
    j[K_FROM]  = p.from;
    j[K_IMAGE] = p.image_data;
    if (p.caption && !p.caption->empty())
        j[K_CAPTION] = *p.caption;
    j[K_NAME] = p.filename;
    j[K_TYPE] = p.content_type;
    j[K_TS]   = p.timestamp;

    try
    {
        out.text = j.dump();
    }
    catch (const json::exception &e)
    {
        // strings that are not valid UTF-8
        LOG_ERROR("encode: %s", e.what());
        return errc::Code::validation;
    }
    TLOG_DEBUG(Encode, "compact payload %zu bytes (image %zu)", out.text.size(),
               p.image_data.size());
    return errc::Code::ok;
}

errc::Code decode(const CompactPayload &c, Payload &out)
{
    json j = json::parse(c.text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        LOG_WARN("decode: compact payload is not a JSON object");
        return errc::Code::parse;
    }

    auto str_field = [&j](const char *key, std::string &dst) -> bool {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string())
            return false;
        dst = it->get<std::string>();
        return true;
    };

    Payload p;
    if (!str_field(K_TO, p.to) || !str_field(K_FROM, p.from) ||
        !str_field(K_IMAGE, p.image_data) || !str_field(K_NAME, p.filename) ||
        !str_field(K_TYPE, p.content_type))
    {
        LOG_WARN("decode: missing or mistyped required key");
        return errc::Code::parse;
    }

    auto ts = j.find(K_TS);
    if (ts == j.end() || !ts->is_number_integer())
    {
        LOG_WARN("decode: missing or mistyped timestamp");
        return errc::Code::parse;
    }
    p.timestamp = ts->get<std::int64_t>();

    if (auto m = j.find(K_CAPTION); m != j.end())
    {
        if (!m->is_string())
        {
            LOG_WARN("decode: caption is not a string");
            return errc::Code::parse;
        }
        p.caption = m->get<std::string>();
    }

    out = std::move(p);
    return errc::Code::ok;
}

std::string hash(const CompactPayload &c)
{
    return digest::sha256_hex(c.text);
}

}  // namespace payload
