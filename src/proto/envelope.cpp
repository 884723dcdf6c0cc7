#include <limits>
#include <nlohmann/json.hpp>

#include "proto/envelope.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace envelope
{

using json = nlohmann::ordered_json;

static std::string dump_or_empty(const json &j)
{
    try
    {
        return j.dump();
    }
    catch (const json::exception &e)
    {
        LOG_ERROR("serialize: %s", e.what());
        return {};
    }
}

std::string serialize(const SingleEnvelope &e)
{
    json j;
    j["v"]  = constants::ENVELOPE_VERSION;
    j["to"] = e.to;
    j["e"]  = e.ciphertext;
    j["h"]  = e.hash;
    return dump_or_empty(j);
}

std::string serialize(const ChunkEnvelope &e)
{
    json j;
    j["v"]   = constants::ENVELOPE_VERSION;
    j["to"]  = e.to;
    j["sid"] = e.session_id;
    j["idx"] = e.index;
    j["tot"] = e.total;
    if (e.hash)
        j["h"] = *e.hash;
    j["e"] = e.data;
    return dump_or_empty(j);
}

std::string serialize(const Envelope &e)
{
    return std::visit([](const auto &x) { return serialize(x); }, e);
}

static bool get_str(const json &j, const char *key, std::string &out)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

static bool get_u32(const json &j, const char *key, std::uint32_t &out)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned())
        return false;
    const auto v = it->get<std::uint64_t>();
    if (v > std::numeric_limits<std::uint32_t>::max())
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

std::optional<Envelope> parse(std::string_view json_text)
{
    json j = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        LOG_DEBUG("parse: not a JSON object");
        return std::nullopt;
    }

    auto v = j.find("v");
    if (v == j.end() || !v->is_number_integer() ||
        v->get<std::int64_t>() != constants::ENVELOPE_VERSION)
    {
        LOG_DEBUG("parse: unsupported or missing version");
        return std::nullopt;
    }

    std::string to;
    if (!get_str(j, "to", to) || to.empty())
    {
        LOG_DEBUG("parse: missing recipient");
        return std::nullopt;
    }

    if (j.find("sid") == j.end())
    {
        SingleEnvelope s;
        s.to = std::move(to);
        if (!get_str(j, "e", s.ciphertext) || !get_str(j, "h", s.hash))
        {
            LOG_DEBUG("parse: single envelope without e/h");
            return std::nullopt;
        }
        return Envelope{std::move(s)};
    }

    ChunkEnvelope c;
    c.to = std::move(to);
    if (!get_str(j, "sid", c.session_id) || c.session_id.empty())
    {
        LOG_DEBUG("parse: bad sid");
        return std::nullopt;
    }
    if (!get_u32(j, "idx", c.index) || !get_u32(j, "tot", c.total))
    {
        LOG_DEBUG("parse: bad idx/tot");
        return std::nullopt;
    }
    if (c.total == 0 || c.index >= c.total)
    {
        LOG_DEBUG("parse: idx %u out of range for tot %u", c.index, c.total);
        return std::nullopt;
    }
    if (!get_str(j, "e", c.data))
    {
        LOG_DEBUG("parse: chunk without data");
        return std::nullopt;
    }
    if (auto h = j.find("h"); h != j.end())
    {
        if (!h->is_string())
        {
            LOG_DEBUG("parse: hash is not a string");
            return std::nullopt;
        }
        c.hash = h->get<std::string>();
    }
    return Envelope{std::move(c)};
}

std::size_t estimate_single_size(const std::string &to,
                                 const std::string &ciphertext,
                                 const std::string &hash)
{
    return serialize(SingleEnvelope{to, ciphertext, hash}).size();
}

}  // namespace envelope
