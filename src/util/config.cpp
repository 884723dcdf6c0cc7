#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

std::optional<std::size_t> parse_bounded(const char *s, std::size_t lo, std::size_t hi)
{
    if (!s || !*s || !std::isdigit(static_cast<unsigned char>(*s)))
        return std::nullopt;
    char *end = nullptr;
    errno     = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return std::nullopt;
    if (v < lo || v > hi)
        return std::nullopt;
    return static_cast<std::size_t>(v);
}

static bool is_hex64(const char *s)
{
    if (std::strlen(s) != 64)
        return false;
    for (const char *p = s; *p; ++p)
    {
        if (!std::isxdigit(static_cast<unsigned char>(*p)))
            return false;
    }
    return true;
}

Settings from_env()
{
    Settings s{};
    s.ledger_path = constants::ledger_path();

    if (const char *e = std::getenv("BLOBCAST_CHANNEL"); e && *e)
        s.channel = e;

    if (const char *e = std::getenv("BLOBCAST_PAGE_SIZE"))
    {
        if (auto v = parse_bounded(e, 1, 1000))
            s.page_size = *v;
        else
            LOG_WARN("Ignoring invalid BLOBCAST_PAGE_SIZE='%s' (expect 1..1000)", e);
    }

    if (const char *e = std::getenv("BLOBCAST_MAX_PAGES"))
    {
        if (auto v = parse_bounded(e, 1, 100))
            s.max_pages = *v;
        else
            LOG_WARN("Ignoring invalid BLOBCAST_MAX_PAGES='%s' (expect 1..100)", e);
    }

    if (const char *e = std::getenv("BLOBCAST_MEMO_SECRET"); e && *e)
    {
        if (is_hex64(e))
            s.memo_secret_hex = std::string(e);
        else
            LOG_WARN("Ignoring BLOBCAST_MEMO_SECRET (expect 64 hex chars)");
    }

    LOG_DEBUG("Config: ledger=%s channel=%s page_size=%zu max_pages=%zu memo=%s",
              s.ledger_path.c_str(), s.channel.c_str(), s.page_size, s.max_pages,
              s.memo_secret_hex ? "sodium" : "noop");
    return s;
}

}  // namespace config
