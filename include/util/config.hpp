#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace config
{

struct Settings
{
    std::string                ledger_path;
    std::string                channel   = std::string(constants::CHANNEL_KIND);
    std::size_t                page_size = constants::DEFAULT_PAGE_SIZE;
    std::size_t                max_pages = constants::DEFAULT_MAX_PAGES;
    std::optional<std::string> memo_secret_hex{};  // unset => no-op memo cipher
};

// Read BLOBCAST_* variables. Invalid values are logged and replaced by defaults.
Settings from_env();

// Parses a decimal in [lo, hi]; nullopt on junk or out of range.
std::optional<std::size_t> parse_bounded(const char *s, std::size_t lo, std::size_t hi);

}  // namespace config
