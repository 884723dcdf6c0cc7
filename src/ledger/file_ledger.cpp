#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <unordered_map>

#include "ledger/file_ledger.hpp"
#include "util/log.hpp"

namespace ledger
{
namespace fs = std::filesystem;
using json   = nlohmann::ordered_json;

static bool ensure_parent_dir(const std::string &path)
{
    std::error_code ec;
    fs::path        dir = fs::path(path).parent_path();
    if (dir.empty())
        return true;  // file in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    return true;
}

FileLedger::FileLedger(std::string path, std::size_t ceiling)
    : path_(std::move(path)), ceiling_(ceiling)
{
}

bool FileLedger::load(std::vector<Record> &out, std::uint64_t &last_block) const
{
    out.clear();
    last_block = 0;

    std::error_code ec;
    if (!fs::exists(path_, ec))
        return !ec;

    std::ifstream in(path_);
    if (!in)
    {
        LOG_ERROR("FileLedger: cannot open %s", path_.c_str());
        return false;
    }

    std::unordered_map<std::string, std::uint64_t> next_seq;
    std::string                                     line;
    std::size_t                                     lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        if (line.empty())
            continue;
        json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object() || !j.contains("tx") || !j["tx"].is_string() ||
            !j.contains("ops") || !j["ops"].is_array())
        {
            LOG_WARN("FileLedger: skipping unreadable line %zu", lineno);
            continue;
        }
        auto u64_or_zero = [&j](const char *key) -> std::uint64_t {
            auto it = j.find(key);
            return (it != j.end() && it->is_number_unsigned()) ? it->get<std::uint64_t>() : 0;
        };
        const std::uint64_t block = u64_or_zero("block");
        const std::uint64_t ts    = u64_or_zero("ts");
        if (block > last_block)
            last_block = block;

        for (const auto &op : j["ops"])
        {
            if (!op.is_object() || !op.contains("kind") || !op["kind"].is_string() ||
                !op.contains("sender") || !op["sender"].is_string() || !op.contains("json") ||
                !op["json"].is_string())
            {
                LOG_WARN("FileLedger: skipping malformed op on line %zu", lineno);
                continue;
            }
            Record r;
            r.tx_id     = j["tx"].get<std::string>();
            r.block     = block;
            r.timestamp = ts;
            r.kind      = op["kind"].get<std::string>();
            r.sender    = op["sender"].get<std::string>();
            r.json      = op["json"].get<std::string>();
            r.seq       = next_seq[r.sender]++;
            out.push_back(std::move(r));
        }
    }
    if (in.bad())
    {
        LOG_ERROR("FileLedger: read error on %s", path_.c_str());
        return false;
    }
    return true;
}

errc::Code FileLedger::broadcast(const Operation &op, std::string &tx_id)
{
    return broadcast_atomic({op}, tx_id);
}

errc::Code FileLedger::broadcast_atomic(const std::vector<Operation> &ops, std::string &tx_id)
{
    if (auto rc = check_operations(ops, ceiling_); rc != errc::Code::ok)
        return rc;

    std::vector<Record> existing;
    std::uint64_t       last_block = 0;
    if (!load(existing, last_block))
        return errc::Code::relay_rejected;

    const std::uint64_t block = last_block + 1;
    const auto          ts    = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const std::string id = make_tx_id(block, ops);

    json tx;
    tx["tx"]    = id;
    tx["block"] = block;
    tx["ts"]    = ts;
    tx["ops"]   = json::array();
    for (const auto &op : ops)
    {
        json o;
        o["kind"]   = op.kind;
        o["sender"] = op.sender;
        o["json"]   = op.json;
        tx["ops"].push_back(std::move(o));
    }

    std::string line;
    try
    {
        line = tx.dump();
    }
    catch (const json::exception &e)
    {
        LOG_ERROR("FileLedger: cannot serialize transaction: %s", e.what());
        return errc::Code::relay_rejected;
    }
    line.push_back('\n');

    if (!ensure_parent_dir(path_))
        return errc::Code::relay_rejected;

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        LOG_ERROR("FileLedger: open(%s) failed: %s", path_.c_str(), std::strerror(errno));
        return errc::Code::relay_rejected;
    }
    const ssize_t n = ::write(fd, line.data(), line.size());
    const int     saved_errno = errno;
    ::close(fd);
    if (n != static_cast<ssize_t>(line.size()))
    {
        LOG_ERROR("FileLedger: short write to %s: %s", path_.c_str(),
                  n < 0 ? std::strerror(saved_errno) : "partial");
        return errc::Code::relay_rejected;
    }

    tx_id = id;
    LOG_DEBUG("FileLedger: tx %s with %zu ops at block %llu", id.c_str(), ops.size(),
              (unsigned long long)block);
    return errc::Code::ok;
}

errc::Code FileLedger::history(const std::string           &account,
                               const std::string           &kind,
                               std::optional<std::uint64_t> cursor,
                               std::size_t                  page_size,
                               Page                        &out)
{
    std::vector<Record> all;
    std::uint64_t       last_block = 0;
    if (!load(all, last_block))
        return errc::Code::retrieval;

    std::vector<Record> mine;
    for (auto it = all.rbegin(); it != all.rend(); ++it)
    {
        if (it->sender == account && it->kind == kind)
            mine.push_back(std::move(*it));
    }
    paginate(mine, cursor, page_size, out);
    return errc::Code::ok;
}

}  // namespace ledger
