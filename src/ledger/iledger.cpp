#include "crypto/digest.hpp"
#include "ledger/iledger.hpp"
#include "util/log.hpp"

namespace ledger
{

errc::Code check_operations(const std::vector<Operation> &ops, std::size_t ceiling)
{
    if (ops.empty())
    {
        LOG_ERROR("check_operations: empty transaction");
        return errc::Code::relay_rejected;
    }
    for (const auto &op : ops)
    {
        if (op.kind.empty() || op.sender.empty())
        {
            LOG_ERROR("check_operations: op without kind or sender");
            return errc::Code::relay_rejected;
        }
        if (op.json.size() > ceiling)
        {
            LOG_ERROR("check_operations: op of %zu bytes exceeds ceiling %zu", op.json.size(),
                      ceiling);
            return errc::Code::relay_rejected;
        }
    }
    return errc::Code::ok;
}

std::string make_tx_id(std::uint64_t block, const std::vector<Operation> &ops)
{
    std::string material = std::to_string(block);
    for (const auto &op : ops)
    {
        material.push_back('\n');
        material += op.sender;
        material.push_back('\n');
        material += op.json;
    }
    return digest::sha256_hex(material).substr(0, 40);
}

void paginate(const std::vector<Record>   &newest_first,
              std::optional<std::uint64_t> cursor,
              std::size_t                  page_size,
              Page                        &out)
{
    out.records.clear();
    out.next_cursor.reset();

    std::size_t i = 0;
    if (cursor)
    {
        while (i < newest_first.size() && newest_first[i].seq > *cursor)
            ++i;
    }
    for (; i < newest_first.size() && out.records.size() < page_size; ++i)
        out.records.push_back(newest_first[i]);

    if (i < newest_first.size())
        out.next_cursor = newest_first[i].seq;
}

}  // namespace ledger
