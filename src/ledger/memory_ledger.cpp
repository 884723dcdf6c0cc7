#include <chrono>

#include "ledger/memory_ledger.hpp"
#include "util/log.hpp"

namespace ledger
{

static std::uint64_t now_ms()
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

errc::Code MemoryLedger::broadcast(const Operation &op, std::string &tx_id)
{
    std::lock_guard<std::mutex> lk(mu_);
    return commit_locked({op}, tx_id);
}

errc::Code MemoryLedger::broadcast_atomic(const std::vector<Operation> &ops, std::string &tx_id)
{
    std::lock_guard<std::mutex> lk(mu_);
    return commit_locked(ops, tx_id);
}

errc::Code MemoryLedger::commit_locked(const std::vector<Operation> &ops, std::string &tx_id)
{
    if (fail_broadcast_)
    {
        const errc::Code c = *fail_broadcast_;
        fail_broadcast_.reset();
        LOG_WARN("MemoryLedger: injected broadcast failure (%s)", errc::name(c));
        return c;
    }
    if (auto rc = check_operations(ops, ceiling_); rc != errc::Code::ok)
        return rc;

    // budget is charged per signer; checked for the whole tx before anything lands
    std::unordered_map<std::string, std::size_t> cost;
    for (const auto &op : ops)
        cost[op.sender] += op.json.size();
    for (const auto &kv : cost)
    {
        auto b = budget_.find(kv.first);
        if (b != budget_.end() && b->second < kv.second)
        {
            LOG_WARN("MemoryLedger: %s lacks budget (%zu < %zu)", kv.first.c_str(), b->second,
                     kv.second);
            return errc::Code::insufficient_budget;
        }
    }
    for (const auto &kv : cost)
    {
        auto b = budget_.find(kv.first);
        if (b != budget_.end())
            b->second -= kv.second;
    }

    ++block_;
    ++tx_count_;
    tx_id                  = make_tx_id(block_, ops);
    const std::uint64_t ts = now_ms();
    for (const auto &op : ops)
    {
        Record r;
        r.tx_id     = tx_id;
        r.seq       = next_seq_[op.sender]++;
        r.block     = block_;
        r.timestamp = ts;
        r.kind      = op.kind;
        r.sender    = op.sender;
        r.json      = op.json;
        records_.push_back(std::move(r));
    }
    LOG_DEBUG("MemoryLedger: tx %s with %zu ops at block %llu", tx_id.c_str(), ops.size(),
              (unsigned long long)block_);
    return errc::Code::ok;
}

errc::Code MemoryLedger::history(const std::string           &account,
                                 const std::string           &kind,
                                 std::optional<std::uint64_t> cursor,
                                 std::size_t                  page_size,
                                 Page                        &out)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (fail_history_)
    {
        const errc::Code c = *fail_history_;
        fail_history_.reset();
        LOG_WARN("MemoryLedger: injected history failure (%s)", errc::name(c));
        return c;
    }

    std::vector<Record> mine;
    for (auto it = records_.rbegin(); it != records_.rend(); ++it)
    {
        if (it->sender == account && it->kind == kind)
            mine.push_back(*it);
    }
    paginate(mine, cursor, page_size, out);
    return errc::Code::ok;
}

void MemoryLedger::set_budget(const std::string &account, std::size_t bytes)
{
    std::lock_guard<std::mutex> lk(mu_);
    budget_[account] = bytes;
}

void MemoryLedger::fail_next_broadcast(errc::Code c)
{
    std::lock_guard<std::mutex> lk(mu_);
    fail_broadcast_ = c;
}

void MemoryLedger::fail_next_history(errc::Code c)
{
    std::lock_guard<std::mutex> lk(mu_);
    fail_history_ = c;
}

std::string MemoryLedger::inject(const Operation &op)
{
    std::lock_guard<std::mutex> lk(mu_);
    ++block_;
    ++tx_count_;
    Record r;
    r.tx_id     = make_tx_id(block_, {op});
    r.seq       = next_seq_[op.sender]++;
    r.block     = block_;
    r.timestamp = now_ms();
    r.kind      = op.kind;
    r.sender    = op.sender;
    r.json      = op.json;
    records_.push_back(r);
    return r.tx_id;
}

std::size_t MemoryLedger::transaction_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return tx_count_;
}

std::size_t MemoryLedger::operation_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

}  // namespace ledger
