#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

#include "ledger/file_ledger.hpp"
#include "ledger/memory_ledger.hpp"

using namespace ledger;

static const std::string kKind = "hive-messenger-img";

static Operation op(const std::string &sender, const std::string &json)
{
    return Operation{kKind, sender, json};
}

// Drain one account's history page by page
static std::vector<Record> all_history(ILedger &l, const std::string &account, std::size_t page)
{
    std::vector<Record>          out;
    std::optional<std::uint64_t> cursor;
    for (int guard = 0; guard < 1000; ++guard)
    {
        Page p;
        EXPECT_EQ(l.history(account, kKind, cursor, page, p), errc::Code::ok);
        out.insert(out.end(), p.records.begin(), p.records.end());
        if (!p.next_cursor)
            break;
        cursor = p.next_cursor;
    }
    return out;
}

TEST(MemoryLedger, History_NewestFirst_Paginated)
{
    MemoryLedger l;
    std::string  tx;
    for (int i = 0; i < 7; ++i)
        ASSERT_EQ(l.broadcast(op("alice", "m" + std::to_string(i)), tx), errc::Code::ok);
    ASSERT_EQ(l.broadcast(op("bob", "other"), tx), errc::Code::ok);

    Page p;
    ASSERT_EQ(l.history("alice", kKind, std::nullopt, 3, p), errc::Code::ok);
    ASSERT_EQ(p.records.size(), 3u);
    EXPECT_EQ(p.records[0].json, "m6");
    EXPECT_EQ(p.records[2].json, "m4");
    ASSERT_TRUE(p.next_cursor.has_value());

    auto all = all_history(l, "alice", 3);
    ASSERT_EQ(all.size(), 7u);
    for (std::size_t i = 0; i < all.size(); ++i)
        EXPECT_EQ(all[i].json, "m" + std::to_string(6 - i));
}

TEST(MemoryLedger, History_FiltersKindAndSender)
{
    MemoryLedger l;
    std::string  tx;
    ASSERT_EQ(l.broadcast(Operation{"other-app", "alice", "{}"}, tx), errc::Code::ok);
    ASSERT_EQ(l.broadcast(op("alice", "{}"), tx), errc::Code::ok);

    Page p;
    ASSERT_EQ(l.history("alice", kKind, std::nullopt, 10, p), errc::Code::ok);
    ASSERT_EQ(p.records.size(), 1u);
    EXPECT_EQ(p.records[0].kind, kKind);
    EXPECT_FALSE(p.next_cursor.has_value());

    ASSERT_EQ(l.history("nobody", kKind, std::nullopt, 10, p), errc::Code::ok);
    EXPECT_TRUE(p.records.empty());
}

TEST(MemoryLedger, Atomic_AllOrNothing_Ceiling)
{
    MemoryLedger l(/*ceiling=*/16);
    std::string  tx;
    std::vector<Operation> ops = {op("alice", "short"), op("alice", std::string(17, 'x'))};
    EXPECT_EQ(l.broadcast_atomic(ops, tx), errc::Code::relay_rejected);
    EXPECT_EQ(l.operation_count(), 0u);
    EXPECT_EQ(l.transaction_count(), 0u);

    ops.pop_back();
    ops.push_back(op("alice", "also short"));
    ASSERT_EQ(l.broadcast_atomic(ops, tx), errc::Code::ok);
    EXPECT_EQ(l.operation_count(), 2u);
    EXPECT_EQ(l.transaction_count(), 1u);

    auto recs = all_history(l, "alice", 10);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].tx_id, tx);
    EXPECT_EQ(recs[1].tx_id, tx);
}

TEST(MemoryLedger, Budget_ChargedPerTransaction)
{
    MemoryLedger l;
    l.set_budget("alice", 10);
    std::string tx;
    EXPECT_EQ(l.broadcast_atomic({op("alice", "123456"), op("alice", "123456")}, tx),
              errc::Code::insufficient_budget);
    EXPECT_EQ(l.operation_count(), 0u);

    ASSERT_EQ(l.broadcast(op("alice", "123456"), tx), errc::Code::ok);
    EXPECT_EQ(l.broadcast(op("alice", "123456"), tx), errc::Code::insufficient_budget);
    EXPECT_EQ(l.operation_count(), 1u);
}

TEST(MemoryLedger, RejectsEmptyOrAnonymousOps)
{
    MemoryLedger l;
    std::string  tx;
    EXPECT_EQ(l.broadcast_atomic({}, tx), errc::Code::relay_rejected);
    EXPECT_EQ(l.broadcast(Operation{kKind, "", "{}"}, tx), errc::Code::relay_rejected);
    EXPECT_EQ(l.broadcast(Operation{"", "alice", "{}"}, tx), errc::Code::relay_rejected);
}

TEST(MemoryLedger, InjectedFailures_AreOneShot)
{
    MemoryLedger l;
    std::string  tx;
    l.fail_next_broadcast(errc::Code::user_cancelled);
    EXPECT_EQ(l.broadcast(op("alice", "{}"), tx), errc::Code::user_cancelled);
    EXPECT_EQ(l.broadcast(op("alice", "{}"), tx), errc::Code::ok);

    Page p;
    l.fail_next_history(errc::Code::retrieval);
    EXPECT_EQ(l.history("alice", kKind, std::nullopt, 10, p), errc::Code::retrieval);
    EXPECT_EQ(l.history("alice", kKind, std::nullopt, 10, p), errc::Code::ok);
    EXPECT_EQ(p.records.size(), 1u);
}

TEST(MemoryLedger, Inject_BypassesValidation)
{
    MemoryLedger l(/*ceiling=*/4);
    const auto   tx = l.inject(op("alice", "far too long for the ceiling"));
    EXPECT_EQ(tx.size(), 40u);
    auto recs = all_history(l, "alice", 10);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].tx_id, tx);
}

TEST(MemoryLedger, TxIds_Distinct)
{
    MemoryLedger l;
    std::string  a, b;
    ASSERT_EQ(l.broadcast(op("alice", "same"), a), errc::Code::ok);
    ASSERT_EQ(l.broadcast(op("alice", "same"), b), errc::Code::ok);
    EXPECT_NE(a, b);
}

namespace
{
struct TempDir
{
    std::filesystem::path path;
    TempDir()
    {
        path = std::filesystem::temp_directory_path() /
               ("blobcast-ledger-test-" + std::to_string(::getpid()) + "-" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};
}  // namespace

TEST(FileLedger, MissingFile_IsEmptyHistory)
{
    TempDir    d;
    FileLedger l((d.path / "ledger.jsonl").string());
    Page       p;
    ASSERT_EQ(l.history("alice", kKind, std::nullopt, 10, p), errc::Code::ok);
    EXPECT_TRUE(p.records.empty());
    EXPECT_FALSE(p.next_cursor.has_value());
}

TEST(FileLedger, Persists_AcrossInstances)
{
    TempDir           d;
    const std::string path = (d.path / "sub" / "ledger.jsonl").string();
    std::string       tx1, tx2;
    {
        FileLedger l(path);
        ASSERT_EQ(l.broadcast(op("alice", R"({"v":1})"), tx1), errc::Code::ok);
        ASSERT_EQ(l.broadcast_atomic({op("alice", "a"), op("alice", "b")}, tx2), errc::Code::ok);
    }
    EXPECT_NE(tx1, tx2);

    FileLedger l(path);
    auto       recs = all_history(l, "alice", 2);
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].json, "b");
    EXPECT_EQ(recs[1].json, "a");
    EXPECT_EQ(recs[2].json, R"({"v":1})");
    EXPECT_EQ(recs[0].tx_id, tx2);
    EXPECT_EQ(recs[2].tx_id, tx1);
    EXPECT_GT(recs[0].block, recs[2].block);
}

TEST(FileLedger, SkipsUnreadableLines)
{
    TempDir           d;
    const std::string path = (d.path / "ledger.jsonl").string();
    std::string       tx;
    {
        FileLedger l(path);
        ASSERT_EQ(l.broadcast(op("alice", "first"), tx), errc::Code::ok);
    }
    {
        std::ofstream out(path, std::ios::app);
        out << "garbage line\n";
        out << R"({"tx":"x","ops":[{"kind":1}]})" << "\n";
    }
    FileLedger l(path);
    ASSERT_EQ(l.broadcast(op("alice", "second"), tx), errc::Code::ok);

    auto recs = all_history(l, "alice", 10);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].json, "second");
    EXPECT_EQ(recs[1].json, "first");
}

TEST(FileLedger, CeilingRejectsWholeTransaction)
{
    TempDir    d;
    FileLedger l((d.path / "ledger.jsonl").string(), /*ceiling=*/8);
    std::string tx;
    EXPECT_EQ(l.broadcast_atomic({op("alice", "ok"), op("alice", "way too long")}, tx),
              errc::Code::relay_rejected);
    EXPECT_TRUE(all_history(l, "alice", 10).empty());
}
