// tests/test_cli.cpp
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace test_cli
{
namespace fs = std::filesystem;

static fs::path temp_dir()
{
    const char *tmp  = std::getenv("TMPDIR");
    fs::path    base = (tmp && *tmp) ? fs::path(tmp) : fs::path("/tmp");
    fs::path    dir  = base / ("blobcast-cli-test-" + std::to_string(::getpid()));
    fs::create_directories(dir);
    return dir;
}

static int run_cli(const std::string &ledger, const std::string &args, std::string *out = nullptr)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "BLOBCAST_LOG_LEVEL=error BLOBCAST_MEMO_SECRET="
                      "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff "
                      "./bin/blobcast --ledger " +
                      ledger + " " + args;
    if (!out)
    {
        int rc = std::system(cmd.c_str());
        if (rc == -1)
            return -1;
        return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
    }

    FILE *p = ::popen(cmd.c_str(), "r");
    if (!p)
        return -1;
    char buf[512];
    out->clear();
    while (std::fgets(buf, sizeof(buf), p))
        *out += buf;
    int rc = ::pclose(p);
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

static std::vector<char> slurp(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
}  // namespace test_cli

TEST(CLI, SendFetchOpen)
{
    namespace fs             = std::filesystem;
    const fs::path    dir    = test_cli::temp_dir();
    const std::string ledger = (dir / "ledger.jsonl").string();
    fs::remove(ledger);

    // a "large" image so the chunked path is used, and a small one
    const fs::path big   = dir / "big.png";
    const fs::path small = dir / "small.png";
    {
        std::ofstream b(big, std::ios::binary);
        for (int i = 0; i < 20000; ++i)
            b.put(static_cast<char>(i * 31));
        std::ofstream s(small, std::ios::binary);
        s << "\x89PNG tiny";
    }

    std::string out;
    ASSERT_EQ(test_cli::run_cli(ledger, "send --from alice --to bob --file " + big.string() +
                                            " --caption \"hello bob\"",
                                &out),
              0);
    EXPECT_NE(out.find("chunked"), std::string::npos) << out;
    const std::string big_tx = out.substr(0, out.find(' '));

    ASSERT_EQ(test_cli::run_cli(ledger, "send --from bob --to alice --file " + small.string(), &out),
              0);
    EXPECT_NE(out.find("single"), std::string::npos) << out;

    ASSERT_EQ(test_cli::run_cli(ledger, "fetch --as bob --with alice", &out), 0);
    EXPECT_NE(out.find(big_tx), std::string::npos) << out;
    EXPECT_NE(out.find("bob -> alice"), std::string::npos) << out;

    const fs::path got = dir / "got.png";
    ASSERT_EQ(test_cli::run_cli(ledger,
                                "open --as bob --with alice --tx " + big_tx + " --out " +
                                    got.string(),
                                &out),
              0);
    EXPECT_NE(out.find("caption: hello bob"), std::string::npos) << out;
    EXPECT_EQ(test_cli::slurp(got), test_cli::slurp(big));

    // a third party cannot open it
    EXPECT_EQ(test_cli::run_cli(ledger, "open --as carol --with alice --tx " + big_tx), 2);

    fs::remove_all(dir);
}

TEST(CLI, BadArguments)
{
    const auto        dir    = test_cli::temp_dir();
    const std::string ledger = (dir / "unused.jsonl").string();
    EXPECT_EQ(test_cli::run_cli(ledger, "bogus"), 2);
    EXPECT_EQ(test_cli::run_cli(ledger, "send --from alice"), 2);
    EXPECT_EQ(test_cli::run_cli(ledger, "fetch --as"), 2);
    EXPECT_EQ(test_cli::run_cli(ledger, "send --from a --to b --file /nonexistent/x.png"), 3);
    EXPECT_EQ(test_cli::run_cli(ledger, "send --from a --to b --file notes.txt"), 2);
    std::filesystem::remove_all(dir);
}
