#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <unordered_map>
#include <vector>

#include "app/message_service.hpp"
#include "crypto/memo_cipher.hpp"
#include "ledger/file_ledger.hpp"
#include "media/image.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  blobcast [--ledger <path>] <command> [options]\n"
                         "\n"
                         "Commands:\n"
                         "  send  --from <id> --to <id> --file <path> [--caption <text>] "
                         "[--type <mime>]\n"
                         "  fetch --as <id> --with <id>\n"
                         "  open  --as <id> --with <id> --tx <tx-or-session id> [--out <path>]\n");
}

// "--key value" pairs after the command name
using Options = std::unordered_map<std::string, std::string>;

static bool parse_options(const std::vector<std::string> &args, Options &out)
{
    for (size_t i = 1; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a.rfind("--", 0) != 0 || a.size() < 3 || i + 1 >= args.size())
        {
            std::fprintf(stderr, "error: unexpected argument: %s\n", a.c_str());
            return false;
        }
        out[a.substr(2)] = args[++i];
    }
    return true;
}

static bool require(const Options &o, std::initializer_list<const char *> keys)
{
    for (const char *k : keys)
    {
        auto it = o.find(k);
        if (it == o.end() || it->second.empty())
        {
            std::fprintf(stderr, "error: missing --%s\n", k);
            return false;
        }
    }
    return true;
}

static const std::string &opt(const Options &o, const char *key)
{
    static const std::string empty;
    auto                     it = o.find(key);
    return it == o.end() ? empty : it->second;
}

static bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

static bool write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return false;
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

static std::string basename_of(const std::string &path)
{
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static int exit_for(errc::Code rc)
{
    switch (rc)
    {
        case errc::Code::ok:
            return exitc::ok;
        case errc::Code::validation:
            return exitc::bad_args;
        case errc::Code::incomplete_session:
            return exitc::pending;
        default:
            return exitc::pipeline;
    }
}

static std::unique_ptr<memo::MemoCipher> make_cipher(const config::Settings &s)
{
    if (s.memo_secret_hex)
    {
        if (auto c = memo::SodiumMemoCipher::FromHex(*s.memo_secret_hex))
            return std::make_unique<memo::SodiumMemoCipher>(std::move(*c));
        LOG_WARN("BLOBCAST_MEMO_SECRET rejected; memos go out unencrypted");
    }
    else
    {
        LOG_WARN("BLOBCAST_MEMO_SECRET not set; memos go out unencrypted");
    }
    return std::make_unique<memo::NoopMemoCipher>();
}

struct Context
{
    app::MessageService &service;
};

static int cmd_send(Context &ctx, const Options &o)
{
    if (!require(o, {"from", "to", "file"}))
    {
        print_usage();
        return exitc::bad_args;
    }
    const std::string &path = opt(o, "file");
    std::string        type = opt(o, "type");
    if (type.empty())
        type = media::guess_content_type(path);
    if (type.empty())
    {
        std::fprintf(stderr, "error: cannot tell image type of %s; pass --type\n", path.c_str());
        return exitc::bad_args;
    }

    std::vector<std::uint8_t> bytes;
    if (!read_file(path, bytes))
    {
        std::fprintf(stderr, "error: cannot read %s\n", path.c_str());
        return exitc::io_error;
    }

    media::PreparedImage img;
    if (auto rc = media::prepare_image(bytes, basename_of(path), type, img); rc != errc::Code::ok)
        return exit_for(rc);

    payload::Payload p;
    p.image_data   = std::move(img.text);
    p.filename     = std::move(img.filename);
    p.content_type = std::move(img.content_type);
    p.from         = opt(o, "from");
    p.to           = opt(o, "to");
    p.timestamp    = now_ms();
    if (!opt(o, "caption").empty())
        p.caption = opt(o, "caption");

    app::BroadcastResult res;
    if (auto rc = ctx.service.send_image(p, res); rc != errc::Code::ok)
    {
        std::fprintf(stderr, "error: send failed: %s\n", errc::name(rc));
        return exit_for(rc);
    }
    std::printf("%s %s ops=%zu%s%s\n", res.tx_id.c_str(),
                res.strategy == frag::Strategy::Single ? "single" : "chunked", res.operations,
                res.session_id.empty() ? "" : " sid=", res.session_id.c_str());
    return exitc::ok;
}

static int cmd_fetch(Context &ctx, const Options &o)
{
    if (!require(o, {"as", "with"}))
    {
        print_usage();
        return exitc::bad_args;
    }
    app::ScanResult scan;
    const auto      rc = ctx.service.fetch_conversation(opt(o, "as"), opt(o, "with"), scan);
    for (const auto &m : scan.messages)
    {
        std::printf("%s %s -> %s ts=%llu chunks=%u\n", m.tx_id.c_str(), m.from.c_str(),
                    m.to.c_str(), (unsigned long long)m.timestamp, m.chunks);
    }
    for (const auto &p : scan.pending)
    {
        std::printf("pending %s from=%s %zu/%u\n", p.session_id.c_str(), p.from.c_str(),
                    p.received, p.total);
    }
    if (rc != errc::Code::ok)
    {
        std::fprintf(stderr, "error: history incomplete: %s\n", errc::name(rc));
        return exit_for(rc);
    }
    return exitc::ok;
}

static int cmd_open(Context &ctx, const Options &o)
{
    if (!require(o, {"as", "with", "tx"}))
    {
        print_usage();
        return exitc::bad_args;
    }
    const std::string &viewer = opt(o, "as");

    app::ScanResult scan;
    if (auto rc = ctx.service.fetch_conversation(viewer, opt(o, "with"), scan);
        rc != errc::Code::ok)
        LOG_WARN("history only partly read (%s); looking in what was found", errc::name(rc));

    app::RetrievedMessage m;
    if (auto rc = app::locate(scan, opt(o, "tx"), m); rc != errc::Code::ok)
    {
        std::fprintf(stderr, "error: %s: %s\n", opt(o, "tx").c_str(),
                     rc == errc::Code::incomplete_session ? "still missing fragments"
                                                          : "not found");
        return exit_for(rc);
    }

    payload::Payload p;
    if (auto rc = ctx.service.open_message(m, viewer, p); rc != errc::Code::ok)
    {
        std::fprintf(stderr, "error: open failed: %s\n", errc::name(rc));
        return exit_for(rc);
    }

    std::printf("from=%s to=%s file=%s type=%s ts=%lld\n", p.from.c_str(), p.to.c_str(),
                p.filename.c_str(), p.content_type.c_str(), (long long)p.timestamp);
    if (p.caption)
        std::printf("caption: %s\n", p.caption->c_str());

    const std::string &out_path = opt(o, "out");
    if (out_path.empty())
        return exitc::ok;

    std::vector<std::uint8_t> bytes;
    if (auto rc = media::decode_image(p.image_data, bytes); rc != errc::Code::ok)
        return exit_for(rc);
    if (!write_file(out_path, bytes))
    {
        std::fprintf(stderr, "error: cannot write %s\n", out_path.c_str());
        return exitc::io_error;
    }
    LOG_SYSTEM("wrote %zu bytes to %s", bytes.size(), out_path.c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args, Context &ctx)
{
    std::unordered_map<std::string, std::function<int(const Options &)>> cmd_map = {
        {"send", [&](const Options &o) { return cmd_send(ctx, o); }},
        {"fetch", [&](const Options &o) { return cmd_fetch(ctx, o); }},
        {"open", [&](const Options &o) { return cmd_open(ctx, o); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    Options o;
    if (!parse_options(args, o))
    {
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second(o);
}
}  // namespace

int main(int argc, char **argv)
{
    blobcast::set_log_level_from_env();
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    config::Settings settings = config::from_env();

    std::vector<std::string> args;
    args.reserve(argc - 1);

    // --ledger overrides BLOBCAST_LEDGER
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--ledger" && args.empty() && i + 1 < argc)
        {
            settings.ledger_path = argv[++i];
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    auto               cipher = make_cipher(settings);
    ledger::FileLedger ledger(settings.ledger_path);

    app::ServiceSettings ss;
    ss.channel   = settings.channel;
    ss.page_size = settings.page_size;
    ss.max_pages = settings.max_pages;
    app::MessageService service(ledger, *cipher, ss);

    Context ctx{service};
    return run_cmd(args[0], args, ctx);
}
