// ulid command line tool
//
//     ulid generate [-n COUNT] [-t MS] [--hex]
//     ulid encode HEX
//     ulid decode TEXT
//     ulid valid TEXT
//     ulid inspect TEXT
//     ulid store add LABEL [ID] | get ID | rm ID | ls
//
// Global flags: -v/--verbose, -q/--quiet, --no-color, --config PATH

#include <ulid/config.hpp>
#include <ulid/generator.hpp>
#include <ulid/log.hpp>
#include <ulid/store.hpp>
#include <ulid/ulid.hpp>

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ulid;

static const int EXIT_USAGE = 2;

static void print_usage() {
    std::cerr <<
        "usage: ulid [options] <command> [args]\n"
        "\n"
        "commands:\n"
        "  generate [-n COUNT] [-t MS] [--hex]   print new identifiers\n"
        "  encode HEX                            32 hex digits -> text\n"
        "  decode TEXT                           text -> 32 hex digits\n"
        "  valid TEXT                            print true/false\n"
        "  inspect TEXT                          show timestamp and randomness\n"
        "  store add LABEL [ID]                  record an id\n"
        "  store get ID | rm ID | ls             query the id store\n"
        "\n"
        "options:\n"
        "  -v, --verbose      debug output\n"
        "  -q, --quiet        errors only\n"
        "  --no-color         disable colored log output\n"
        "  --config PATH      config file (default ~/.ulid/config.toml)\n";
}

static int report(const UlidError& err) {
    log::error("%s", err.format().c_str());
    return 1;
}

static Result<uint64_t> parse_u64(const std::string& s, const char* what) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return UlidError(UlidError::InvalidArg,
            std::string("invalid ") + what + ": '" + s + "'",
            "expected a non-negative integer");
    }
    try {
        return Result<uint64_t>::ok(std::stoull(s));
    } catch (const std::out_of_range&) {
        return UlidError(UlidError::InvalidArg,
            std::string(what) + " out of range: " + s);
    }
}

static std::string format_utc(uint64_t ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03uZ", buf, static_cast<unsigned>(ms % 1000));
    return out;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_generate(const std::vector<std::string>& args, const Config& cfg) {
    int count = cfg.generate_count;
    OutputFormat format = cfg.format;
    bool have_ts = false;
    uint64_t ts = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if ((a == "-n" || a == "-t") && i + 1 >= args.size()) {
            log::error("%s requires a value", a.c_str());
            return EXIT_USAGE;
        }
        if (a == "-n") {
            auto n = parse_u64(args[++i], "count");
            if (n.is_err()) return report(n.error());
            if (n.value() == 0 || n.value() > static_cast<uint64_t>(MAX_GENERATE_COUNT)) {
                return report(UlidError(UlidError::InvalidArg,
                    "count must be between 1 and " + std::to_string(MAX_GENERATE_COUNT)));
            }
            count = static_cast<int>(n.value());
        } else if (a == "-t") {
            auto t = parse_u64(args[++i], "timestamp");
            if (t.is_err()) return report(t.error());
            ts = t.value();
            have_ts = true;
        } else if (a == "--hex") {
            format = OutputFormat::Hex;
        } else {
            log::error("unknown generate option '%s'", a.c_str());
            return EXIT_USAGE;
        }
    }

    Generator gen;
    if (have_ts) {
        // Surface out-of-range timestamps instead of silently truncating
        auto checked = gen.at_checked(ts);
        if (checked.is_err()) return report(checked.error());
    }
    log::debug("generating %d id(s) as %s", count, output_format_name(format));

    for (int i = 0; i < count; ++i) {
        Ulid u = have_ts ? gen.at_binary(ts) : gen.next_binary();
        std::cout << (format == OutputFormat::Hex ? u.to_hex() : u.to_string()) << "\n";
    }
    return 0;
}

static int cmd_encode(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        log::error("encode takes exactly one argument");
        return EXIT_USAGE;
    }
    auto u = Ulid::from_hex(args[0]);
    if (u.is_err()) return report(u.error());
    std::cout << u.value().to_string() << "\n";
    return 0;
}

static int cmd_decode(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        log::error("decode takes exactly one argument");
        return EXIT_USAGE;
    }
    auto u = Ulid::parse(args[0]);
    if (u.is_err()) return report(u.error());
    std::cout << u.value().to_hex() << "\n";
    return 0;
}

static int cmd_valid(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        log::error("valid takes exactly one argument");
        return EXIT_USAGE;
    }
    bool ok = valid(args[0]);
    std::cout << (ok ? "true" : "false") << "\n";
    return ok ? 0 : 1;
}

static int cmd_inspect(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        log::error("inspect takes exactly one argument");
        return EXIT_USAGE;
    }
    auto u = Ulid::parse(args[0]);
    if (u.is_err()) return report(u.error());

    const Ulid& id = u.value();
    std::string hex = id.to_hex();
    std::cout << "ulid:       " << id.to_string() << "\n"
              << "timestamp:  " << id.timestamp() << "\n"
              << "time:       " << format_utc(id.timestamp()) << "\n"
              << "randomness: " << hex.substr(12) << "\n";
    return 0;
}

static int cmd_store(const std::vector<std::string>& args, const Config& cfg) {
    if (args.empty()) {
        log::error("store requires a subcommand: add, get, rm, ls");
        return EXIT_USAGE;
    }
    const std::string& sub = args[0];

    std::string path = cfg.store_path.empty() ? IdStore::default_store_path() : cfg.store_path;
    IdStore store;
    auto opened = store.open(path);
    if (opened.is_err()) return report(opened.error());

    if (sub == "add" && (args.size() == 2 || args.size() == 3)) {
        if (args.size() == 3) {
            auto st = store.insert(args[2], args[1]);
            if (st.is_err()) return report(st.error());
            std::cout << args[2] << "\n";
        } else {
            auto id = store.insert(args[1]);
            if (id.is_err()) return report(id.error());
            std::cout << id.value() << "\n";
        }
        return 0;
    }
    if (sub == "get" && args.size() == 2) {
        auto e = store.lookup(args[1]);
        if (e.is_err()) return report(e.error());
        std::cout << e.value().id << "  " << e.value().label << "\n";
        return 0;
    }
    if (sub == "rm" && args.size() == 2) {
        auto st = store.remove(args[1]);
        if (st.is_err()) return report(st.error());
        return 0;
    }
    if (sub == "ls" && args.size() == 1) {
        auto entries = store.list();
        if (entries.is_err()) return report(entries.error());
        for (const auto& e : entries.value()) {
            std::cout << e.id << "  " << e.label << "\n";
        }
        log::debug("%zu id(s) in %s", entries.value().size(), path.c_str());
        return 0;
    }

    log::error("bad store invocation '%s'", sub.c_str());
    return EXIT_USAGE;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    bool verbose = false;
    bool quiet = false;
    bool no_color = false;
    std::string config_path;
    bool explicit_config = false;

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-v" || a == "--verbose") {
            verbose = true;
        } else if (a == "-q" || a == "--quiet") {
            quiet = true;
        } else if (a == "--no-color") {
            no_color = true;
        } else if (a == "--config") {
            if (i + 1 >= args.size()) {
                log::error("--config requires a path");
                return EXIT_USAGE;
            }
            config_path = args[++i];
            explicit_config = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            return 0;
        } else {
            break;
        }
    }

    if (i >= args.size()) {
        print_usage();
        return EXIT_USAGE;
    }

    // Config: defaults, then file, then command line flags
    Config cfg;
    if (!explicit_config) config_path = default_config_path();
    if (explicit_config || fs::exists(config_path)) {
        auto loaded = Config::load(config_path);
        if (loaded.is_err()) return report(loaded.error());
        cfg.merge(loaded.value());
    }

    log::set_level(cfg.log_level);
    if (cfg.color_set) log::set_color_enabled(cfg.color && log::is_color_enabled());
    if (verbose) log::set_level(log::Debug);
    if (quiet) log::set_level(log::Error);
    if (no_color) log::set_color_enabled(false);

    log::debug("config: %s", config_path.c_str());

    const std::string cmd = args[i];
    std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

    if (cmd == "generate") return cmd_generate(rest, cfg);
    if (cmd == "encode")   return cmd_encode(rest);
    if (cmd == "decode")   return cmd_decode(rest);
    if (cmd == "valid")    return cmd_valid(rest);
    if (cmd == "inspect")  return cmd_inspect(rest);
    if (cmd == "store")    return cmd_store(rest, cfg);

    log::error("unknown command '%s'", cmd.c_str());
    print_usage();
    return EXIT_USAGE;
}
