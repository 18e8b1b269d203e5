#include <ulidkit/cli.hpp>
#include <ulidkit/config.hpp>
#include <ulidkit/log.hpp>
#include <charconv>
#include <filesystem>
#include <ostream>

namespace fs = std::filesystem;

namespace ulidkit::cli {

std::string usage() {
    return
        "ulidkit\n"
        "\n"
        "Usage:\n"
        "    ulidkit [options]\n"
        "        Generate a ULID.\n"
        "\n"
        "    ulidkit [options] <args>...\n"
        "        Check ULIDs given as args.\n"
        "\n"
        "Options:\n"
        "    -h, --help            Display this message and exit\n"
        "    -V, --version         Print version info and exit\n"
        "    -v, --verbose         Use verbose output\n"
        "    -n, --count <count>   Number of ULIDs to generate\n"
        "    -m, --monotonic       Generate a monotonic sequence\n"
        "        --config <path>   Read settings from this TOML file\n";
}

static Result<int64_t> parse_count(const std::string& text) {
    int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value < 1) {
        return UlidError{UlidError::InvalidArg,
            "invalid count '" + text + "'",
            "count must be a positive integer"};
    }
    return Result<int64_t>::ok(value);
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-V" || arg == "--version") {
            opts.version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-m" || arg == "--monotonic") {
            opts.monotonic = true;
        } else if (arg == "-n" || arg == "--count" || arg == "--config") {
            if (i + 1 >= args.size()) {
                return UlidError{UlidError::InvalidArg,
                    "missing value for " + arg};
            }
            const std::string& value = args[++i];
            if (arg == "--config") {
                opts.config_path = value;
            } else {
                auto count = parse_count(value);
                if (count.is_err()) return std::move(count).error();
                opts.count = count.value();
            }
        } else {
            opts.candidates.push_back(arg);
        }
    }
    return Result<Options>::ok(std::move(opts));
}

// Explicit --config must exist; discovered files are optional.
static Result<Config> load_config(const Options& opts) {
    if (opts.config_path) {
        return Config::load(*opts.config_path);
    }

    std::optional<Config> global;
    std::optional<Config> local;

    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto r = Config::load(global_path);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }
    if (fs::exists(local_config_path(), ec)) {
        auto r = Config::load(local_config_path());
        if (r.is_err()) return std::move(r).error();
        local = std::move(r).value();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static void print(std::ostream& out, const Ulid& ulid, bool verbose) {
    if (verbose) {
        out << ulid << '\n' << ulid.to_rfc3339() << "\n\n";
    } else {
        out << ulid << '\n';
    }
}

static void generate(Generator& generator, int64_t count, bool monotonic, bool verbose,
                     std::ostream& out) {
    Ulid previous = generator.generate();
    print(out, previous, verbose);
    for (int64_t i = 1; i < count; ++i) {
        previous = monotonic ? generator.next_monotonic(previous) : generator.generate();
        print(out, previous, verbose);
    }
    log::debug("generated %lld ULID(s)%s", static_cast<long long>(count),
               monotonic ? " (monotonic)" : "");
}

static int validate(const std::vector<std::string>& candidates, bool verbose,
                    std::ostream& out, std::ostream& err) {
    std::vector<std::string> broken;
    for (const auto& candidate : candidates) {
        auto parsed = Ulid::parse(candidate);
        if (parsed.is_ok()) {
            if (verbose) {
                print(out, parsed.value(), verbose);
            }
        } else {
            log::info("'%s': %s", candidate.c_str(), parsed.error().format().c_str());
            broken.push_back(candidate);
        }
    }

    if (broken.empty()) {
        return kExitOk;
    }

    err << "Invalid ULID strings: [";
    for (std::size_t i = 0; i < broken.size(); ++i) {
        if (i > 0) err << ", ";
        err << '"' << broken[i] << '"';
    }
    err << "]\n";
    return kExitInvalidUlid;
}

int run(const std::vector<std::string>& args, Generator& generator,
        std::ostream& out, std::ostream& err) {
    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        err << parsed.error().format() << "\n\n" << usage();
        return kExitUsage;
    }
    const Options& opts = parsed.value();

    if (opts.version) {
        out << "ulidkit " << kVersion << '\n';
        return kExitOk;
    }
    if (opts.help) {
        out << usage();
        return kExitOk;
    }

    auto cfg = load_config(opts);
    if (cfg.is_err()) {
        err << cfg.error().format() << '\n';
        return kExitUsage;
    }
    const Config& config = cfg.value();

    log::set_level(config.logging.level);
    if (config.log_color_set) {
        log::set_color_enabled(config.logging.color);
    }

    bool verbose = opts.verbose || config.output.verbose;

    if (opts.candidates.empty()) {
        int64_t count = opts.count.value_or(config.generate.count);
        bool monotonic = opts.monotonic || config.generate.monotonic;
        generate(generator, count, monotonic, verbose, out);
        return kExitOk;
    }

    return validate(opts.candidates, verbose, out, err);
}

} // namespace ulidkit::cli
