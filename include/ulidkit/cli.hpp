#pragma once

#include <ulidkit/generator.hpp>
#include <ulidkit/result.hpp>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ulidkit::cli {

constexpr const char* kVersion = "1.0.0";

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitInvalidUlid = 1;
constexpr int kExitUsage = 2;

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;
    bool monotonic = false;
    std::optional<int64_t> count;
    std::optional<std::string> config_path;
    std::vector<std::string> candidates;  // positional args to validate
};

Result<Options> parse_args(const std::vector<std::string>& args);

std::string usage();

// Runs the tool against `args` (without argv[0]). With no positional
// arguments, prints freshly generated ULIDs; otherwise validates each
// argument and returns kExitInvalidUlid if any fail.
int run(const std::vector<std::string>& args, Generator& generator,
        std::ostream& out, std::ostream& err);

} // namespace ulidkit::cli
