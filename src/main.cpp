// ulidkit command-line tool
//
//     ulidkit                     # print a fresh ULID
//     ulidkit -n 5 --monotonic    # five ULIDs sorting in generation order
//     ulidkit -v 01CAT3X5Y5G9A62FH1FA6T9GVR
//                                 # validate and show the embedded time

#include <ulidkit/cli.hpp>
#include <ulidkit/log.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return ulidkit::cli::run(args, ulidkit::Generator::system(), std::cout, std::cerr);
    } catch (const std::exception& e) {
        // Clock or entropy failure; nothing sensible to fall back to.
        ulidkit::log::error("%s", e.what());
        return 3;
    }
}
