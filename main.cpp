#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include "lib.hpp"
#include "record.hpp"
#include "ulid.hpp"

#ifndef ULIDKIT_VERSION
#define ULIDKIT_VERSION "0.0.0"
#endif

namespace {

    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    void print_usage(std::ostream& out) {
        out << "usage:\n"
            << "  ulidkit random [-0|--zeroed] [-1|--oned] [-v|--verbose] [INPUT|-]\n"
            << "  ulidkit parse [ULID...]\n"
            << "  ulidkit version\n"
            << "  ulidkit help\n"
            << "\n"
            << "commands:\n"
            << "  random   Generate a random ulid (search terms: generate, ulid, uuid)\n"
            << "           INPUT is a date-time or a JSON record {\"" K_TS "\": <date>, \"" K_RND "\": <int|string>}\n"
            << "           -0, --zeroed  Fill the random portion of the ulid with zeros\n"
            << "           -1, --oned    Fill the random portion of the ulid with ones\n"
            << "  parse    Parse a ulid into a date (search terms: parse, ulid, date)\n"
            << "           reads one ulid per line from stdin when none is given\n"
            << "\n"
            << "examples:\n"
            << "  ulidkit random                        # based on the current time\n"
            << "  ulidkit random 2024-03-19T11:46:00    # based on the given timestamp\n"
            << "  ulidkit random --zeroed               # random portion all set to 0\n"
            << "  ulidkit random '{\"" K_RND "\": \"12345\"}'\n"
            << "  ulidkit random | ulidkit parse        # parse out the date portion\n";
    }

    void report(const ulid_error& e) {
        std::cerr << "error: " << error_kind_name(e.kind()) << ": " << e.message() << std::endl;
    }

    int run_random(const std::vector<std::string_view>& args) {
        GenerateFlags flags;
        bool verbose = false;
        std::string input;
        bool have_input = false;

        for (auto arg : args) {
            if (arg == "-0" || arg == "--zeroed") {
                flags.zeroed = true;
            } else if (arg == "-1" || arg == "--oned") {
                flags.oned = true;
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg.size() > 1 && arg.front() == '-' && arg != "-") {
                std::cerr << "unknown flag: " << arg << "\n";
                print_usage(std::cerr);
                return EXIT_USAGE;
            } else if (have_input) {
                std::cerr << "random takes at most one input\n";
                print_usage(std::cerr);
                return EXIT_USAGE;
            } else {
                have_input = true;
                input = std::string(arg);
            }
        }
        if (input == "-") {
            input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }

        try {
            GenerateOptions opts = resolve_options(input, flags);
            ULID ulid = ULID::generate(opts);
            if (verbose) {
                std::cerr << "[*] timestamp: " << ulid.timestamp_ms() << " ms ("
                          << dt::to_rfc3339(ulid.datetime()) << ")"
                          << ", payload: " << payload_kind_name(opts.payload.kind) << std::endl;
            }
            std::cout << ulid << std::endl;
        } catch (const ulid_error& e) {
            report(e);
            return e.kind() == ErrorKind::ConflictingOptions ? EXIT_USAGE : EXIT_FAILED;
        }
        return EXIT_OK;
    }

    bool parse_one(std::string_view text) {
        try {
            std::cout << parse_ulid(std::string(text)) << std::endl;
            return true;
        } catch (const ulid_error& e) {
            report(e);
            return false;
        }
    }

    int run_parse(const std::vector<std::string_view>& args) {
        bool ok = true;
        if (args.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
                ok = parse_one(line) && ok;
            }
            return ok ? EXIT_OK : EXIT_FAILED;
        }
        for (auto arg : args) {
            ok = parse_one(arg) && ok;
        }
        return ok ? EXIT_OK : EXIT_FAILED;
    }
}

int main(int argc, char** argv)
{
    if (argc < 2) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    const std::string_view command = argv[1];
    std::vector<std::string_view> args(argv + 2, argv + argc);

    if (command == "random") return run_random(args);
    if (command == "parse") return run_parse(args);
    if (command == "version" || command == "--version") {
        std::cout << "ulidkit " << ULIDKIT_VERSION << std::endl;
        return EXIT_OK;
    }
    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(std::cout);
        return EXIT_OK;
    }

    std::cerr << "unknown command: " << command << "\n";
    print_usage(std::cerr);
    return EXIT_USAGE;
}
