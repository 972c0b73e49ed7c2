#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <arena.hpp>
#include <eval/environment.hpp>
#include <fmt/core.h>
#include <runner/runner.hpp>

namespace
{
constexpr auto prompt = ">> ";

struct options
{
    bool help {};
    bool debug {};
    std::string_view file;
};

auto usage(std::string_view program) -> std::string
{
    return fmt::format("usage: {} [-d] [-h] [<file>]\n"
                       "  -d  print the environment bindings after each evaluation\n"
                       "  -h  show this help\n"
                       "  <file>  evaluate the file instead of starting the REPL\n",
                       program);
}

auto parse_options(std::span<char*> args) -> options
{
    auto opts = options {};
    for (const std::string_view arg : args) {
        if (arg == "-h") {
            opts.help = true;
        } else if (arg == "-d") {
            opts.debug = true;
        } else if (arg.starts_with('-')) {
            throw std::invalid_argument(fmt::format("unknown option {}", arg));
        } else if (opts.file.empty()) {
            opts.file = arg;
        } else {
            throw std::invalid_argument(fmt::format("unexpected argument {}", arg));
        }
    }
    return opts;
}

auto read_file(std::string_view path) -> std::string
{
    auto input = std::ifstream {std::string {path}};
    if (!input) {
        throw std::runtime_error(fmt::format("could not open file: {}", path));
    }
    return {std::istreambuf_iterator<char> {input}, std::istreambuf_iterator<char> {}};
}

auto run_file(const options& opts) -> int
{
    const auto source = read_file(opts.file);
    const auto succeeded = run_source(
        source, make<environment>(), std::cout, std::cerr, run_options {.filename = opts.file, .debug = opts.debug});
    return succeeded ? EXIT_SUCCESS : EXIT_FAILURE;
}

auto run_repl(const options& opts) -> int
{
    auto* env = make<environment>();
    auto line = std::string {};
    std::cout << prompt << std::flush;
    while (std::getline(std::cin, line)) {
        run_source(line, env, std::cout, std::cerr, run_options {.debug = opts.debug});
        std::cout << prompt << std::flush;
    }
    return EXIT_SUCCESS;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    const auto args = std::span(argv, static_cast<std::size_t>(argc));
    const auto program = args.empty() ? std::string_view {"walnut"} : std::string_view {args.front()};
    auto opts = options {};
    try {
        opts = parse_options(args.subspan(args.empty() ? 0 : 1));
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "error: {}\n{}", e.what(), usage(program));
        return EXIT_FAILURE;
    }
    if (opts.help) {
        fmt::print("{}", usage(program));
        return EXIT_SUCCESS;
    }
    try {
        return opts.file.empty() ? run_repl(opts) : run_file(opts);
    } catch (const std::exception& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
    }
    return EXIT_FAILURE;
}
