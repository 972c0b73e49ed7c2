#include <ostream>
#include <string_view>

#include "runner.hpp"

#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <fmt/ostream.h>
#include <lexer/lexer.hpp>
#include <object/object.hpp>
#include <parser/parser.hpp>

auto run_source(std::string_view source,
                environment* env,
                std::ostream& out,
                std::ostream& err,
                const run_options& opts) -> bool
{
    auto prsr = parser {lexer {source, opts.filename}};
    const auto* prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        for (const auto& error : prsr.errors()) {
            fmt::print(err, "parse error: {}\n", error);
        }
        return false;
    }

    auto ev = evaluator {env};
    const auto* result = ev.evaluate(prgrm);
    if (result != nullptr) {
        fmt::print(out, "{}\n", result->inspect());
    }
    if (opts.debug) {
        env->debug(out);
    }
    return result == nullptr || !result->is_error();
}
