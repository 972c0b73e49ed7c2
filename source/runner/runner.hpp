#pragma once

#include <ostream>
#include <string_view>

#include <eval/environment.hpp>

struct run_options
{
    std::string_view filename {"<stdin>"};
    // dump the environment bindings after evaluating
    bool debug {};
};

// Parses and evaluates one chunk of source against env. Values, NULL and errors included, are printed to out with
// inspect(); a result without value prints nothing. Parse errors go to err.
// Returns false when parsing failed or the result is an error.
auto run_source(std::string_view source,
                environment* env,
                std::ostream& out,
                std::ostream& err,
                const run_options& opts = {}) -> bool;
