#pragma once

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace wheelbuf::examples::cli::tail {

struct Params {
    std::size_t capacity  = 80;
    std::size_t skip      = 0;
    std::string log_level = "info";
    bool stats            = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Capacity  : " << capacity << "\n"
           << "  Skip      : " << skip << "\n"
           << "  Log Level : " << log_level << "\n"
           << "  Stats     : " << (stats ? "on" : "off") << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-c,--capacity", params.capacity, "Number of trailing characters kept")->check(capacity_validator)->default_val(params.capacity);
    app.add_option("-s,--skip", params.skip, "Characters skipped from the oldest end before printing")->default_val(params.skip);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal | off")->check(log_level_validator)->default_val(params.log_level);
    app.add_flag("--stats", params.stats, "Print capacity, length and total after the tail");

    app.footer(
        "Reads stdin to the end and keeps only the last <capacity> characters.\n"
        "Older input is overwritten in place; nothing is allocated per character."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr) == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace wheelbuf::examples::cli::tail
