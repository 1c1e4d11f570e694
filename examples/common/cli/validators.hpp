#pragma once

#include <array>
#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>


namespace wheelbuf::examples::cli {

// -------------------------------------------------------------
// Wheel capacity validator
// -------------------------------------------------------------
inline auto capacity_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            std::size_t pos = 0;
            const auto c = std::stoull(value, &pos);
            if (pos != value.size() || value.front() == '-') {
                return "Capacity must be a positive integer";
            }
            if (c == 0) {
                return "Capacity must be at least 1 (a zero-capacity wheel rejects every write)";
            }
            return {};
        } catch (const std::exception&) {
            return "Capacity must be a valid integer";
        }
    },
    "Wheel capacity validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline constexpr std::array<std::string_view, 7> valid_log_levels = {
    "trace", "debug", "info", "warn", "error", "fatal", "off"
};

inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (auto v : valid_log_levels) {
            if (value == v) {
                return {};
            }
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);

} // namespace wheelbuf::examples::cli
