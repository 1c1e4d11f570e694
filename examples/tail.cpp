// ============================================================================
// wheelbuf example: tail
//
// Demonstrates:
// - Owning storage handed to a wheel_buffer (std::vector, allocated once)
// - Bulk text append with write_str()
// - Non-destructive reading with a cursor, skipping with nth()
// - Detecting overwritten input through total()
//
// Usage:
//   some_command | wheelbuf_tail -c 120 --stats
// ============================================================================
#include <array>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "wheelbuf.hpp"

#include "common/cli/tail_params.hpp"


int main(int argc, char** argv) {
    using namespace wheelbuf;

    const std::string description = std::format("wheelbuf tail v{}.{}.{}: keep the last N characters of stdin",
                                                version_major, version_minor, version_patch);
    const auto params = examples::cli::tail::configure(argc, argv, description);
    params.dump("Configuration", std::clog);

    // -------------------------------------------------------------------------
    // Wheel setup: the only allocation happens here
    // -------------------------------------------------------------------------
    wheel_buffer<std::vector<char>> wheel{std::vector<char>(params.capacity)};
    WB_DEBUG("[tail] wheel ready, capacity=" << wheel.capacity());

    // -------------------------------------------------------------------------
    // Feed stdin in chunks
    // -------------------------------------------------------------------------
    std::array<char, 4096> chunk{};
    while (std::cin.read(chunk.data(), chunk.size()) || std::cin.gcount() > 0) {
        const auto n = static_cast<std::size_t>(std::cin.gcount());
        if (const Error err = wheel.write_str(std::string_view(chunk.data(), n)); err != Error::None) {
            WB_ERROR("[tail] failed to append input: " << to_string(err));
            return EXIT_FAILURE;
        }
        WB_TRACE("[tail] appended " << n << " bytes (total=" << wheel.total() << ")");
    }

    if (std::cin.bad()) {
        WB_ERROR("[tail] error while reading stdin");
        return EXIT_FAILURE;
    }

    if (wheel.total() > wheel.capacity()) {
        WB_INFO("[tail] " << (wheel.total() - wheel.capacity()) << " leading characters were overwritten");
    }

    // -------------------------------------------------------------------------
    // Print the tail, oldest first
    // -------------------------------------------------------------------------
    auto cursor = wheel.iter();
    for (const char* c = cursor.nth(params.skip); c != nullptr; c = cursor.next()) {
        std::cout.put(*c);
    }
    std::cout << std::endl;

    if (params.stats) {
        std::cout << "capacity=" << wheel.capacity()
                  << " length=" << wheel.length()
                  << " total=" << wheel.total() << std::endl;
    }

    return EXIT_SUCCESS;
}
