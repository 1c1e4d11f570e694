/*
===============================================================================
 wheel_buffer — Group D Unit Tests
===============================================================================

Scope:
------
These tests validate the *text append helpers* of
wheelbuf::wheel_buffer<Storage> and wheelbuf::push_iterator.

Covered Requirements:
---------------------
D1. write_str() on char buffers
    - Every byte is pushed in order, including chunks larger than capacity
    - Consecutive chunks behave like one long chunk

D2. write_str() on char32_t buffers
    - UTF-8 input is decoded to code points before pushing
    - Malformed sequences become U+FFFD and decoding continues

D3. write_fmt()
    - std::format output lands in the wheel, oldest characters overwritten

D4. push_iterator
    - Works as an output iterator for standard algorithms
    - Reports the first failed push through error()

Non-Goals:
----------
- Zero-capacity policy for text (Group E)
===============================================================================
*/

#include <algorithm>
#include <array>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include "wheelbuf/wheel_buffer.hpp"
#include "wheelbuf/push_iterator.hpp"

#include "common/test_check.hpp"

using namespace wheelbuf;

static_assert(std::output_iterator<push_iterator<wheel_buffer<std::span<char>>>, const char&>);


template <typename Wheel>
static auto collect(const Wheel& wheel) {
    return std::basic_string<typename Wheel::value_type>(wheel.begin(), wheel.end());
}

// -----------------------------------------------------------------------------
// Group D1: write_str() on char buffers
// -----------------------------------------------------------------------------
void test_write_str_chars() {
    std::cout << "[TEST] Group D1: write_str chars\n";

    char storage[8];
    wheel_buffer wheel{storage};

    TEST_CHECK(wheel.write_str("Hello World") == Error::None);
    TEST_CHECK(wheel.length() == 8);
    TEST_CHECK(wheel.total() == 11);
    TEST_CHECK(collect(wheel) == "lo World");

    char split_storage[8];
    wheel_buffer split{split_storage};
    TEST_CHECK(split.write_str("Hel") == Error::None);
    TEST_CHECK(split.write_str("") == Error::None);
    TEST_CHECK(split.write_str("lo Wor") == Error::None);
    TEST_CHECK(split.write_str("ld") == Error::None);
    TEST_CHECK(collect(split) == collect(wheel));
    TEST_CHECK(split.total() == wheel.total());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D2: write_str() on char32_t buffers
// -----------------------------------------------------------------------------
void test_write_str_code_points() {
    std::cout << "[TEST] Group D2: write_str code points\n";

    wheel_buffer<std::array<char32_t, 4>> wheel{std::array<char32_t, 4>{}};

    // 1, 2, 3 and 4 byte sequences
    TEST_CHECK(wheel.write_str("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80") == Error::None);
    TEST_CHECK(wheel.total() == 4);
    TEST_CHECK(collect(wheel) == U"a\u00E9\u20AC\U0001F600");

    // one more code point pushes out 'a'
    TEST_CHECK(wheel.write_str("z") == Error::None);
    TEST_CHECK(collect(wheel) == U"\u00E9\u20AC\U0001F600z");

    // stray continuation, truncated sequence, overlong encoding
    wheel_buffer<std::vector<char32_t>> bad{std::vector<char32_t>(8)};
    TEST_CHECK(bad.write_str("\x80" "a" "\xE2\x82" "b" "\xC0\xAF") == Error::None);
    TEST_CHECK(collect(bad) == U"\uFFFDa\uFFFDb\uFFFD");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D3: write_fmt()
// -----------------------------------------------------------------------------
void test_write_fmt() {
    std::cout << "[TEST] Group D3: write_fmt\n";

    char storage[16];
    wheel_buffer wheel{storage};

    TEST_CHECK(wheel.write_fmt("t={} v={:.1f};", 7, 2.5) == Error::None);
    TEST_CHECK(collect(wheel) == "t=7 v=2.5;");

    TEST_CHECK(wheel.write_fmt("t={} v={:.1f};", 8, -1.0) == Error::None);
    TEST_CHECK(wheel.total() == 21);
    TEST_CHECK(collect(wheel) == "=2.5;t=8 v=-1.0;");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group D4: push_iterator
// -----------------------------------------------------------------------------
void test_push_iterator() {
    std::cout << "[TEST] Group D4: push_iterator\n";

    int storage[4];
    wheel_buffer wheel{storage};

    const std::vector<int> samples{1, 2, 3, 4, 5, 6};
    const auto out = std::copy(samples.begin(), samples.end(), pusher(wheel));
    TEST_CHECK(out.error() == Error::None);
    TEST_CHECK(wheel.total() == 6);
    TEST_CHECK(std::ranges::equal(wheel, std::vector<int>{3, 4, 5, 6}));

    std::array<int, 0> nothing{};
    wheel_buffer empty{std::move(nothing)};
    auto rejected = pusher(empty);
    *rejected++ = 1;
    *rejected++ = 2;
    TEST_CHECK(rejected.error() == Error::InvalidCapacity);
    TEST_CHECK(empty.total() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "wheelbuf/log/logger.hpp"

int main() {
    wheelbuf::log::Logger::instance().set_level(wheelbuf::log::Level::Trace);

    test_write_str_chars();
    test_write_str_code_points();
    test_write_fmt();
    test_push_iterator();

    std::cout << "\n[GROUP D — TEXT APPEND TESTS PASSED]\n";
    return 0;
}
