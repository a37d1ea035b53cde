#include "catch2_custom.hpp"

#include <trialrun/common/error_types.hpp>
#include <trialrun/common/expected.hpp>

#include <string>
#include <string_view>
#include <system_error>

using namespace std::literals;
using trialrun::ErrorKind;
using trialrun::Expected;
using trialrun::Result;

// Simple types
using Et = Expected<int, std::string>;

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});

    // Implicit conversions from value / error
    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != 456);
    REQUIRE(Et{123} != "1234");

    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != "Exp!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("Other (monadic) operations") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{123}.error_or("E") == "E");

    REQUIRE(Et{"A"}.value_or(123.5) == 123);
    REQUIRE(Et{"A"}.error_or("B") == "A");

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{123}.transform(square) == 123 * 123);
    REQUIRE(Et{"no"}.transform(square) == "no");
}

namespace {

Result<int> half(int n) {
    if (n % 2 != 0) {
        return ErrorKind::BadArgument;
    }
    return n / 2;
}

Result<int> quarter(int n) {
    int halved = TRY(half(n));
    return TRY(half(halved));
}

Result<void> check_even(int n) {
    TRY(half(n));
    return {};
}

Expected<int> as_syscall(int n) {
    if (n < 0) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    return n;
}

Result<int> remapped(int n) {
    return TRYE(as_syscall(n), SyscallFailure);
}

} // namespace

TEST_CASE("TRY propagates the first error") {
    REQUIRE(quarter(8) == 2);
    REQUIRE(quarter(6) == ErrorKind::BadArgument);
    REQUIRE(quarter(3) == ErrorKind::BadArgument);

    REQUIRE(check_even(4).has_value());
    REQUIRE(check_even(5).error() == ErrorKind::BadArgument);
}

TEST_CASE("TRYE replaces the error kind") {
    REQUIRE(remapped(7) == 7);
    REQUIRE(remapped(-1) == ErrorKind::SyscallFailure);
}
