#include <catch2/catch_test_macros.hpp>

#include "window_error.hpp"

TEST_CASE("WindowError", "[error]") {

    SECTION("FactoriesSetKind") {
        REQUIRE(WindowError::transport("x").kind == WindowErrorKind::Transport);
        REQUIRE(WindowError::property("x").kind == WindowErrorKind::Property);
        REQUIRE(WindowError::invalid_handle("x").kind == WindowErrorKind::InvalidHandle);
        REQUIRE(WindowError::partial("x").kind == WindowErrorKind::PartialOperation);
    }

    SECTION("Describe") {
        auto err = WindowError::invalid_handle("window 0x1 does not exist");
        REQUIRE(err.describe() == "invalid handle: window 0x1 does not exist");
    }

    SECTION("KindNames") {
        REQUIRE(to_string(WindowErrorKind::Transport) == "transport");
        REQUIRE(to_string(WindowErrorKind::Property) == "property");
        REQUIRE(to_string(WindowErrorKind::PartialOperation) == "partial operation");
    }
}
