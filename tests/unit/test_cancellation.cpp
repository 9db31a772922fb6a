#include <catch2/catch_test_macros.hpp>

#include "core/cancellation.hpp"

#include <thread>

using lanscout::CancellationToken;

TEST_CASE("CancellationToken copies share one flag", "[cancellation]") {
    CancellationToken token;
    const auto copy = token;
    REQUIRE_FALSE(copy.is_cancelled());

    token.cancel();
    REQUIRE(copy.is_cancelled());
}

TEST_CASE("Child tokens follow their parent but not the reverse", "[cancellation]") {
    CancellationToken parent;
    const auto child = parent.child();
    const auto sibling = parent.child();

    child.cancel();
    REQUIRE(child.is_cancelled());
    REQUIRE_FALSE(parent.is_cancelled());
    REQUIRE_FALSE(sibling.is_cancelled());

    parent.cancel();
    REQUIRE(sibling.is_cancelled());
}

TEST_CASE("Cancellation set through flag() is visible to the token", "[cancellation]") {
    CancellationToken token;
    const auto grandchild = token.child().child();

    std::thread setter([flag = token.flag()] { flag->store(true); });
    setter.join();

    REQUIRE(token.is_cancelled());
    REQUIRE(grandchild.is_cancelled());
}
