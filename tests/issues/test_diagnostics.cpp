#include <catch2/catch_test_macros.hpp>
#include "issues/Diagnostics.hpp"

#include <string>

using issues::Diagnostics;

TEST_CASE("Diagnostics::Preview renders text on one line", "[diagnostics]")
{
    REQUIRE(Diagnostics::Preview("a\nb\tc\r") == "a\\nb\\tc\\r");
    REQUIRE(Diagnostics::Preview(std::string("x\x01y")) == "x?y");
}

TEST_CASE("Diagnostics::Preview truncates long text", "[diagnostics]")
{
    const auto previous = Diagnostics::MaxPreview();
    Diagnostics::SetMaxPreview(4);

    REQUIRE(Diagnostics::Preview("abcdefgh") == "abcd... (8 bytes)");
    REQUIRE(Diagnostics::Preview("abcd") == "abcd");

    Diagnostics::SetMaxPreview(0);
    REQUIRE(Diagnostics::MaxPreview() == 1);

    Diagnostics::SetMaxPreview(previous);
}

TEST_CASE("Diagnostics verbose flag toggles", "[diagnostics]")
{
    Diagnostics::SetVerbose(true);
    REQUIRE(Diagnostics::IsVerbose());
    Diagnostics::SetVerbose(false);
    REQUIRE_FALSE(Diagnostics::IsVerbose());
}
