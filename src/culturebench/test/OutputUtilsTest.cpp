#include <catch2/catch_test_macros.hpp>
#include <sstream>

#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

using namespace culturebench::utils;
using culturebench::analysis::ConfidenceInterval;

TEST_CASE("TeeStream writes to both streams", "[OutputUtils]")
{
    std::ostringstream a, b;
    {
        TeeStream tee(a, b);
        tee << "Loaded " << 3 << " files" << std::endl;
    }
    REQUIRE(a.str() == "Loaded 3 files\n");
    REQUIRE(b.str() == a.str());
}

TEST_CASE("Display name helpers", "[OutputUtils]")
{
    REQUIRE(titleCase("gpt") == "Gpt");
    REQUIRE(titleCase("CLAUDE") == "Claude");
    REQUIRE(titleCase("gpt-4o") == "Gpt-4O");
    REQUIRE(titleCase("gemini 2.5 pro") == "Gemini 2.5 Pro");
    REQUIRE(titleCase("") == "");

    REQUIRE(toDisplayName("lebanese_arabic") == "Lebanese Arabic");
    REQUIRE(toDisplayName("igala") == "Igala");
    REQUIRE(toDisplayName("abstract_vs_everyday") == "Abstract Vs Everyday");
}

TEST_CASE("Number formatting", "[OutputUtils]")
{
    REQUIRE(formatPercent(0.75) == "75%");
    REQUIRE(formatPercent(1.0) == "100%");
    REQUIRE(formatPercent(std::nullopt) == "--");
    REQUIRE(formatWholePercent(66.4) == "66%");
    REQUIRE(formatWholePercent(0.0) == "0%");

    REQUIRE(formatScore(4.126, ConfidenceInterval{3.5, 4.5}) == "4.13 +/- 0.50");
    REQUIRE(formatScore(2.0, ConfidenceInterval{2.0, 2.0}) == "2.00 +/- 0.00");

    REQUIRE(formatAlpha(0.7434) == "0.743");
    REQUIRE(formatAlpha(-0.5) == "-0.500");
    REQUIRE(formatAlpha(std::nullopt) == "N/A");

    REQUIRE(formatFixed(3.14159, 1) == "3.1");
}

TEST_CASE("UTC timestamp layout", "[TimeUtils]")
{
    const std::string ts = getCurrentUtcTimestamp();
    // YYYY-MM-DD HH:MM UTC
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[7] == '-');
    REQUIRE(ts[10] == ' ');
    REQUIRE(ts[13] == ':');
    REQUIRE(ts.substr(16) == " UTC");
}
