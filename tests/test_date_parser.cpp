#include <catch2/catch_all.hpp>
#include "aiprocesses/extract/rcx_date_parser.h"

using namespace rcx::extract;

SCENARIO("rcx_date_parser accepts the supported layouts") {
    rcx_date_parser parser;
    rcx_datetime expected(2024, 3, 12);

    auto parses_to_expected = [&](const rcx_string& raw) {
        rcx_datetime out(2000, 1, 1);
        return parser.parse(raw, out) && out == expected;
    };

    THEN("each layout yields the same calendar date") {
        REQUIRE(parses_to_expected("12/03/2024"));
        REQUIRE(parses_to_expected("12-03-2024"));
        REQUIRE(parses_to_expected("12.03.2024"));
        REQUIRE(parses_to_expected("2024-03-12"));
        REQUIRE(parses_to_expected("12 Mar 2024"));
        REQUIRE(parses_to_expected("12-MAR-2024"));
        REQUIRE(parses_to_expected("12 March 2024"));
        REQUIRE(parses_to_expected("March 12, 2024"));
        REQUIRE(parses_to_expected("Mar 12 2024"));
        REQUIRE(parses_to_expected("12/03/24"));
        REQUIRE(parses_to_expected("  12/03/2024  "));
    }

    THEN("the reported layout is the first that accepts the text") {
        REQUIRE(parser.matching_pattern("12/03/2024") == "dd/MM/yyyy");
        REQUIRE(parser.matching_pattern("2024-03-12") == "yyyy-MM-dd");
        REQUIRE(parser.matching_pattern("12 March 2024") == "dd MMMM yyyy");
        REQUIRE(parser.matching_pattern("12/03/24") == "dd/MM/yy");
        REQUIRE(parser.get_patterns().size() == 9);
    }
}

SCENARIO("rcx_date_parser skips invalid calendar dates") {
    rcx_date_parser parser;

    GIVEN("a day-first reading that is impossible") {
        rcx_datetime out(2000, 1, 1);

        WHEN("the month-first reading is valid") {
            THEN("the month-first layout is used") {
                REQUIRE(parser.parse("02/13/2024", out));
                REQUIRE(out == rcx_datetime(2024, 2, 13));
                REQUIRE(parser.matching_pattern("02/13/2024") == "MM/dd/yyyy");
            }
        }

        WHEN("no reading is valid") {
            THEN("the date is absent and out is untouched") {
                REQUIRE_FALSE(parser.parse("31/02/2024", out));
                REQUIRE_FALSE(parser.parse("29/02/2023", out));
                REQUIRE_FALSE(parser.parse("31/04/2024", out));
                REQUIRE(out == rcx_datetime(2000, 1, 1));
            }
        }
    }

    GIVEN("leap day") {
        rcx_datetime out;
        THEN("it is accepted in a leap year") {
            REQUIRE(parser.parse("29/02/2024", out));
            REQUIRE(out.to_iso_date() == "2024-02-29");
        }
    }

    GIVEN("text that is not a date") {
        rcx_datetime out;
        THEN("nothing is parsed and nothing is thrown") {
            REQUIRE_FALSE(parser.parse("", out));
            REQUIRE_FALSE(parser.parse("not a date", out));
            REQUIRE_FALSE(parser.parse("12 Foo 2024", out));
            REQUIRE_FALSE(parser.parse("123/03/2024", out));
            REQUIRE(parser.matching_pattern("tomorrow").empty());
        }
    }
}
