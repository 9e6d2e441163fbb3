#include <catch2/catch_all.hpp>
#include "utils/rcx_string.h"

SCENARIO("rcx_string basic operations") {
    GIVEN("a label with surrounding whitespace") {
        rcx_string s = "  Grand Total  ";

        WHEN("trimming") {
            THEN("outer whitespace is removed") {
                REQUIRE(s.trim() == "Grand Total");
            }
        }

        WHEN("lower-casing") {
            THEN("ASCII letters are folded") {
                REQUIRE(s.trim().to_lower() == "grand total");
            }
        }
    }

    GIVEN("a comma separated list") {
        rcx_string s = "Cement,Steel,,Sand";

        WHEN("splitting on commas") {
            std::vector<rcx_string> parts = s.split(",");
            THEN("empty parts are kept") {
                REQUIRE(parts.size() == 4);
                REQUIRE(parts[0] == "Cement");
                REQUIRE(parts[2].empty());
                REQUIRE(parts[3] == "Sand");
            }
        }

        WHEN("joining the parts again") {
            THEN("the original string is restored") {
                REQUIRE(rcx_string(",").join(s.split(",")) == s);
            }
        }
    }
}

SCENARIO("rcx_string numeric detection") {
    THEN("plain decimals are numeric") {
        REQUIRE(rcx_string("12450.00").is_numeric());
        REQUIRE(rcx_string("-3").is_numeric());
        REQUIRE(rcx_string(".5").is_numeric());
    }
    THEN("anything else is not") {
        REQUIRE_FALSE(rcx_string("").is_numeric());
        REQUIRE_FALSE(rcx_string(".").is_numeric());
        REQUIRE_FALSE(rcx_string("-").is_numeric());
        REQUIRE_FALSE(rcx_string("1.2.3").is_numeric());
        REQUIRE_FALSE(rcx_string("12,450").is_numeric());
        REQUIRE_FALSE(rcx_string("5 bags").is_numeric());
    }
    THEN("to_double falls back to the default") {
        REQUIRE(rcx_string("2.5").to_double() == Catch::Approx(2.5));
        REQUIRE(rcx_string("abc").to_double(-1.0) == Catch::Approx(-1.0));
    }
}

SCENARIO("rcx_string UTF-8 handling") {
    GIVEN("text with a rupee sign") {
        rcx_string s = "Total \xE2\x82\xB9 450";

        WHEN("lower-casing") {
            rcx_string lowered = s.to_lower();
            THEN("multi-byte sequences and byte offsets are preserved") {
                REQUIRE(lowered == "total \xE2\x82\xB9 450");
                REQUIRE(lowered.size() == s.size());
            }
        }
    }

    GIVEN("text with no-break and thin spaces") {
        rcx_string s = "  12\xC2\xA0" "450 \xE2\x80\x89 Rs  ";

        WHEN("normalizing whitespace") {
            THEN("every run becomes one ASCII space") {
                REQUIRE(s.normalize_whitespace() == "12 450 Rs");
            }
        }

        WHEN("removing whitespace") {
            THEN("no space code point remains") {
                REQUIRE(s.remove_whitespace() == "12450Rs");
            }
        }
    }

    GIVEN("a malformed byte sequence") {
        rcx_string s("Qty\xFF" "5");

        WHEN("sanitizing") {
            THEN("the bad byte becomes U+FFFD") {
                REQUIRE(s.sanitize_utf8() == "Qty\xEF\xBF\xBD" "5");
            }
        }

        WHEN("normalizing whitespace") {
            THEN("the text is repaired instead of throwing") {
                REQUIRE_NOTHROW(s.normalize_whitespace());
            }
        }
    }
}
