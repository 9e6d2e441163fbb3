#include <catch2/catch_all.hpp>
#include "aiprocesses/extract/rcx_field_matcher.h"

using namespace rcx::extract;

SCENARIO("rcx_field_matcher finds label candidates") {
    rcx_field_matcher matcher(rcx_field_table::standard());
    rcx_extraction_state state(4);
    rcx_label_match match;

    GIVEN("a label containing aliases of several fields") {
        WHEN("matching \"Item Type: Hardware\"") {
            REQUIRE(matcher.match("Item Type: Hardware", state, match));
            THEN("the earlier field in table order wins") {
                REQUIRE(match.field->key == "itemType");
                REQUIRE(match.alias == "item type");
            }
        }

        WHEN("matching \"Unit Price\"") {
            REQUIRE(matcher.match("Unit Price", state, match));
            THEN("unitPrice wins over uom") {
                REQUIRE(match.field->key == "unitPrice");
            }
        }

        WHEN("matching \"Brand: UltraTech\" which also contains \"rate\"") {
            REQUIRE(matcher.match("Brand: UltraTech", state, match));
            THEN("brand wins because it comes first") {
                REQUIRE(match.field->key == "brand");
            }
        }
    }

    GIVEN("a label containing several aliases of one field") {
        WHEN("matching \"Total Amount: 500\"") {
            REQUIRE(matcher.match("Total Amount: 500", state, match));
            THEN("the earliest, longest alias is reported with its byte range") {
                REQUIRE(match.field->key == "amount");
                REQUIRE(match.alias == "total amount");
                REQUIRE(match.alias_begin == 0);
                REQUIRE(match.alias_end == 12);
            }
        }

        WHEN("matching \"Bill Date 12/03/2024\"") {
            REQUIRE(matcher.match("Bill Date 12/03/2024", state, match));
            THEN("\"bill date\" is preferred over \"date\"") {
                REQUIRE(match.alias == "bill date");
                REQUIRE(match.alias_end == 9);
            }
        }
    }

    GIVEN("upper-case text") {
        THEN("matching is case-insensitive") {
            REQUIRE(matcher.match("QTY", state, match));
            REQUIRE(match.field->key == "quantity");
        }
    }

    GIVEN("a field that is already resolved") {
        rcx_field_resolution amount;
        amount.key = "amount";
        amount.raw_value = "500";
        amount.label_index = 0;
        REQUIRE(state.commit(amount));

        THEN("its aliases no longer produce candidates") {
            REQUIRE_FALSE(matcher.match("Grand Total", state, match));
        }
    }

    GIVEN("text without any alias") {
        THEN("there is no match") {
            REQUIRE_FALSE(matcher.match("Sharma Hardware Store", state, match));
            REQUIRE_FALSE(matcher.match("\xE2\x82\xB9 12,450.00", state, match));
        }
    }
}

SCENARIO("rcx_extraction_state enforces at-most-once consumption") {
    rcx_extraction_state state(3);

    rcx_field_resolution first;
    first.key = "quantity";
    first.raw_value = "5";
    first.label_index = 0;
    first.value_index = 1;
    first.method = rcx_resolution_method::spatial;

    REQUIRE(state.commit(first));
    REQUIRE(state.is_consumed(0));
    REQUIRE(state.is_consumed(1));
    REQUIRE_FALSE(state.is_consumed(2));
    REQUIRE(state.is_resolved("quantity"));

    WHEN("another field wants an already consumed fragment") {
        rcx_field_resolution second;
        second.key = "unitPrice";
        second.raw_value = "5";
        second.label_index = 2;
        second.value_index = 1;

        THEN("the commit is rejected without side effects") {
            REQUIRE_FALSE(state.commit(second));
            REQUIRE_FALSE(state.is_consumed(2));
            REQUIRE_FALSE(state.is_resolved("unitPrice"));
        }
    }

    WHEN("the same field is committed again") {
        rcx_field_resolution again = first;
        again.label_index = 2;
        again.value_index = rcx_field_resolution::npos;

        THEN("it is rejected") {
            REQUIRE_FALSE(state.commit(again));
            REQUIRE(state.get_resolutions().size() == 1);
        }
    }

    WHEN("a resolution refers to no fragment or an invalid one") {
        rcx_field_resolution none;
        none.key = "brand";
        rcx_field_resolution invalid;
        invalid.key = "brand";
        invalid.label_index = 7;

        THEN("it is rejected") {
            REQUIRE_FALSE(state.commit(none));
            REQUIRE_FALSE(state.commit(invalid));
        }
    }
}
