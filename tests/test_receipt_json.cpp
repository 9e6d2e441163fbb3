#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "api/json/rcx_json.h"
#include "aiprocesses/extract/rcx_receipt_analyzer.h"

using namespace rcx::extract;

SCENARIO("rcx_json parses fragment documents") {
    std::vector<rcx_fragment> fragments;

    GIVEN("a bare array with box coordinates") {
        rcx_string json = R"([
            {"text": "Qty - 5", "confidence": 0.8, "box": {"x": 0.1, "y": 0.2, "width": 0.3, "height": 0.02}},
            {"text": "Rate", "box": {"x": 0.1, "y": 0.3, "width": 0.1, "height": 0.02}}
        ])";

        WHEN("parsing") {
            REQUIRE(rcx_json::parse_fragments(json, fragments));

            THEN("text, geometry and confidence are read") {
                REQUIRE(fragments.size() == 2);
                REQUIRE(fragments[0] == rcx_fragment("Qty - 5", 0.1, 0.2, 0.3, 0.02, 0.8));
            }

            THEN("a missing confidence defaults to 1.0") {
                REQUIRE(fragments[1].confidence == Catch::Approx(1.0));
            }
        }
    }

    GIVEN("an object with boundingBox coordinates") {
        rcx_string json = R"({"fragments": [
            {"text": "Grand Total", "confidence": 0.9, "boundingBox": {"minX": 0.05, "minY": 0.45, "width": 0.2, "height": 0.02}}
        ]})";

        THEN("the alternative layout is accepted") {
            REQUIRE(rcx_json::parse_fragments(json, fragments));
            REQUIRE(fragments.size() == 1);
            REQUIRE(fragments[0].x == Catch::Approx(0.05));
            REQUIRE(fragments[0].y == Catch::Approx(0.45));
        }
    }

    GIVEN("malformed documents") {
        fragments.push_back(rcx_fragment("stale", 0, 0, 0, 0));

        THEN("parsing fails and leaves the output empty") {
            REQUIRE_FALSE(rcx_json::parse_fragments("{not json", fragments));
            REQUIRE(fragments.empty());
            REQUIRE_FALSE(rcx_json::parse_fragments(R"({"items": []})", fragments));
            REQUIRE_FALSE(rcx_json::parse_fragments(R"({"fragments": 3})", fragments));
            REQUIRE_FALSE(rcx_json::parse_fragments(R"([{"box": {"x": 0, "y": 0, "width": 0, "height": 0}}])", fragments));
            REQUIRE_FALSE(rcx_json::parse_fragments(R"([{"text": "Qty"}])", fragments));
            REQUIRE_FALSE(rcx_json::parse_fragments(R"([{"text": "Qty", "confidence": "high", "box": {}}])", fragments));
            REQUIRE(fragments.empty());
        }
    }

    GIVEN("an empty array") {
        THEN("it parses to no fragments") {
            REQUIRE(rcx_json::parse_fragments("[]", fragments));
            REQUIRE(fragments.empty());
        }
    }
}

SCENARIO("rcx_json reads fragment files") {
    std::vector<rcx_fragment> fragments;

    GIVEN("the sample hardware receipt") {
        REQUIRE(rcx_json::read_fragments_file(RECTURE_SOURCE_DIR "/tests/data/hardware_receipt.json", fragments));

        THEN("every fragment is loaded") {
            REQUIRE(fragments.size() == 13);
            REQUIRE(fragments[10].text == "\xE2\x82\xB9 1,900.00");
            REQUIRE(fragments[11].confidence == Catch::Approx(1.0));
        }

        THEN("it analyzes like the in-memory receipt") {
            rcx_receipt_analyzer analyzer;
            auto result = analyzer.analyze(fragments);
            REQUIRE(*result.amount == Catch::Approx(1900.0));
            REQUIRE(result.quantity == "5");
            REQUIRE(result.unit_of_measure == "bags");
            REQUIRE(result.payment_mode == rcx_payment_mode::upi);
        }
    }

    GIVEN("a missing file") {
        THEN("reading fails") {
            REQUIRE_FALSE(rcx_json::read_fragments_file("/nonexistent/fragments.json", fragments));
        }
    }
}

SCENARIO("rcx_json serializes analysis results") {
    GIVEN("a filled result") {
        rcx_receipt_result result;
        result.date = rcx_datetime(2024, 3, 12);
        result.amount = 1900.0;
        result.categories = {"Material", "Hardware"};
        result.payment_mode = rcx_payment_mode::upi;
        result.quantity = "5";
        result.unit_of_measure = "bags";
        result.fields["projectId"] = "PRJ-17";

        rcx_field_resolution r;
        r.key = "projectId";
        r.raw_value = "PRJ-17";
        r.label_index = 3;
        r.method = rcx_resolution_method::inline_pattern;
        result.resolutions.push_back(r);

        auto doc = nlohmann::json::parse(rcx_json::create(result).to_std_const());

        THEN("all documented keys are present") {
            REQUIRE(doc["date"] == "2024-03-12");
            REQUIRE(doc["amount"].get<double>() == Catch::Approx(1900.0));
            REQUIRE(doc["categories"].size() == 2);
            REQUIRE(doc["paymentMode"] == "upi");
            REQUIRE(doc["paymentModeLabel"] == "By UPI");
            REQUIRE(doc["quantity"] == "5");
            REQUIRE(doc["uom"] == "bags");
            REQUIRE(doc["unitPrice"] == "");
            REQUIRE(doc["fields"]["projectId"] == "PRJ-17");
        }

        THEN("resolutions carry their fragment indices") {
            const auto& first = doc["resolutions"][0];
            REQUIRE(first["key"] == "projectId");
            REQUIRE(first["method"] == "inline");
            REQUIRE(first["labelIndex"] == 3);
            REQUIRE(first["valueIndex"].is_null());
        }
    }

    GIVEN("an empty result") {
        auto doc = nlohmann::json::parse(rcx_json::create(rcx_receipt_result(), true).to_std_const());

        THEN("absent values are null or empty") {
            REQUIRE(doc["date"].is_null());
            REQUIRE(doc["amount"].is_null());
            REQUIRE(doc["categories"].empty());
            REQUIRE(doc["paymentMode"] == "cash");
            REQUIRE(doc["description"] == "");
        }
    }
}

SCENARIO("rcx_json writes fragments it can read back") {
    std::vector<rcx_fragment> original = {
        rcx_fragment("Brand: UltraTech", 0.05, 0.25, 0.3, 0.02, 0.91),
    };
    std::vector<rcx_fragment> parsed;

    REQUIRE(rcx_json::parse_fragments(rcx_json::create(original), parsed));
    REQUIRE(parsed == original);
}
