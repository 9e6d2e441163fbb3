#include <catch2/catch_all.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "documents/receipt/rcx_receipt_scanner.h"
#include "documents/receipt/rcx_precomputed_recognizer.h"

using namespace rcx::extract;

namespace {

class fake_recognizer : public i_text_recognizer {
public:
    std::vector<rcx_fragment> fragments;
    bool fail = false;
    rcx_string failure_message = "OCR engine unavailable";
    int calls = 0;
    int last_width = 0;

    bool recognize_text(const cv::Mat& image, std::vector<rcx_fragment>& out, rcx_string& error) override {
        ++calls;
        last_width = image.cols;
        if (fail) {
            error = failure_message;
            return false;
        }
        out = fragments;
        return true;
    }
};

std::vector<unsigned char> encoded_white_image(int width, int height) {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<unsigned char> bytes;
    cv::imencode(".png", image, bytes);
    return bytes;
}

}

SCENARIO("rcx_receipt_scanner decodes, recognizes and analyzes") {
    rcx_receipt_analyzer analyzer;
    fake_recognizer recognizer;
    rcx_receipt_scanner scanner(analyzer, recognizer);

    GIVEN("a decodable image and a working recognizer") {
        recognizer.fragments = {
            rcx_fragment("Grand Total", 0.10, 0.50, 0.20, 0.02),
            rcx_fragment("\xE2\x82\xB9 12,450.00", 0.10, 0.60, 0.20, 0.02),
        };
        auto bytes = encoded_white_image(40, 60);
        REQUIRE_FALSE(bytes.empty());

        WHEN("scanning the bytes") {
            auto result = scanner.scan_bytes(bytes);

            THEN("the recognizer sees the decoded image and the result is analyzed") {
                REQUIRE(recognizer.calls == 1);
                REQUIRE(recognizer.last_width == 40);
                REQUIRE(result.amount.has_value());
                REQUIRE(*result.amount == Catch::Approx(12450.0));
            }
        }
    }

    GIVEN("bytes that are not an image") {
        std::vector<unsigned char> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};

        THEN("an image processing failure is raised before recognition") {
            REQUIRE_THROWS_AS(scanner.scan_bytes(garbage), rcx_image_processing_failure);
            REQUIRE_THROWS_AS(scanner.scan_bytes({}), rcx_image_processing_failure);
            REQUIRE(recognizer.calls == 0);
        }
    }

    GIVEN("a path that does not exist") {
        THEN("an image processing failure names the path") {
            try {
                scanner.scan_file("/nonexistent/receipt.jpg");
                FAIL("expected rcx_image_processing_failure");
            } catch (const rcx_image_processing_failure& e) {
                REQUIRE(e.get_source() == "/nonexistent/receipt.jpg");
            }
            REQUIRE_THROWS_AS(scanner.scan_file(""), rcx_image_processing_failure);
        }
    }

    GIVEN("an empty matrix") {
        THEN("it is rejected") {
            REQUIRE_THROWS_AS(scanner.scan_image(cv::Mat()), rcx_image_processing_failure);
        }
    }

    GIVEN("a recognizer that fails") {
        recognizer.fail = true;

        THEN("its message is surfaced as a recognition failure") {
            try {
                scanner.scan_bytes(encoded_white_image(10, 10));
                FAIL("expected rcx_recognition_failure");
            } catch (const rcx_recognition_failure& e) {
                REQUIRE(rcx_string(e.what()) == "OCR engine unavailable");
            }
        }
    }

    GIVEN("a recognizer that finds only noise") {
        recognizer.fragments = {rcx_fragment("~~", 0.1, 0.1, 0.1, 0.02, 0.05)};

        THEN("the scan ends with a parsing failure") {
            REQUIRE_THROWS_AS(scanner.scan_bytes(encoded_white_image(10, 10)), rcx_parsing_failure);
        }
    }
}

SCENARIO("rcx_precomputed_recognizer serves stored fragments") {
    cv::Mat image(10, 10, CV_8UC3, cv::Scalar(0, 0, 0));
    std::vector<rcx_fragment> out;
    rcx_string error;

    GIVEN("a recognizer without fragments") {
        rcx_precomputed_recognizer recognizer;

        THEN("recognition fails with a message") {
            REQUIRE_FALSE(recognizer.is_loaded());
            REQUIRE_FALSE(recognizer.recognize_text(image, out, error));
            REQUIRE_FALSE(error.empty());
        }

        WHEN("loading a missing file") {
            THEN("the path is reported") {
                REQUIRE_FALSE(recognizer.load_file("/nonexistent/fragments.json"));
                REQUIRE_FALSE(recognizer.recognize_text(image, out, error));
                REQUIRE(error.contains("/nonexistent/fragments.json"));
            }
        }

        WHEN("loading the sample receipt") {
            REQUIRE(recognizer.load_file(RECTURE_SOURCE_DIR "/tests/data/hardware_receipt.json"));

            THEN("it returns the stored fragments for any image") {
                REQUIRE(recognizer.recognize_text(image, out, error));
                REQUIRE(out.size() == 13);
            }
        }
    }

    GIVEN("a recognizer built from fragments") {
        rcx_precomputed_recognizer recognizer({rcx_fragment("Qty - 5", 0.1, 0.1, 0.2, 0.02)});

        THEN("an empty image is still refused") {
            REQUIRE_FALSE(recognizer.recognize_text(cv::Mat(), out, error));
        }

        THEN("the scanner analyzes its fragments") {
            rcx_receipt_analyzer analyzer;
            rcx_receipt_scanner scanner(analyzer, recognizer);
            REQUIRE(scanner.scan_image(image).quantity == "5");
        }
    }
}
