/**
 * recture - receipt field extraction
 *
 * Usage:
 *   ./recture <fragments.json> [options]
 *
 * Examples:
 *   ./recture receipt.json
 *   ./recture receipt.json --pretty --verbose
 *   ./recture receipt.json --image=receipt.jpg --max-gap=0.4
 */

#include "aiprocesses/extract/rcx_receipt_analyzer.h"
#include "api/json/rcx_json.h"
#include "documents/receipt/rcx_precomputed_recognizer.h"
#include "documents/receipt/rcx_receipt_scanner.h"
#include "utils/rcx_env.h"
#include <iostream>
#include <string>

using namespace rcx::extract;

namespace {

const int exit_ok = 0;
const int exit_usage = 1;
const int exit_image = 2;
const int exit_recognition = 3;
const int exit_parsing = 4;

}

void print_usage(const char* program_name) {
    std::cout << "Receipt field extraction - recture\n" << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " <fragments.json> [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --image=<path>            Decode this receipt image before analysis" << std::endl;
    std::cout << "  --confidence-floor=<f>    Drop fragments below this confidence (default: 0.3)" << std::endl;
    std::cout << "  --row-resolution=<f>      Height of one row bucket (default: 0.01)" << std::endl;
    std::cout << "  --max-gap=<f>             Farthest value right of a label (default: 0.6)" << std::endl;
    std::cout << "  --verbose                 Log resolutions to stderr" << std::endl;
    std::cout << "  --pretty                  Indent the JSON output\n" << std::endl;
    std::cout << "Exit codes:" << std::endl;
    std::cout << "  0 success, 1 usage or input error, 2 image error, 3 recognition error, 4 no usable text\n" << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " receipt.json --pretty" << std::endl;
    std::cout << "  " << program_name << " receipt.json --image=receipt.jpg --verbose" << std::endl;
}

std::string get_option_value(const std::string& arg, const std::string& prefix) {
    if (arg.find(prefix) == 0) {
        return arg.substr(prefix.length());
    }
    return "";
}

bool parse_fraction(const std::string& text, const char* option, bool allow_zero, double& out) {
    rcx_string value(text);
    if (!value.is_numeric()) {
        std::cerr << "Error: " << option << " expects a number, got '" << text << "'" << std::endl;
        return false;
    }
    double parsed = value.to_double();
    if (parsed < 0.0 || (parsed == 0.0 && !allow_zero) || parsed > 1.0) {
        std::cerr << "Error: " << option << " out of range: " << text << std::endl;
        return false;
    }
    out = parsed;
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return exit_usage;
    }

    load_env_file(".env");
    rcx_extraction_config config = rcx_extraction_config::from_env();

    std::string fragments_path;
    std::string image_path;
    bool pretty = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return exit_ok;
        } else if (arg.find("--image=") == 0) {
            image_path = get_option_value(arg, "--image=");
        } else if (arg.find("--confidence-floor=") == 0) {
            if (!parse_fraction(get_option_value(arg, "--confidence-floor="), "--confidence-floor", true, config.confidence_floor)) {
                return exit_usage;
            }
        } else if (arg.find("--row-resolution=") == 0) {
            if (!parse_fraction(get_option_value(arg, "--row-resolution="), "--row-resolution", false, config.row_resolution)) {
                return exit_usage;
            }
        } else if (arg.find("--max-gap=") == 0) {
            if (!parse_fraction(get_option_value(arg, "--max-gap="), "--max-gap", false, config.max_gap)) {
                return exit_usage;
            }
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--pretty") {
            pretty = true;
        } else if (!arg.empty() && arg[0] != '-' && fragments_path.empty()) {
            fragments_path = arg;
        } else {
            std::cerr << "Error: unknown argument " << arg << std::endl;
            print_usage(argv[0]);
            return exit_usage;
        }
    }

    if (fragments_path.empty()) {
        print_usage(argv[0]);
        return exit_usage;
    }

    rcx_precomputed_recognizer recognizer;
    if (!recognizer.load_file(fragments_path.c_str())) {
        return exit_usage;
    }

    rcx_receipt_analyzer analyzer(config);

    try {
        rcx_receipt_result result;
        if (!image_path.empty()) {
            rcx_receipt_scanner scanner(analyzer, recognizer);
            result = scanner.scan_file(image_path.c_str());
        } else {
            result = analyzer.analyze(recognizer.get_fragments());
        }

        rcx_string json = rcx_json::create(result, pretty);
        if (json.empty()) {
            return exit_usage;
        }
        std::cout << json.c_str() << std::endl;
        return exit_ok;

    } catch (const rcx_image_processing_failure& e) {
        std::cerr << "Image error: " << e.what();
        if (!e.get_source().empty()) {
            std::cerr << " (" << e.get_source().c_str() << ")";
        }
        std::cerr << std::endl;
        return exit_image;
    } catch (const rcx_recognition_failure& e) {
        std::cerr << "Recognition error: " << e.what() << std::endl;
        return exit_recognition;
    } catch (const rcx_parsing_failure& e) {
        std::cerr << "No usable text: " << e.what() << " (" << e.get_fragment_count() << " fragments received)" << std::endl;
        return exit_parsing;
    }
}
