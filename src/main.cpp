#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "utils/config.h"
#include "canonical/canonicalizer.h"
#include "session/session_tokens.h"
#include "parser/resource.h"
#include "parser/text_parser.h"
#include "observability/logger.h"
#include "observability/metrics.h"
#include <nlohmann/json.hpp>

using namespace spidercore;

namespace {

void print_usage() {
    std::cerr << "usage: spidercore <config.yaml> canonicalize [base_url]\n"
              << "       spidercore <config.yaml> scan <content_type> <file> [resource_url]\n";
}

void record(const CanonicalResult& result) {
    switch (result.status) {
        case CanonicalStatus::CANONICAL:
            Metrics::instance().increment_counter("canonical_urls_total");
            break;
        case CanonicalStatus::UNSUPPORTED:
            Metrics::instance().increment_counter("unsupported_urls_total");
            break;
        case CanonicalStatus::MALFORMED:
            Metrics::instance().increment_counter("malformed_urls_total");
            break;
    }
}

nlohmann::json to_json(const std::string& input, const CanonicalResult& result) {
    nlohmann::json item;
    item["input"] = input;
    item["status"] = to_string(result.status);
    if (result.ok()) {
        item["url"] = result.url;
    } else if (result.status == CanonicalStatus::MALFORMED) {
        item["error"] = result.error_message;
    }
    return item;
}

int run_canonicalize(const Config& config, const UrlCanonicalizer& canonicalizer, const std::string& base) {
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        CanonicalResult result = canonicalizer.canonicalize(line, base, config.excluded_parameters());
        record(result);
        std::cout << to_json(line, result).dump() << "\n";
    }
    return 0;
}

int run_scan(const Config& config, const UrlCanonicalizer& canonicalizer,
             const std::string& content_type, const std::string& path, const std::string& resource_url) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Logger::instance().error("cannot open " + path);
        return 1;
    }

    // Bound the scan cost before handing the body over
    std::string body(static_cast<size_t>(config.scanner_max_body_bytes()), '\0');
    file.read(&body[0], static_cast<std::streamsize>(body.size()));
    body.resize(static_cast<size_t>(file.gcount()));
    if (file.peek() != std::ifstream::traits_type::eof()) {
        Logger::instance().warn(path + " truncated to " + std::to_string(body.size()) + " bytes");
    }

    Resource resource(resource_url, content_type, body);
    TextParser parser;
    if (!parser.can_parse(&resource, &path, false)) {
        Logger::instance().info(path + " (" + content_type + ") is not eligible for text scanning");
        return 0;
    }

    parser.add_listener([&](const FoundUrl& found) {
        Metrics::instance().increment_counter("found_urls_total");
        CanonicalResult result = canonicalizer.canonicalize(
            found.url, found.source_url, config.excluded_parameters());
        record(result);

        nlohmann::json item = to_json(found.url, result);
        item["depth"] = found.depth;
        std::cout << item.dump() << "\n";
    });

    parser.parse(&resource, resource.body, 0);
    Metrics::instance().increment_counter("scanned_resources_total");
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 2;
    }

    // Load configuration
    Config config;
    if (!config.load(argv[1])) {
        std::cerr << config.last_error() << std::endl;
        return 1;
    }

    // Initialize logger
    if (!Logger::instance().init(config.log_level(), config.log_format(), config.log_output())) {
        std::cerr << "invalid logging configuration" << std::endl;
        return 1;
    }

    SessionTokenRegistry session_tokens(config.session_tokens());
    UrlCanonicalizer canonicalizer(config.canonicalizer_options(), session_tokens);
    Logger::instance().debug("parameter mode " + to_string(config.handle_parameters()) +
                             ", structured segments " +
                             (config.handle_odata_parameters() ? "on" : "off"));

    std::string command = argv[2];
    int status = 0;
    if (command == "canonicalize") {
        status = run_canonicalize(config, canonicalizer, argc > 3 ? argv[3] : "");
    } else if (command == "scan" && argc >= 5) {
        status = run_scan(config, canonicalizer, argv[3], argv[4], argc > 5 ? argv[5] : "");
    } else {
        print_usage();
        return 2;
    }

    std::cerr << Metrics::instance().to_json() << std::endl;
    return status;
}
