#include <cassert>
#include "../../src/utils/config.h"

int main() {
    using namespace spidercore;

    // Test defaults
    Config defaults;
    assert(defaults.handle_parameters() == ParameterMode::USE_ALL);
    assert(!defaults.handle_odata_parameters());
    assert(defaults.session_tokens().size() == 3);
    assert(defaults.excluded_parameters().empty());
    assert(defaults.scanner_max_body_bytes() == 10 * 1024 * 1024);

    // Test load_from_string
    Config config;
    bool loaded = config.load_from_string(
        "spider:\n"
        "  handle_parameters: ignore_value\n"
        "  handle_odata_parameters: true\n"
        "  excluded_parameters: [utm_source, utm_medium]\n"
        "session_tokens: [sid]\n"
        "scanner:\n"
        "  max_body_bytes: 4096\n"
        "logging:\n"
        "  level: debug\n"
        "  format: json\n");
    assert(loaded);
    assert(config.last_error().empty());
    assert(config.handle_parameters() == ParameterMode::IGNORE_VALUE);
    assert(config.handle_odata_parameters());
    assert(config.excluded_parameters().count("utm_medium") == 1);
    assert(config.session_tokens().size() == 1 && config.session_tokens()[0] == "sid");
    assert(config.scanner_max_body_bytes() == 4096);
    assert(config.log_level() == "debug");
    assert(config.log_format() == "json");

    CanonicalizerOptions options = config.canonicalizer_options();
    assert(options.mode == ParameterMode::IGNORE_VALUE);
    assert(options.handle_structured_segments);

    // Test errors are reported
    Config bad_mode;
    assert(!bad_mode.load_from_string("spider:\n  handle_parameters: sometimes\n"));
    assert(!bad_mode.last_error().empty());

    Config bad_size;
    assert(!bad_size.load_from_string("scanner:\n  max_body_bytes: 0\n"));

    Config bad_yaml;
    assert(!bad_yaml.load_from_string("spider: [unterminated\n"));

    Config missing;
    assert(!missing.load("/nonexistent/spidercore.yaml"));
    assert(!missing.last_error().empty());

    return 0;
}
