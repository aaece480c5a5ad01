#include "config.h"
#include "../session/session_tokens.h"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace spidercore {

Config::Config()
    : session_tokens_(SessionTokenRegistry::default_tokens()) {}

bool Config::load(const std::string& config_path) {
    try {
        return apply(YAML::LoadFile(config_path));
    } catch (const std::exception& e) {
        last_error_ = "failed to load " + config_path + ": " + e.what();
        return false;
    }
}

bool Config::load_from_string(const std::string& yaml) {
    try {
        return apply(YAML::Load(yaml));
    } catch (const std::exception& e) {
        last_error_ = std::string("failed to parse configuration: ") + e.what();
        return false;
    }
}

bool Config::apply(const YAML::Node& config) {
    // Spider
    if (config["spider"]) {
        auto spider = config["spider"];
        if (spider["handle_parameters"]) {
            std::string mode = spider["handle_parameters"].as<std::string>();
            if (!parameter_mode_from_string(mode, handle_parameters_)) {
                last_error_ = "unknown spider.handle_parameters '" + mode + "'";
                return false;
            }
        }
        if (spider["handle_odata_parameters"]) {
            handle_odata_parameters_ = spider["handle_odata_parameters"].as<bool>();
        }
        if (spider["excluded_parameters"]) {
            excluded_parameters_.clear();
            for (const auto& item : spider["excluded_parameters"]) {
                excluded_parameters_.insert(item.as<std::string>());
            }
        }
    }

    // Session tokens replace the defaults when present
    if (config["session_tokens"]) {
        session_tokens_.clear();
        for (const auto& item : config["session_tokens"]) {
            session_tokens_.push_back(item.as<std::string>());
        }
    }

    // Scanner
    if (config["scanner"]) {
        auto scanner = config["scanner"];
        if (scanner["max_body_bytes"]) {
            scanner_max_body_bytes_ = scanner["max_body_bytes"].as<int64_t>();
            if (scanner_max_body_bytes_ <= 0) {
                last_error_ = "scanner.max_body_bytes must be positive";
                return false;
            }
        }
    }

    // Logging
    if (config["logging"]) {
        auto logging = config["logging"];
        if (logging["level"]) log_level_ = logging["level"].as<std::string>();
        if (logging["format"]) log_format_ = logging["format"].as<std::string>();
        if (logging["output"]) log_output_ = logging["output"].as<std::string>();
    }

    last_error_.clear();
    return true;
}

CanonicalizerOptions Config::canonicalizer_options() const {
    CanonicalizerOptions options;
    options.mode = handle_parameters_;
    options.handle_structured_segments = handle_odata_parameters_;
    return options;
}

} // namespace spidercore
