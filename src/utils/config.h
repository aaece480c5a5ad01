#pragma once

#include "../canonical/canonicalizer.h"
#include <string>
#include <vector>
#include <unordered_set>
#include <cstdint>

namespace YAML {
class Node;
}

namespace spidercore {

class Config {
public:
    Config();

    bool load(const std::string& config_path);
    bool load_from_string(const std::string& yaml);

    const std::string& last_error() const { return last_error_; }

    // Spider
    ParameterMode handle_parameters() const { return handle_parameters_; }
    bool handle_odata_parameters() const { return handle_odata_parameters_; }
    const std::unordered_set<std::string>& excluded_parameters() const { return excluded_parameters_; }
    CanonicalizerOptions canonicalizer_options() const;

    // Session tokens
    const std::vector<std::string>& session_tokens() const { return session_tokens_; }

    // Scanner
    int64_t scanner_max_body_bytes() const { return scanner_max_body_bytes_; }

    // Logging
    std::string log_level() const { return log_level_; }
    std::string log_format() const { return log_format_; }
    std::string log_output() const { return log_output_; }

private:
    bool apply(const YAML::Node& config);

    ParameterMode handle_parameters_ = ParameterMode::USE_ALL;
    bool handle_odata_parameters_ = false;
    std::unordered_set<std::string> excluded_parameters_;

    std::vector<std::string> session_tokens_;

    int64_t scanner_max_body_bytes_ = 10 * 1024 * 1024;

    std::string log_level_ = "info";
    std::string log_format_ = "text";
    std::string log_output_ = "stderr";

    std::string last_error_;
};

} // namespace spidercore
