#pragma once

#include <string>
#include <vector>
#include <unordered_set>

namespace spidercore {

// How query (and structured path) parameters take part in URL identity
enum class ParameterMode {
    USE_ALL,
    IGNORE_VALUE,
    IGNORE_COMPLETELY
};

// Accepts "use_all", "ignore_value", "ignore_completely" (any case)
bool parameter_mode_from_string(const std::string& name, ParameterMode& mode);
std::string to_string(ParameterMode mode);

struct QueryParameter {
    std::string name;
    std::string value;
    bool has_value = false; // a literal '=' was present

    bool operator==(const QueryParameter& other) const {
        return name == other.name && value == other.value && has_value == other.has_value;
    }
};

// Parameter names that never take part in URL identity: caller supplied names
// (exact match) plus session token names (ASCII case-insensitive).
class ExcludedParameters {
public:
    ExcludedParameters() = default;
    ExcludedParameters(std::unordered_set<std::string> names,
                       std::unordered_set<std::string> session_tokens);

    bool contains(const std::string& name) const;
    bool empty() const { return names_.empty() && session_tokens_.empty(); }

    size_t size() const { return names_.size() + session_tokens_.size(); }

private:
    std::unordered_set<std::string> names_;
    std::unordered_set<std::string> session_tokens_; // stored lowercased
};

// Split on literal '&' and the first literal '='. Empty pieces are dropped and
// percent escapes (%26, %3D) are never treated as separators.
std::vector<QueryParameter> parse_query(const std::string& raw_query);

std::string build_query(const std::vector<QueryParameter>& params);

// Stable sort by (name, value), byte-wise
void sort_parameters(std::vector<QueryParameter>& params);

// Apply exclusions and the mode to a raw query string. USE_ALL keeps wire order,
// IGNORE_VALUE yields the distinct names in byte-wise order.
std::vector<QueryParameter> clean_query(const std::string& raw_query,
                                        ParameterMode mode,
                                        const ExcludedParameters& excluded);

} // namespace spidercore
