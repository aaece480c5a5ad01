#include "query_params.h"
#include "../utils/url_utils.h"
#include <algorithm>
#include <set>
#include <utility>

namespace spidercore {

bool parameter_mode_from_string(const std::string& name, ParameterMode& mode) {
    std::string lower = UrlUtils::to_lower(name);
    if (lower == "use_all") mode = ParameterMode::USE_ALL;
    else if (lower == "ignore_value") mode = ParameterMode::IGNORE_VALUE;
    else if (lower == "ignore_completely") mode = ParameterMode::IGNORE_COMPLETELY;
    else return false;
    return true;
}

std::string to_string(ParameterMode mode) {
    switch (mode) {
        case ParameterMode::USE_ALL: return "use_all";
        case ParameterMode::IGNORE_VALUE: return "ignore_value";
        case ParameterMode::IGNORE_COMPLETELY: return "ignore_completely";
        default: return "unknown";
    }
}

ExcludedParameters::ExcludedParameters(std::unordered_set<std::string> names,
                                       std::unordered_set<std::string> session_tokens)
    : names_(std::move(names)) {
    for (const auto& token : session_tokens) {
        session_tokens_.insert(UrlUtils::to_lower(token));
    }
}

bool ExcludedParameters::contains(const std::string& name) const {
    if (names_.count(name) > 0) {
        return true;
    }
    return !session_tokens_.empty() && session_tokens_.count(UrlUtils::to_lower(name)) > 0;
}

std::vector<QueryParameter> parse_query(const std::string& raw_query) {
    std::vector<QueryParameter> params;
    size_t start = 0;
    while (start <= raw_query.size()) {
        size_t amp = raw_query.find('&', start);
        if (amp == std::string::npos) amp = raw_query.size();

        std::string piece = raw_query.substr(start, amp - start);
        if (!piece.empty()) {
            QueryParameter param;
            size_t eq = piece.find('=');
            if (eq == std::string::npos) {
                param.name = piece;
            } else {
                param.name = piece.substr(0, eq);
                param.value = piece.substr(eq + 1);
                param.has_value = true;
            }
            params.push_back(std::move(param));
        }
        start = amp + 1;
    }
    return params;
}

std::string build_query(const std::vector<QueryParameter>& params) {
    std::string query;
    for (const auto& param : params) {
        if (!query.empty()) query += '&';
        query += param.name;
        if (param.has_value) {
            query += '=';
            query += param.value;
        }
    }
    return query;
}

void sort_parameters(std::vector<QueryParameter>& params) {
    std::stable_sort(params.begin(), params.end(),
                     [](const QueryParameter& a, const QueryParameter& b) {
                         if (a.name != b.name) return a.name < b.name;
                         return a.value < b.value;
                     });
}

std::vector<QueryParameter> clean_query(const std::string& raw_query,
                                        ParameterMode mode,
                                        const ExcludedParameters& excluded) {
    std::vector<QueryParameter> cleaned;
    if (mode == ParameterMode::IGNORE_COMPLETELY) {
        return cleaned;
    }

    std::vector<QueryParameter> params = parse_query(raw_query);
    if (mode == ParameterMode::USE_ALL) {
        for (auto& param : params) {
            if (!excluded.contains(param.name)) {
                cleaned.push_back(std::move(param));
            }
        }
        return cleaned;
    }

    std::set<std::string> names;
    for (const auto& param : params) {
        if (!excluded.contains(param.name)) {
            names.insert(param.name);
        }
    }
    for (const auto& name : names) {
        QueryParameter param;
        param.name = name;
        cleaned.push_back(std::move(param));
    }
    return cleaned;
}

} // namespace spidercore
