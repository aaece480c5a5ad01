#include "canonicalizer.h"
#include "structured_path.h"
#include "../observability/logger.h"
#include <vector>

namespace spidercore {

namespace {

const char* kComponent = "canonicalizer";

// Apply the parameter policy to the path and query of uri and return the
// surviving query parameters (uri.query is left untouched).
std::vector<QueryParameter> apply_parameter_policy(Uri& uri,
                                                   ParameterMode mode,
                                                   bool handle_structured_segments,
                                                   const ExcludedParameters& excluded) {
    if (handle_structured_segments) {
        uri.path = clean_structured_path(uri.path, mode);
    }
    if (!uri.has_query) {
        return {};
    }
    return clean_query(uri.query, mode, excluded);
}

void set_query(Uri& uri, const std::vector<QueryParameter>& params) {
    uri.query = build_query(params);
    uri.has_query = !uri.query.empty();
}

CanonicalResult log_malformed(const std::string& raw, const std::string& error) {
    if (Logger::instance().enabled(LogLevel::DEBUG)) {
        Logger::instance().debug("malformed URL '" + raw + "': " + error, kComponent);
    }
    return CanonicalResult::malformed(error);
}

} // namespace

std::string to_string(CanonicalStatus status) {
    switch (status) {
        case CanonicalStatus::CANONICAL: return "canonical";
        case CanonicalStatus::UNSUPPORTED: return "unsupported";
        case CanonicalStatus::MALFORMED: return "malformed";
        default: return "unknown";
    }
}

CanonicalResult CanonicalResult::canonical(const std::string& url) {
    CanonicalResult result;
    result.status = CanonicalStatus::CANONICAL;
    result.url = url;
    return result;
}

CanonicalResult CanonicalResult::unsupported() {
    CanonicalResult result;
    result.status = CanonicalStatus::UNSUPPORTED;
    return result;
}

CanonicalResult CanonicalResult::malformed(const std::string& error) {
    CanonicalResult result;
    result.status = CanonicalStatus::MALFORMED;
    result.error_message = error;
    return result;
}

UrlCanonicalizer::UrlCanonicalizer(const CanonicalizerOptions& options,
                                   const SessionTokenRegistry& session_tokens)
    : options_(options), session_tokens_(session_tokens) {}

CanonicalResult UrlCanonicalizer::canonicalize(const std::string& raw) const {
    return canonicalize(raw, "", {});
}

CanonicalResult UrlCanonicalizer::canonicalize(
    const std::string& raw,
    const std::string& base,
    const std::unordered_set<std::string>& excluded_params) const {

    Uri uri;
    if (!(raw.empty() && !base.empty())) {
        UriParseResult parsed = UrlUtils::parse(raw);
        if (!parsed.success) {
            return log_malformed(raw, parsed.error_message);
        }
        uri = parsed.uri;
    }

    if (uri.is_relative()) {
        if (base.empty()) {
            if (uri.has_authority) {
                return log_malformed(raw, "scheme-relative reference without a base URI");
            }
            return CanonicalResult::unsupported();
        }

        UriParseResult parsed_base = UrlUtils::parse(base);
        if (!parsed_base.success) {
            return log_malformed(raw, "invalid base URI '" + base + "': " + parsed_base.error_message);
        }
        if (parsed_base.uri.is_relative()) {
            return log_malformed(raw, "base URI '" + base + "' is not absolute");
        }
        uri = UrlUtils::resolve(parsed_base.uri, uri);
    }

    if (!uri.has_authority) {
        return CanonicalResult::unsupported();
    }

    return canonicalize_absolute(uri, session_tokens_.excluded_with(excluded_params));
}

CanonicalResult UrlCanonicalizer::canonicalize_absolute(Uri uri, const ExcludedParameters& excluded) const {
    uri.scheme = UrlUtils::to_lower(uri.scheme);
    uri.host = UrlUtils::to_lower(uri.host);

    int default_port = UrlUtils::default_port(uri.scheme);
    if (!uri.port.empty() && default_port != 0 && std::stoi(uri.port) == default_port) {
        uri.port.clear();
    }

    uri.path = UrlUtils::normalize_path(uri.path);
    if (uri.path.empty()) {
        uri.path = "/";
    }

    uri.has_fragment = false;
    uri.fragment.clear();

    std::vector<QueryParameter> params = apply_parameter_policy(
        uri, options_.mode, options_.handle_structured_segments, excluded);
    sort_parameters(params);
    set_query(uri, params);

    return CanonicalResult::canonical(UrlUtils::to_string(uri));
}

std::string UrlCanonicalizer::clean_parameters(const Uri& uri,
                                               ParameterMode mode,
                                               bool handle_structured_segments,
                                               const ExcludedParameters& excluded) {
    Uri cleaned = uri;
    std::vector<QueryParameter> params = apply_parameter_policy(
        cleaned, mode, handle_structured_segments, excluded);
    set_query(cleaned, params);

    cleaned.has_fragment = false;
    cleaned.fragment.clear();
    return UrlUtils::to_string(cleaned);
}

} // namespace spidercore
