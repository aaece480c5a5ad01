#pragma once

#include "query_params.h"
#include "../session/session_tokens.h"
#include "../utils/url_utils.h"
#include <string>
#include <unordered_set>

namespace spidercore {

enum class CanonicalStatus {
    CANONICAL,
    UNSUPPORTED, // no authority, e.g. mailto: or javascript:
    MALFORMED    // could not be parsed as a URI
};

std::string to_string(CanonicalStatus status);

struct CanonicalResult {
    CanonicalStatus status = CanonicalStatus::MALFORMED;
    std::string url;
    std::string error_message;

    bool ok() const { return status == CanonicalStatus::CANONICAL; }

    static CanonicalResult canonical(const std::string& url);
    static CanonicalResult unsupported();
    static CanonicalResult malformed(const std::string& error);
};

struct CanonicalizerOptions {
    ParameterMode mode = ParameterMode::USE_ALL;
    bool handle_structured_segments = false;
};

// Produces the deduplication key of a URL. Stateless apart from its options;
// safe to share between threads.
class UrlCanonicalizer {
public:
    // The registry is copied; later changes to it are not seen
    UrlCanonicalizer(const CanonicalizerOptions& options, const SessionTokenRegistry& session_tokens);

    CanonicalResult canonicalize(const std::string& raw) const;

    // base may be empty; excluded_params are matched exactly and added to the
    // session tokens for this call only
    CanonicalResult canonicalize(const std::string& raw,
                                 const std::string& base,
                                 const std::unordered_set<std::string>& excluded_params) const;

    // Filter the query (and structured path segments when enabled) without
    // sorting, lowercasing, port stripping or resolution
    static std::string clean_parameters(const Uri& uri,
                                        ParameterMode mode,
                                        bool handle_structured_segments,
                                        const ExcludedParameters& excluded);

    const CanonicalizerOptions& options() const { return options_; }

private:
    CanonicalResult canonicalize_absolute(Uri uri, const ExcludedParameters& excluded) const;

    CanonicalizerOptions options_;
    SessionTokenRegistry session_tokens_;
};

} // namespace spidercore
