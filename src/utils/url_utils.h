#pragma once

#include <string>

namespace spidercore {

// Components of a URI reference, kept in their raw (still percent-encoded) form.
struct Uri {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;

    bool has_authority = false;
    bool has_userinfo = false;
    bool has_query = false;
    bool has_fragment = false;

    bool is_relative() const { return scheme.empty(); }
};

struct UriParseResult {
    bool success = false;
    Uri uri;
    std::string error_message;
};

class UrlUtils {
public:
    // Split a URI reference into its components
    static UriParseResult parse(const std::string& raw);

    // Resolve a reference against an absolute base (RFC 3986 section 5.2)
    static Uri resolve(const Uri& base, const Uri& reference);

    // Collapse empty segments and resolve dot segments
    static std::string normalize_path(const std::string& path);

    // Default port of the scheme, 0 when it has none
    static int default_port(const std::string& scheme);

    // [userinfo@]host[:port]
    static std::string authority(const Uri& uri);

    // Recompose the reference, fragment included
    static std::string to_string(const Uri& uri);

    // Lowercased host of an absolute URL, empty if it has none
    static std::string extract_domain(const std::string& url);

    static std::string to_lower(const std::string& value);
};

} // namespace spidercore
