#include "url_utils.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace spidercore {

namespace {

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), is_scheme_char);
}

bool parse_authority(const std::string& authority, Uri& uri, std::string& error) {
    std::string host_port = authority;

    size_t at_pos = authority.rfind('@');
    if (at_pos != std::string::npos) {
        uri.userinfo = authority.substr(0, at_pos);
        uri.has_userinfo = true;
        host_port = authority.substr(at_pos + 1);
    }

    std::string port;
    if (!host_port.empty() && host_port[0] == '[') {
        size_t close = host_port.find(']');
        if (close == std::string::npos) {
            error = "unterminated IPv6 literal in authority '" + authority + "'";
            return false;
        }
        uri.host = host_port.substr(0, close + 1);
        std::string rest = host_port.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                error = "unexpected characters after IPv6 literal in '" + authority + "'";
                return false;
            }
            port = rest.substr(1);
        }
    } else {
        size_t colon = host_port.rfind(':');
        if (colon != std::string::npos) {
            uri.host = host_port.substr(0, colon);
            port = host_port.substr(colon + 1);
        } else {
            uri.host = host_port;
        }
    }

    if (!port.empty()) {
        if (!std::all_of(port.begin(), port.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            error = "invalid port '" + port + "'";
            return false;
        }
        if (port.size() > 5 || std::stoi(port) > 65535) {
            error = "port out of range '" + port + "'";
            return false;
        }
    }
    uri.port = port;
    return true;
}

std::string directory_of(const Uri& base) {
    size_t last_slash = base.path.rfind('/');
    if (last_slash == std::string::npos) {
        return base.has_authority ? "/" : "";
    }
    return base.path.substr(0, last_slash + 1);
}

std::string merge_paths(const Uri& base, const std::string& reference_path) {
    if (base.has_authority && base.path.empty()) {
        return "/" + reference_path;
    }
    return directory_of(base) + reference_path;
}

} // namespace

UriParseResult UrlUtils::parse(const std::string& raw) {
    UriParseResult result;
    if (raw.empty()) {
        result.error_message = "empty URI";
        return result;
    }

    for (size_t i = 0; i < raw.size(); i++) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c <= 0x20 || c == 0x7f) {
            result.error_message = "illegal character at position " + std::to_string(i);
            return result;
        }
    }

    Uri& uri = result.uri;
    size_t pos = 0;

    size_t scheme_end = raw.find_first_of(":/?#");
    if (scheme_end != std::string::npos && raw[scheme_end] == ':') {
        std::string scheme = raw.substr(0, scheme_end);
        if (!valid_scheme(scheme)) {
            result.error_message = "invalid scheme '" + scheme + "'";
            return result;
        }
        uri.scheme = scheme;
        pos = scheme_end + 1;
    }

    if (raw.compare(pos, 2, "//") == 0) {
        pos += 2;
        size_t authority_end = raw.find_first_of("/?#", pos);
        if (authority_end == std::string::npos) authority_end = raw.size();
        uri.has_authority = true;
        if (!parse_authority(raw.substr(pos, authority_end - pos), uri, result.error_message)) {
            return result;
        }
        pos = authority_end;

        std::string lower_scheme = to_lower(uri.scheme);
        if (uri.host.empty() && (lower_scheme == "http" || lower_scheme == "https")) {
            result.error_message = "missing host in '" + raw + "'";
            return result;
        }
    }

    size_t path_end = raw.find_first_of("?#", pos);
    if (path_end == std::string::npos) path_end = raw.size();
    uri.path = raw.substr(pos, path_end - pos);
    pos = path_end;

    if (pos < raw.size() && raw[pos] == '?') {
        size_t query_end = raw.find('#', pos);
        if (query_end == std::string::npos) query_end = raw.size();
        uri.has_query = true;
        uri.query = raw.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    if (pos < raw.size() && raw[pos] == '#') {
        uri.has_fragment = true;
        uri.fragment = raw.substr(pos + 1);
    }

    result.success = true;
    return result;
}

// Dot segments are left in place; callers run normalize_path on the result.
Uri UrlUtils::resolve(const Uri& base, const Uri& reference) {
    if (!reference.scheme.empty()) {
        return reference;
    }

    Uri target;
    target.scheme = base.scheme;

    if (reference.has_authority) {
        target = reference;
        target.scheme = base.scheme;
        return target;
    }

    target.has_authority = base.has_authority;
    target.has_userinfo = base.has_userinfo;
    target.userinfo = base.userinfo;
    target.host = base.host;
    target.port = base.port;

    if (reference.path.empty()) {
        if (!reference.has_query && !reference.has_fragment) {
            // A bare empty reference points at the base's directory
            target.path = directory_of(base);
            return target;
        }
        target.path = base.path;
        if (reference.has_query) {
            target.has_query = true;
            target.query = reference.query;
        } else {
            target.has_query = base.has_query;
            target.query = base.query;
        }
    } else {
        if (reference.path[0] == '/') {
            target.path = reference.path;
        } else {
            target.path = merge_paths(base, reference.path);
        }
        target.has_query = reference.has_query;
        target.query = reference.query;
    }

    target.has_fragment = reference.has_fragment;
    target.fragment = reference.fragment;
    return target;
}

std::string UrlUtils::normalize_path(const std::string& path) {
    if (path.empty()) return path;

    bool absolute = path[0] == '/';
    std::vector<std::string> segments;
    size_t start = absolute ? 1 : 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }

    std::vector<std::string> output;
    bool trailing_slash = false;
    for (size_t i = 0; i < segments.size(); i++) {
        const std::string& segment = segments[i];
        bool last = (i + 1 == segments.size());

        if (segment.empty() || segment == ".") {
            if (last) trailing_slash = true;
            continue;
        }

        if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
                if (last) trailing_slash = true;
            } else if (last) {
                // ".." at the root as the final segment is kept as a literal
                output.push_back(segment);
                trailing_slash = false;
            }
            continue;
        }

        output.push_back(segment);
        trailing_slash = false;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < output.size(); i++) {
        if (i > 0) result += '/';
        result += output[i];
    }
    if (trailing_slash && !output.empty()) {
        result += '/';
    }
    return result;
}

int UrlUtils::default_port(const std::string& scheme) {
    std::string lower = to_lower(scheme);
    if (lower == "http") return 80;
    if (lower == "https") return 443;
    return 0;
}

std::string UrlUtils::authority(const Uri& uri) {
    std::string result;
    if (uri.has_userinfo) {
        result += uri.userinfo + "@";
    }
    result += uri.host;
    if (!uri.port.empty()) {
        result += ":" + uri.port;
    }
    return result;
}

std::string UrlUtils::to_string(const Uri& uri) {
    std::string result;
    if (!uri.scheme.empty()) {
        result += uri.scheme + ":";
    }
    if (uri.has_authority) {
        result += "//" + authority(uri);
    }
    result += uri.path;
    if (uri.has_query) {
        result += "?" + uri.query;
    }
    if (uri.has_fragment) {
        result += "#" + uri.fragment;
    }
    return result;
}

std::string UrlUtils::extract_domain(const std::string& url) {
    UriParseResult parsed = parse(url);
    if (!parsed.success || !parsed.uri.has_authority) {
        return "";
    }
    return to_lower(parsed.uri.host);
}

std::string UrlUtils::to_lower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace spidercore
