#pragma once

#include <string>

namespace spidercore {

struct ContentType {
    std::string type;    // lowercased, e.g. "text"
    std::string subtype; // lowercased, e.g. "plain"

    // Parse a Content-Type header value; parameters such as charset are dropped
    static ContentType parse(const std::string& header);

    bool is_text() const { return type == "text"; }
    bool is_html() const { return is_text() && subtype == "html"; }
};

// A fetched resource whose body is already in memory
struct Resource {
    std::string url;
    ContentType content_type;
    std::string body;

    Resource() = default;
    Resource(const std::string& url, const std::string& content_type_header, const std::string& body);
};

} // namespace spidercore
