#pragma once

#include "resource.h"
#include <string>
#include <vector>
#include <functional>

namespace spidercore {

struct FoundUrl {
    std::string url;
    std::string source_url; // URL of the resource the occurrence was found in
    int depth = 0;          // depth of the scanned resource + 1
};

using UrlListener = std::function<void(const FoundUrl&)>;

// Report every http/https URL in text, in order, and return how many were found.
// Scheme and host are lowercased, fragments dropped, and an empty path becomes "/".
size_t find_text_urls(const std::string& text, const std::function<void(const std::string&)>& emit);

// Finds absolute http(s) URLs in non-markup text bodies
class TextParser {
public:
    TextParser() = default;

    void add_listener(UrlListener listener);
    size_t listener_count() const { return listeners_.size(); }

    // path_hint may be null and is not used. Throws std::invalid_argument if
    // resource is null.
    bool can_parse(const Resource* resource, const std::string* path_hint, bool already_parsed) const;

    // Always returns false: the body stays available to other parsers.
    // Throws std::invalid_argument if resource is null.
    bool parse(const Resource* resource, const std::string& body, int depth) const;

private:
    std::vector<UrlListener> listeners_;
};

} // namespace spidercore
