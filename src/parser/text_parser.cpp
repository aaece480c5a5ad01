#include "text_parser.h"
#include "../observability/logger.h"
#include "../utils/url_utils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace spidercore {

namespace {

const char* kComponent = "text_parser";

bool equals_ignore_case(const std::string& text, size_t pos, const char* literal) {
    for (size_t i = 0; literal[i] != '\0'; i++) {
        if (pos + i >= text.size() ||
            std::tolower(static_cast<unsigned char>(text[pos + i])) != literal[i]) {
            return false;
        }
    }
    return true;
}

// Length of the "http://" or "https://" anchor at pos, 0 if there is none
size_t anchor_length(const std::string& text, size_t pos) {
    if (!equals_ignore_case(text, pos, "http")) {
        return 0;
    }
    if (equals_ignore_case(text, pos + 4, "://")) {
        return 7;
    }
    if (equals_ignore_case(text, pos + 4, "s://")) {
        return 8;
    }
    return 0;
}

bool closing_delimiter(char opening, char& closing) {
    switch (opening) {
        case '\'': closing = '\''; return true;
        case '"': closing = '"'; return true;
        case '<': closing = '>'; return true;
        case '(': closing = ')'; return true;
        case '[': closing = ']'; return true;
        case '{': closing = '}'; return true;
        default: return false;
    }
}

// Drop the fragment, lowercase scheme and host. Empty when there is no host.
std::string tidy_match(const std::string& raw_match, size_t anchor_len) {
    std::string match = raw_match.substr(0, raw_match.find('#'));

    size_t authority_end = match.find_first_of("/?", anchor_len);
    if (authority_end == std::string::npos) authority_end = match.size();
    std::string authority = match.substr(anchor_len, authority_end - anchor_len);

    size_t host_start = authority.rfind('@');
    host_start = (host_start == std::string::npos) ? 0 : host_start + 1;
    if (host_start >= authority.size()) {
        return "";
    }
    std::transform(authority.begin() + host_start, authority.end(), authority.begin() + host_start,
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string rest = match.substr(authority_end);
    if (rest.empty() || rest[0] == '?') {
        rest = "/" + rest;
    }

    return UrlUtils::to_lower(match.substr(0, anchor_len)) + authority + rest;
}

} // namespace

size_t find_text_urls(const std::string& text, const std::function<void(const std::string&)>& emit) {
    size_t found = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t anchor_len = anchor_length(text, pos);
        if (anchor_len == 0) {
            pos++;
            continue;
        }

        char closing = 0;
        bool delimited = pos > 0 && closing_delimiter(text[pos - 1], closing);

        size_t end = pos + anchor_len;
        while (end < text.size() &&
               !std::isspace(static_cast<unsigned char>(text[end])) &&
               !(delimited && text[end] == closing)) {
            end++;
        }

        std::string url = tidy_match(text.substr(pos, end - pos), anchor_len);
        if (!url.empty()) {
            emit(url);
            found++;
        }
        pos = end;
    }
    return found;
}

void TextParser::add_listener(UrlListener listener) {
    listeners_.push_back(std::move(listener));
}

bool TextParser::can_parse(const Resource* resource, const std::string* /*path_hint*/,
                           bool already_parsed) const {
    if (resource == nullptr) {
        throw std::invalid_argument("TextParser::can_parse: resource must not be null");
    }
    if (already_parsed) {
        return false;
    }
    // Markup goes to the HTML parser
    return resource->content_type.is_text() && !resource->content_type.is_html();
}

bool TextParser::parse(const Resource* resource, const std::string& body, int depth) const {
    if (resource == nullptr) {
        throw std::invalid_argument("TextParser::parse: resource must not be null");
    }

    size_t found = find_text_urls(body, [&](const std::string& url) {
        FoundUrl occurrence;
        occurrence.url = url;
        occurrence.source_url = resource->url;
        occurrence.depth = depth + 1;
        for (const auto& listener : listeners_) {
            listener(occurrence);
        }
    });

    if (Logger::instance().enabled(LogLevel::DEBUG)) {
        Logger::instance().debug("found " + std::to_string(found) + " URLs in " +
                                 (resource->url.empty() ? std::string("<unnamed>") : resource->url),
                                 kComponent);
    }
    return false;
}

} // namespace spidercore
