#include "resource.h"
#include "../utils/url_utils.h"

namespace spidercore {

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

} // namespace

ContentType ContentType::parse(const std::string& header) {
    ContentType content_type;
    std::string media_type = header.substr(0, header.find(';'));

    size_t slash = media_type.find('/');
    if (slash == std::string::npos) {
        content_type.type = UrlUtils::to_lower(trim(media_type));
    } else {
        content_type.type = UrlUtils::to_lower(trim(media_type.substr(0, slash)));
        content_type.subtype = UrlUtils::to_lower(trim(media_type.substr(slash + 1)));
    }
    return content_type;
}

Resource::Resource(const std::string& url, const std::string& content_type_header, const std::string& body)
    : url(url), content_type(ContentType::parse(content_type_header)), body(body) {}

} // namespace spidercore
