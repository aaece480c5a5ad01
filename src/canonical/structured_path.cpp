#include "structured_path.h"
#include <algorithm>
#include <cctype>
#include <utility>

namespace spidercore {

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '%' || c == '.' || c == '-';
}

// Split on commas that are not inside a single-quoted literal
std::vector<std::string> split_arguments(const std::string& arguments) {
    std::vector<std::string> items;
    std::string current;
    bool quoted = false;
    for (char c : arguments) {
        if (c == '\'') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            items.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    items.push_back(current);
    return items;
}

// A key such as "title", "na%20me" or "my-key". Keys of key=value items and
// bare keys left behind by IGNORE_VALUE share this rule; a leading digit, '-'
// or '.' reads as a numeric literal.
bool is_key(const std::string& text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-' || text[0] == '.') {
        return false;
    }
    return std::all_of(text.begin(), text.end(), is_name_char);
}

size_t find_unquoted(const std::string& text, char wanted) {
    bool quoted = false;
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\'') {
            quoted = !quoted;
        } else if (text[i] == wanted && !quoted) {
            return i;
        }
    }
    return std::string::npos;
}

} // namespace

bool parse_structured_segment(const std::string& segment, StructuredSegment& parsed) {
    size_t open = segment.find('(');
    if (open == std::string::npos || open == 0 || segment.back() != ')') {
        return false;
    }

    std::string name = segment.substr(0, open);
    if (!std::all_of(name.begin(), name.end(), is_name_char)) {
        return false;
    }

    parsed.name = name;
    parsed.arguments = segment.substr(open + 1, segment.size() - open - 2);
    parsed.keys.clear();
    parsed.keyed = false;

    if (parsed.arguments.empty()) {
        return true;
    }

    std::vector<std::string> keys;
    for (const auto& item : split_arguments(parsed.arguments)) {
        size_t eq = find_unquoted(item, '=');
        if (eq != std::string::npos && is_key(item.substr(0, eq))) {
            keys.push_back(item.substr(0, eq));
        } else if (eq == std::string::npos && is_key(item)) {
            keys.push_back(item);
        } else {
            // Any unnamed literal makes the whole argument list a literal
            return true;
        }
    }
    parsed.keys = std::move(keys);
    parsed.keyed = true;
    return true;
}

std::string clean_structured_segment(const std::string& segment, ParameterMode mode) {
    if (mode == ParameterMode::USE_ALL) {
        return segment;
    }

    StructuredSegment parsed;
    if (!parse_structured_segment(segment, parsed)) {
        return segment;
    }

    if (mode == ParameterMode::IGNORE_VALUE && parsed.keyed) {
        std::string result = parsed.name + "(";
        for (size_t i = 0; i < parsed.keys.size(); i++) {
            if (i > 0) result += ',';
            result += parsed.keys[i];
        }
        return result + ")";
    }
    return parsed.name + "()";
}

std::string clean_structured_path(const std::string& path, ParameterMode mode) {
    if (mode == ParameterMode::USE_ALL || path.find('(') == std::string::npos) {
        return path;
    }

    std::string result;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            result += clean_structured_segment(path.substr(start), mode);
            break;
        }
        result += clean_structured_segment(path.substr(start, slash - start), mode);
        result += '/';
        start = slash + 1;
    }
    return result;
}

} // namespace spidercore
