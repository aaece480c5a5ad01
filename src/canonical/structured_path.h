#pragma once

#include "query_params.h"
#include <string>
#include <vector>

namespace spidercore {

// A path segment written as a call, e.g. Book(1) or Book(title='x',year=2012)
struct StructuredSegment {
    std::string name;
    std::string arguments;                 // raw text between the parentheses
    std::vector<std::string> keys;         // filled only for key lists, e.g. title=x or title
    bool keyed = false;
};

// Recognize Name(args); returns false for ordinary segments
bool parse_structured_segment(const std::string& segment, StructuredSegment& parsed);

std::string clean_structured_segment(const std::string& segment, ParameterMode mode);

// Apply clean_structured_segment to every segment of a path
std::string clean_structured_path(const std::string& path, ParameterMode mode);

} // namespace spidercore
