#include <cassert>
#include <vector>
#include "../../src/canonical/query_params.h"

int main() {
    using namespace spidercore;

    // Test parse_query keeps encoded separators inside names and values
    std::vector<QueryParameter> params = parse_query("par%3Dam1=val%26ue1&par%26am2=val%3Due2");
    assert(params.size() == 2);
    assert(params[0].name == "par%3Dam1" && params[0].value == "val%26ue1");
    assert(params[1].name == "par%26am2" && params[1].value == "val%3Due2");

    // Test parse_query drops empty pieces and remembers bare names
    params = parse_query("&a=1&&b&c=");
    assert(params.size() == 3);
    assert(params[0].name == "a" && params[0].has_value);
    assert(params[1].name == "b" && !params[1].has_value);
    assert(params[2].name == "c" && params[2].has_value && params[2].value.empty());
    assert(build_query(params) == "a=1&b&c=");
    assert(parse_query("").empty());

    // Test value containing a literal '='
    params = parse_query("a=b=c");
    assert(params.size() == 1 && params[0].name == "a" && params[0].value == "b=c");

    // Test sort_parameters
    params = parse_query("name2=value2&name3=value3&name1=value1.2&name1=value1.1");
    sort_parameters(params);
    assert(build_query(params) == "name1=value1.1&name1=value1.2&name2=value2&name3=value3");

    params = parse_query("b=%C3%A1&b=%41&a=z");
    sort_parameters(params);
    assert(build_query(params) == "a=z&b=%41&b=%C3%A1");

    // Test clean_query in each mode
    ExcludedParameters none;
    const std::string query = "param1=value1.1&param1=value1.2&param2=value2";
    assert(build_query(clean_query(query, ParameterMode::USE_ALL, none)) == query);
    assert(build_query(clean_query(query, ParameterMode::IGNORE_VALUE, none)) == "param1&param2");
    assert(clean_query(query, ParameterMode::IGNORE_COMPLETELY, none).empty());

    assert(build_query(clean_query("par%3Dam1=val%26ue1&par%26am2=val%3Due2",
                                   ParameterMode::IGNORE_VALUE, none)) == "par%26am2&par%3Dam1");

    // Test exclusions
    ExcludedParameters excluded({"name1", "name3"}, {"JSESSIONID"});
    assert(excluded.contains("name1"));
    assert(!excluded.contains("NAME1"));
    assert(excluded.contains("jsessionid"));
    assert(excluded.contains("JSessionId"));
    assert(!excluded.empty());

    assert(build_query(clean_query("name1=value1&name2=value2&name3=value3&jsessionid=x",
                                   ParameterMode::USE_ALL, excluded)) == "name2=value2");
    assert(build_query(clean_query("name1=value1&name2=value2&JSESSIONID=x",
                                   ParameterMode::IGNORE_VALUE, excluded)) == "name2");

    // Test mode names
    ParameterMode mode = ParameterMode::USE_ALL;
    assert(parameter_mode_from_string("IGNORE_VALUE", mode) && mode == ParameterMode::IGNORE_VALUE);
    assert(parameter_mode_from_string("ignore_completely", mode) && mode == ParameterMode::IGNORE_COMPLETELY);
    assert(!parameter_mode_from_string("sometimes", mode));
    assert(mode == ParameterMode::IGNORE_COMPLETELY);
    assert(to_string(ParameterMode::USE_ALL) == "use_all");

    return 0;
}
