#include <cassert>
#include "../../src/session/session_tokens.h"

int main() {
    using namespace spidercore;

    // Test defaults
    SessionTokenRegistry registry;
    assert(registry.tokens().size() == 3);
    assert(registry.is_session_token("jsessionid"));
    assert(registry.is_session_token("PHPSESSID"));
    assert(registry.is_session_token("AspSessionId"));
    assert(!registry.is_session_token("sid"));

    // Test add/remove
    registry.add_token("CFTOKEN");
    assert(registry.is_session_token("cftoken"));
    registry.remove_token("JSessionID");
    assert(!registry.is_session_token("jsessionid"));
    registry.add_token("");
    assert(registry.tokens().size() == 3);

    // Test union with caller names
    ExcludedParameters excluded = registry.excluded_with({"utm_source"});
    assert(excluded.contains("utm_source"));
    assert(!excluded.contains("UTM_SOURCE"));
    assert(excluded.contains("CfToken"));
    assert(!excluded.contains("jsessionid"));

    registry.clear();
    assert(registry.tokens().empty());
    assert(registry.excluded_with({}).empty());

    return 0;
}
