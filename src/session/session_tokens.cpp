#include "session_tokens.h"
#include "../utils/url_utils.h"

namespace spidercore {

SessionTokenRegistry::SessionTokenRegistry()
    : SessionTokenRegistry(default_tokens()) {}

SessionTokenRegistry::SessionTokenRegistry(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        add_token(token);
    }
}

const std::vector<std::string>& SessionTokenRegistry::default_tokens() {
    static const std::vector<std::string> tokens = {
        "jsessionid",
        "phpsessid",
        "aspsessionid"
    };
    return tokens;
}

void SessionTokenRegistry::add_token(const std::string& name) {
    if (!name.empty()) {
        tokens_.insert(UrlUtils::to_lower(name));
    }
}

void SessionTokenRegistry::remove_token(const std::string& name) {
    tokens_.erase(UrlUtils::to_lower(name));
}

bool SessionTokenRegistry::is_session_token(const std::string& name) const {
    return tokens_.count(UrlUtils::to_lower(name)) > 0;
}

ExcludedParameters SessionTokenRegistry::excluded_with(
    const std::unordered_set<std::string>& names) const {
    return ExcludedParameters(names, tokens_);
}

} // namespace spidercore
