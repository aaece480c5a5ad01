#pragma once

#include "../canonical/query_params.h"
#include <string>
#include <vector>
#include <unordered_set>

namespace spidercore {

// Names of parameters that carry session identifiers. Matching is
// case-insensitive; names are stored lowercased.
class SessionTokenRegistry {
public:
    SessionTokenRegistry();
    explicit SessionTokenRegistry(const std::vector<std::string>& tokens);

    static const std::vector<std::string>& default_tokens();

    void add_token(const std::string& name);
    void remove_token(const std::string& name);
    void clear() { tokens_.clear(); }

    bool is_session_token(const std::string& name) const;
    const std::unordered_set<std::string>& tokens() const { return tokens_; }

    // Union of these tokens and the caller's names
    ExcludedParameters excluded_with(const std::unordered_set<std::string>& names) const;

private:
    std::unordered_set<std::string> tokens_;
};

} // namespace spidercore
