#pragma once

#include <string>
#include <vector>

namespace bountygate {

// Authorised program scope. Loaded once per run and never mutated.
struct ScopeDefinition {
    std::vector<std::string> in_scope;
    std::vector<std::string> out_of_scope;

    // Reads {"in_scope": [...], "out_of_scope": [...]}. Either list may be
    // absent. Throws ConfigError on unreadable files, bad JSON or non-string
    // entries.
    static ScopeDefinition load_file(const std::string& path);
};

} // namespace bountygate
