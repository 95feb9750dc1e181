#pragma once

#include <string>
#include <vector>

namespace bountygate {

// Host pattern matching, in priority order:
//   "api.example.com"  exact (case-insensitive)
//   "*.example.com"    example.com itself or any host under ".example.com"
//   "example.com"      any host under ".example.com"
// Patterns are compared structurally and never compiled as regexes.
bool matches(const std::string& target, const std::string& pattern);

// First pattern in `patterns` that matches, or nullptr.
const std::string* first_match(const std::string& target,
                               const std::vector<std::string>& patterns);

} // namespace bountygate
