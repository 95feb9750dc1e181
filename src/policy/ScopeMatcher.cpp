#include "bountygate/policy/ScopeMatcher.hpp"

#include <cctype>

namespace bountygate {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool matches(const std::string& target, const std::string& pattern) {
    if (target.empty() || pattern.empty()) return false;

    const std::string t = lower(target);
    const std::string p = lower(pattern);

    if (t == p) return true;

    if (p.size() > 2 && p[0] == '*' && p[1] == '.') {
        const std::string domain = p.substr(2);
        return t == domain || ends_with(t, "." + domain);
    }

    return ends_with(t, "." + p);
}

const std::string* first_match(const std::string& target,
                               const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        if (matches(target, p)) return &p;
    }
    return nullptr;
}

} // namespace bountygate
