#include "bountygate/triage/TextFeatures.hpp"

#include <cctype>

namespace bountygate {

std::string finding_text(const FindingRecord& finding) {
    std::string text;
    text += finding.name;
    text += ' ';
    text += finding.description;
    text += ' ';
    text += finding.severity;
    text += ' ';
    if (!finding.evidence.is_null()) {
        text += finding.evidence.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return text;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string cur;

    auto flush = [&]() {
        if (cur.size() >= 2) tokens.push_back(cur);
        cur.clear();
    };

    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '_') {
            cur += static_cast<char>(std::tolower(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

std::vector<std::string> ngram_terms(const std::vector<std::string>& tokens) {
    std::vector<std::string> terms(tokens.begin(), tokens.end());
    if (tokens.size() < 2) return terms;

    terms.reserve(tokens.size() * 2 - 1);
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        terms.push_back(tokens[i] + " " + tokens[i + 1]);
    }
    return terms;
}

} // namespace bountygate
