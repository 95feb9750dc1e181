#pragma once

#include <string>
#include <vector>

#include "bountygate/core/Types.hpp"

namespace bountygate {

// "<name> <description> <severity> <compact evidence JSON>"
// Triage fields never contribute, so re-scoring a scored finding sees the
// same text.
std::string finding_text(const FindingRecord& finding);

// Lower-cased runs of [a-z0-9_] at least two characters long.
std::vector<std::string> tokenize(const std::string& text);

// Unigrams followed by space-joined bigrams, in token order.
std::vector<std::string> ngram_terms(const std::vector<std::string>& tokens);

} // namespace bountygate
