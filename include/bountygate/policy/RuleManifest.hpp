#pragma once

#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace bountygate {

struct BlockRule {
    std::string id;
    std::string pattern;
    std::string notes;
    std::regex compiled;
};

struct ValidationRule {
    std::string id;
    std::string pattern;
    std::string notes;
    std::regex compiled;
};

using ManifestRule = std::variant<BlockRule, ValidationRule>;

// ---------------------------------------------------------------------------
// Ordered action rules, immutable for the lifetime of a run.
//
// JSON layout:
//   {
//     "blocked_patterns":    [{"id": "...", "pattern": "...", "notes": "..."}],
//     "requires_validation": [{"id": "...", "pattern": "...", "notes": "..."}]
//   }
//
// Patterns are case-insensitive ECMAScript regexes searched anywhere in the
// template or rule identifier. Block rules are always consulted before
// validation rules; within each kind, declaration order wins.
// ---------------------------------------------------------------------------
class RuleManifest {
public:
    // Built-in rules: rce-templates, sql-exploit, file-upload-exec,
    // dos-attacks (block); auth-bypass, file-inclusion (validate).
    static RuleManifest defaults();

    // Throws ConfigError on unreadable files, malformed JSON, missing
    // fields, duplicate ids or invalid regexes.
    static RuleManifest load_file(const std::string& path);
    static RuleManifest from_json_text(const std::string& text);

    const BlockRule* first_block(const std::string& template_id) const;
    const ValidationRule* first_validation(const std::string& template_id) const;

    const std::vector<ManifestRule>& rules() const { return rules_; }
    size_t block_count() const;
    size_t validation_count() const;

private:
    RuleManifest() = default;

    void add_block(const std::string& id, const std::string& pattern, const std::string& notes);
    void add_validation(const std::string& id, const std::string& pattern, const std::string& notes);

    std::vector<ManifestRule> rules_;
};

} // namespace bountygate
