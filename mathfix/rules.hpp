// rules.hpp - Rewrite rules for math and prose regions
//
// Every transform is a pure, idempotent text -> text function. Math body
// rules see only the text between the canonical delimiters; the
// delimiter rule and the prose rules see the whole region text.
//
// Order of default_rules() is a contract: later rules rely on the normal
// forms produced by earlier ones (orphan scripts are judged after
// decoration runs of "___" are gone, and so on).

#pragma once
#ifndef MATHFIX_RULES_HPP
#define MATHFIX_RULES_HPP

#include "document.hpp"
#include <string>
#include <vector>

namespace mathfix {

enum class RuleTarget : uint8_t {
    Whole,      // entire region text, delimiters included
    Body,       // math body between canonical delimiters
};

typedef bool (*RulePrecondition)(const Region& region);
typedef std::string (*RuleTransform)(const std::string& text);

struct Rule {
    const char* name;
    unsigned scope;             // mask of region_kind_bit()
    RuleTarget target;
    RulePrecondition precondition;
    RuleTransform transform;
};

extern const unsigned MATH_SCOPE;
extern const unsigned PROSE_SCOPE;

// The canonical ordered list
const std::vector<Rule>& default_rules();

// ============================================================================
// Canonical math region shape
// ============================================================================

// "$body$", "$$body$$" or "$$\nbody\n$$"
struct MathParts {
    std::string open;
    std::string body;
    std::string close;
};

// Fails when text is not in canonical delimiter form
bool split_math(const std::string& text, MathParts* parts);
std::string join_math(const MathParts& parts);

// ============================================================================
// Transforms
// ============================================================================

namespace rules {

// 1. $$$ runs, \[ \], bracket lines -> $$; \( \) -> $; closes unterminated blocks
std::string normalize_delimiters(const std::string& text);

// 2. separator lines, blank lines and ---/===/___ runs inside math
std::string strip_decoration(const std::string& body);

// 3. _ or ^ without an argument
std::string remove_orphan_scripts(const std::string& body);

// 4. |x| -> \left|x\right|
std::string rewrite_absolute_values(const std::string& body);

// 5. "\int, f" -> "\int f"; ",dt" -> "\,dt" next to integrals
std::string clean_operator_punctuation(const std::string& body);

// 6. ";\sim;" -> " \sim "
std::string fix_spacing_commands(const std::string& body);

// 7. "\mathbb R" -> "\mathbb{R}"
std::string brace_font_commands(const std::string& body);

// 8. "#" -> "\#"
std::string escape_hashes(const std::string& body);

// prose: lines holding only a remote ![image](http://...)
std::string strip_remote_images(const std::string& text);

// prose: runs of blank lines -> one blank line
std::string collapse_blank_lines(const std::string& text);

} // namespace rules

} // namespace mathfix

#endif // MATHFIX_RULES_HPP
