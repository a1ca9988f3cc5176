// rule_engine.hpp - Ordered, fail-open application of rewrite rules
//
// The engine walks its rule list in order over one region at a time.
// A rule fires only when its scope covers the region kind and its
// precondition holds. Body rules get the math body; the engine splits
// and re-joins the canonical delimiters around them.
//
// A transform that throws degrades to identity: the failure is logged,
// recorded as RuleFailure, and the next rule sees the unchanged text.
// The list is re-run over a region until a pass changes nothing; a rule
// that failed once is not retried on that region.

#pragma once
#ifndef MATHFIX_RULE_ENGINE_HPP
#define MATHFIX_RULE_ENGINE_HPP

#include "rules.hpp"
#include "diagnostic.hpp"
#include <map>
#include <string>
#include <vector>

namespace mathfix {

// Outcome of one rule invocation
struct RuleResult {
    bool ok;
    std::string text;       // rewritten text, or the input when !ok
    std::string error;

    static RuleResult success(std::string text) {
        return RuleResult{true, std::move(text), std::string()};
    }
    static RuleResult failure(const std::string& input, std::string error) {
        return RuleResult{false, input, std::move(error)};
    }
};

class RuleEngine {
public:
    RuleEngine();
    explicit RuleEngine(std::vector<Rule> rules);

    // Returns false for an unknown rule name
    bool disable(const std::string& name);
    bool is_enabled(const std::string& name) const;
    bool has_rule(const std::string& name) const;

    const std::vector<Rule>& rules() const { return rules_; }

    // Runs one transform behind the fail-open boundary
    RuleResult invoke(const Rule& rule, const std::string& text) const;

    // Runs the enabled rules over one region and returns its new text.
    // An empty result means the region has nothing left to render.
    std::string apply(const Region& region, DiagnosticList* diagnostics);

    // Any enabled rule whose scope covers kind
    bool applies_to(RegionKind kind) const;

    const std::map<std::string, size_t>& fire_counts() const { return fire_counts_; }
    size_t failure_count() const { return failures_; }
    void reset_counts();

private:
    void run_pass(Region& work, std::vector<bool>& failed, DiagnosticList* diagnostics);

    std::vector<Rule> rules_;
    std::vector<bool> enabled_;
    std::map<std::string, size_t> fire_counts_;
    size_t failures_;
};

// Trims inline bodies, trims and drops blank lines of multi-line display
// bodies, and drops math whose body is blank
std::string finalize_math(const std::string& text, RegionKind kind);

} // namespace mathfix

#endif // MATHFIX_RULE_ENGINE_HPP
