#include "rule_engine.hpp"
#include "../lib/log.h"

#include <cctype>
#include <exception>

namespace mathfix {

static log_category_t* rules_log = nullptr;

// Bound on re-running the rule list over one region
static const int MAX_RULE_PASSES = 4;

static void ensure_log() {
    if (!rules_log) rules_log = log_get_category("mathfix.rules");
}

static bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

RuleEngine::RuleEngine()
    : RuleEngine(default_rules())
{
}

RuleEngine::RuleEngine(std::vector<Rule> rules)
    : rules_(std::move(rules))
    , enabled_(rules_.size(), true)
    , failures_(0)
{
    ensure_log();
}

bool RuleEngine::disable(const std::string& name) {
    for (size_t i = 0; i < rules_.size(); i++) {
        if (name == rules_[i].name) {
            enabled_[i] = false;
            clog_debug(rules_log, "rule '%s' disabled", rules_[i].name);
            return true;
        }
    }
    return false;
}

bool RuleEngine::is_enabled(const std::string& name) const {
    for (size_t i = 0; i < rules_.size(); i++) {
        if (name == rules_[i].name) return enabled_[i];
    }
    return false;
}

bool RuleEngine::has_rule(const std::string& name) const {
    for (const Rule& rule : rules_) {
        if (name == rule.name) return true;
    }
    return false;
}

bool RuleEngine::applies_to(RegionKind kind) const {
    for (size_t i = 0; i < rules_.size(); i++) {
        if (enabled_[i] && (rules_[i].scope & region_kind_bit(kind))) return true;
    }
    return false;
}

void RuleEngine::reset_counts() {
    fire_counts_.clear();
    failures_ = 0;
}

RuleResult RuleEngine::invoke(const Rule& rule, const std::string& text) const {
    if (!rule.transform) {
        return RuleResult::failure(text, "rule has no transform");
    }
    try {
        return RuleResult::success(rule.transform(text));
    } catch (const std::exception& e) {
        return RuleResult::failure(text, e.what());
    }
}

std::string RuleEngine::apply(const Region& region, DiagnosticList* diagnostics) {
    if (region.is_protected()) {
        return region.text;
    }

    Region work(region.kind, region.text, region.span);
    work.unterminated = region.unterminated;

    // later rules can leave work for earlier ones (an orphan removed at a
    // line end leaves a trailing space); the list runs until a pass
    // changes nothing, so a second run over the output is a no-op
    std::vector<bool> failed(rules_.size(), false);
    int pass = 0;
    for (; pass < MAX_RULE_PASSES; pass++) {
        std::string before = work.text;
        run_pass(work, failed, diagnostics);
        work.unterminated = false;
        if (work.is_math()) {
            work.text = finalize_math(work.text, work.kind);
        }
        if (work.text.empty() || work.text == before) break;
    }
    if (pass == MAX_RULE_PASSES) {
        clog_debug(rules_log, "%s at line %zu still changing after %d passes",
                   region_kind_name(region.kind), region.span.start.line, MAX_RULE_PASSES);
    }
    return work.text;
}

void RuleEngine::run_pass(Region& work, std::vector<bool>& failed, DiagnosticList* diagnostics) {
    for (size_t i = 0; i < rules_.size(); i++) {
        const Rule& rule = rules_[i];
        if (!enabled_[i] || failed[i] || !(rule.scope & region_kind_bit(work.kind))) continue;
        if (rule.precondition && !rule.precondition(work)) continue;

        RuleResult result;
        MathParts parts;
        if (rule.target == RuleTarget::Body) {
            if (!split_math(work.text, &parts)) {
                clog_debug(rules_log, "%s: region at line %zu not in canonical form, skipped",
                           rule.name, work.span.start.line);
                continue;
            }
            result = invoke(rule, parts.body);
            if (result.ok) {
                // a body emptied by the rule drops the region
                parts.body = result.text;
                result.text = is_blank(parts.body) ? std::string() : join_math(parts);
            }
        } else {
            result = invoke(rule, work.text);
        }

        if (!result.ok) {
            failed[i] = true;
            failures_++;
            clog_warn(rules_log, "%s failed on %s at line %zu: %s; region left unchanged",
                      rule.name, region_kind_name(work.kind), work.span.start.line,
                      result.error.c_str());
            if (diagnostics) {
                diagnostics->addWarning(DiagnosticKind::RuleFailure, work.span.start,
                                        std::string(rule.name) + ": " + result.error);
            }
            continue;
        }

        if (result.text != work.text) {
            fire_counts_[rule.name]++;
            clog_debug(rules_log, "%s rewrote %s at line %zu", rule.name,
                       region_kind_name(work.kind), work.span.start.line);
            work.text = std::move(result.text);
        }
        if (work.text.empty()) return;
    }
}

// A line the segmenter would read as a code fence: 3+ backticks or tildes
static bool opens_fence(const std::string& line) {
    if (line.empty() || (line[0] != '`' && line[0] != '~')) return false;
    size_t n = 0;
    while (n < line.size() && line[n] == line[0]) n++;
    return n >= 3;
}

// Multi-line display body: lines trimmed, blank lines dropped, and no
// line left that would open a code fence once it starts a line
static std::string tidy_block_lines(const std::string& body) {
    std::string out;
    size_t start = 0;
    while (start <= body.size()) {
        size_t nl = body.find('\n', start);
        if (nl == std::string::npos) nl = body.size();
        size_t b = start, e = nl;
        while (b < e && std::isspace(static_cast<unsigned char>(body[b]))) b++;
        while (e > b && std::isspace(static_cast<unsigned char>(body[e - 1]))) e--;
        if (b < e) {
            std::string line = body.substr(b, e - b);
            if (!out.empty()) out += '\n';
            if (opens_fence(line)) out += "{}";
            out += line;
        }
        start = nl + 1;
    }
    return out;
}

std::string finalize_math(const std::string& text, RegionKind kind) {
    MathParts parts;
    if (text.empty() || !split_math(text, &parts)) return text;

    size_t b = 0, e = parts.body.size();
    while (b < e && std::isspace(static_cast<unsigned char>(parts.body[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(parts.body[e - 1]))) e--;
    if (b == e) return std::string();

    if (kind == RegionKind::MathInline) {
        parts.body = parts.body.substr(b, e - b);
    } else if (parts.open == "$$\n") {
        parts.body = tidy_block_lines(parts.body);
    }
    return join_math(parts);
}

} // namespace mathfix
