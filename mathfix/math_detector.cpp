#include "math_detector.hpp"
#include "../lib/log.h"

#include <re2/re2.h>

#include <cctype>

namespace mathfix {

static log_category_t* detect_log = nullptr;

// ============================================================================
// Allow-lists
// ============================================================================

const std::vector<std::string>& default_detector_commands() {
    static const std::vector<std::string> commands = {
        "frac", "int", "sum", "prod", "sqrt", "partial", "infty", "pm", "mp",
        "times", "div", "cdot", "circ", "sim", "approx", "equiv", "leq", "geq",
        "neq", "rightarrow", "leftarrow", "leftrightarrow", "boxed", "mid",
        "Rightarrow", "Leftarrow", "to", "mapsto", "text", "mathcal", "mathbb",
        "mathrm", "mathbf", "hat", "bar", "vec", "dot", "tilde", "lim", "max",
        "min", "log", "exp", "sin", "cos", "tan",
        "alpha", "beta", "gamma", "delta", "epsilon", "zeta", "eta", "theta",
        "iota", "kappa", "lambda", "mu", "nu", "xi", "pi", "rho", "sigma", "tau",
        "upsilon", "phi", "chi", "psi", "omega",
        "Alpha", "Beta", "Gamma", "Delta", "Epsilon", "Zeta", "Eta", "Theta",
        "Lambda", "Mu", "Nu", "Xi", "Pi", "Rho", "Sigma", "Tau", "Upsilon",
        "Phi", "Chi", "Psi", "Omega",
    };
    return commands;
}

const std::vector<std::string>& default_detector_operators() {
    static const std::vector<std::string> operators = {"=", "^", "_"};
    return operators;
}

DetectorOptions::DetectorOptions()
    : enabled(true)
    , commands(default_detector_commands())
    , operators(default_detector_operators())
    , max_span(200)
{
}

const char* math_signal_name(MathSignal signal) {
    switch (signal) {
        case MathSignal::None:     return "none";
        case MathSignal::Command:  return "command";
        case MathSignal::Operator: return "operator";
    }
    return "unknown";
}

// ============================================================================
// Helpers
// ============================================================================

static bool is_hspace(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

static bool escaped_at(const std::string& text, size_t pos) {
    return pos > 0 && text[pos - 1] == '\\';
}

static std::string trim(const std::string& text) {
    size_t b = 0, e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) e--;
    return text.substr(b, e - b);
}

static std::string drop_dollars(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '$' && !escaped_at(text, i)) continue;
        out += text[i];
    }
    return out;
}

// Index of the ')' matching text[open], or npos when it lies beyond limit
// interior bytes or past a blank line
static size_t match_paren(const std::string& text, size_t open, size_t limit) {
    size_t n = text.size();
    int depth = 0;
    for (size_t j = open; j < n; j++) {
        if (j > open && j - open - 1 > limit) return std::string::npos;
        char c = text[j];
        if (c == '\\') {
            j++;
            continue;
        }
        if (c == '\n') {
            size_t k = j + 1;
            while (k < n && is_hspace(text[k])) k++;
            if (k < n && text[k] == '\n') return std::string::npos;
        } else if (c == '(') {
            depth++;
        } else if (c == ')') {
            if (--depth == 0) return j;
        }
    }
    return std::string::npos;
}

// Unescaped '$' outside the candidate spans
static bool has_stray_dollar(const std::string& text, const std::vector<MathSpan>& spans) {
    size_t next = 0;
    for (size_t i = 0; i < text.size(); i++) {
        if (next < spans.size() && i == spans[next].open) {
            i = spans[next].close;
            next++;
            continue;
        }
        if (text[i] == '$' && !escaped_at(text, i)) return true;
    }
    return false;
}

// Location of text[local] given where the region starts
static Span span_at(const Region& region, size_t local, size_t length) {
    SourceLocation loc = region.span.start;
    for (size_t i = 0; i < local && i < region.text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(region.text[i]);
        if (c == '\n') {
            loc.line++;
            loc.column = 1;
        } else if ((c & 0xC0) != 0x80) {
            loc.column++;
        }
    }
    loc.offset = region.span.offset + local;
    return Span(region.span.offset + local, length, loc);
}

// ============================================================================
// MathDetector
// ============================================================================

MathDetector::MathDetector(const DetectorOptions& options)
    : options_(options)
    , promoted_(0)
{
    if (!detect_log) detect_log = log_get_category("mathfix.detect");

    if (!options_.commands.empty()) {
        std::string pattern = "\\\\(?:";
        for (size_t i = 0; i < options_.commands.size(); i++) {
            if (i) pattern += '|';
            pattern += re2::RE2::QuoteMeta(options_.commands[i]);
        }
        pattern += ")(?:[^A-Za-z]|$)";

        re2::RE2::Options re_options;
        re_options.set_log_errors(false);
        command_re_.reset(new re2::RE2(pattern, re_options));
        if (!command_re_->ok()) {
            error_ = "bad command allow-list: " + command_re_->error();
            clog_error(detect_log, "%s", error_.c_str());
            command_re_.reset();
        }
    }
}

MathDetector::~MathDetector() = default;

bool MathDetector::has_script(const std::string& s, char marker) const {
    size_t n = s.size();
    for (size_t i = 1; i + 1 < n; i++) {
        if (s[i] != marker || escaped_at(s, i)) continue;

        unsigned char prev = static_cast<unsigned char>(s[i - 1]);
        if (!std::isalnum(prev) && prev != '}' && prev != ')') continue;

        unsigned char next = static_cast<unsigned char>(s[i + 1]);
        if (next == '{' || std::isdigit(next)) return true;
        if (next == '\\' && i + 2 < n && std::isalpha(static_cast<unsigned char>(s[i + 2]))) {
            return true;
        }
        // a single letter: "x_i" yes, "file_name" no
        if (std::isalpha(next) &&
            (i + 2 >= n || !std::isalpha(static_cast<unsigned char>(s[i + 2])))) {
            return true;
        }
    }
    return false;
}

MathSignal MathDetector::classify(const std::string& interior) const {
    if (command_re_ && re2::RE2::PartialMatch(interior, *command_re_)) {
        return MathSignal::Command;
    }
    for (const std::string& op : options_.operators) {
        if (op == "^" || op == "_") {
            if (has_script(interior, op[0])) return MathSignal::Operator;
        } else if (!op.empty() && interior.find(op) != std::string::npos) {
            return MathSignal::Operator;
        }
    }
    return MathSignal::None;
}

bool MathDetector::rejects(const std::string& interior) const {
    static const re2::RE2 sentence_break("\\.\\s+[A-Z]");

    std::string body = trim(interior);
    if (body.empty()) return true;
    if (body.back() == '\\') return true;
    if (interior.find("://") != std::string::npos) return true;

    size_t dollars = 0;
    for (size_t i = 0; i < interior.size(); i++) {
        if (interior[i] == '$' && !escaped_at(interior, i)) dollars++;
    }
    if (dollars % 2) return true;

    return re2::RE2::PartialMatch(interior, sentence_break);
}

std::vector<MathSpan> MathDetector::find_spans(const std::string& text) const {
    std::vector<MathSpan> spans;
    size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] != '(' || escaped_at(text, i)) {
            i++;
            continue;
        }
        // link or image target: skip it whole
        if (i > 0 && text[i - 1] == ']') {
            size_t end = match_paren(text, i, n);
            i = end == std::string::npos ? i + 1 : end + 1;
            continue;
        }

        size_t close = match_paren(text, i, options_.max_span);
        if (close != std::string::npos &&
            !(close + 1 < n && std::isdigit(static_cast<unsigned char>(text[close + 1])))) {
            std::string interior = text.substr(i + 1, close - i - 1);
            if (!rejects(interior)) {
                MathSignal signal = classify(interior);
                if (signal != MathSignal::None) {
                    spans.push_back(MathSpan{i, close, interior, signal});
                    i = close + 1;
                    continue;
                }
            }
        }
        // not promoted: nested candidates may still qualify
        i++;
    }
    return spans;
}

std::vector<Region> MathDetector::detect(const Region& prose, RuleEngine& engine,
                                         DiagnosticList* diagnostics,
                                         char before, char after) {
    std::vector<Region> pieces;
    if (!options_.enabled || prose.kind != RegionKind::Prose) return pieces;
    if (prose.text.find('(') == std::string::npos) return pieces;

    std::vector<MathSpan> spans = find_spans(prose.text);
    if (spans.empty()) return pieces;

    // "costs $5 (x=1)" would pair the stray dollar with the new delimiter
    if (has_stray_dollar(prose.text, spans)) {
        clog_debug(detect_log, "prose at line %zu holds a stray '$', %zu candidate(s) skipped",
                   prose.span.start.line, spans.size());
        return pieces;
    }

    size_t cursor = 0;
    size_t promoted = 0;
    size_t n = prose.text.size();
    for (const MathSpan& span : spans) {
        // "$a$$b$" would read as a display marker, "$x$2" never closes
        if (span.open == 0 && before == '$') continue;
        if (promoted && span.open == cursor) continue;
        if (span.close + 1 == n &&
            (after == '$' || std::isdigit(static_cast<unsigned char>(after)))) {
            continue;
        }

        std::string body = trim(drop_dollars(span.interior));
        if (body.empty()) continue;

        Region math(RegionKind::MathInline, "$" + body + "$",
                    span_at(prose, span.open, span.close + 1 - span.open));
        std::string text = engine.apply(math, diagnostics);
        if (text.empty()) continue;

        if (span.open > cursor) {
            pieces.emplace_back(RegionKind::Prose, prose.text.substr(cursor, span.open - cursor),
                                span_at(prose, cursor, span.open - cursor));
        }
        clog_debug(detect_log, "line %zu: promoted (%s) on %s", math.span.start.line,
                   span.interior.c_str(), math_signal_name(span.signal));
        math.text = std::move(text);
        pieces.push_back(std::move(math));
        cursor = span.close + 1;
        promoted++;
    }

    if (!promoted) {
        pieces.clear();
        return pieces;
    }
    if (cursor < prose.text.size()) {
        pieces.emplace_back(RegionKind::Prose, prose.text.substr(cursor),
                            span_at(prose, cursor, prose.text.size() - cursor));
    }
    promoted_ += promoted;
    return pieces;
}

} // namespace mathfix
