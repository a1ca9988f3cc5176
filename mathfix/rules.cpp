#include "rules.hpp"
#include "../lib/log.h"

#include <re2/re2.h>

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace mathfix {

const unsigned MATH_SCOPE = region_kind_bit(RegionKind::MathBlock) | region_kind_bit(RegionKind::MathInline);
const unsigned PROSE_SCOPE = region_kind_bit(RegionKind::Prose);

// Fixpoint bound for rules that re-run their own pass
static const int MAX_PASSES = 8;

// ============================================================================
// Helpers
// ============================================================================

static re2::RE2::Options quiet_options() {
    re2::RE2::Options options;
    options.set_log_errors(false);
    return options;
}

static void require_ok(const re2::RE2& re, const char* rule) {
    if (!re.ok()) {
        throw std::runtime_error(std::string(rule) + ": bad pattern: " + re.error());
    }
}

// GlobalReplace until nothing matches; matches may share context characters
static void replace_to_fixpoint(std::string* text, const re2::RE2& re, const char* rewrite) {
    for (int pass = 0; pass < MAX_PASSES; pass++) {
        if (re2::RE2::GlobalReplace(text, re, rewrite) == 0) break;
    }
}

static bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

static bool is_hspace(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

static bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static std::string trim(const std::string& text) {
    size_t b = 0, e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) e--;
    return text.substr(b, e - b);
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (;;) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

static bool escaped_at(const std::string& text, size_t pos) {
    return pos > 0 && text[pos - 1] == '\\';
}

// ============================================================================
// Canonical shape
// ============================================================================

bool split_math(const std::string& text, MathParts* parts) {
    size_t n = text.size();
    if (n >= 6 && text.compare(0, 3, "$$\n") == 0 && text.compare(n - 3, 3, "\n$$") == 0) {
        parts->open = "$$\n";
        parts->close = "\n$$";
    } else if (n >= 4 && text.compare(0, 2, "$$") == 0 && text.compare(n - 2, 2, "$$") == 0) {
        parts->open = "$$";
        parts->close = "$$";
    } else if (n >= 2 && text[0] == '$' && text[n - 1] == '$' && text[1] != '$') {
        parts->open = "$";
        parts->close = "$";
    } else {
        return false;
    }
    parts->body = text.substr(parts->open.size(), n - parts->open.size() - parts->close.size());
    return true;
}

std::string join_math(const MathParts& parts) {
    return parts.open + parts.body + parts.close;
}

namespace rules {

// ============================================================================
// 1. Delimiter normalization
// ============================================================================

static std::string drop_unescaped_dollars(const std::string& body) {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); i++) {
        if (body[i] == '$' && !escaped_at(body, i)) continue;
        out += body[i];
    }
    return out;
}

std::string normalize_delimiters(const std::string& text) {
    size_t n = text.size();
    size_t p = 0;
    while (p < n && (text[p] == ' ' || text[p] == '\t')) p++;
    size_t q = n;
    while (q > p && is_hspace(text[q - 1])) q--;
    if (p >= q) return text;

    bool display = false;
    size_t open_end = p;
    size_t close_begin = q;

    if (text[p] == '$') {
        size_t r = 0;
        while (p + r < q && text[p + r] == '$') r++;
        display = r >= 2;
        open_end = p + r;

        size_t r2 = 0;
        while (q - r2 > open_end && text[q - r2 - 1] == '$') r2++;
        if (r2 > 0 && q - r2 > open_end && text[q - r2 - 1] == '\\') r2--;
        if (display ? r2 >= 2 : r2 >= 1) {
            close_begin = q - r2;
        }
    } else if (text.compare(p, 2, "\\[") == 0) {
        display = true;
        open_end = p + 2;
        if (q >= open_end + 2 && text.compare(q - 2, 2, "\\]") == 0) close_begin = q - 2;
    } else if (text[p] == '[') {
        display = true;
        open_end = p + 1;
        if (q > open_end && text[q - 1] == ']') close_begin = q - 1;
    } else if (text.compare(p, 2, "\\(") == 0) {
        open_end = p + 2;
        if (q >= open_end + 2 && text.compare(q - 2, 2, "\\)") == 0) close_begin = q - 2;
    } else {
        return text;
    }

    std::string body = drop_unescaped_dollars(text.substr(open_end, close_begin - open_end));
    if (is_blank(body)) return std::string();

    if (!display) {
        return "$" + trim(body) + "$";
    }
    if (body.find('\n') != std::string::npos) {
        return "$$\n" + trim(body) + "\n$$";
    }
    return "$$" + body + "$$";
}

static bool needs_delimiter_fix(const Region& region) {
    const std::string& t = region.text;
    if (region.unterminated || t.size() < 2) return true;
    if (t[0] != '$' || t[t.size() - 1] != '$') return true;
    if (contains(t, "$$$")) return true;
    if (region.kind == RegionKind::MathBlock) {
        if (t.find('\n') != std::string::npos &&
            (t.compare(0, 3, "$$\n") != 0 || t.compare(t.size() - 3, 3, "\n$$") != 0)) {
            return true;
        }
        // stray single dollars inside the body
        size_t inner = t.find('$', 2);
        return inner != std::string::npos && inner < t.size() - 2;
    }
    return false;
}

// ============================================================================
// 2. Decoration strip
// ============================================================================

// Only -, =, _, en/em dashes and spaces, with at least two markers
static bool is_separator_line(const std::string& line) {
    size_t markers = 0;
    for (size_t i = 0; i < line.size(); i++) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (c == '-' || c == '=' || c == '_') {
            markers++;
        } else if (c == 0xE2 && i + 2 < line.size() &&
                   static_cast<unsigned char>(line[i + 1]) == 0x80 &&
                   (static_cast<unsigned char>(line[i + 2]) == 0x93 ||
                    static_cast<unsigned char>(line[i + 2]) == 0x94)) {
            markers++;
            i += 2;
        } else if (!is_hspace(static_cast<char>(c))) {
            return false;
        }
    }
    return markers >= 2;
}

// Runs of 3+ '=', '-' or '_' become one space; whitespace runs collapse
static std::string clean_line(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        if ((c == '=' || c == '-' || c == '_') && !escaped_at(line, i)) {
            size_t j = i;
            while (j < line.size() && line[j] == c) j++;
            if (j - i >= 3) {
                c = ' ';
                i = j;
            } else {
                out.append(line, i, j - i);
                i = j;
                continue;
            }
        } else {
            i++;
        }
        if (is_hspace(c)) {
            if (out.empty() || out.back() != ' ') out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

std::string strip_decoration(const std::string& body) {
    std::vector<std::string> lines = split_lines(body);
    bool multi = lines.size() > 1;

    std::string out;
    bool first = true;
    for (const std::string& line : lines) {
        if (multi && is_separator_line(line)) continue;
        std::string cleaned = clean_line(line);
        if (multi) {
            cleaned = trim(cleaned);
            if (cleaned.empty()) continue;
        }
        if (!first) out += '\n';
        out += cleaned;
        first = false;
    }
    return out;
}

static bool has_decoration(const Region& region) {
    const std::string& t = region.text;
    return t.find('\n') != std::string::npos || t.find('\t') != std::string::npos ||
           contains(t, "---") || contains(t, "===") || contains(t, "___") || contains(t, "  ");
}

// ============================================================================
// 3. Orphan script removal
// ============================================================================

// TeX skips spaces before a script argument: "x ^ 2" and "a_ \alpha" are
// fine, "value is _ large" is not
static bool attaches_after_space(const std::string& s, size_t k) {
    size_t n = s.size();
    if (k >= n) return false;
    unsigned char c = static_cast<unsigned char>(s[k]);
    if (c == '{') {
        size_t m = k + 1;
        while (m < n && is_hspace(s[m])) m++;
        return m < n && s[m] != '}';
    }
    if (c == '\\') {
        return k + 1 < n && std::isalpha(static_cast<unsigned char>(s[k + 1]));
    }
    if (std::isdigit(c)) return true;
    if (std::isalpha(c)) {
        return k + 1 >= n || !std::isalpha(static_cast<unsigned char>(s[k + 1]));
    }
    return false;
}

static std::string orphan_pass(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        char c = s[i];
        if (c == '\\' && i + 1 < n) {
            out += c;
            out += s[i + 1];
            i += 2;
            continue;
        }
        if (c == '_' || c == '^') {
            size_t j = i + 1;
            size_t skip_to = j;
            bool orphan = false;
            if (j >= n) {
                orphan = true;
            } else if (std::isspace(static_cast<unsigned char>(s[j]))) {
                size_t k = j;
                while (k < n && is_hspace(s[k])) k++;
                orphan = !attaches_after_space(s, k);
            } else if (s[j] == '}' || s[j] == '_' || s[j] == '^' || s[j] == '&') {
                orphan = true;
            } else if (s[j] == '\\' && j + 1 < n && s[j + 1] == '\\') {
                orphan = true;   // followed by a line break
            } else if (s[j] == '{') {
                size_t k = j + 1;
                while (k < n && is_hspace(s[k])) k++;
                if (k < n && s[k] == '}') {
                    orphan = true;
                    skip_to = k + 1;
                }
            }
            if (orphan) {
                // "is _ large" -> "is large"
                if (skip_to < n && s[skip_to] == ' ' && (out.empty() || out.back() == ' ')) {
                    skip_to++;
                }
                i = skip_to;
                continue;
            }
        }
        out += c;
        i++;
    }
    return out;
}

std::string remove_orphan_scripts(const std::string& body) {
    std::string current = body;
    for (int pass = 0; pass < MAX_PASSES; pass++) {
        std::string next = orphan_pass(current);
        if (next == current) break;
        current.swap(next);
    }
    return current;
}

static bool has_scripts(const Region& region) {
    return region.text.find_first_of("_^") != std::string::npos;
}

// ============================================================================
// 4. Absolute value
// ============================================================================

static bool is_sizing_command(const std::string& name) {
    static const char* const names[] = {
        "left", "right", "middle",
        "big", "Big", "bigg", "Bigg",
        "bigl", "bigr", "bigm", "Bigl", "Bigr", "Bigm",
        "biggl", "biggr", "biggm", "Biggl", "Biggr", "Biggm",
    };
    for (const char* n : names) {
        if (name == n) return true;
    }
    return false;
}

static bool is_bare_pipe(const std::string& s, size_t i) {
    if (s[i] != '|') return false;
    if (i > 0 && (s[i - 1] == '\\' || s[i - 1] == '|')) return false;
    if (i + 1 < s.size() && s[i + 1] == '|') return false;

    size_t k = i;
    while (k > 0 && std::isalpha(static_cast<unsigned char>(s[k - 1]))) k--;
    if (k < i && k > 0 && s[k - 1] == '\\' && is_sizing_command(s.substr(k, i - k))) {
        return false;
    }
    return true;
}

static bool groups_balanced(const std::string& inner) {
    int braces = 0, parens = 0, brackets = 0;
    for (size_t i = 0; i < inner.size(); i++) {
        char c = inner[i];
        if (c == '\\') {
            i++;  // \{ \} are literal braces
            continue;
        }
        switch (c) {
            case '{': braces++; break;
            case '}': braces--; break;
            case '(': parens++; break;
            case ')': parens--; break;
            case '[': brackets++; break;
            case ']': brackets--; break;
            case '&': return false;
            default: break;
        }
        if (braces < 0 || parens < 0 || brackets < 0) return false;
    }
    return braces == 0 && parens == 0 && brackets == 0;
}

std::string rewrite_absolute_values(const std::string& body) {
    std::string out;
    out.reserve(body.size() + 16);
    size_t n = body.size();
    size_t i = 0;
    while (i < n) {
        if (is_bare_pipe(body, i)) {
            size_t j = i + 1;
            while (j < n && body[j] != '\n' && !is_bare_pipe(body, j)) j++;
            if (j < n && body[j] == '|') {
                std::string inner = body.substr(i + 1, j - i - 1);
                if (!is_blank(inner) && groups_balanced(inner)) {
                    out += "\\left|";
                    out += inner;
                    out += "\\right|";
                    i = j + 1;
                    continue;
                }
            }
        }
        out += body[i];
        i++;
    }
    return out;
}

static bool has_pipe(const Region& region) {
    return region.text.find('|') != std::string::npos;
}

// ============================================================================
// 5. Operator punctuation
// ============================================================================

std::string clean_operator_punctuation(const std::string& body) {
    static const re2::RE2 comma_after_op(
        "(\\\\(?:int|iint|iiint|oint|sum|prod)"
        "(?:\\s*[_^]\\s*(?:\\{[^{}]*\\}|\\\\?[A-Za-z0-9]+))*)"
        "\\s*,\\s*",
        quiet_options());
    static const re2::RE2 differential(
        "(^|[^\\\\]),(\\s*)(d(?:\\\\[A-Za-z]+|[A-Za-z]))\\b",
        quiet_options());
    require_ok(comma_after_op, "operator-punctuation");
    require_ok(differential, "operator-punctuation");

    std::string out = body;
    replace_to_fixpoint(&out, comma_after_op, "\\1 ");
    if (contains(out, "\\int") || contains(out, "\\oint") || contains(out, "\\iint")) {
        replace_to_fixpoint(&out, differential, "\\1\\\\,\\2\\3");
    }
    return out;
}

static bool has_operator_comma(const Region& region) {
    const std::string& t = region.text;
    if (t.find(',') == std::string::npos) return false;
    return contains(t, "\\int") || contains(t, "\\oint") || contains(t, "\\iint") ||
           contains(t, "\\sum") || contains(t, "\\prod");
}

// ============================================================================
// 6. Spacing commands
// ============================================================================

std::string fix_spacing_commands(const std::string& body) {
    static const re2::RE2 spacer(
        "(^|[^\\\\\\s])\\s*;\\s*(\\\\(?:sim|circ|mid|approx|equiv|cdot))\\s*;\\s*",
        quiet_options());
    require_ok(spacer, "spacing-command");

    std::string out = body;
    replace_to_fixpoint(&out, spacer, "\\1 \\2 ");
    return out;
}

static bool has_semicolon(const Region& region) {
    return region.text.find(';') != std::string::npos;
}

// ============================================================================
// 7. Font command bracing
// ============================================================================

std::string brace_font_commands(const std::string& body) {
    static const re2::RE2 font(
        "\\\\(mathcal|mathbb|mathrm|mathbf|text)\\s+([A-Za-z])([^A-Za-z]|$)",
        quiet_options());
    require_ok(font, "font-bracing");

    std::string out = body;
    replace_to_fixpoint(&out, font, "\\\\\\1{\\2}\\3");
    return out;
}

static bool has_font_command(const Region& region) {
    return contains(region.text, "\\math") || contains(region.text, "\\text");
}

// ============================================================================
// 8. Hash escape
// ============================================================================

std::string escape_hashes(const std::string& body) {
    std::string out;
    out.reserve(body.size() + 4);
    for (size_t i = 0; i < body.size(); i++) {
        if (body[i] == '#' && !escaped_at(body, i)) out += '\\';
        out += body[i];
    }
    return out;
}

static bool has_hash(const Region& region) {
    return region.text.find('#') != std::string::npos;
}

// ============================================================================
// Prose rules
// ============================================================================

std::string strip_remote_images(const std::string& text) {
    static const re2::RE2 remote_image(
        "(?m)^[ \\t]*!\\[[^\\]\\n]*\\]\\([ \\t]*https?://[^)\\n]*\\)[ \\t]*(?:\\n|$)",
        quiet_options());
    require_ok(remote_image, "remote-image-strip");

    std::string out = text;
    re2::RE2::GlobalReplace(&out, remote_image, "");
    return out;
}

static bool has_remote_image(const Region& region) {
    return contains(region.text, "](http");
}

std::string collapse_blank_lines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] == '\n') {
            size_t k = i + 1;
            int blanks = 0;
            for (;;) {
                size_t m = k;
                while (m < n && is_hspace(text[m])) m++;
                if (m < n && text[m] == '\n') {
                    blanks++;
                    k = m + 1;
                } else {
                    break;
                }
            }
            if (blanks >= 2) {
                out += "\n\n";
                i = k;
                continue;
            }
        }
        out += text[i];
        i++;
    }
    return out;
}

static bool has_blank_run(const Region& region) {
    size_t newlines = 0;
    for (char c : region.text) {
        if (c == '\n' && ++newlines >= 3) return true;
    }
    return false;
}

} // namespace rules

// ============================================================================
// Rule table
// ============================================================================

const std::vector<Rule>& default_rules() {
    static const std::vector<Rule> table = {
        {"delimiter-normalization", MATH_SCOPE, RuleTarget::Whole,
         rules::needs_delimiter_fix, rules::normalize_delimiters},
        {"decoration-strip", MATH_SCOPE, RuleTarget::Body,
         rules::has_decoration, rules::strip_decoration},
        {"orphan-script", MATH_SCOPE, RuleTarget::Body,
         rules::has_scripts, rules::remove_orphan_scripts},
        {"absolute-value", MATH_SCOPE, RuleTarget::Body,
         rules::has_pipe, rules::rewrite_absolute_values},
        {"operator-punctuation", MATH_SCOPE, RuleTarget::Body,
         rules::has_operator_comma, rules::clean_operator_punctuation},
        {"spacing-command", MATH_SCOPE, RuleTarget::Body,
         rules::has_semicolon, rules::fix_spacing_commands},
        {"font-bracing", MATH_SCOPE, RuleTarget::Body,
         rules::has_font_command, rules::brace_font_commands},
        {"hash-escape", MATH_SCOPE, RuleTarget::Body,
         rules::has_hash, rules::escape_hashes},
        {"remote-image-strip", PROSE_SCOPE, RuleTarget::Whole,
         rules::has_remote_image, rules::strip_remote_images},
        {"blank-line-collapse", PROSE_SCOPE, RuleTarget::Whole,
         rules::has_blank_run, rules::collapse_blank_lines},
    };
    return table;
}

} // namespace mathfix
