#include "segmenter.hpp"
#include "../lib/log.h"

#include <cctype>

namespace mathfix {

static log_category_t* seg_log = nullptr;

struct Segmenter::State {
    const std::string& text;
    SourceMap map;
    Document doc;
    DiagnosticList* diagnostics;
    size_t prose_start;

    State(const std::string& t, DiagnosticList* d)
        : text(t), map(t), diagnostics(d), prose_start(0) {}
};

// ============================================================================
// Line helpers
// ============================================================================

size_t run_length(const std::string& text, size_t pos, size_t end, char c) {
    size_t n = 0;
    while (pos + n < end && text[pos + n] == c) n++;
    return n;
}

static size_t line_end(const std::string& text, size_t pos, size_t end) {
    while (pos < end && text[pos] != '\n') pos++;
    return pos;
}

static size_t next_line(const std::string& text, size_t pos, size_t end) {
    size_t le = line_end(text, pos, end);
    return le < end ? le + 1 : end;
}

static bool is_blank(const std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; i++) {
        if (text[i] != ' ' && text[i] != '\t' && text[i] != '\r') return false;
    }
    return true;
}

static bool at_line_start(const std::string& text, size_t pos) {
    return pos == 0 || text[pos - 1] == '\n';
}

// only spaces/tabs between the start of the line and pos
static bool only_space_before(const std::string& text, size_t pos) {
    while (pos > 0 && text[pos - 1] != '\n') {
        if (text[pos - 1] != ' ' && text[pos - 1] != '\t') return false;
        pos--;
    }
    return true;
}

// Trimmed content of the line [begin, end) equals token
static bool line_is(const std::string& text, size_t begin, size_t end, const char* token) {
    while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) begin++;
    while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t' || text[end - 1] == '\r')) end--;
    return text.compare(begin, end - begin, token) == 0;
}

// True when a newline at pos is followed by a blank line
static bool newline_ends_paragraph(const std::string& text, size_t pos, size_t end) {
    if (pos >= end || text[pos] != '\n') return false;
    size_t ls = pos + 1;
    if (ls >= end) return false;
    return is_blank(text, ls, line_end(text, ls, end));
}

// End of the paragraph containing pos: the newline before the first blank
// line, or end with trailing line breaks left out
static size_t paragraph_end(const std::string& text, size_t pos, size_t end) {
    for (size_t i = pos; i < end; i++) {
        if (newline_ends_paragraph(text, i, end)) return i;
    }
    size_t stop = end;
    while (stop > pos && (text[stop - 1] == '\n' || text[stop - 1] == '\r')) stop--;
    return stop;
}

// Fence opener: up to 3 spaces, then 3+ backticks or tildes
static bool fence_open(const std::string& text, size_t begin, size_t end, char* fence_char, size_t* fence_len) {
    size_t pos = begin;
    while (pos < end && pos - begin < 3 && text[pos] == ' ') pos++;
    if (pos >= end || (text[pos] != '`' && text[pos] != '~')) return false;

    char c = text[pos];
    size_t n = run_length(text, pos, end, c);
    if (n < 3) return false;
    // backtick info strings may not contain backticks
    if (c == '`') {
        for (size_t i = pos + n; i < end; i++) {
            if (text[i] == '`') return false;
        }
    }
    *fence_char = c;
    *fence_len = n;
    return true;
}

static bool fence_close(const std::string& text, size_t begin, size_t end, char fence_char, size_t fence_len) {
    size_t pos = begin;
    while (pos < end && pos - begin < 3 && text[pos] == ' ') pos++;
    size_t n = run_length(text, pos, end, fence_char);
    if (n < fence_len) return false;
    return is_blank(text, pos + n, end);
}

// ============================================================================
// Delimiter searches
// ============================================================================

// Next run of two or more '$' at or after pos; escaped dollars are skipped
static bool find_display_close(const std::string& text, size_t pos, size_t end, size_t* at, size_t* len) {
    while (pos < end) {
        char c = text[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (c == '$') {
            size_t n = run_length(text, pos, end, '$');
            if (n >= 2) {
                *at = pos;
                *len = n;
                return true;
            }
            pos += n;
            continue;
        }
        pos++;
    }
    return false;
}

// Closing '$' of inline math (pandoc rules): preceded by non-space, not
// followed by a digit, not part of "$$", within the paragraph. The first
// '$' met decides.
static bool find_inline_close(const std::string& text, size_t pos, size_t end, size_t* at) {
    while (pos < end) {
        char c = text[pos];
        if (c == '\\') {
            pos += 2;
            continue;
        }
        if (c == '\n' && newline_ends_paragraph(text, pos, end)) return false;
        if (c == '$') {
            if (pos + 1 < end && text[pos + 1] == '$') return false;
            if (std::isspace(static_cast<unsigned char>(text[pos - 1]))) return false;
            if (pos + 1 < end && std::isdigit(static_cast<unsigned char>(text[pos + 1]))) return false;
            *at = pos;
            return true;
        }
        pos++;
    }
    return false;
}

// Backtick run of exactly len within the paragraph
static bool find_code_close(const std::string& text, size_t pos, size_t end, size_t len, size_t* at) {
    while (pos < end) {
        char c = text[pos];
        if (c == '\n' && newline_ends_paragraph(text, pos, end)) return false;
        if (c == '`') {
            size_t n = run_length(text, pos, end, '`');
            if (n == len) {
                *at = pos;
                return true;
            }
            pos += n;
            continue;
        }
        pos++;
    }
    return false;
}

static bool find_token(const std::string& text, size_t pos, size_t end, const char* token,
                       bool stop_at_paragraph, size_t* at) {
    size_t token_len = std::char_traits<char>::length(token);
    while (pos + token_len <= end) {
        if (stop_at_paragraph && text[pos] == '\n' && newline_ends_paragraph(text, pos, end)) return false;
        if (text.compare(pos, token_len, token) == 0) {
            *at = pos;
            return true;
        }
        // "\\)" is an escaped backslash followed by ')'
        if (text[pos] == '\\' && pos + 1 < end && text[pos + 1] == '\\') {
            pos += 2;
            continue;
        }
        pos++;
    }
    return false;
}

// Line holding only "[" or "\[" closed by a line holding only "]" or "\]"
static bool find_bracket_block(const std::string& text, size_t line_start, size_t end, size_t* block_end) {
    size_t le = line_end(text, line_start, end);
    if (!line_is(text, line_start, le, "[") && !line_is(text, line_start, le, "\\[")) return false;

    size_t pos = next_line(text, line_start, end);
    while (pos < end) {
        size_t e = line_end(text, pos, end);
        if (line_is(text, pos, e, "]") || line_is(text, pos, e, "\\]")) {
            *block_end = e;
            return true;
        }
        pos = next_line(text, pos, end);
    }
    return false;
}

// ============================================================================
// Segmenter
// ============================================================================

void Segmenter::flush_prose(State& st, size_t upto) {
    if (upto > st.prose_start) {
        Span span(st.prose_start, upto - st.prose_start, st.map.locate(st.prose_start));
        st.doc.append(Region(RegionKind::Prose, st.text.substr(st.prose_start, upto - st.prose_start), span));
    }
    st.prose_start = upto;
}

void Segmenter::emit(State& st, RegionKind kind, size_t begin, size_t end, bool unterminated) {
    flush_prose(st, begin);
    Span span(begin, end - begin, st.map.locate(begin));
    Region region(kind, st.text.substr(begin, end - begin), span);
    region.unterminated = unterminated;
    st.doc.append(std::move(region));
    st.prose_start = end;
}

void Segmenter::scan_chunk(State& st, size_t begin, size_t end) {
    const std::string& t = st.text;
    st.prose_start = begin;

    size_t i = begin;
    while (i < end) {
        size_t close = 0, close_len = 0;

        if (at_line_start(t, i) && find_bracket_block(t, i, end, &close)) {
            emit(st, RegionKind::MathBlock, i, close);
            i = close;
            continue;
        }

        char c = t[i];
        if (c == '\\') {
            if (i + 1 < end && t[i + 1] == '(' && find_token(t, i + 2, end, "\\)", true, &close)) {
                emit(st, RegionKind::MathInline, i, close + 2);
                i = close + 2;
                continue;
            }
            // \[ ... \] only as display math when it opens the line
            if (i + 1 < end && t[i + 1] == '[' && only_space_before(t, i) &&
                find_token(t, i + 2, end, "\\]", false, &close)) {
                emit(st, RegionKind::MathBlock, i, close + 2);
                i = close + 2;
                continue;
            }
            i += 2;  // escaped character or command name start
            continue;
        }

        if (c == '`') {
            size_t n = run_length(t, i, end, '`');
            if (find_code_close(t, i + n, end, n, &close)) {
                emit(st, RegionKind::InlineCode, i, close + n);
                i = close + n;
            } else {
                i += n;
            }
            continue;
        }

        if (c == '$') {
            size_t n = run_length(t, i, end, '$');
            if (n >= 2) {
                if (find_display_close(t, i + n, end, &close, &close_len)) {
                    emit(st, RegionKind::MathBlock, i, close + close_len);
                    i = close + close_len;
                } else {
                    size_t stop = paragraph_end(t, i + n, end);
                    SourceLocation loc = st.map.locate(i);
                    clog_warn(seg_log, "segmenter: unterminated display math at line %zu, col %zu",
                              loc.line, loc.column);
                    if (st.diagnostics) {
                        st.diagnostics->addWarning(DiagnosticKind::UnbalancedDelimiter, loc,
                                                   "display math opened here is never closed; closing it at end of paragraph",
                                                   st.map.lineText(loc.line));
                    }
                    emit(st, RegionKind::MathBlock, i, stop, true);
                    i = stop;
                }
                continue;
            }
            if (i + 1 < end && !std::isspace(static_cast<unsigned char>(t[i + 1])) &&
                find_inline_close(t, i + 1, end, &close)) {
                emit(st, RegionKind::MathInline, i, close + 1);
                i = close + 1;
                continue;
            }
            i++;
            continue;
        }

        i++;
    }
    flush_prose(st, end);
}

void Segmenter::scan_fences(State& st) {
    const std::string& t = st.text;
    size_t n = t.size();
    size_t chunk_start = 0;
    size_t pos = 0;

    while (pos < n) {
        size_t le = line_end(t, pos, n);
        char fence_char = 0;
        size_t fence_len = 0;
        if (fence_open(t, pos, le, &fence_char, &fence_len)) {
            scan_chunk(st, chunk_start, pos);

            // unterminated fences run to the end of the document
            size_t block_end = n;
            size_t p = next_line(t, pos, n);
            while (p < n) {
                size_t ple = line_end(t, p, n);
                if (fence_close(t, p, ple, fence_char, fence_len)) {
                    block_end = ple < n ? ple + 1 : n;
                    break;
                }
                p = next_line(t, p, n);
            }
            emit(st, RegionKind::CodeBlock, pos, block_end);
            pos = chunk_start = block_end;
            continue;
        }
        pos = next_line(t, pos, n);
    }
    scan_chunk(st, chunk_start, n);
}

Document Segmenter::segment(const std::string& text, DiagnosticList* diagnostics) {
    if (!seg_log) seg_log = log_get_category("mathfix.segment");

    State st(text, diagnostics);
    scan_fences(st);

    clog_debug(seg_log, "segmenter: %zu bytes -> %zu regions (%zu math, %zu code)",
               text.size(), st.doc.size(),
               st.doc.count(RegionKind::MathBlock) + st.doc.count(RegionKind::MathInline),
               st.doc.count(RegionKind::CodeBlock) + st.doc.count(RegionKind::InlineCode));
    return std::move(st.doc);
}

} // namespace mathfix
