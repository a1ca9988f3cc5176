// segmenter.hpp - Split raw Markdown text into typed regions
//
// Fenced code is found line by line first; the text between fences is
// then scanned left to right for inline code spans and math delimiters
// ($$, $, \[ \], \( \), bracket-line blocks). Every byte ends up in exactly
// one region and the concatenation reproduces the input.
//
// An opening display marker with no later marker is closed at the end of
// its paragraph, flagged unterminated, and reported as UnbalancedDelimiter.

#pragma once
#ifndef MATHFIX_SEGMENTER_HPP
#define MATHFIX_SEGMENTER_HPP

#include "document.hpp"
#include "diagnostic.hpp"
#include <string>

namespace mathfix {

class Segmenter {
public:
    Segmenter() = default;

    // Never fails; diagnostics may be null
    Document segment(const std::string& text, DiagnosticList* diagnostics);

private:
    struct State;

    void scan_fences(State& st);
    void scan_chunk(State& st, size_t begin, size_t end);

    static void emit(State& st, RegionKind kind, size_t begin, size_t end, bool unterminated = false);
    static void flush_prose(State& st, size_t upto);
};

// Counts a run of c starting at pos
size_t run_length(const std::string& text, size_t pos, size_t end, char c);

} // namespace mathfix

#endif // MATHFIX_SEGMENTER_HPP
