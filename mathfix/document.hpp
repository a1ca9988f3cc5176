// document.hpp - Typed region model of a Markdown/LaTeX document
//
// A Document is the ordered sequence of Regions produced by the segmenter.
// Code regions are protected: the Document refuses to change their text,
// so no later stage can alter verbatim content.

#pragma once
#ifndef MATHFIX_DOCUMENT_HPP
#define MATHFIX_DOCUMENT_HPP

#include "source_map.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mathfix {

// ============================================================================
// Regions
// ============================================================================

enum class RegionKind : uint8_t {
    CodeBlock,      // fenced code block, fence lines included
    InlineCode,     // `code` span, backticks included
    MathBlock,      // $$...$$, \[...\], bracket-line block
    MathInline,     // $...$, \(...\)
    Prose,          // everything else
};

const char* region_kind_name(RegionKind kind);

// Bit for RegionKind in a rule scope mask
constexpr unsigned region_kind_bit(RegionKind kind) {
    return 1u << static_cast<unsigned>(kind);
}

// Position in the original document, diagnostics only
struct Span {
    size_t offset;
    size_t length;
    SourceLocation start;

    Span() : offset(0), length(0) {}
    Span(size_t off, size_t len, const SourceLocation& loc)
        : offset(off), length(len), start(loc) {}
};

struct Region {
    RegionKind kind;
    std::string text;           // delimiters included
    Span span;
    bool unterminated;          // display block closed implicitly

    Region(RegionKind k, std::string t, const Span& s = Span())
        : kind(k), text(std::move(t)), span(s), unterminated(false) {}

    bool is_protected() const {
        return kind == RegionKind::CodeBlock || kind == RegionKind::InlineCode;
    }
    bool is_math() const {
        return kind == RegionKind::MathBlock || kind == RegionKind::MathInline;
    }
};

// ============================================================================
// Document
// ============================================================================

class Document {
public:
    Document() = default;

    // Documents are per-file and never shared
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    void append(Region region);

    size_t size() const { return regions_.size(); }
    bool empty() const { return regions_.empty(); }
    const Region& at(size_t index) const { return regions_.at(index); }
    const std::vector<Region>& regions() const { return regions_; }

    // Returns false (and leaves the region untouched) for protected regions
    bool set_text(size_t index, std::string text);

    // Replaces one Prose region by the given pieces, in place
    bool split(size_t index, std::vector<Region> pieces);

    // Drops emptied regions and merges neighbouring Prose regions.
    // Returns the number of merges.
    size_t compact();

    // Concatenation of all region texts, in order
    std::string concat() const;

    size_t count(RegionKind kind) const;

private:
    std::vector<Region> regions_;
};

} // namespace mathfix

#endif // MATHFIX_DOCUMENT_HPP
