#include "document.hpp"
#include "../lib/log.h"

#include <iterator>
#include <utility>

namespace mathfix {

const char* region_kind_name(RegionKind kind) {
    switch (kind) {
        case RegionKind::CodeBlock:  return "CodeBlock";
        case RegionKind::InlineCode: return "InlineCode";
        case RegionKind::MathBlock:  return "MathBlock";
        case RegionKind::MathInline: return "MathInline";
        case RegionKind::Prose:      return "Prose";
    }
    return "Unknown";
}

void Document::append(Region region) {
    regions_.push_back(std::move(region));
}

bool Document::set_text(size_t index, std::string text) {
    if (index >= regions_.size()) {
        log_error("document: set_text index %zu out of range (%zu regions)", index, regions_.size());
        return false;
    }
    Region& region = regions_[index];
    if (region.is_protected()) {
        log_error("document: refusing to modify protected %s region at line %zu",
                  region_kind_name(region.kind), region.span.start.line);
        return false;
    }
    region.text = std::move(text);
    return true;
}

bool Document::split(size_t index, std::vector<Region> pieces) {
    if (index >= regions_.size()) return false;
    if (regions_[index].kind != RegionKind::Prose) {
        log_error("document: split called on non-prose %s region",
                  region_kind_name(regions_[index].kind));
        return false;
    }
    for (const Region& piece : pieces) {
        if (piece.is_protected()) {
            log_error("document: split may not introduce protected regions");
            return false;
        }
    }

    auto pos = regions_.erase(regions_.begin() + static_cast<std::ptrdiff_t>(index));
    regions_.insert(pos, std::make_move_iterator(pieces.begin()),
                    std::make_move_iterator(pieces.end()));
    return true;
}

size_t Document::compact() {
    std::vector<Region> out;
    out.reserve(regions_.size());
    size_t merges = 0;
    for (Region& r : regions_) {
        if (r.text.empty() && !r.is_protected()) continue;
        if (r.kind == RegionKind::Prose && !out.empty() && out.back().kind == RegionKind::Prose) {
            Region& prev = out.back();
            prev.text += r.text;
            prev.span.length = r.span.offset + r.span.length - prev.span.offset;
            merges++;
            continue;
        }
        out.push_back(std::move(r));
    }
    regions_.swap(out);
    return merges;
}

std::string Document::concat() const {
    size_t total = 0;
    for (const Region& r : regions_) total += r.text.size();

    std::string out;
    out.reserve(total);
    for (const Region& r : regions_) out += r.text;
    return out;
}

size_t Document::count(RegionKind kind) const {
    size_t n = 0;
    for (const Region& r : regions_) {
        if (r.kind == kind) n++;
    }
    return n;
}

} // namespace mathfix
