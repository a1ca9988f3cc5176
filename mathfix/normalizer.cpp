#include "normalizer.hpp"
#include "segmenter.hpp"
#include "../lib/log.h"

#include <cstdio>

namespace mathfix {

const char* normalizer_state_name(NormalizerState state) {
    switch (state) {
        case NormalizerState::Idle:        return "idle";
        case NormalizerState::Segmented:   return "segmented";
        case NormalizerState::RuleApplied: return "rule-applied";
        case NormalizerState::Detected:    return "detected";
        case NormalizerState::Reassembled: return "reassembled";
    }
    return "unknown";
}

void NormalizerStats::clear() {
    for (size_t& n : regions) n = 0;
    unterminated = 0;
    promoted = 0;
    rule_failures = 0;
    rule_fires.clear();
}

size_t NormalizerStats::total_fires() const {
    size_t total = 0;
    for (const auto& entry : rule_fires) total += entry.second;
    return total;
}

Normalizer::Normalizer(const NormalizerOptions& options)
    : options_(options)
    , engine_()
    , detector_(options.detector)
    , state_(NormalizerState::Idle)
{
    for (const std::string& name : options_.disabled_rules) {
        if (!engine_.disable(name)) {
            log_warn("normalizer: unknown rule '%s' in disable list, ignored", name.c_str());
        }
    }
}

Document Normalizer::run(const std::string& text, DiagnosticList* diagnostics) {
    stats_.clear();
    engine_.reset_counts();
    detector_.reset_counts();

    Segmenter segmenter;
    Document doc = segmenter.segment(text, diagnostics);
    for (const Region& r : doc.regions()) {
        stats_.regions[static_cast<size_t>(r.kind)]++;
        if (r.unterminated) stats_.unterminated++;
    }
    state_ = NormalizerState::Segmented;

    apply_rules(doc, diagnostics);
    state_ = NormalizerState::RuleApplied;

    detect_math(doc, diagnostics);
    state_ = NormalizerState::Detected;

    stats_.promoted = detector_.promoted();
    stats_.rule_fires = engine_.fire_counts();
    stats_.rule_failures = engine_.failure_count();
    state_ = NormalizerState::Reassembled;

    log_debug("normalizer: %s", summary().c_str());
    return doc;
}

std::string Normalizer::normalize(const std::string& text, DiagnosticList* diagnostics) {
    return run(text, diagnostics).concat();
}

void Normalizer::apply_rules(Document& doc, DiagnosticList* diagnostics) {
    for (size_t i = 0; i < doc.size(); i++) {
        const Region& r = doc.at(i);
        if (r.is_protected() || !engine_.applies_to(r.kind)) continue;

        std::string text = engine_.apply(r, diagnostics);
        if (text == r.text) continue;
        if (!doc.set_text(i, std::move(text))) {
            log_warn("normalizer: region %zu kept its original text", i);
        }
    }

    // a dropped math region can leave two prose runs side by side;
    // merged prose gets the prose rules again
    if (doc.compact() == 0 || !engine_.applies_to(RegionKind::Prose)) return;
    for (size_t i = 0; i < doc.size(); i++) {
        const Region& r = doc.at(i);
        if (r.kind != RegionKind::Prose) continue;

        std::string text = engine_.apply(r, diagnostics);
        if (text != r.text && !doc.set_text(i, std::move(text))) {
            log_warn("normalizer: prose region %zu kept its original text", i);
        }
    }
}

void Normalizer::detect_math(Document& doc, DiagnosticList* diagnostics) {
    if (!options_.detector.enabled) return;

    size_t i = 0;
    while (i < doc.size()) {
        const Region& r = doc.at(i);
        if (r.kind != RegionKind::Prose) {
            i++;
            continue;
        }
        char before = '\0', after = '\0';
        if (i > 0 && !doc.at(i - 1).text.empty()) before = doc.at(i - 1).text.back();
        if (i + 1 < doc.size() && !doc.at(i + 1).text.empty()) after = doc.at(i + 1).text.front();

        std::vector<Region> pieces = detector_.detect(r, engine_, diagnostics, before, after);
        size_t count = pieces.size();
        if (count == 0 || !doc.split(i, std::move(pieces))) {
            i++;
            continue;
        }
        i += count;
    }
}

std::string Normalizer::summary() const {
    char buf[256];
    snprintf(buf, sizeof(buf),
             "%zu code block(s), %zu inline code, %zu display, %zu inline math, %zu prose; "
             "%zu rewrite(s), %zu promoted, %zu unterminated, %zu rule failure(s)",
             stats_.regions[static_cast<size_t>(RegionKind::CodeBlock)],
             stats_.regions[static_cast<size_t>(RegionKind::InlineCode)],
             stats_.regions[static_cast<size_t>(RegionKind::MathBlock)],
             stats_.regions[static_cast<size_t>(RegionKind::MathInline)],
             stats_.regions[static_cast<size_t>(RegionKind::Prose)],
             stats_.total_fires(), stats_.promoted, stats_.unterminated,
             stats_.rule_failures);
    return std::string(buf);
}

std::string normalize_text(const std::string& text, DiagnosticList* diagnostics) {
    Normalizer normalizer;
    return normalizer.normalize(text, diagnostics);
}

} // namespace mathfix
