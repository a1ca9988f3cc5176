// normalizer.hpp - Segment, rewrite, detect and reassemble one document
//
// Pipeline states:
//   Segmented    typed regions, concatenation equals the input
//   RuleApplied  rule list applied to math regions and prose-marked rules
//   Detected     undelimited math in prose promoted to MathInline
//   Reassembled  region texts concatenated
//
// Output depends only on the input text and the options.

#pragma once
#ifndef MATHFIX_NORMALIZER_HPP
#define MATHFIX_NORMALIZER_HPP

#include "document.hpp"
#include "diagnostic.hpp"
#include "rule_engine.hpp"
#include "math_detector.hpp"
#include <map>
#include <string>
#include <vector>

namespace mathfix {

enum class NormalizerState {
    Idle,
    Segmented,
    RuleApplied,
    Detected,
    Reassembled,
};

const char* normalizer_state_name(NormalizerState state);

struct NormalizerOptions {
    std::string suffix;                         // output file name suffix
    std::vector<std::string> disabled_rules;
    DetectorOptions detector;

    NormalizerOptions() : suffix("_fixed") {}
};

struct NormalizerStats {
    size_t regions[5];                          // by RegionKind, after segmentation
    size_t unterminated;
    size_t promoted;
    size_t rule_failures;
    std::map<std::string, size_t> rule_fires;

    NormalizerStats() { clear(); }
    void clear();
    size_t total_fires() const;
};

class Normalizer {
public:
    explicit Normalizer(const NormalizerOptions& options = NormalizerOptions());

    Normalizer(const Normalizer&) = delete;
    Normalizer& operator=(const Normalizer&) = delete;

    // False when the options could not be applied (bad allow-list)
    bool ok() const { return detector_.ok(); }
    const std::string& error() const { return detector_.error(); }

    // Full pipeline; the returned Document is the reassembled result
    Document run(const std::string& text, DiagnosticList* diagnostics);

    // run() followed by concatenation
    std::string normalize(const std::string& text, DiagnosticList* diagnostics);

    NormalizerState state() const { return state_; }
    const NormalizerStats& stats() const { return stats_; }
    const RuleEngine& engine() const { return engine_; }

    // One-line summary of the last run
    std::string summary() const;

private:
    void apply_rules(Document& doc, DiagnosticList* diagnostics);
    void detect_math(Document& doc, DiagnosticList* diagnostics);

    NormalizerOptions options_;
    RuleEngine engine_;
    MathDetector detector_;
    NormalizerState state_;
    NormalizerStats stats_;
};

// Convenience wrapper with default options
std::string normalize_text(const std::string& text, DiagnosticList* diagnostics = nullptr);

} // namespace mathfix

#endif // MATHFIX_NORMALIZER_HPP
