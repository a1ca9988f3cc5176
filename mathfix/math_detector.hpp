// math_detector.hpp - Promote undelimited parenthesized math in prose
//
// Looks for "(...)" spans in Prose regions whose interior is very likely
// math: a LaTeX command from the allow-list, or an allow-listed operator.
// The parentheses are read as \( \) delimiters that lost their
// backslashes and become "$...$"; the new MathInline goes through the
// same math rules as any other inline region.
//
// A false positive rewrites prose, so every doubtful span is rejected.

#pragma once
#ifndef MATHFIX_MATH_DETECTOR_HPP
#define MATHFIX_MATH_DETECTOR_HPP

#include "document.hpp"
#include "diagnostic.hpp"
#include "rule_engine.hpp"
#include <memory>
#include <string>
#include <vector>

namespace re2 { class RE2; }

namespace mathfix {

struct DetectorOptions {
    bool enabled;
    std::vector<std::string> commands;      // command names without backslash
    std::vector<std::string> operators;     // "^" and "_" mean script markers
    size_t max_span;                        // interior bytes

    DetectorOptions();
};

const std::vector<std::string>& default_detector_commands();
const std::vector<std::string>& default_detector_operators();

enum class MathSignal {
    None,
    Command,
    Operator,
};

const char* math_signal_name(MathSignal signal);

// Candidate span, offsets relative to the scanned text
struct MathSpan {
    size_t open;            // index of '('
    size_t close;           // index of ')'
    std::string interior;
    MathSignal signal;
};

class MathDetector {
public:
    explicit MathDetector(const DetectorOptions& options = DetectorOptions());
    ~MathDetector();

    MathDetector(const MathDetector&) = delete;
    MathDetector& operator=(const MathDetector&) = delete;

    // False when the command allow-list did not compile
    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }
    const DetectorOptions& options() const { return options_; }

    // Why an interior qualifies, or None
    MathSignal classify(const std::string& interior) const;

    // Spans that pass every check, left to right, non-overlapping
    std::vector<MathSpan> find_spans(const std::string& text) const;

    // Splits one Prose region into Prose | MathInline | Prose pieces.
    // before/after are the neighbouring characters outside the region.
    // Returns an empty vector when nothing was promoted.
    std::vector<Region> detect(const Region& prose, RuleEngine& engine,
                               DiagnosticList* diagnostics,
                               char before = '\0', char after = '\0');

    size_t promoted() const { return promoted_; }
    void reset_counts() { promoted_ = 0; }

private:
    bool rejects(const std::string& interior) const;
    bool has_script(const std::string& interior, char marker) const;

    DetectorOptions options_;
    std::unique_ptr<re2::RE2> command_re_;
    std::string error_;
    size_t promoted_;
};

} // namespace mathfix

#endif // MATHFIX_MATH_DETECTOR_HPP
