// diagnostic.hpp - Located warnings and errors collected during a run

#pragma once
#ifndef MATHFIX_DIAGNOSTIC_HPP
#define MATHFIX_DIAGNOSTIC_HPP

#include "source_map.hpp"
#include <string>
#include <vector>

namespace mathfix {

// What went wrong; fatal kinds abort the run, the others are recovered
enum class DiagnosticKind {
    InputNotFound,          // source missing or unreadable (fatal)
    RuleFailure,            // a rule threw, region kept as-is
    UnbalancedDelimiter,    // display math closed implicitly
    WriteFailure,           // destination unwritable (fatal)
    ConfigError,            // config file unreadable or malformed (fatal)
};

enum class DiagnosticSeverity {
    ERROR,
    WARNING,
    NOTE
};

const char* diagnostic_kind_name(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind;
    DiagnosticSeverity severity;
    SourceLocation location;
    std::string message;
    std::string context_line;   // Source line the diagnostic points at
    std::string hint;

    Diagnostic(DiagnosticKind k, DiagnosticSeverity sev,
               const SourceLocation& loc, const std::string& msg)
        : kind(k), severity(sev), location(loc), message(msg) {}
};

// Collection of diagnostics for one run, with a configurable limit
class DiagnosticList {
private:
    std::vector<Diagnostic> diagnostics_;
    size_t max_diagnostics_;
    size_t error_count_;
    size_t warning_count_;

public:
    explicit DiagnosticList(size_t max_diagnostics = 200)
        : max_diagnostics_(max_diagnostics), error_count_(0), warning_count_(0) {}

    // Returns false once the limit is reached; counters still update
    bool add(const Diagnostic& diagnostic);

    void addError(DiagnosticKind kind, const std::string& msg);
    void addWarning(DiagnosticKind kind, const SourceLocation& loc,
                    const std::string& msg, const std::string& context = std::string());
    void addNote(DiagnosticKind kind, const SourceLocation& loc, const std::string& msg);

    bool hasErrors() const { return error_count_ > 0; }
    bool hasWarnings() const { return warning_count_ > 0; }
    size_t errorCount() const { return error_count_; }
    size_t warningCount() const { return warning_count_; }
    size_t totalCount() const { return diagnostics_.size(); }

    bool contains(DiagnosticKind kind) const;
    size_t count(DiagnosticKind kind) const;

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    std::string formatDiagnostics(const char* file_name) const;
    std::string formatDiagnostic(const Diagnostic& diagnostic, const char* file_name) const;

    void clear() {
        diagnostics_.clear();
        error_count_ = 0;
        warning_count_ = 0;
    }
};

} // namespace mathfix

#endif // MATHFIX_DIAGNOSTIC_HPP
