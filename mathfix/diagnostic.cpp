#include "diagnostic.hpp"
#include <sstream>

namespace mathfix {

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::InputNotFound:       return "InputNotFound";
        case DiagnosticKind::RuleFailure:         return "RuleFailure";
        case DiagnosticKind::UnbalancedDelimiter: return "UnbalancedDelimiter";
        case DiagnosticKind::WriteFailure:        return "WriteFailure";
        case DiagnosticKind::ConfigError:         return "ConfigError";
    }
    return "Unknown";
}

bool DiagnosticList::add(const Diagnostic& diagnostic) {
    switch (diagnostic.severity) {
        case DiagnosticSeverity::ERROR:
            error_count_++;
            break;
        case DiagnosticSeverity::WARNING:
            warning_count_++;
            break;
        case DiagnosticSeverity::NOTE:
            break;
    }

    if (diagnostics_.size() >= max_diagnostics_) {
        return false;
    }
    diagnostics_.push_back(diagnostic);
    return true;
}

void DiagnosticList::addError(DiagnosticKind kind, const std::string& msg) {
    add(Diagnostic(kind, DiagnosticSeverity::ERROR, SourceLocation(), msg));
}

void DiagnosticList::addWarning(DiagnosticKind kind, const SourceLocation& loc,
                                const std::string& msg, const std::string& context) {
    Diagnostic diagnostic(kind, DiagnosticSeverity::WARNING, loc, msg);
    diagnostic.context_line = context;
    add(diagnostic);
}

void DiagnosticList::addNote(DiagnosticKind kind, const SourceLocation& loc, const std::string& msg) {
    add(Diagnostic(kind, DiagnosticSeverity::NOTE, loc, msg));
}

bool DiagnosticList::contains(DiagnosticKind kind) const {
    return count(kind) > 0;
}

size_t DiagnosticList::count(DiagnosticKind kind) const {
    size_t n = 0;
    for (const Diagnostic& d : diagnostics_) {
        if (d.kind == kind) n++;
    }
    return n;
}

std::string DiagnosticList::formatDiagnostic(const Diagnostic& diagnostic, const char* file_name) const {
    std::ostringstream oss;

    const char* severity_str = "";
    switch (diagnostic.severity) {
        case DiagnosticSeverity::ERROR:   severity_str = "error"; break;
        case DiagnosticSeverity::WARNING: severity_str = "warning"; break;
        case DiagnosticSeverity::NOTE:    severity_str = "note"; break;
    }

    // Format: "file:line:column: severity: [Kind] message"
    if (file_name && *file_name) oss << file_name << ":";
    oss << diagnostic.location.line << ":" << diagnostic.location.column
        << ": " << severity_str << ": [" << diagnostic_kind_name(diagnostic.kind)
        << "] " << diagnostic.message << "\n";

    if (!diagnostic.context_line.empty()) {
        oss << "  " << diagnostic.context_line << "\n";

        // caret under the column
        if (diagnostic.location.column <= diagnostic.context_line.length() + 1) {
            oss << "  ";
            for (size_t i = 1; i < diagnostic.location.column; ++i) {
                oss << " ";
            }
            oss << "^\n";
        }
    }

    if (!diagnostic.hint.empty()) {
        oss << "  hint: " << diagnostic.hint << "\n";
    }

    return oss.str();
}

std::string DiagnosticList::formatDiagnostics(const char* file_name) const {
    std::ostringstream oss;
    for (const Diagnostic& d : diagnostics_) {
        oss << formatDiagnostic(d, file_name);
    }
    if (diagnostics_.size() >= max_diagnostics_) {
        oss << "(diagnostic limit of " << max_diagnostics_ << " reached)\n";
    }
    return oss.str();
}

} // namespace mathfix
