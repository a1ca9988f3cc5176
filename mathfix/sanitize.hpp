// sanitize.hpp - File-level driver: config, read, normalize, write

#pragma once
#ifndef MATHFIX_SANITIZE_HPP
#define MATHFIX_SANITIZE_HPP

#include "diagnostic.hpp"
#include "normalizer.hpp"
#include <string>

namespace mathfix {

// Doubles as the process exit code
enum SanitizeStatus {
    SANITIZE_OK = 0,
    SANITIZE_USAGE = 1,
    SANITIZE_INPUT_NOT_FOUND = 2,
    SANITIZE_WRITE_FAILURE = 3,
    SANITIZE_CONFIG_ERROR = 4,
};

struct SanitizeRequest {
    std::string input;
    std::string output;         // empty: sibling <stem><suffix><ext>
    std::string config;         // empty: built-in defaults
    bool dry_run;

    SanitizeRequest() : dry_run(false) {}
};

struct SanitizeResult {
    SanitizeStatus status;
    std::string output;                     // resolved destination
    DiagnosticList config_diagnostics;      // located in the config file
    DiagnosticList diagnostics;             // located in the input file
    NormalizerStats stats;

    SanitizeResult() : status(SANITIZE_OK) {}
};

SanitizeResult sanitize_file(const SanitizeRequest& request);

} // namespace mathfix

#endif // MATHFIX_SANITIZE_HPP
