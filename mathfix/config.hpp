// config.hpp - INI configuration for the normalizer
//
//   [output]
//   suffix = _fixed
//
//   [rules]
//   disable = hash-escape, font-bracing
//
//   [detector]
//   enabled  = true
//   commands = frac, sum, int, alpha
//   operators = =, ^, _
//   max_span = 200
//
// Lines starting with ';' or '#' are comments. Unknown sections and keys
// are reported as warnings; a line that cannot be parsed or a value that
// does not fit its key is a ConfigError.

#pragma once
#ifndef MATHFIX_CONFIG_HPP
#define MATHFIX_CONFIG_HPP

#include "normalizer.hpp"
#include "diagnostic.hpp"
#include <string>

namespace mathfix {

// Applies settings from text on top of options. Returns false on any error.
bool parse_config(const std::string& text, NormalizerOptions* options,
                  DiagnosticList* diagnostics);

// Reads path and parses it; an unreadable file is a ConfigError
bool load_config_file(const std::string& path, NormalizerOptions* options,
                      DiagnosticList* diagnostics);

} // namespace mathfix

#endif // MATHFIX_CONFIG_HPP
