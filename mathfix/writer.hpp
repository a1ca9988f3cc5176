// writer.hpp - Serialize a Document and persist it all-or-nothing

#pragma once
#ifndef MATHFIX_WRITER_HPP
#define MATHFIX_WRITER_HPP

#include "document.hpp"
#include "diagnostic.hpp"
#include <string>

namespace mathfix {

// Region texts in order
std::string serialize(const Document& doc);

// dir/stem.ext -> dir/stem<suffix>.ext
std::string derive_output_path(const std::string& input, const std::string& suffix);

// Writes content to output through a temporary file in the same directory.
// Refuses an output that is the input file. On failure a WriteFailure
// error is recorded and output is left as it was.
bool write_output(const std::string& content, const std::string& output,
                  const std::string& input, DiagnosticList* diagnostics);

bool write_document(const Document& doc, const std::string& output,
                    const std::string& input, DiagnosticList* diagnostics);

} // namespace mathfix

#endif // MATHFIX_WRITER_HPP
