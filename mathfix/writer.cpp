#include "writer.hpp"
#include "../lib/file.h"
#include "../lib/log.h"

#include <cstring>

namespace mathfix {

static log_category_t* io_log = nullptr;

std::string serialize(const Document& doc) {
    return doc.concat();
}

std::string derive_output_path(const std::string& input, const std::string& suffix) {
    size_t slash = input.find_last_of('/');
    size_t base = slash == std::string::npos ? 0 : slash + 1;
    size_t dot = input.find_last_of('.');

    // ".notes" and "dir.v2/notes" have no extension
    if (dot == std::string::npos || dot <= base) {
        return input + suffix;
    }
    return input.substr(0, dot) + suffix + input.substr(dot);
}

bool write_output(const std::string& content, const std::string& output,
                  const std::string& input, DiagnosticList* diagnostics) {
    if (!io_log) io_log = log_get_category("mathfix.io");

    if (output.empty()) {
        clog_error(io_log, "write: empty output path");
        if (diagnostics) diagnostics->addError(DiagnosticKind::WriteFailure, "empty output path");
        return false;
    }
    if (!input.empty() && (output == input || same_file(input.c_str(), output.c_str()))) {
        std::string msg = "refusing to overwrite the input file " + output;
        clog_error(io_log, "write: %s", msg.c_str());
        if (diagnostics) diagnostics->addError(DiagnosticKind::WriteFailure, msg);
        return false;
    }

    int err = write_text_file_atomic(output.c_str(), content.data(), content.size());
    if (err != 0) {
        std::string msg = "cannot write " + output + ": " + strerror(err);
        clog_error(io_log, "write: %s", msg.c_str());
        if (diagnostics) diagnostics->addError(DiagnosticKind::WriteFailure, msg);
        return false;
    }
    clog_info(io_log, "wrote %zu bytes to %s", content.size(), output.c_str());
    return true;
}

bool write_document(const Document& doc, const std::string& output,
                    const std::string& input, DiagnosticList* diagnostics) {
    return write_output(serialize(doc), output, input, diagnostics);
}

} // namespace mathfix
