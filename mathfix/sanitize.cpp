#include "sanitize.hpp"
#include "config.hpp"
#include "writer.hpp"
#include "../lib/file.h"
#include "../lib/log.h"

#include <cstdlib>
#include <memory>

namespace mathfix {

SanitizeResult sanitize_file(const SanitizeRequest& request) {
    SanitizeResult result;

    NormalizerOptions options;
    if (!request.config.empty() &&
        !load_config_file(request.config, &options, &result.config_diagnostics)) {
        result.status = SANITIZE_CONFIG_ERROR;
        return result;
    }

    Normalizer normalizer(options);
    if (!normalizer.ok()) {
        result.config_diagnostics.addError(DiagnosticKind::ConfigError, normalizer.error());
        result.status = SANITIZE_CONFIG_ERROR;
        return result;
    }

    size_t len = 0;
    std::unique_ptr<char, decltype(&free)> buf(read_text_file(request.input.c_str(), &len), &free);
    if (!buf) {
        std::string msg = file_exists(request.input.c_str())
            ? "cannot read input file " + request.input
            : "input file not found: " + request.input;
        log_error("sanitize: %s", msg.c_str());
        result.diagnostics.addError(DiagnosticKind::InputNotFound, msg);
        result.status = SANITIZE_INPUT_NOT_FOUND;
        return result;
    }

    result.output = request.output.empty()
        ? derive_output_path(request.input, options.suffix)
        : request.output;

    Document doc = normalizer.run(std::string(buf.get(), len), &result.diagnostics);
    result.stats = normalizer.stats();
    log_info("sanitize: %s: %s", request.input.c_str(), normalizer.summary().c_str());

    if (request.dry_run) {
        log_debug("sanitize: dry run, %s not written", result.output.c_str());
        return result;
    }
    if (!write_document(doc, result.output, request.input, &result.diagnostics)) {
        result.status = SANITIZE_WRITE_FAILURE;
    }
    return result;
}

} // namespace mathfix
