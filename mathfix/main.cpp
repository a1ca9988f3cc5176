#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include "sanitize.hpp"
#include "../lib/log.h"

using namespace mathfix;

static void print_help(const char* prog) {
    printf("mathfix - LaTeX-in-Markdown sanitizer\n\n");
    printf("Usage: %s sanitize <input> [output] [-c <config>] [-v] [--dry-run]\n", prog);
    printf("       %s --help\n", prog);
    printf("\nOptions:\n");
    printf("  -c <config>    INI file with rule and detector settings\n");
    printf("  -v             Verbose: log at debug level\n");
    printf("  --dry-run      Normalize and report, but do not write\n");
    printf("  -h, --help     Show this help message\n");
    printf("\nThe output defaults to <stem>_fixed<ext> next to the input.\n");
    printf("\nExit codes:\n");
    printf("  0  success\n");
    printf("  1  usage error\n");
    printf("  2  input not found or unreadable\n");
    printf("  3  output could not be written\n");
    printf("  4  configuration error\n");
}

static int exec_sanitize(int argc, char* argv[]) {
    SanitizeRequest request;
    bool verbose = false;

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            return SANITIZE_OK;
        } else if (strcmp(argv[i], "-c") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -c requires a config file\n");
                return SANITIZE_USAGE;
            }
            request.config = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            request.dry_run = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            printf("Error: unknown option '%s'\n", argv[i]);
            return SANITIZE_USAGE;
        } else if (request.input.empty()) {
            request.input = argv[i];
        } else if (request.output.empty()) {
            request.output = argv[i];
        } else {
            printf("Error: unexpected argument '%s'\n", argv[i]);
            return SANITIZE_USAGE;
        }
    }

    if (request.input.empty()) {
        printf("Error: no input file\n");
        printf("Usage: %s sanitize <input> [output] [-c <config>] [-v] [--dry-run]\n", argv[0]);
        return SANITIZE_USAGE;
    }
    if (verbose) {
        log_set_level_all(LOG_LEVEL_DEBUG);
    }
    log_debug("sanitize: input=%s output=%s config=%s dry_run=%d", request.input.c_str(),
              request.output.empty() ? "(derived)" : request.output.c_str(),
              request.config.empty() ? "(defaults)" : request.config.c_str(), request.dry_run);

    SanitizeResult result = sanitize_file(request);

    if (result.config_diagnostics.totalCount() > 0) {
        fprintf(stderr, "%s", result.config_diagnostics.formatDiagnostics(request.config.c_str()).c_str());
    }
    if (result.diagnostics.totalCount() > 0) {
        fprintf(stderr, "%s", result.diagnostics.formatDiagnostics(request.input.c_str()).c_str());
    }

    if (result.status == SANITIZE_OK) {
        if (request.dry_run) {
            printf("%s -> %s (dry run, not written)\n", request.input.c_str(), result.output.c_str());
        } else {
            printf("%s -> %s\n", request.input.c_str(), result.output.c_str());
        }
    }
    return result.status;
}

int main(int argc, char* argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    log_debug("main() started with %d arguments", argc);

    if (argc < 2) {
        print_help(argv[0]);
        log_fini();
        return SANITIZE_USAGE;
    }
    if (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help(argv[0]);
        log_fini();
        return SANITIZE_OK;
    }

    if (strcmp(argv[1], "sanitize") == 0) {
        int exit_code = exec_sanitize(argc, argv);
        log_debug("sanitize completed with exit code %d", exit_code);
        log_fini();
        return exit_code;
    }

    printf("Error: unknown command '%s'\n", argv[1]);
    printf("Run '%s --help' for usage\n", argv[0]);
    log_fini();
    return SANITIZE_USAGE;
}
