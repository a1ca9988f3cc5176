#include "config.hpp"
#include "rules.hpp"
#include "../lib/file.h"
#include "../lib/log.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <strings.h>

namespace mathfix {

// ============================================================================
// Scanning
// ============================================================================

static void skip_whitespace(const char** ini) {
    while (**ini && (**ini == ' ' || **ini == '\t')) {
        (*ini)++;
    }
}

static void skip_to_newline(const char** ini) {
    while (**ini && **ini != '\n' && **ini != '\r') {
        (*ini)++;
    }
    if (**ini == '\r' && *(*ini + 1) == '\n') {
        (*ini) += 2;
    } else if (**ini == '\n' || **ini == '\r') {
        (*ini)++;
    }
}

static bool is_comment(const char* ini) {
    return *ini == ';' || *ini == '#';
}

static bool at_line_end(const char* ini) {
    return !*ini || *ini == '\n' || *ini == '\r';
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

// Rest of the line, unquoted when wrapped in "..." or '...'
static bool parse_raw_value(const char** ini, std::string* value) {
    skip_whitespace(ini);
    value->clear();
    if (**ini == '"' || **ini == '\'') {
        char quote_char = **ini;
        (*ini)++;
        while (**ini && **ini != quote_char && !at_line_end(*ini)) {
            if (**ini == '\\' && *(*ini + 1) == quote_char) {
                (*ini)++;
            }
            *value += **ini;
            (*ini)++;
        }
        if (**ini != quote_char) return false;
        (*ini)++;
        skip_whitespace(ini);
        return at_line_end(*ini);
    }
    while (!at_line_end(*ini)) {
        *value += **ini;
        (*ini)++;
    }
    *value = trim(*value);
    return true;
}

static std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    for (;;) {
        size_t comma = value.find(',', start);
        std::string item = trim(value.substr(start, comma == std::string::npos ? std::string::npos
                                                                                 : comma - start));
        if (!item.empty()) items.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return items;
}

static bool parse_bool(const std::string& value, bool* out) {
    static const char* const yes[] = {"true", "yes", "on", "1"};
    static const char* const no[] = {"false", "no", "off", "0"};
    for (const char* s : yes) {
        if (strcasecmp(value.c_str(), s) == 0) { *out = true; return true; }
    }
    for (const char* s : no) {
        if (strcasecmp(value.c_str(), s) == 0) { *out = false; return true; }
    }
    return false;
}

static bool is_command_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ============================================================================
// Settings
// ============================================================================

struct ConfigParser {
    NormalizerOptions* options;
    DiagnosticList* diagnostics;
    SourceLocation location;
    std::string line_text;
    bool ok;

    void error(const std::string& msg) {
        ok = false;
        log_error("config: line %zu: %s", location.line, msg.c_str());
        if (diagnostics) {
            Diagnostic d(DiagnosticKind::ConfigError, DiagnosticSeverity::ERROR, location, msg);
            d.context_line = line_text;
            diagnostics->add(d);
        }
    }

    void warning(const std::string& msg) {
        log_warn("config: line %zu: %s", location.line, msg.c_str());
        if (diagnostics) {
            diagnostics->addWarning(DiagnosticKind::ConfigError, location, msg, line_text);
        }
    }

    void set(const std::string& section, const std::string& key, const std::string& value);
};

void ConfigParser::set(const std::string& section, const std::string& key, const std::string& value) {
    if (section == "output") {
        if (key == "suffix") {
            if (value.empty() || value.find('/') != std::string::npos) {
                error("suffix must be non-empty and may not contain '/'");
                return;
            }
            options->suffix = value;
            return;
        }
    } else if (section == "rules") {
        if (key == "disable") {
            for (const std::string& name : split_list(value)) {
                bool known = false;
                for (const Rule& rule : default_rules()) {
                    if (name == rule.name) known = true;
                }
                if (!known) {
                    warning("unknown rule '" + name + "'");
                    continue;
                }
                options->disabled_rules.push_back(name);
            }
            return;
        }
    } else if (section == "detector") {
        DetectorOptions& det = options->detector;
        if (key == "enabled") {
            if (!parse_bool(value, &det.enabled)) error("expected a boolean, got '" + value + "'");
            return;
        }
        if (key == "commands") {
            std::vector<std::string> names = split_list(value);
            for (std::string& name : names) {
                if (!name.empty() && name[0] == '\\') name.erase(0, 1);
                if (!is_command_name(name)) {
                    error("command names are letters only, got '" + name + "'");
                    return;
                }
            }
            det.commands = names;
            return;
        }
        if (key == "operators") {
            det.operators = split_list(value);
            return;
        }
        if (key == "max_span") {
            char* end = nullptr;
            errno = 0;
            long n = strtol(value.c_str(), &end, 10);
            if (value.empty() || *end || errno || n <= 0) {
                error("max_span must be a positive integer, got '" + value + "'");
                return;
            }
            det.max_span = static_cast<size_t>(n);
            return;
        }
    } else {
        warning("unknown section [" + section + "]");
        return;
    }
    warning("unknown key '" + key + "' in [" + section + "]");
}

bool parse_config(const std::string& text, NormalizerOptions* options,
                  DiagnosticList* diagnostics) {
    ConfigParser parser{options, diagnostics, SourceLocation(), std::string(), true};
    std::string section;

    const char* begin = text.c_str();
    const char* ini = begin;
    size_t line = 0;
    while (*ini) {
        line++;
        const char* line_start = ini;
        const char* eol = line_start;
        while (*eol && *eol != '\n' && *eol != '\r') eol++;
        parser.location = SourceLocation(static_cast<size_t>(line_start - begin), line, 1);
        parser.line_text.assign(line_start, eol);

        skip_whitespace(&ini);
        if (at_line_end(ini) || is_comment(ini)) {
            skip_to_newline(&ini);
            continue;
        }

        if (*ini == '[') {
            ini++;
            std::string name;
            while (!at_line_end(ini) && *ini != ']') name += *ini++;
            if (*ini != ']') {
                parser.error("unterminated section header");
            } else {
                ini++;
                skip_whitespace(&ini);
                if (!at_line_end(ini)) parser.error("text after section header");
                section = trim(name);
            }
            skip_to_newline(&ini);
            continue;
        }

        std::string key;
        while (!at_line_end(ini) && *ini != '=' && !std::isspace(static_cast<unsigned char>(*ini))) {
            key += *ini++;
        }
        skip_whitespace(&ini);
        if (*ini != '=' || key.empty()) {
            parser.error("expected 'key = value'");
            skip_to_newline(&ini);
            continue;
        }
        ini++;

        std::string value;
        if (!parse_raw_value(&ini, &value)) {
            parser.error("unterminated quoted value");
        } else if (section.empty()) {
            parser.warning("key '" + key + "' outside any section");
        } else {
            parser.set(section, key, value);
        }
        skip_to_newline(&ini);
    }
    return parser.ok;
}

bool load_config_file(const std::string& path, NormalizerOptions* options,
                      DiagnosticList* diagnostics) {
    size_t len = 0;
    std::unique_ptr<char, decltype(&free)> buf(read_text_file(path.c_str(), &len), &free);
    if (!buf) {
        std::string msg = "cannot read config file " + path +
                          (file_exists(path.c_str()) ? ": unreadable" : ": no such file");
        log_error("config: %s", msg.c_str());
        if (diagnostics) diagnostics->addError(DiagnosticKind::ConfigError, msg);
        return false;
    }
    log_debug("config: loading %s", path.c_str());
    return parse_config(std::string(buf.get(), len), options, diagnostics);
}

} // namespace mathfix
