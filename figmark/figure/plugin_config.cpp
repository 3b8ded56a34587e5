#include "plugin_config.hpp"
#include "../../lib/log.h"
#include <ctype.h>
#include <string.h>
#include <strings.h>

namespace figmark {

bool parse_bool_literal(const char* text, bool* out) {
    if (!text || !out) return false;
    if (strcasecmp(text, "true") == 0 || strcmp(text, "1") == 0 ||
        strcasecmp(text, "yes") == 0 || strcasecmp(text, "on") == 0) {
        *out = true;
        return true;
    }
    if (strcasecmp(text, "false") == 0 || strcmp(text, "0") == 0 ||
        strcasecmp(text, "no") == 0 || strcasecmp(text, "off") == 0) {
        *out = false;
        return true;
    }
    return false;
}

FigmarkErrorCode plugin_config_set(PluginConfig* config, const char* key, const char* value, bool strict) {
    if (!config || !key) return ERR_NULL_REFERENCE;

    bool* field = nullptr;
    if (strcmp(key, "image_link") == 0 || strcmp(key, "imageLink") == 0) {
        field = &config->image_link;
    } else if (strcmp(key, "skip_no_caption") == 0 || strcmp(key, "skipNoCaption") == 0) {
        field = &config->skip_no_caption;
    }

    if (!field) {
        if (strict) {
            log_error("figure option '%s': %s", key, err_code_message(ERR_UNDEFINED_FIELD));
            return ERR_UNDEFINED_FIELD;
        }
        log_warn("figure option '%s' is not recognized, ignored", key);
        return ERR_OK;
    }

    bool flag = false;
    if (!parse_bool_literal(value ? value : "true", &flag)) {
        log_error("figure option '%s': invalid boolean '%s'", key, value);
        return ERR_INVALID_LITERAL;
    }
    *field = flag;
    return ERR_OK;
}

static bool is_separator(char c) {
    return c == ',' || c == ';' || isspace((unsigned char)c);
}

FigmarkErrorCode plugin_config_parse(const char* options, PluginConfig* config, bool strict) {
    if (!config) return ERR_NULL_REFERENCE;
    if (!options) return ERR_OK;

    PluginConfig parsed = *config;
    const char* pos = options;
    while (*pos) {
        while (*pos && is_separator(*pos)) pos++;
        if (!*pos) break;

        const char* start = pos;
        while (*pos && !is_separator(*pos)) pos++;
        std::string entry(start, pos - start);

        std::string key = entry;
        std::string value;
        bool has_value = false;
        size_t eq = entry.find('=');
        if (eq != std::string::npos) {
            key = entry.substr(0, eq);
            value = entry.substr(eq + 1);
            has_value = true;
        }
        if (key.empty()) {
            log_error("figure options: missing key in '%s'", entry.c_str());
            return ERR_MISSING_TOKEN;
        }
        if (has_value && value.empty()) {
            log_error("figure options: missing value for '%s'", key.c_str());
            return ERR_MISSING_TOKEN;
        }

        FigmarkErrorCode rc = plugin_config_set(&parsed, key.c_str(), has_value ? value.c_str() : nullptr, strict);
        if (rc != ERR_OK) return rc;
    }

    *config = parsed;
    return ERR_OK;
}

std::string plugin_config_to_string(const PluginConfig& config) {
    std::string out = "image_link=";
    out += config.image_link ? "true" : "false";
    out += " skip_no_caption=";
    out += config.skip_no_caption ? "true" : "false";
    return out;
}

} // namespace figmark
