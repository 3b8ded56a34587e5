// plugin_config.hpp - parse figure plugin options from key=value text

#ifndef FIGMARK_PLUGIN_CONFIG_HPP
#define FIGMARK_PLUGIN_CONFIG_HPP

#include "figure.hpp"
#include "../figmark_error.h"
#include <string>

namespace figmark {

// true/false, 1/0, yes/no, on/off (case-insensitive)
bool parse_bool_literal(const char* text, bool* out);

/**
 * Set one option. Recognized keys: image_link / imageLink and
 * skip_no_caption / skipNoCaption.
 *
 * Unknown keys return ERR_UNDEFINED_FIELD when strict, otherwise they are
 * logged and ignored (ERR_OK). A bad value returns ERR_INVALID_LITERAL.
 */
FigmarkErrorCode plugin_config_set(PluginConfig* config, const char* key, const char* value, bool strict);

/**
 * Parse an option list such as "image_link=true, skip_no_caption=0".
 * Entries are separated by commas, semicolons or whitespace; a bare key
 * means `key=true`. On error `config` is left unchanged.
 */
FigmarkErrorCode plugin_config_parse(const char* options, PluginConfig* config, bool strict);

// "image_link=false skip_no_caption=true"
std::string plugin_config_to_string(const PluginConfig& config);

} // namespace figmark

#endif // FIGMARK_PLUGIN_CONFIG_HPP
