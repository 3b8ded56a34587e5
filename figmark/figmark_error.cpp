#include "figmark_error.h"
#include <stddef.h>

struct ErrorEntry {
    FigmarkErrorCode code;
    const char* name;
    const char* message;
};

static const ErrorEntry error_entries[] = {
    {ERR_OK,                   "OK",                   "no error"},
    {ERR_SYNTAX_ERROR,         "SYNTAX_ERROR",         "malformed input"},
    {ERR_MISSING_TOKEN,        "MISSING_TOKEN",        "option needs a key and a value"},
    {ERR_INVALID_LITERAL,      "INVALID_LITERAL",      "expected true/false, yes/no, on/off or 1/0"},
    {ERR_UNDEFINED_FIELD,      "UNDEFINED_FIELD",      "unknown option"},
    {ERR_DUPLICATE_DEFINITION, "DUPLICATE_DEFINITION", "a rule with this name is already registered"},
    {ERR_NULL_REFERENCE,       "NULL_REFERENCE",       "required argument is null"},
    {ERR_INDEX_OUT_OF_BOUNDS,  "INDEX_OUT_OF_BOUNDS",  "position is outside the block"},
    {ERR_KEY_NOT_FOUND,        "KEY_NOT_FOUND",        "no rule with that name"},
    {ERR_EMPTY_COLLECTION,     "EMPTY_COLLECTION",     "a figure needs at least one image"},
    {ERR_IO_ERROR,             "IO_ERROR",             "input/output failure"},
    {ERR_FILE_NOT_FOUND,       "FILE_NOT_FOUND",       "no such file"},
    {ERR_FILE_READ_ERROR,      "FILE_READ_ERROR",      "could not read file"},
    {ERR_FILE_WRITE_ERROR,     "FILE_WRITE_ERROR",     "could not write file"},
    {ERR_INTERNAL_ERROR,       "INTERNAL_ERROR",       "internal error"},
    {ERR_INVALID_STATE,        "INVALID_STATE",        "inconsistent internal state"},
};

static const ErrorEntry* find_entry(FigmarkErrorCode code) {
    for (const ErrorEntry& entry : error_entries) {
        if (entry.code == code) return &entry;
    }
    return NULL;
}

const char* err_code_name(FigmarkErrorCode code) {
    const ErrorEntry* entry = find_entry(code);
    return entry ? entry->name : "UNKNOWN_ERROR";
}

const char* err_code_message(FigmarkErrorCode code) {
    const ErrorEntry* entry = find_entry(code);
    return entry ? entry->message : "unknown error";
}

const char* err_category_name(FigmarkErrorCode code) {
    if (code == ERR_OK) return "None";
    if (ERR_IS_SYNTAX(code)) return "Syntax";
    if (ERR_IS_SEMANTIC(code)) return "Semantic";
    if (ERR_IS_RUNTIME(code)) return "Runtime";
    if (ERR_IS_IO(code)) return "I/O";
    if (ERR_IS_INTERNAL(code)) return "Internal";
    return "Unknown";
}
