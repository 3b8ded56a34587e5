/*
 * figmark error codes.
 *
 * Option parsing, rule registration and file I/O report failures as a
 * FigmarkErrorCode; ERR_OK is success. The hundreds digit is the category.
 * A paragraph that is not a figure is a normal outcome, not an error.
 */
#ifndef FIGMARK_ERROR_H
#define FIGMARK_ERROR_H

#ifdef __cplusplus
extern "C" {
#endif

#define ERR_SYNTAX_BASE    100
#define ERR_SEMANTIC_BASE  200
#define ERR_RUNTIME_BASE   300
#define ERR_IO_BASE        400
#define ERR_INTERNAL_BASE  500

#define ERR_IN_RANGE(code, base)  ((code) >= (base) && (code) < (base) + 100)
#define ERR_IS_SYNTAX(code)    ERR_IN_RANGE(code, ERR_SYNTAX_BASE)
#define ERR_IS_SEMANTIC(code)  ERR_IN_RANGE(code, ERR_SEMANTIC_BASE)
#define ERR_IS_RUNTIME(code)   ERR_IN_RANGE(code, ERR_RUNTIME_BASE)
#define ERR_IS_IO(code)        ERR_IN_RANGE(code, ERR_IO_BASE)
#define ERR_IS_INTERNAL(code)  ERR_IN_RANGE(code, ERR_INTERNAL_BASE)

typedef enum FigmarkErrorCode {
    ERR_OK = 0,

    /* option strings and command line */
    ERR_SYNTAX_ERROR = ERR_SYNTAX_BASE,
    ERR_MISSING_TOKEN = 102,          /* key or value missing around '=' */
    ERR_INVALID_LITERAL = 103,        /* value is not a boolean */

    /* configuration and pipeline wiring */
    ERR_UNDEFINED_FIELD = 205,        /* unknown option key */
    ERR_DUPLICATE_DEFINITION = 209,   /* rule name already registered */

    ERR_NULL_REFERENCE = ERR_RUNTIME_BASE + 1,
    ERR_INDEX_OUT_OF_BOUNDS = 302,
    ERR_KEY_NOT_FOUND = 303,          /* push_after anchor missing */
    ERR_EMPTY_COLLECTION = 313,       /* figure with no images */

    ERR_IO_ERROR = ERR_IO_BASE,
    ERR_FILE_NOT_FOUND = 401,
    ERR_FILE_READ_ERROR = 403,
    ERR_FILE_WRITE_ERROR = 404,

    ERR_INTERNAL_ERROR = ERR_INTERNAL_BASE,
    ERR_INVALID_STATE = 502,
} FigmarkErrorCode;

/* symbolic name without the ERR_ prefix, e.g. "KEY_NOT_FOUND" */
const char* err_code_name(FigmarkErrorCode code);
const char* err_code_message(FigmarkErrorCode code);
/* "None", "Syntax", "Semantic", "Runtime", "I/O", "Internal" or "Unknown" */
const char* err_category_name(FigmarkErrorCode code);

#ifdef __cplusplus
}
#endif

#endif /* FIGMARK_ERROR_H */
