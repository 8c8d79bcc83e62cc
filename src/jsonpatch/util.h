/**
 * This is the utility module, containing the error codes and shared helper code.
 *
 * Coding Conventions & Best Practices:
 * 1. Every public interface method declared in this file should be prefixed with "jsonpatch_".
 * 2. Generally speaking, interface methods should not have Valkey module types such as ValkeyModuleCtx
 *    or ValkeyModuleString, because that would make unit tests hard to write.
 */
#ifndef VALKEYJSONPATCH_UTIL_H_
#define VALKEYJSONPATCH_UTIL_H_

#include <stdint.h>
#include <string_view>

#include "jsonpatch/memory.h"

extern "C" {
#define VALKEYMODULE_EXPERIMENTAL_API
#include <./include/valkeymodule.h>
}

typedef enum {
    JSONPATCH_SUCCESS = 0,
    JSONPATCH_WRONG_NUM_ARGS,
    JSONPATCH_COMMAND_SYNTAX_ERROR,
    JSONPATCH_DOCUMENT_KEY_NOT_FOUND,
    JSONPATCH_NOT_A_STRING_KEY,
    JSONPATCH_JSON_PARSE_ERROR,

    // query syntax errors, always positioned
    JSONPATCH_EXPECTING_ABSOLUTE_QUERY,
    JSONPATCH_EXPECTING_RELATIVE_QUERY,
    JSONPATCH_EXPECTING_PROPERTY,
    JSONPATCH_EXPECTING_VALUE,
    JSONPATCH_EXPECTING_CLOSING_BRACKET,
    JSONPATCH_EXPECTING_END_OF_QUERY,
    JSONPATCH_UNEXPECTED_OPERATOR,
    JSONPATCH_UNTERMINATED_STRING,
    JSONPATCH_TRUNCATED_ESCAPE,
    JSONPATCH_INVALID_ESCAPE,
    JSONPATCH_START_TOO_BIG,
    JSONPATCH_STOP_TOO_BIG,
    JSONPATCH_STEP_TOO_BIG,
    JSONPATCH_INDEX_TOO_BIG,
    JSONPATCH_SLICE_NOT_ALLOWED,
    JSONPATCH_FILTER_NOT_ALLOWED,
    JSONPATCH_OPTIONAL_MARKER_NOT_ALLOWED,
    JSONPATCH_INFINITY_NOT_ALLOWED,
    JSONPATCH_NEGATIVE_INFINITY_NOT_ALLOWED,
    JSONPATCH_BIG_NUMBER_REQUIRES_DECIMAL,
    JSONPATCH_NUMBER_TOO_BIG,

    // type errors
    JSONPATCH_OBJECT_KEY_IS_INDEX,
    JSONPATCH_OBJECT_KEY_IS_SLICE,
    JSONPATCH_ARRAY_INDEX_IS_STRING,
    JSONPATCH_ARRAY_INDEX_IS_SLICE,
    JSONPATCH_ARRAY_SLICE_INDEX_IS_STRING,
    JSONPATCH_NOT_A_CONTAINER,
    JSONPATCH_NOT_ORDERABLE,
    JSONPATCH_JSON_ELEMENT_NOT_ARRAY,
    JSONPATCH_JSON_ELEMENT_NOT_OBJECT,
    JSONPATCH_VALUE_NOT_ARRAY,
    JSONPATCH_VALUE_NOT_OBJECT,
    JSONPATCH_OPERATION_NOT_OBJECT,

    // value errors
    JSONPATCH_UNKNOWN_OPERATION,
    JSONPATCH_MISSING_MEMBER,
    JSONPATCH_MEMBER_NOT_STRING,
    JSONPATCH_CANNOT_MODIFY_ROOT,
    JSONPATCH_SLICE_STEP_ZERO,
    JSONPATCH_SLICE_SIZE_MISMATCH,
    JSONPATCH_ASSERTION_FAILED,

    // lookup errors
    JSONPATCH_KEY_NOT_FOUND,
    JSONPATCH_INDEX_OUT_OF_ARRAY_BOUNDARIES,

    // limits
    JSONPATCH_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED,
    JSONPATCH_QUERY_STRING_SIZE_LIMIT_EXCEEDED,
    JSONPATCH_LAST
} JsonPatchCode;

/* Get message for a given code. */
const char *jsonpatch_code_to_message(JsonPatchCode code);

/* Is the code a positioned syntax error of the query language? */
bool jsonpatch_is_syntax_error(JsonPatchCode code);

/**
 * Positioned diagnostic, shared by query errors and document decoding errors. Lines and columns are 1-based;
 * the end position is exclusive, so a zero-width error has colno == end_colno.
 */
struct SyntaxDiagnostic {
    SyntaxDiagnostic()
            : message()
            , lineno(0)
            , colno(0)
            , end_lineno(0)
            , end_colno(0)
            , source()
            , filename()
    {}
    jp::string message;
    size_t lineno;
    size_t colno;
    size_t end_lineno;
    size_t end_colno;
    jp::string source;
    jp::string filename;
};

/**
 * Build a diagnostic for the byte range [start, end) of the source text.
 * @param detail - optional detail appended to the code message, may be empty.
 * @param diag - OUTPUT param
 */
void jsonpatch_make_diagnostic(JsonPatchCode code, const std::string_view &detail, const std::string_view &source,
                               size_t start, size_t end, const char *filename, SyntaxDiagnostic &diag);

/**
 * Render a diagnostic as a one-line error reply, e.g.
 * "SYNTAXERR Start is too big (<path>, line 1, column 3-23)". Spans print as ranges.
 */
jp::string jsonpatch_format_diagnostic(const SyntaxDiagnostic &diag);

/**
 * Build the message of a code plus an optional detail, e.g.
 * "WRONGTYPE Expected an object or array: number".
 */
jp::string jsonpatch_error_message(JsonPatchCode code, const std::string_view &detail);

/* Enum for the buffer size used in conversion of double to string */
enum { BUF_SIZE_DOUBLE_JSON = 32 };

/* Convert a double value to its shortest round-trip string, the way rapidjson's Writer does. */
size_t jsonpatch_double_to_string(const double val, char *double_to_string_buf, size_t len);

/* Check if a double value is int64.
 * If the given double does not equal an integer (int64), return false.
 * If the given double is out of range of int64, return false.
 */
bool jsonpatch_is_int64(const double a);

#endif  // VALKEYJSONPATCH_UTIL_H_
