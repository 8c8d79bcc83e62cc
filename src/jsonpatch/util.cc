#include "jsonpatch/util.h"
#include "jsonpatch/rapidjson_includes.h"
#include <cstring>
#include <cstdio>
#include <string>

const char *jsonpatch_code_to_message(JsonPatchCode code) {
    switch (code) {
        case JSONPATCH_SUCCESS:
        case JSONPATCH_WRONG_NUM_ARGS:
            // only used as code, no message needed
            break;
        case JSONPATCH_COMMAND_SYNTAX_ERROR: return "SYNTAXERR Command syntax error";
        case JSONPATCH_DOCUMENT_KEY_NOT_FOUND: return "NONEXISTENT Document key does not exist";
        case JSONPATCH_NOT_A_STRING_KEY: return "WRONGTYPE Document key does not hold a string value";
        case JSONPATCH_JSON_PARSE_ERROR: return "SYNTAXERR Failed to parse JSON string due to syntax error";
        case JSONPATCH_EXPECTING_ABSOLUTE_QUERY: return "SYNTAXERR Expecting an absolute query";
        case JSONPATCH_EXPECTING_RELATIVE_QUERY: return "SYNTAXERR Expecting a relative query";
        case JSONPATCH_EXPECTING_PROPERTY: return "SYNTAXERR Expecting property";
        case JSONPATCH_EXPECTING_VALUE: return "SYNTAXERR Expecting value";
        case JSONPATCH_EXPECTING_CLOSING_BRACKET: return "SYNTAXERR Expecting a closing bracket";
        case JSONPATCH_EXPECTING_END_OF_QUERY: return "SYNTAXERR Expecting end of query";
        case JSONPATCH_UNEXPECTED_OPERATOR: return "SYNTAXERR Unexpected operator";
        case JSONPATCH_UNTERMINATED_STRING: return "SYNTAXERR Unterminated string";
        case JSONPATCH_TRUNCATED_ESCAPE: return "SYNTAXERR Truncated escape";
        case JSONPATCH_INVALID_ESCAPE: return "SYNTAXERR Invalid escape";
        case JSONPATCH_START_TOO_BIG: return "SYNTAXERR Start is too big";
        case JSONPATCH_STOP_TOO_BIG: return "SYNTAXERR Stop is too big";
        case JSONPATCH_STEP_TOO_BIG: return "SYNTAXERR Step is too big";
        case JSONPATCH_INDEX_TOO_BIG: return "SYNTAXERR Index is too big";
        case JSONPATCH_SLICE_NOT_ALLOWED: return "SYNTAXERR Slice is not allowed";
        case JSONPATCH_FILTER_NOT_ALLOWED: return "SYNTAXERR Filter is not allowed";
        case JSONPATCH_OPTIONAL_MARKER_NOT_ALLOWED: return "SYNTAXERR Optional marker is not allowed";
        case JSONPATCH_INFINITY_NOT_ALLOWED: return "SYNTAXERR Infinity is not allowed";
        case JSONPATCH_NEGATIVE_INFINITY_NOT_ALLOWED: return "SYNTAXERR -Infinity is not allowed";
        case JSONPATCH_BIG_NUMBER_REQUIRES_DECIMAL: return "SYNTAXERR Big numbers require decimal";
        case JSONPATCH_NUMBER_TOO_BIG: return "SYNTAXERR Number is too big";
        case JSONPATCH_OBJECT_KEY_IS_INDEX: return "WRONGTYPE Object key must be a string, not an index";
        case JSONPATCH_OBJECT_KEY_IS_SLICE: return "WRONGTYPE Object key must be a string, not a slice";
        case JSONPATCH_ARRAY_INDEX_IS_STRING: return "WRONGTYPE Array index must be an integer, not a string";
        case JSONPATCH_ARRAY_INDEX_IS_SLICE: return "WRONGTYPE Array index must be an integer, not a slice";
        case JSONPATCH_ARRAY_SLICE_INDEX_IS_STRING:
            return "WRONGTYPE Array index must be an integer or slice, not a string";
        case JSONPATCH_NOT_A_CONTAINER: return "WRONGTYPE Expected an object or array";
        case JSONPATCH_NOT_ORDERABLE: return "WRONGTYPE Values cannot be ordered";
        case JSONPATCH_JSON_ELEMENT_NOT_ARRAY: return "WRONGTYPE JSON element is not an array";
        case JSONPATCH_JSON_ELEMENT_NOT_OBJECT: return "WRONGTYPE JSON element is not an object";
        case JSONPATCH_VALUE_NOT_ARRAY: return "WRONGTYPE Patch value is not an array";
        case JSONPATCH_VALUE_NOT_OBJECT: return "WRONGTYPE Patch value is not an object";
        case JSONPATCH_OPERATION_NOT_OBJECT: return "WRONGTYPE Patch operation is not an object";
        case JSONPATCH_UNKNOWN_OPERATION: return "ERROR Unknown patch operation";
        case JSONPATCH_MISSING_MEMBER: return "ERROR Patch operation is missing a member";
        case JSONPATCH_MEMBER_NOT_STRING: return "ERROR Patch operation member must be a string";
        case JSONPATCH_CANNOT_MODIFY_ROOT: return "ERROR Cannot delete or insert at the document root";
        case JSONPATCH_SLICE_STEP_ZERO: return "ERROR Slice step cannot be zero";
        case JSONPATCH_SLICE_SIZE_MISMATCH:
            return "ERROR Cannot assign an array to an extended slice of a different size";
        case JSONPATCH_ASSERTION_FAILED: return "ASSERTFAIL Patch assertion failed";
        case JSONPATCH_KEY_NOT_FOUND: return "NONEXISTENT Object key does not exist";
        case JSONPATCH_INDEX_OUT_OF_ARRAY_BOUNDARIES: return "OUTOFBOUNDARIES Array index is out of bounds";
        case JSONPATCH_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED:
            return "LIMIT Parser recursion depth is exceeded";
        case JSONPATCH_QUERY_STRING_SIZE_LIMIT_EXCEEDED:
            return "LIMIT Query string size limit is exceeded";
        default: ValkeyModule_Assert(false);
    }
    return "";
}

bool jsonpatch_is_syntax_error(JsonPatchCode code) {
    return code >= JSONPATCH_EXPECTING_ABSOLUTE_QUERY && code <= JSONPATCH_NUMBER_TOO_BIG;
}

jp::string jsonpatch_error_message(JsonPatchCode code, const std::string_view &detail) {
    jp::string msg = jsonpatch_code_to_message(code);
    if (!detail.empty()) {
        msg += ": ";
        msg.append(detail.data(), detail.length());
    }
    return msg;
}

/**
 * Translate a byte offset into a 1-based (line, column) pair. Lines are separated by '\n'.
 */
static void offset_to_line_col(const std::string_view &source, size_t offset, size_t &line, size_t &col) {
    if (offset > source.length()) offset = source.length();
    line = 1;
    size_t line_start = 0;
    for (size_t i = 0; i < offset; i++) {
        if (source[i] == '\n') {
            line++;
            line_start = i + 1;
        }
    }
    col = offset - line_start + 1;
}

void jsonpatch_make_diagnostic(JsonPatchCode code, const std::string_view &detail, const std::string_view &source,
                               size_t start, size_t end, const char *filename, SyntaxDiagnostic &diag) {
    if (end < start) end = start;
    diag.message = jsonpatch_error_message(code, detail);
    offset_to_line_col(source, start, diag.lineno, diag.colno);
    offset_to_line_col(source, end, diag.end_lineno, diag.end_colno);
    diag.source.assign(source.data(), source.length());
    diag.filename = filename ? filename : "";
}

jp::string jsonpatch_format_diagnostic(const SyntaxDiagnostic &diag) {
    jp::stringstream ss;
    ss << diag.message << " (";
    if (!diag.filename.empty()) ss << diag.filename << ", ";
    ss << "line " << diag.lineno;
    if (diag.end_lineno != diag.lineno) ss << "-" << diag.end_lineno;
    ss << ", column " << diag.colno;
    if (diag.end_colno != diag.colno) ss << "-" << diag.end_colno;
    ss << ")";
    return ss.str();
}

size_t jsonpatch_double_to_string(const double val, char *double_to_string_buf, size_t len) {
    // rapidjson's Writer::WriteDouble needs at most 25 bytes.
    ValkeyModule_Assert(len >= 25);
    char *end = rapidjson::internal::dtoa(val, double_to_string_buf,
                                          rapidjson::Writer<rapidjson::StringBuffer>::kDefaultMaxDecimalPlaces);
    *end = '\0';
    return end - double_to_string_buf;
}

bool jsonpatch_is_int64(const double a) {
    if (!(a >= -9223372036854775808.0 && a < 9223372036854775808.0)) return false;
    int64_t a_l = static_cast<int64_t>(a);
    double b = static_cast<double>(a_l);
    return (a <= b && a >= b);
}
