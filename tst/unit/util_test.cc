#include <stdint.h>
#include <cstdlib>
#include <cstring>
#include <string>
#include <gtest/gtest.h>
#include "jsonpatch/util.h"
#include "jsonpatch/dom.h"
#include "jsonpatch/alloc.h"
#include "module_sim.h"

class UtilTest : public ::testing::Test {
 protected:
    void SetUp() override {
        setupValkeyModulePointers();
    }
};

TEST_F(UtilTest, testCodeToMessage) {
    for (JsonPatchCode code=JSONPATCH_SUCCESS; code < JSONPATCH_LAST; code = JsonPatchCode(code + 1)) {
        const char *msg = jsonpatch_code_to_message(code);
        EXPECT_TRUE(msg != nullptr);
        if (code == JSONPATCH_SUCCESS || code == JSONPATCH_WRONG_NUM_ARGS) {
            EXPECT_STREQ(msg, "");
        } else {
            EXPECT_GT(strlen(msg), 0);
        }
    }
}

TEST_F(UtilTest, testMessagePrefixes) {
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_EXPECTING_VALUE), "SYNTAXERR ", 10), 0);
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_NOT_ORDERABLE), "WRONGTYPE ", 10), 0);
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_CANNOT_MODIFY_ROOT), "ERROR ", 6), 0);
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_ASSERTION_FAILED), "ASSERTFAIL ", 11), 0);
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_KEY_NOT_FOUND), "NONEXISTENT ", 12), 0);
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_INDEX_OUT_OF_ARRAY_BOUNDARIES), "OUTOFBOUNDARIES ", 16),
              0);
    EXPECT_EQ(strncmp(jsonpatch_code_to_message(JSONPATCH_QUERY_STRING_SIZE_LIMIT_EXCEEDED), "LIMIT ", 6), 0);
}

TEST_F(UtilTest, testIsSyntaxError) {
    EXPECT_TRUE(jsonpatch_is_syntax_error(JSONPATCH_EXPECTING_ABSOLUTE_QUERY));
    EXPECT_TRUE(jsonpatch_is_syntax_error(JSONPATCH_EXPECTING_PROPERTY));
    EXPECT_TRUE(jsonpatch_is_syntax_error(JSONPATCH_START_TOO_BIG));
    EXPECT_TRUE(jsonpatch_is_syntax_error(JSONPATCH_NUMBER_TOO_BIG));
    EXPECT_FALSE(jsonpatch_is_syntax_error(JSONPATCH_SUCCESS));
    EXPECT_FALSE(jsonpatch_is_syntax_error(JSONPATCH_JSON_PARSE_ERROR));
    EXPECT_FALSE(jsonpatch_is_syntax_error(JSONPATCH_KEY_NOT_FOUND));
    EXPECT_FALSE(jsonpatch_is_syntax_error(JSONPATCH_NOT_ORDERABLE));
}

TEST_F(UtilTest, testErrorMessageWithDetail) {
    EXPECT_EQ(jsonpatch_error_message(JSONPATCH_NOT_A_CONTAINER, "number"),
              "WRONGTYPE Expected an object or array: number");
    EXPECT_EQ(jsonpatch_error_message(JSONPATCH_SLICE_STEP_ZERO, ""), "ERROR Slice step cannot be zero");
}

TEST_F(UtilTest, testMakeDiagnostic) {
    SyntaxDiagnostic diag;
    jsonpatch_make_diagnostic(JSONPATCH_EXPECTING_VALUE, "", "@ == ", 5, 5, "<query>", diag);
    EXPECT_EQ(diag.message, "SYNTAXERR Expecting value");
    EXPECT_EQ(diag.lineno, 1);
    EXPECT_EQ(diag.colno, 6);
    EXPECT_EQ(diag.end_lineno, 1);
    EXPECT_EQ(diag.end_colno, 6);
    EXPECT_EQ(diag.source, "@ == ");
    EXPECT_EQ(diag.filename, "<query>");
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Expecting value (<query>, line 1, column 6)");
}

TEST_F(UtilTest, testMakeDiagnosticMultiLine) {
    SyntaxDiagnostic diag;
    jsonpatch_make_diagnostic(JSONPATCH_UNEXPECTED_OPERATOR, "", "!@\n== 0", 3, 5, nullptr, diag);
    EXPECT_EQ(diag.lineno, 2);
    EXPECT_EQ(diag.colno, 1);
    EXPECT_EQ(diag.end_lineno, 2);
    EXPECT_EQ(diag.end_colno, 3);
    EXPECT_EQ(diag.filename, "");
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Unexpected operator (line 2, column 1-3)");
}

TEST_F(UtilTest, testFormatDiagnosticRanges) {
    SyntaxDiagnostic diag;
    jsonpatch_make_diagnostic(JSONPATCH_START_TOO_BIG, "", "$[99999999999999999999:]", 2, 22, "<path>", diag);
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Start is too big (<path>, line 1, column 3-23)");

    jsonpatch_make_diagnostic(JSONPATCH_UNTERMINATED_STRING, "", "$['a\nb", 2, 6, "<path>", diag);
    EXPECT_EQ(diag.end_lineno, 2);
    EXPECT_EQ(diag.end_colno, 2);
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Unterminated string (<path>, line 1-2, column 3-2)");

    jsonpatch_make_diagnostic(JSONPATCH_EXPECTING_VALUE, "", "@ ==", 4, 4, nullptr, diag);
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Expecting value (line 1, column 5)");
}

TEST_F(UtilTest, testDoubleToString) {
    double v = 189.31;
    char buf[BUF_SIZE_DOUBLE_JSON];
    size_t len = jsonpatch_double_to_string(v, buf, sizeof(buf));
    EXPECT_STREQ(buf, "189.31");
    EXPECT_EQ(len, strlen(buf));
}

TEST_F(UtilTest, testIsInt64) {
    EXPECT_TRUE(jsonpatch_is_int64(0));
    EXPECT_TRUE(jsonpatch_is_int64(1));
    EXPECT_TRUE(jsonpatch_is_int64(INT32_MAX));
    EXPECT_TRUE(jsonpatch_is_int64(INT32_MIN));
    EXPECT_TRUE(jsonpatch_is_int64(INT64_MAX >> 1));
    EXPECT_TRUE(jsonpatch_is_int64(INT64_MIN));
    EXPECT_FALSE(jsonpatch_is_int64(1e28));      // out of range of int64
    EXPECT_FALSE(jsonpatch_is_int64(-1e28));     // out of range of int64
    EXPECT_TRUE(jsonpatch_is_int64(108.0));
    EXPECT_FALSE(jsonpatch_is_int64(108.9));
    EXPECT_TRUE(jsonpatch_is_int64(-108.0));
    EXPECT_FALSE(jsonpatch_is_int64(-108.0000001));
}
