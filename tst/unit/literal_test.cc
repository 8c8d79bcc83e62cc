#include <cstdlib>
#include <cstring>
#include <cmath>
#include <string>
#include <gtest/gtest.h>
#include "jsonpatch/dom.h"
#include "jsonpatch/literal.h"
#include "jsonpatch/selector.h"
#include "module_sim.h"

class LiteralTest : public ::testing::Test {
 protected:
    QueryOptions floatOptions;
    QueryOptions decimalOptions;
    size_t baseline;

    void SetUp() override {
        setupValkeyModulePointers();
        baseline = memory_usage();
        decimalOptions.useDecimal = true;
    }

    void TearDown() override {
        EXPECT_EQ(memory_usage(), baseline);
    }

    std::string load(const char *text, const QueryOptions &options) {
        QueryValue value;
        SyntaxDiagnostic diag;
        JsonPatchCode rc = jsonpatch_load_query_value(text, options, value, diag);
        EXPECT_EQ(rc, JSONPATCH_SUCCESS) << text << ": " << diag.message;
        rapidjson::StringBuffer oss;
        literal_serialize(value, oss);
        return oss.GetString();
    }

    JsonPatchCode loadError(const char *text, const QueryOptions &options, SyntaxDiagnostic &diag) {
        QueryValue value;
        JsonPatchCode rc = jsonpatch_load_query_value(text, options, value, diag);
        EXPECT_TRUE(value.getJValue().IsNull());
        EXPECT_FALSE(value.isDecimal());
        return rc;
    }

    bool compare(const JValue &lhs, const Operator op, const JValue &rhs) {
        bool result;
        jp::string kinds;
        EXPECT_EQ(literal_compare(lhs, op, rhs, result, kinds), JSONPATCH_SUCCESS);
        return result;
    }
};

TEST_F(LiteralTest, testLoadScalars) {
    EXPECT_EQ(load("'abc'", floatOptions), "\"abc\"");
    EXPECT_EQ(load("''", floatOptions), "\"\"");
    EXPECT_EQ(load("null", floatOptions), "null");
    EXPECT_EQ(load("true", floatOptions), "true");
    EXPECT_EQ(load("false", floatOptions), "false");
    EXPECT_EQ(load("12", floatOptions), "12");
    EXPECT_EQ(load("-12", floatOptions), "-12");
    EXPECT_EQ(load("0", floatOptions), "0");
    EXPECT_EQ(load("1.5e3", floatOptions), "1500.0");
    EXPECT_EQ(load("0.25", floatOptions), "0.25");
}

TEST_F(LiteralTest, testLoadEscapes) {
    EXPECT_EQ(load("'a~'b'", floatOptions), "\"a'b\"");
    EXPECT_EQ(load("'~~~!~&~.~<~=~>~[~]'", floatOptions), "\"~!&.<=>[]\"");
}

TEST_F(LiteralTest, testLoadIntegerKinds) {
    QueryValue value;
    SyntaxDiagnostic diag;
    ASSERT_EQ(jsonpatch_load_query_value("9223372036854775807", floatOptions, value, diag), JSONPATCH_SUCCESS);
    EXPECT_TRUE(value.getJValue().IsInt64());
    ASSERT_EQ(jsonpatch_load_query_value("18446744073709551615", floatOptions, value, diag), JSONPATCH_SUCCESS);
    EXPECT_FALSE(value.getJValue().IsInt64());
    EXPECT_TRUE(value.getJValue().IsUint64());
    EXPECT_EQ(value.getJValue().GetUint64(), UINT64_MAX);
}

TEST_F(LiteralTest, testBigIntegerFallsBackToFloat) {
    QueryValue value;
    SyntaxDiagnostic diag;
    ASSERT_EQ(jsonpatch_load_query_value("99999999999999999999", floatOptions, value, diag), JSONPATCH_SUCCESS);
    EXPECT_TRUE(value.getJValue().IsDouble());
    EXPECT_EQ(value.getJValue().GetDouble(), 1e20);
}

TEST_F(LiteralTest, testBigIntegerDecimal) {
    EXPECT_EQ(load("99999999999999999999", decimalOptions), "99999999999999999999");
    EXPECT_EQ(load("-99999999999999999999", decimalOptions), "-99999999999999999999");
    EXPECT_EQ(load("12", decimalOptions), "12");
}

TEST_F(LiteralTest, testBigNumberRequiresDecimal) {
    SyntaxDiagnostic diag;
    EXPECT_EQ(loadError("1e400", floatOptions, diag), JSONPATCH_BIG_NUMBER_REQUIRES_DECIMAL);
    EXPECT_EQ(diag.colno, 1);
    EXPECT_EQ(diag.end_colno, 6);
    EXPECT_EQ(loadError("-1e400", floatOptions, diag), JSONPATCH_BIG_NUMBER_REQUIRES_DECIMAL);
    EXPECT_EQ(load("1e400", decimalOptions), "1E+400");
}

TEST_F(LiteralTest, testDecimalTooBig) {
    SyntaxDiagnostic diag;
    EXPECT_EQ(loadError("1e99999999999999999999", decimalOptions, diag), JSONPATCH_NUMBER_TOO_BIG);
    EXPECT_EQ(diag.colno, 1);
    EXPECT_EQ(diag.end_colno, 23);
}

TEST_F(LiteralTest, testInfinity) {
    SyntaxDiagnostic diag;
    EXPECT_EQ(loadError("Infinity", floatOptions, diag), JSONPATCH_INFINITY_NOT_ALLOWED);
    EXPECT_EQ(diag.colno, 1);
    EXPECT_EQ(diag.end_colno, 9);
    EXPECT_EQ(loadError("-Infinity", floatOptions, diag), JSONPATCH_NEGATIVE_INFINITY_NOT_ALLOWED);
    EXPECT_EQ(diag.end_colno, 10);

    QueryOptions options;
    options.allowNanAndInfinity = true;
    EXPECT_EQ(load("Infinity", options), "Infinity");
    EXPECT_EQ(load("-Infinity", options), "-Infinity");
    options.useDecimal = true;
    EXPECT_EQ(load("Infinity", options), "Infinity");
    EXPECT_EQ(load("-Infinity", options), "-Infinity");
}

TEST_F(LiteralTest, testLoadErrors) {
    SyntaxDiagnostic diag;
    EXPECT_EQ(loadError("", floatOptions, diag), JSONPATCH_EXPECTING_VALUE);
    EXPECT_EQ(diag.colno, 1);
    EXPECT_EQ(loadError("12 ", floatOptions, diag), JSONPATCH_EXPECTING_END_OF_QUERY);
    EXPECT_EQ(diag.colno, 3);
    EXPECT_EQ(loadError("01", floatOptions, diag), JSONPATCH_EXPECTING_END_OF_QUERY);
    EXPECT_EQ(diag.colno, 2);
    EXPECT_EQ(loadError("abc", floatOptions, diag), JSONPATCH_EXPECTING_VALUE);
    EXPECT_EQ(loadError("'abc", floatOptions, diag), JSONPATCH_UNTERMINATED_STRING);
    EXPECT_EQ(diag.colno, 1);
    EXPECT_EQ(diag.end_colno, 5);
    EXPECT_EQ(loadError("'a~x'", floatOptions, diag), JSONPATCH_INVALID_ESCAPE);
    EXPECT_EQ(diag.colno, 3);
    EXPECT_EQ(diag.end_colno, 5);
    EXPECT_EQ(loadError("'a~", floatOptions, diag), JSONPATCH_TRUNCATED_ESCAPE);
    EXPECT_EQ(loadError("1.", floatOptions, diag), JSONPATCH_EXPECTING_END_OF_QUERY);
    EXPECT_EQ(diag.colno, 2);
}

TEST_F(LiteralTest, testOperatorLaws) {
    JValue zero(0);
    JValue one(1);
    const Operator ops[] = {OP_LT, OP_LE, OP_EQ, OP_NE, OP_GE, OP_GT};
    for (Operator op : ops) {
        // a op b  <=>  b mirror(op) a
        bool forward = compare(zero, op, one);
        Operator mirror = op;
        if (op == OP_LT) mirror = OP_GT;
        if (op == OP_LE) mirror = OP_GE;
        if (op == OP_GE) mirror = OP_LE;
        if (op == OP_GT) mirror = OP_LT;
        EXPECT_EQ(forward, compare(one, mirror, zero)) << literal_operator_name(op);
    }
    EXPECT_TRUE(compare(zero, OP_LE, zero));
    EXPECT_TRUE(compare(zero, OP_GE, zero));
    EXPECT_FALSE(compare(zero, OP_LT, zero));
    EXPECT_NE(compare(zero, OP_EQ, one), compare(zero, OP_NE, one));
}

TEST_F(LiteralTest, testExactNumberComparison) {
    JValue big(static_cast<int64_t>(9007199254740993LL));
    JValue rounded(9007199254740992.0);
    EXPECT_TRUE(compare(big, OP_GT, rounded));
    EXPECT_TRUE(compare(big, OP_NE, rounded));
    EXPECT_TRUE(compare(rounded, OP_LT, big));

    JValue umax(static_cast<uint64_t>(UINT64_MAX));
    JValue minus(static_cast<int64_t>(-1));
    EXPECT_TRUE(compare(minus, OP_LT, umax));
    EXPECT_TRUE(compare(umax, OP_GT, minus));

    JValue one(1);
    JValue onef(1.0);
    JValue half(1.5);
    EXPECT_TRUE(compare(one, OP_EQ, onef));
    EXPECT_TRUE(compare(one, OP_LT, half));
    EXPECT_TRUE(compare(half, OP_GT, one));
}

TEST_F(LiteralTest, testNanIsUnordered) {
    JValue nan(std::nan(""));
    JValue zero(0);
    EXPECT_FALSE(compare(nan, OP_LT, zero));
    EXPECT_FALSE(compare(nan, OP_GE, zero));
    EXPECT_FALSE(compare(nan, OP_EQ, nan));
    EXPECT_TRUE(compare(nan, OP_NE, zero));
}

TEST_F(LiteralTest, testStringAndBoolOrdering) {
    JValue a("a");
    JValue b("b");
    JValue ab("ab");
    EXPECT_TRUE(compare(a, OP_LT, b));
    EXPECT_TRUE(compare(a, OP_LT, ab));
    EXPECT_TRUE(compare(ab, OP_LT, b));
    JValue f(false);
    JValue t(true);
    EXPECT_TRUE(compare(f, OP_LT, t));
    EXPECT_TRUE(compare(t, OP_GE, t));
}

TEST_F(LiteralTest, testNotOrderable) {
    JValue zero(0);
    JValue s("0");
    JValue nul;
    JValue t(true);
    bool result;
    jp::string kinds;
    EXPECT_EQ(literal_compare(zero, OP_LT, s, result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "number and string");
    EXPECT_EQ(literal_compare(nul, OP_GE, nul, result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "null and null");
    EXPECT_EQ(literal_compare(t, OP_GT, s, result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "bool and string");

    // equality is total
    EXPECT_FALSE(compare(zero, OP_EQ, s));
    EXPECT_TRUE(compare(zero, OP_NE, s));
    EXPECT_FALSE(compare(t, OP_EQ, zero));
    EXPECT_FALSE(compare(t, OP_EQ, s));
}

TEST_F(LiteralTest, testBooleansCompareAsNumbers) {
    JValue f(false);
    JValue t(true);
    JValue zero(0);
    JValue one(1);
    JValue onef(1.0);
    JValue half(0.5);
    EXPECT_TRUE(compare(t, OP_EQ, one));
    EXPECT_TRUE(compare(t, OP_EQ, onef));
    EXPECT_TRUE(compare(zero, OP_EQ, f));
    EXPECT_TRUE(compare(t, OP_GT, zero));
    EXPECT_TRUE(compare(f, OP_LT, half));
    EXPECT_TRUE(compare(half, OP_LT, t));
    EXPECT_FALSE(compare(t, OP_NE, one));
    EXPECT_TRUE(literal_values_equal(t, one));

    QueryValue value;
    SyntaxDiagnostic diag;
    ASSERT_EQ(jsonpatch_load_query_value("0.5", decimalOptions, value, diag), JSONPATCH_SUCCESS);
    ASSERT_TRUE(value.isDecimal());
    bool result;
    jp::string kinds;
    ASSERT_EQ(literal_compare(t, OP_GT, value, result, kinds), JSONPATCH_SUCCESS);
    EXPECT_TRUE(result);
    ASSERT_EQ(literal_compare(f, OP_EQ, value, result, kinds), JSONPATCH_SUCCESS);
    EXPECT_FALSE(result);
}

TEST_F(LiteralTest, testArrayOrdering) {
    const char *texts[] = {"[1,2]", "[1,3]", "[1,2,0]", "[]", "[true,\"a\"]", "[1,\"b\"]", "[\"x\"]"};
    JParser p[7];
    SyntaxDiagnostic diag;
    for (int i = 0; i < 7; i++) {
        ASSERT_EQ(dom_parse_value(texts[i], strlen(texts[i]), false, nullptr, p[i], diag), JSONPATCH_SUCCESS);
    }
    const JValue &a12 = p[0].GetJValue();
    const JValue &a13 = p[1].GetJValue();
    const JValue &a120 = p[2].GetJValue();
    const JValue &empty = p[3].GetJValue();
    EXPECT_TRUE(compare(a12, OP_LT, a13));
    EXPECT_TRUE(compare(a13, OP_GT, a120));
    EXPECT_TRUE(compare(a12, OP_LT, a120));
    EXPECT_TRUE(compare(empty, OP_LT, a12));
    EXPECT_TRUE(compare(a12, OP_LE, a12));
    EXPECT_FALSE(compare(a12, OP_GT, a12));

    // the first unequal pair decides, booleans count as numbers
    EXPECT_TRUE(compare(p[4].GetJValue(), OP_LT, p[5].GetJValue()));

    bool result;
    jp::string kinds;
    EXPECT_EQ(literal_compare(a12, OP_LT, p[6].GetJValue(), result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "number and string");
    JValue one(1);
    EXPECT_EQ(literal_compare(a12, OP_LT, one, result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "array and number");
}

TEST_F(LiteralTest, testDeepEquality) {
    JParser p1;
    JParser p2;
    JParser p3;
    SyntaxDiagnostic diag;
    const char *a = "{\"x\":[1,{\"y\":2}],\"z\":null}";
    const char *b = "{\"z\":null,\"x\":[1.0,{\"y\":2}]}";
    const char *c = "{\"x\":[{\"y\":2},1],\"z\":null}";
    ASSERT_EQ(dom_parse_value(a, strlen(a), false, nullptr, p1, diag), JSONPATCH_SUCCESS);
    ASSERT_EQ(dom_parse_value(b, strlen(b), false, nullptr, p2, diag), JSONPATCH_SUCCESS);
    ASSERT_EQ(dom_parse_value(c, strlen(c), false, nullptr, p3, diag), JSONPATCH_SUCCESS);
    EXPECT_TRUE(literal_values_equal(p1.GetJValue(), p2.GetJValue()));
    EXPECT_FALSE(literal_values_equal(p1.GetJValue(), p3.GetJValue()));
    bool result;
    jp::string kinds;
    EXPECT_EQ(literal_compare(p1.GetJValue(), OP_LT, p2.GetJValue(), result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "object and object");
}

TEST_F(LiteralTest, testDecimalComparison) {
    QueryValue value;
    SyntaxDiagnostic diag;
    ASSERT_EQ(jsonpatch_load_query_value("99999999999999999999", decimalOptions, value, diag), JSONPATCH_SUCCESS);
    ASSERT_TRUE(value.isDecimal());
    EXPECT_STREQ(value.kindName(), "number");

    JValue umax(static_cast<uint64_t>(UINT64_MAX));
    JValue d(1e20);
    JValue s("x");
    bool result;
    jp::string kinds;
    ASSERT_EQ(literal_compare(umax, OP_LT, value, result, kinds), JSONPATCH_SUCCESS);
    EXPECT_TRUE(result);
    ASSERT_EQ(literal_compare(d, OP_GT, value, result, kinds), JSONPATCH_SUCCESS);
    EXPECT_TRUE(result);
    ASSERT_EQ(literal_compare(s, OP_EQ, value, result, kinds), JSONPATCH_SUCCESS);
    EXPECT_FALSE(result);
    EXPECT_EQ(literal_compare(s, OP_LT, value, result, kinds), JSONPATCH_NOT_ORDERABLE);
    EXPECT_EQ(kinds, "string and number");

    ASSERT_EQ(jsonpatch_load_query_value("0.1", decimalOptions, value, diag), JSONPATCH_SUCCESS);
    JValue tenth(0.1);
    ASSERT_EQ(literal_compare(tenth, OP_EQ, value, result, kinds), JSONPATCH_SUCCESS);
    EXPECT_TRUE(result);
}
