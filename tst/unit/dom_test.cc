#include <cstdlib>
#include <cstddef>
#include <cstring>
#include <string>
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "jsonpatch/dom.h"
#include "jsonpatch/alloc.h"
#include "module_sim.h"

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

class DomTest : public ::testing::Test {
 protected:
    const char *json1 = "{"
                            "\"firstName\":\"John\","
                            "\"lastName\":\"Smith\","
                            "\"age\":27,"
                            "\"weight\":135.17,"
                            "\"isAlive\":true,"
                            "\"address\":{"
                                "\"street\":\"21 2nd Street\","
                                "\"city\":\"New York\""
                            "},"
                            "\"phoneNumbers\":["
                                "{\"type\":\"home\",\"number\":\"212 555-1234\"},"
                                "{\"type\":\"office\",\"number\":\"646 555-4567\"}"
                            "],"
                            "\"children\":[],"
                            "\"spouse\":null,"
                            "\"groups\":{}"
                        "}";
    JDocument *doc1;
    size_t baseline;

    void SetUp() override {
        setupValkeyModulePointers();
        baseline = memory_usage();
        SyntaxDiagnostic diag;
        JsonPatchCode rc = dom_parse(json1, strlen(json1), false, nullptr, &doc1, diag);
        ASSERT_EQ(rc, JSONPATCH_SUCCESS);
    }

    void TearDown() override {
        dom_free_doc(doc1);
        EXPECT_EQ(memory_usage(), baseline);
    }

    void roundTrip(const char *input) {
        JDocument *doc;
        SyntaxDiagnostic diag;
        JsonPatchCode rc = dom_parse(input, strlen(input), false, nullptr, &doc, diag);
        ASSERT_EQ(rc, JSONPATCH_SUCCESS);
        rapidjson::StringBuffer oss;
        dom_serialize(doc, false, oss);
        EXPECT_STREQ(oss.GetString(), input);
        dom_free_doc(doc);
    }
};

TEST_F(DomTest, testSerialize_DefaultFormat) {
    rapidjson::StringBuffer oss;
    dom_serialize(doc1, false, oss);
    EXPECT_STREQ(oss.GetString(), json1);
}

TEST_F(DomTest, testParseScalarsAndContainers) {
    roundTrip("[1,2,3]");
    roundTrip("\"abc\"");
    roundTrip("123");
    roundTrip("-1.5");
    roundTrip("false");
    roundTrip("null");
    roundTrip("{\"a\":{\"b\":[{}]}}");
    roundTrip("18446744073709551615");
}

TEST_F(DomTest, testRootWrapper) {
    EXPECT_TRUE(doc1->IsArray());
    EXPECT_EQ(doc1->Size(), 1);
    EXPECT_TRUE(doc1->GetJValue().IsObject());
    EXPECT_EQ(&(*doc1)[0], &doc1->GetJValue());
}

TEST_F(DomTest, testParseInvalidJSON) {
    const char *input = "{\"a\"}";
    JDocument *doc;
    SyntaxDiagnostic diag;
    JsonPatchCode rc = dom_parse(input, strlen(input), false, "<document>", &doc, diag);
    EXPECT_EQ(rc, JSONPATCH_JSON_PARSE_ERROR);
    EXPECT_TRUE(doc == nullptr);
    EXPECT_EQ(diag.lineno, 1);
    EXPECT_EQ(diag.colno, 5);
    EXPECT_EQ(diag.colno, diag.end_colno);
    EXPECT_EQ(diag.filename, "<document>");
    EXPECT_THAT(std::string(diag.message.c_str()),
                StartsWith("SYNTAXERR Failed to parse JSON string due to syntax error: "));
}

TEST_F(DomTest, testParseInvalidJSONSecondLine) {
    const char *input = "[1,\n 2,]";
    JDocument *doc;
    SyntaxDiagnostic diag;
    JsonPatchCode rc = dom_parse(input, strlen(input), false, nullptr, &doc, diag);
    EXPECT_EQ(rc, JSONPATCH_JSON_PARSE_ERROR);
    EXPECT_EQ(diag.lineno, 2);
}

TEST_F(DomTest, testNanAndInfinity) {
    const char *input = "[NaN,Infinity,-Infinity]";
    JDocument *doc;
    SyntaxDiagnostic diag;
    EXPECT_EQ(dom_parse(input, strlen(input), false, nullptr, &doc, diag), JSONPATCH_JSON_PARSE_ERROR);

    JsonPatchCode rc = dom_parse(input, strlen(input), true, nullptr, &doc, diag);
    ASSERT_EQ(rc, JSONPATCH_SUCCESS);
    rapidjson::StringBuffer oss;
    dom_serialize(doc, true, oss);
    EXPECT_STREQ(oss.GetString(), input);
    dom_free_doc(doc);
}

TEST_F(DomTest, testParseValue) {
    const char *input = "{\"op\":\"del\",\"path\":\"$[0]\"}";
    JParser parser;
    SyntaxDiagnostic diag;
    JsonPatchCode rc = dom_parse_value(input, strlen(input), false, "<patch>", parser, diag);
    ASSERT_EQ(rc, JSONPATCH_SUCCESS);
    EXPECT_TRUE(parser.GetJValue().IsObject());
    EXPECT_STREQ(parser.GetJValue()["op"].GetString(), "del");
}

TEST_F(DomTest, testKindName) {
    JValue &v = doc1->GetJValue();
    EXPECT_STREQ(dom_kind_name(v), "object");
    EXPECT_STREQ(dom_kind_name(v["firstName"]), "string");
    EXPECT_STREQ(dom_kind_name(v["age"]), "number");
    EXPECT_STREQ(dom_kind_name(v["weight"]), "number");
    EXPECT_STREQ(dom_kind_name(v["isAlive"]), "bool");
    EXPECT_STREQ(dom_kind_name(v["spouse"]), "null");
    EXPECT_STREQ(dom_kind_name(v["children"]), "array");
}

TEST_F(DomTest, testDumpRedacted) {
    test_getLogText();
    dom_dump_redacted(doc1->GetJValue()["phoneNumbers"], nullptr, "warning");
    std::string log = test_getLogText();
    EXPECT_THAT(log, HasSubstr("Array with 2 Members"));
    EXPECT_THAT(log, HasSubstr("Object with 2 Members"));
    EXPECT_THAT(log, HasSubstr("String of length 4"));
    EXPECT_THAT(log, Not(HasSubstr("home")));
}
