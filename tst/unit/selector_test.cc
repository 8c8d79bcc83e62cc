#include <cstdlib>
#include <cstddef>
#include <cstring>
#include <cstdint>
#include <string>
#include <gtest/gtest.h>
#include "jsonpatch/dom.h"
#include "jsonpatch/selector.h"
#include "jsonpatch/jsonpatch.h"
#include "module_sim.h"

class SelectorTest : public ::testing::Test {
 protected:
    const char *json = "{"
                       "\"a\":{\"b\":[1,2,3]},"
                       "\"c\":[{\"d\":1},{\"d\":2}],"
                       "\"e\":\"x\","
                       "\"f.g\":5,"
                       "\"\":7"
                       "}";
    JDocument *doc;
    NodeList root;
    QueryOptions options;

    void SetUp() override {
        setupValkeyModulePointers();
        doc = parse(json);
        root.push_back(Node(doc, NodeKey::makeIndex(0)));
    }

    void TearDown() override {
        dom_free_doc(doc);
    }

    JDocument *parse(const char *input) {
        JDocument *d = nullptr;
        SyntaxDiagnostic diag;
        JsonPatchCode rc = dom_parse(input, strlen(input), false, nullptr, &d, diag);
        EXPECT_EQ(rc, JSONPATCH_SUCCESS);
        return d;
    }

    JValue &value() { return doc->GetJValue(); }

    // Select and expect success.
    const NodeList &select(Selector &selector, const std::string &query) {
        JsonPatchCode rc = selector.selectNodes(root, query, options);
        EXPECT_EQ(rc, JSONPATCH_SUCCESS) << query << ": " << selector.getErrorMessage();
        return selector.getResultSet();
    }

    JsonPatchCode selectError(Selector &selector, const std::string &query) {
        JsonPatchCode rc = selector.selectNodes(root, query, options);
        EXPECT_TRUE(selector.getResultSet().empty());
        return rc;
    }
};

TEST_F(SelectorTest, testRoot) {
    Selector selector;
    const NodeList &nodes = select(selector, "$");
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes[0].container, doc);
    EXPECT_EQ(nodes[0].key, NodeKey::makeIndex(0));
    EXPECT_EQ(&jsonpatch_node_value(nodes[0]), &value());
}

TEST_F(SelectorTest, testIndexReturnsContainerAndKey) {
    JDocument *arr = parse("[10,20,30]");
    NodeList start;
    start.push_back(Node(arr, NodeKey::makeIndex(0)));
    Selector selector;
    ASSERT_EQ(selector.selectNodes(start, "$[1]", options), JSONPATCH_SUCCESS);
    ASSERT_EQ(selector.getResultSet().size(), 1);
    EXPECT_EQ(selector.getResultSet()[0], Node(&arr->GetJValue(), NodeKey::makeIndex(1)));
    EXPECT_EQ(jsonpatch_node_value(selector.getResultSet()[0]).GetInt(), 20);
    dom_free_doc(arr);
}

TEST_F(SelectorTest, testProperty) {
    Selector selector;
    const NodeList &nodes = select(selector, "$.a.b");
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes[0].container, &value()["a"]);
    EXPECT_EQ(nodes[0].key, NodeKey::makeProperty("b"));
    EXPECT_EQ(jsonpatch_node_value(nodes[0]).Size(), 3);
}

TEST_F(SelectorTest, testQuotedKeys) {
    Selector selector;
    const NodeList &quoted = select(selector, "$['f.g']");
    ASSERT_EQ(quoted.size(), 1);
    EXPECT_EQ(quoted[0].key.name, "f.g");
    EXPECT_EQ(jsonpatch_node_value(quoted[0]).GetInt(), 5);

    const NodeList &escaped = select(selector, "$['f~.g']");
    ASSERT_EQ(escaped.size(), 1);
    EXPECT_EQ(escaped[0].key.name, "f.g");

    const NodeList &quote = select(selector, "$['it~'s']");
    ASSERT_EQ(quote.size(), 1);
    EXPECT_EQ(quote[0].key.name, "it's");

    const NodeList &spaces = select(selector, "$[' a ']");
    ASSERT_EQ(spaces.size(), 1);
    EXPECT_EQ(spaces[0].key.name, " a ");

    const NodeList &empty = select(selector, "$['']");
    ASSERT_EQ(empty.size(), 1);
    EXPECT_EQ(jsonpatch_node_value(empty[0]).GetInt(), 7);
}

TEST_F(SelectorTest, testIdentifierKeys) {
    const char *keys[] = {
        "A", "_", "\u16ee", "\u1885", "\u2118", "A0", "AA", "A_", "A\u0300", "A\u2118", "caf\u00e9", "\u00e9t\u00e9",
    };
    JDocument *obj = parse("{}");
    NodeList start;
    start.push_back(Node(obj, NodeKey::makeIndex(0)));
    for (const char *key : keys) {
        Selector selector;
        std::string query = std::string("$.") + key;
        ASSERT_EQ(selector.selectNodes(start, query, options), JSONPATCH_SUCCESS) << query;
        ASSERT_EQ(selector.getResultSet().size(), 1) << query;
        EXPECT_EQ(selector.getResultSet()[0], Node(&obj->GetJValue(), NodeKey::makeProperty(key))) << query;
    }
    dom_free_doc(obj);
}

TEST_F(SelectorTest, testInvalidIdentifierKeys) {
    const std::string keys[] = {
        std::string("\0", 1), " ", "!", "$", "0", "~", "'", "\xc2\xb2", "\xcc\x80", "\xcd\xba", "\xd2\x88",
        "\xff", "",
    };
    for (const std::string &key : keys) {
        Selector selector;
        SyntaxDiagnostic diag;
        std::string query = "$." + key;
        EXPECT_EQ(selectError(selector, query), JSONPATCH_EXPECTING_PROPERTY) << query;
        selector.makeDiagnostic("<query>", diag);
        EXPECT_EQ(diag.colno, 3) << query;
        EXPECT_EQ(diag.end_colno, 3) << query;
        EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Expecting property (<query>, line 1, column 3)");
    }
}

TEST_F(SelectorTest, testIdentifierKeysStopAtOtherCharacters) {
    const char *rest[] = {"\xc2\xb2", "\xcd\xba", "\xd2\x88", "-", " ", "~x"};
    for (const char *r : rest) {
        Selector selector;
        std::string query = std::string("$.A") + r;
        EXPECT_EQ(selectError(selector, query), JSONPATCH_EXPECTING_END_OF_QUERY) << query;
        SyntaxDiagnostic diag;
        selector.makeDiagnostic("<query>", diag);
        EXPECT_EQ(diag.colno, 4) << query;
    }

    Selector selector;
    EXPECT_EQ(selectError(selector, "$.f.1"), JSONPATCH_EXPECTING_PROPERTY);
    const NodeList &nodes = select(selector, "$.a.b");
    EXPECT_EQ(nodes.size(), 1);
}

TEST_F(SelectorTest, testNegativeIndex) {
    Selector selector;
    const NodeList &nodes = select(selector, "$.a.b[-1]");
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes[0].key.index, -1);
    EXPECT_EQ(jsonpatch_node_value(nodes[0]).GetInt(), 3);
}

TEST_F(SelectorTest, testIndexKeywords) {
    Selector selector;
    const NodeList &end = select(selector, "$.a.b[end]");
    ASSERT_EQ(end.size(), 1);
    EXPECT_EQ(end[0].key.index, INT64_MAX);
    EXPECT_FALSE(Selector::isPresent(end[0]));
    const NodeList &start = select(selector, "$.a.b[start]");
    ASSERT_EQ(start.size(), 1);
    EXPECT_EQ(start[0].key.index, INT64_MIN);
}

TEST_F(SelectorTest, testTerminalSlice) {
    Selector selector;
    EXPECT_EQ(selectError(selector, "$.a.b[1:]"), JSONPATCH_ARRAY_INDEX_IS_SLICE);

    options.allowSlice = true;
    const NodeList &nodes = select(selector, "$.a.b[1:]");
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes[0].key.type, NodeKey::SLICE);
    EXPECT_TRUE(nodes[0].key.slice.hasStart);
    EXPECT_FALSE(nodes[0].key.slice.hasStop);
    EXPECT_FALSE(nodes[0].key.slice.hasStep);
    EXPECT_EQ(nodes[0].key.slice.start, 1);
    EXPECT_TRUE(Selector::isPresent(nodes[0]));
}

TEST_F(SelectorTest, testSliceExpansion) {
    Selector selector;
    const NodeList &forward = select(selector, "$.c[:].d");
    ASSERT_EQ(forward.size(), 2);
    EXPECT_EQ(forward[0].container, &value()["c"][0]);
    EXPECT_EQ(forward[1].container, &value()["c"][1]);

    const NodeList &backward = select(selector, "$.c[::-1].d");
    ASSERT_EQ(backward.size(), 2);
    EXPECT_EQ(backward[0].container, &value()["c"][1]);
    EXPECT_EQ(backward[1].container, &value()["c"][0]);

    const NodeList &none = select(selector, "$.c[5:].d");
    EXPECT_TRUE(none.empty());

    EXPECT_EQ(selectError(selector, "$.c[::0].d"), JSONPATCH_SLICE_STEP_ZERO);
}

TEST_F(SelectorTest, testSliceIndices) {
    int64_t first, incr;
    size_t count;
    SliceSpec slice;
    ASSERT_EQ(slice.indices(5, first, incr, count), JSONPATCH_SUCCESS);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(incr, 1);
    EXPECT_EQ(count, 5);

    slice.hasStep = true;
    slice.step = -2;
    ASSERT_EQ(slice.indices(5, first, incr, count), JSONPATCH_SUCCESS);
    EXPECT_EQ(first, 4);
    EXPECT_EQ(incr, -2);
    EXPECT_EQ(count, 3);

    slice.hasStart = true;
    slice.start = -100;
    slice.step = 1;
    slice.hasStop = true;
    slice.stop = 100;
    ASSERT_EQ(slice.indices(5, first, incr, count), JSONPATCH_SUCCESS);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(count, 5);

    slice.step = 0;
    EXPECT_EQ(slice.indices(5, first, incr, count), JSONPATCH_SLICE_STEP_ZERO);
}

TEST_F(SelectorTest, testFilterStep) {
    Selector selector;
    const NodeList &nodes = select(selector, "$.c[@.d> 1]");
    ASSERT_EQ(nodes.size(), 1);
    EXPECT_EQ(nodes[0], Node(&value()["c"], NodeKey::makeIndex(1)));

    const NodeList &all = select(selector, "$.a[@]");
    ASSERT_EQ(all.size(), 1);
    EXPECT_EQ(all[0], Node(&value()["a"], NodeKey::makeProperty("b")));

    const NodeList &deeper = select(selector, "$.c[@['d'] == 1].d");
    ASSERT_EQ(deeper.size(), 1);
    EXPECT_EQ(deeper[0].container, &value()["c"][0]);
}

TEST_F(SelectorTest, testMissingKeys) {
    Selector selector;
    const NodeList &terminal = select(selector, "$.x");
    ASSERT_EQ(terminal.size(), 1);
    EXPECT_FALSE(Selector::isPresent(terminal[0]));

    EXPECT_EQ(selectError(selector, "$.x.y"), JSONPATCH_KEY_NOT_FOUND);
    EXPECT_EQ(selector.getErrorDetail(), "x");
    EXPECT_EQ(selector.getErrorMessage(), "NONEXISTENT Object key does not exist: x");
    EXPECT_EQ(selectError(selector, "$.a.b[5][0]"), JSONPATCH_INDEX_OUT_OF_ARRAY_BOUNDARIES);
}

TEST_F(SelectorTest, testOptionalMarker) {
    Selector selector;
    EXPECT_TRUE(select(selector, "$?.x.y").empty());
    EXPECT_TRUE(select(selector, "$?.x").empty());
    EXPECT_TRUE(select(selector, "$?.a.b[5]").empty());
    EXPECT_EQ(select(selector, "$?.a.b[0]").size(), 1);
}

TEST_F(SelectorTest, testKeyTypeErrors) {
    Selector selector;
    EXPECT_EQ(selectError(selector, "$.a.b.x"), JSONPATCH_ARRAY_INDEX_IS_STRING);
    EXPECT_EQ(selectError(selector, "$.a[0]"), JSONPATCH_OBJECT_KEY_IS_INDEX);
    EXPECT_EQ(selectError(selector, "$.e.x"), JSONPATCH_NOT_A_CONTAINER);
    EXPECT_EQ(selector.getErrorDetail(), "string");
    EXPECT_EQ(selectError(selector, "$.a.b[0].x"), JSONPATCH_NOT_A_CONTAINER);
    EXPECT_EQ(selector.getErrorDetail(), "number");

    options.allowSlice = true;
    EXPECT_EQ(selectError(selector, "$.a.b.x"), JSONPATCH_ARRAY_SLICE_INDEX_IS_STRING);
    EXPECT_EQ(selectError(selector, "$.a[0:1]"), JSONPATCH_OBJECT_KEY_IS_SLICE);
}

TEST_F(SelectorTest, testSyntaxErrorPositions) {
    Selector selector;
    SyntaxDiagnostic diag;

    EXPECT_EQ(selectError(selector, "$ $ $"), JSONPATCH_EXPECTING_END_OF_QUERY);
    selector.makeDiagnostic("<query>", diag);
    EXPECT_EQ(diag.colno, 2);
    EXPECT_EQ(diag.end_colno, 2);
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Expecting end of query (<query>, line 1, column 2)");

    EXPECT_EQ(selectError(selector, "$.a.b[0"), JSONPATCH_EXPECTING_CLOSING_BRACKET);
    selector.makeDiagnostic("<query>", diag);
    EXPECT_EQ(diag.colno, 8);

    EXPECT_EQ(selectError(selector, "$[99999999999999999999:]"), JSONPATCH_START_TOO_BIG);
    selector.makeDiagnostic("<query>", diag);
    EXPECT_EQ(diag.colno, 3);
    EXPECT_EQ(diag.end_colno, 23);

    EXPECT_EQ(selectError(selector, "$[0:99999999999999999999]"), JSONPATCH_STOP_TOO_BIG);
    EXPECT_EQ(selectError(selector, "$[::99999999999999999999]"), JSONPATCH_STEP_TOO_BIG);
    EXPECT_EQ(selectError(selector, "$[99999999999999999999]"), JSONPATCH_INDEX_TOO_BIG);

    EXPECT_EQ(selectError(selector, "a"), JSONPATCH_EXPECTING_ABSOLUTE_QUERY);
    selector.makeDiagnostic("<query>", diag);
    EXPECT_EQ(diag.colno, 1);

    EXPECT_EQ(selectError(selector, "$['a~x']"), JSONPATCH_INVALID_ESCAPE);
    selector.makeDiagnostic("<query>", diag);
    EXPECT_EQ(diag.colno, 5);
    EXPECT_EQ(diag.end_colno, 7);
    EXPECT_EQ(jsonpatch_format_diagnostic(diag), "SYNTAXERR Invalid escape (<query>, line 1, column 5-7)");

    EXPECT_EQ(selectError(selector, "$['a~"), JSONPATCH_TRUNCATED_ESCAPE);
    EXPECT_EQ(selectError(selector, "$['abc"), JSONPATCH_UNTERMINATED_STRING);
}

TEST_F(SelectorTest, testMappingMode) {
    Selector selector;
    SyntaxDiagnostic diag;
    options.mapping = true;

    EXPECT_EQ(selectError(selector, "$.a.b[0:1]"), JSONPATCH_SLICE_NOT_ALLOWED);
    selector.makeDiagnostic(nullptr, diag);
    EXPECT_EQ(diag.colno, 8);
    EXPECT_EQ(diag.end_colno, 9);

    EXPECT_EQ(selectError(selector, "$.c[@]"), JSONPATCH_FILTER_NOT_ALLOWED);
    selector.makeDiagnostic(nullptr, diag);
    EXPECT_EQ(diag.colno, 5);

    EXPECT_EQ(selectError(selector, "$?.a"), JSONPATCH_OPTIONAL_MARKER_NOT_ALLOWED);
    selector.makeDiagnostic(nullptr, diag);
    EXPECT_EQ(diag.colno, 2);
    EXPECT_EQ(diag.end_colno, 3);

    EXPECT_EQ(select(selector, "$.a.b[0]").size(), 1);
}

TEST_F(SelectorTest, testRelativeQuery) {
    Selector selector;
    options.relative = true;
    EXPECT_EQ(select(selector, "@.a").size(), 1);
    EXPECT_EQ(selectError(selector, "$.a"), JSONPATCH_EXPECTING_RELATIVE_QUERY);
}

TEST_F(SelectorTest, testNodesAliasTheDocument) {
    Selector selector;
    const NodeList &nodes = select(selector, "$.a.b[0]");
    ASSERT_EQ(nodes.size(), 1);
    jsonpatch_node_value(nodes[0]).SetInt(42);

    rapidjson::StringBuffer oss;
    dom_serialize(doc, false, oss);
    EXPECT_NE(std::string(oss.GetString()).find("\"b\":[42,2,3]"), std::string::npos);
}

TEST_F(SelectorTest, testFilteredNodesAliasTheDocument) {
    JDocument *arr = parse("[1,2,3,4,5,6]");
    NodeList start;
    start.push_back(Node(arr, NodeKey::makeIndex(0)));
    Selector selector;
    ASSERT_EQ(selector.selectNodes(start, "$[@ > 3]", options), JSONPATCH_SUCCESS);
    const NodeList &nodes = selector.getResultSet();
    ASSERT_EQ(nodes.size(), 3);
    for (size_t i = 0; i < nodes.size(); i++) {
        EXPECT_EQ(nodes[i], Node(&arr->GetJValue(), NodeKey::makeIndex(i + 3)));
        JValue &v = jsonpatch_node_value(nodes[i]);
        v.SetInt(v.GetInt() * 10);
    }

    rapidjson::StringBuffer oss;
    dom_serialize(arr, false, oss);
    EXPECT_STREQ(oss.GetString(), "[1,2,3,40,50,60]");
    dom_free_doc(arr);
}

TEST_F(SelectorTest, testQueryStringSizeLimit) {
    std::string query = "$" + std::string(jsonpatch_get_max_query_string_size(), 'a');
    Selector selector;
    EXPECT_EQ(selectError(selector, query.c_str()), JSONPATCH_QUERY_STRING_SIZE_LIMIT_EXCEEDED);
}
