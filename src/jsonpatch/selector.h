#ifndef VALKEYJSONPATCH_SELECTOR_H_
#define VALKEYJSONPATCH_SELECTOR_H_

#include "jsonpatch/dom.h"
#include "jsonpatch/literal.h"
#include "jsonpatch/rapidjson_includes.h"
#include <string_view>

/**
 * Slice bounds. Every component is optional, a missing bound defaults to the array end that matches the step
 * direction.
 */
struct SliceSpec {
    SliceSpec()
            : hasStart(false)
            , hasStop(false)
            , hasStep(false)
            , start(0)
            , stop(0)
            , step(1)
    {}
    bool hasStart;
    bool hasStop;
    bool hasStep;
    int64_t start;
    int64_t stop;
    int64_t step;

    /**
     * Resolve the slice against an array of the given size. Negative bounds count from the end, out of range
     * bounds are clamped.
     * @return JSONPATCH_SLICE_STEP_ZERO if the step is zero
     */
    JsonPatchCode indices(const size_t size, int64_t &first, int64_t &incr, size_t &count) const;
};

/**
 * The key half of a node: a property name, an array index or a slice. The "start" and "end" index keywords
 * are stored as INT64_MIN and INT64_MAX.
 */
struct NodeKey {
    enum KeyType {
        PROPERTY = 0,
        INDEX,
        SLICE
    };

    NodeKey()
            : type(INDEX)
            , name()
            , index(0)
            , slice()
    {}
    static NodeKey makeProperty(const std::string_view &name);
    static NodeKey makeIndex(const int64_t index);
    static NodeKey makeSlice(const SliceSpec &slice);
    bool operator==(const NodeKey &other) const;

    KeyType type;
    jp::string name;
    int64_t index;
    SliceSpec slice;
};

/**
 * An addressable location: a container inside a document plus a key into it. A node does not own anything,
 * writing through it changes the document.
 */
struct Node {
    Node() : container(nullptr), key() {}
    Node(JValue *c, const NodeKey &k) : container(c), key(k) {}
    bool operator==(const Node &other) const {
        return container == other.container && key == other.key;
    }
    bool operator!=(const Node &other) const { return !(*this == other); }

    JValue *container;
    NodeKey key;
};

typedef jp::vector<Node> NodeList;

/**
 * Query modes.
 *   allowSlice - final nodes may carry slice keys.
 *   mapping    - single-result mode, no slices, no filters and no optional marker. One output node per input node.
 *   relative   - the entry symbol is "@" instead of "$".
 */
struct QueryOptions {
    QueryOptions()
            : allowSlice(false)
            , mapping(false)
            , relative(false)
            , allowNanAndInfinity(false)
            , useDecimal(false)
    {}
    // Options with the literal settings taken from the module configs.
    static QueryOptions fromConfig();

    bool allowSlice;
    bool mapping;
    bool relative;
    bool allowNanAndInfinity;
    bool useDecimal;
};

/**
 * Character-level scanner over a query string. All positions are byte offsets into the query. When a scan
 * fails, errStart and errEnd hold the span of the offending text.
 */
class Lexer {
 public:
    Lexer()
            : query()
            , pos(0)
            , errStart(0)
            , errEnd(0)
    {}
    void init(const std::string_view &q) {
        query = q;
        pos = 0;
        errStart = errEnd = 0;
    }
    bool atEnd() const { return pos >= query.length(); }
    char peek() const { return atEnd() ? '\0' : query[pos]; }
    bool match(const char c);
    bool matchString(const char *s);
    void skipSpaces();
    size_t peekCodePoint(unsigned &cp) const;
    JsonPatchCode scanKey(jp::string &name);
    JsonPatchCode scanQuotedString(jp::string &str);
    size_t indexTokenLength(const bool allow_keywords) const;
    JsonPatchCode scanIndex(const size_t len, const JsonPatchCode too_big, int64_t &val);
    Operator scanOperator();
    JsonPatchCode scanLiteral(const QueryOptions &options, QueryValue &value);

    std::string_view query;
    size_t pos;       // current position in query
    size_t errStart;  // span of the last scan error
    size_t errEnd;

 private:
    Lexer(const Lexer &t);  // disable copy constructor
    Lexer& operator=(const Lexer &rhs);  // disable assignment constructor
    JsonPatchCode fail(const JsonPatchCode code, const size_t start, const size_t end) {
        errStart = start;
        errEnd = end;
        return code;
    }
    size_t numberTokenLength(bool &is_integer) const;
};

/**
 * A query parser and evaluator. It is named Selector because evaluation means selecting the list of nodes
 * that match the query. Parsing and evaluation happen in a single pass: each step is applied to the current
 * node list as soon as it is parsed, so a query is re-parsed every time it is run.
 *
 * 1. Select:
 *    Selector selector;
 *    JsonPatchCode rc = selector.selectNodes(nodes, "$.a[@ > 1]", options);
 *
 *    The outcome is selector.getResultSet(), the nodes reached from the given ones.
 *
 * 2. Filter:
 *    Selector selector;
 *    JsonPatchCode rc = selector.filterNodes(nodes, "@.b == 'x' && !@.c", options);
 *
 *    The outcome is the subset of the given nodes that satisfies the filter, in the original order.
 *
 * On failure, getError() returns the code, getErrorDetail() the optional detail and makeDiagnostic() the
 * position of the error within the query.
 */
class Selector {
 public:
    Selector()
            : lex()
            , options()
            , stepStart(0)
            , resultSet()
            , error(JSONPATCH_SUCCESS)
            , errorDetail()
            , errStart(0)
            , errEnd(0)
    {}

    /**
     * Entry point for select queries. The query must be consumed entirely.
     */
    JsonPatchCode selectNodes(const NodeList &nodes, const std::string_view &query, const QueryOptions &opts);

    /**
     * Entry point for filter queries. The query is a filter expression run over the given nodes and must be
     * consumed entirely.
     */
    JsonPatchCode filterNodes(const NodeList &nodes, const std::string_view &query, const QueryOptions &opts);

    const NodeList& getResultSet() const { return resultSet; }
    NodeList& getResultSet() { return resultSet; }
    JsonPatchCode getError() const { return error; }
    const jp::string& getErrorDetail() const { return errorDetail; }
    jp::string getErrorMessage() const { return jsonpatch_error_message(error, errorDetail); }
    void makeDiagnostic(const char *filename, SyntaxDiagnostic &diag) const;

    /* Does the node's key exist in its container? Slices always exist. */
    static bool isPresent(const Node &node);

 private:
    Selector(const Selector&);             // disable copy constructor
    Selector& operator=(const Selector&);  // disable assignment operator

    void init(const std::string_view &query, const QueryOptions &opts);
    JsonPatchCode parseQuery(NodeList &nodes, const bool relative, const bool mapping, const bool allow_slice);
    JsonPatchCode parseSteps(NodeList &nodes, const bool optional, const bool mapping, const bool allow_slice);
    JsonPatchCode parseDotStep(NodeList &nodes, const bool optional);
    JsonPatchCode parseBracketStep(NodeList &nodes, const bool optional, const bool mapping);
    JsonPatchCode parseIndexOrSlice(const bool mapping, NodeKey &key);
    JsonPatchCode parseFilterExpr(NodeList &candidates);
    JsonPatchCode parseComparison(const NodeList &nodes, const NodeList &lhs, const jp::vector<size_t> &pairs,
                                  const Operator op, const size_t op_start, NodeList &survivors);
    JsonPatchCode expandKeys(const NodeList &nodes, const bool optional, const NodeKey *key, NodeList &result);
    JsonPatchCode getTargets(const Node &node, const bool optional, jp::vector<JValue*> &targets);
    JsonPatchCode checkKey(const Node &node, const bool allow_slice);
    JsonPatchCode setError(const JsonPatchCode code, const size_t start, const size_t end,
                           const std::string_view &detail = std::string_view());
    JsonPatchCode lexError(const JsonPatchCode code) { return setError(code, lex.errStart, lex.errEnd); }

    Lexer lex;
    QueryOptions options;
    size_t stepStart;  // position of the step being evaluated, used to place evaluation errors
    NodeList resultSet;
    JsonPatchCode error;  // JSONPATCH_SUCCESS indicates no error
    jp::string errorDetail;
    size_t errStart;
    size_t errEnd;
};

/**
 * Parse a standalone query value, e.g. "'abc'", "12", "1.5e3", "true". The whole text must be a single literal.
 * @param value - OUTPUT param
 * @param diag - OUTPUT param, filled on syntax errors
 */
JsonPatchCode jsonpatch_load_query_value(const std::string_view &text, const QueryOptions &options,
                                         QueryValue &value, SyntaxDiagnostic &diag);

/* Dereference a present node. The key must be a property or an index that exists. */
JValue& jsonpatch_node_value(const Node &node);

#endif  // VALKEYJSONPATCH_SELECTOR_H_
