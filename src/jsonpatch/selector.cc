#include "jsonpatch/selector.h"
#include "jsonpatch/util.h"
#include "jsonpatch/jsonpatch.h"
#include "jsonpatch/identifier.h"
#include "jsonpatch/rapidjson_includes.h"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <algorithm>

#ifdef INSTRUMENT_QUERY
#define TRACE(level, msg) \
std::cout << level << " " << msg << std::endl;
#else
#define TRACE(level, msg)
#endif

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

static const char *STRING_ESCAPE_CHARS = "'~!&.<=>[]";

thread_local int64_t current_depth = 0;  // parser's recursion depth

class RecursionDepthTracker {
 public:
    RecursionDepthTracker() {
        current_depth++;
    }
    ~RecursionDepthTracker() {
        current_depth--;
    }
    bool isTooDeep() { return current_depth > static_cast<int64_t>(jsonpatch_get_max_parser_recursion_depth()); }
};

#define CHECK_RECURSION_DEPTH() \
    RecursionDepthTracker _rdtracker; \
    if (_rdtracker.isTooDeep()) \
        return setError(JSONPATCH_PARSER_RECURSION_DEPTH_LIMIT_EXCEEDED, lex.pos, lex.pos);

#define CHECK_QUERY_STRING_SIZE(query) \
    if ((query).length() > jsonpatch_get_max_query_string_size()) \
        return setError(JSONPATCH_QUERY_STRING_SIZE_LIMIT_EXCEEDED, 0, 0);

/**
 * EBNF Grammar of the query language:
 *   Query               ::= Entry ["?"] {Step}
 *   Entry               ::= "$" | "@"
 *   Step                ::= "." Key | "[" Bracket "]"
 *   Bracket             ::= QuotedString | Slice | Index | FilterExpr
 *   Slice               ::= [Index] ":" [Index] [":" [Integer]]
 *   Index               ::= "start" | "end" | Integer
 *   Integer             ::= ["-"] ("0" | nonzero-digit {digit})
 *   Key                 ::= IdentifierStart {IdentifierContinue}
 *   FilterExpr          ::= ["!"] RelativeQuery [{SPACE} ComparisonOp {SPACE} ComparisonValue]
 *                           [{SPACE} "&&" {SPACE} FilterExpr]
 *   RelativeQuery       ::= "@" {Step}
 *   ComparisonOp        ::= "<" | "<=" | "==" | "!=" | ">=" | ">"
 *   ComparisonValue     ::= Literal | RelativeQuery
 *   Literal             ::= QuotedString | "null" | "true" | "false" | Number | "Infinity" | "-Infinity"
 *   QuotedString        ::= "'" {char | "~" StringEscape} "'"
 *   StringEscape        ::= "'" | "!" | "&" | "." | "<" | "=" | ">" | "[" | "]" | "~"
 *   Number              ::= Integer ["." digit {digit}] [("e" | "E") ["+" | "-"] digit {digit}]
 *   SPACE               ::= ' ' | '\t' | '\n' | '\r'
 *
 * IdentifierStart is an ASCII letter, "_" or an XID_Start code point. IdentifierContinue adds ASCII digits
 * and XID_Continue code points. Any other key is written as a quoted string.
 */

STATIC bool is_digit(const char c) {
    return c >= '0' && c <= '9';
}

STATIC bool is_space(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool Lexer::match(const char c) {
    if (peek() != c) return false;
    pos++;
    return true;
}

bool Lexer::matchString(const char *s) {
    size_t len = strlen(s);
    if (query.substr(pos, len) != std::string_view(s, len)) return false;
    pos += len;
    return true;
}

/**
 * Skip whitespaces.
 */
void Lexer::skipSpaces() {
    while (!atEnd() && is_space(query[pos])) pos++;
}

/**
 * Decode the UTF-8 code point at the current position without consuming it.
 * @return its length in bytes, 0 at the end of the query or on malformed UTF-8.
 */
size_t Lexer::peekCodePoint(unsigned &cp) const {
    if (atEnd()) return 0;
    rapidjson::MemoryStream is(query.data() + pos, query.length() - pos);
    if (!rapidjson::UTF8<>::Decode(is, &cp)) return 0;
    return is.Tell();
}

/**
 * Scan the property name of a dot step.
 */
JsonPatchCode Lexer::scanKey(jp::string &name) {
    size_t start = pos;
    unsigned cp;
    size_t len = peekCodePoint(cp);
    if (len == 0 || !jsonpatch_is_identifier_start(cp)) return fail(JSONPATCH_EXPECTING_PROPERTY, start, start);
    pos += len;
    while ((len = peekCodePoint(cp)) > 0 && jsonpatch_is_identifier_continue(cp)) pos += len;
    name.assign(query.data() + start, pos - start);
    TRACE("DEBUG", "scanKey name: " << name << ", pos: " << pos)
    return JSONPATCH_SUCCESS;
}

/**
 * Scan a single quoted string. The current character must be the opening quote.
 */
JsonPatchCode Lexer::scanQuotedString(jp::string &str) {
    ValkeyModule_Assert(peek() == '\'');
    size_t start = pos++;
    str.clear();
    while (true) {
        if (atEnd()) return fail(JSONPATCH_UNTERMINATED_STRING, start, pos);
        char c = query[pos];
        if (c == '\'') {
            pos++;
            break;
        }
        if (c != '~') {
            str.push_back(c);
            pos++;
            continue;
        }
        size_t esc = pos++;
        if (atEnd()) return fail(JSONPATCH_TRUNCATED_ESCAPE, esc, pos);
        if (strchr(STRING_ESCAPE_CHARS, query[pos]) == nullptr) return fail(JSONPATCH_INVALID_ESCAPE, esc, pos + 1);
        str.push_back(query[pos++]);
    }
    TRACE("DEBUG", "scanQuotedString str: " << str << ", pos: " << pos)
    return JSONPATCH_SUCCESS;
}

/**
 * Length of the index token at the current position, 0 if there is none.
 *   Index     ::= "start" | "end" | Integer
 */
size_t Lexer::indexTokenLength(const bool allow_keywords) const {
    if (allow_keywords) {
        if (query.substr(pos, 5) == "start") return 5;
        if (query.substr(pos, 3) == "end") return 3;
    }
    size_t p = pos;
    if (p < query.length() && query[p] == '-') p++;
    if (p >= query.length() || !is_digit(query[p])) return 0;
    if (query[p] == '0') {
        p++;
    } else {
        while (p < query.length() && is_digit(query[p])) p++;
    }
    return p - pos;
}

/**
 * Convert the index token of the given length at the current position.
 * @param too_big - code reported when the integer does not fit in int64
 */
JsonPatchCode Lexer::scanIndex(const size_t len, const JsonPatchCode too_big, int64_t &val) {
    std::string_view token = query.substr(pos, len);
    if (token == "start") {
        val = INT64_MIN;
    } else if (token == "end") {
        val = INT64_MAX;
    } else {
        jp::string text(token.data(), token.length());
        errno = 0;
        long long v = strtoll(text.c_str(), nullptr, 10);
        if (errno != 0) return fail(too_big, pos, pos + len);
        val = static_cast<int64_t>(v);
    }
    pos += len;
    TRACE("DEBUG", "scanIndex val: " << val)
    return JSONPATCH_SUCCESS;
}

/**
 * Scan a comparison operator, matched longest-first. Returns OP_NONE and does not move if there is none.
 */
Operator Lexer::scanOperator() {
    if (matchString("<=")) return OP_LE;
    if (matchString(">=")) return OP_GE;
    if (matchString("==")) return OP_EQ;
    if (matchString("!=")) return OP_NE;
    if (matchString("<")) return OP_LT;
    if (matchString(">")) return OP_GT;
    return OP_NONE;
}

/**
 * Length of the number token at the current position, 0 if there is none.
 *   Number    ::= Integer ["." digit {digit}] [("e" | "E") ["+" | "-"] digit {digit}]
 */
size_t Lexer::numberTokenLength(bool &is_integer) const {
    is_integer = true;
    size_t p = pos + indexTokenLength(false);
    if (p == pos) return 0;
    size_t len = query.length();
    if (p + 1 < len && query[p] == '.' && is_digit(query[p + 1])) {
        is_integer = false;
        p++;
        while (p < len && is_digit(query[p])) p++;
    }
    if (p < len && (query[p] == 'e' || query[p] == 'E')) {
        size_t e = p + 1;
        if (e < len && (query[e] == '+' || query[e] == '-')) e++;
        if (e < len && is_digit(query[e])) {
            is_integer = false;
            p = e;
            while (p < len && is_digit(query[p])) p++;
        }
    }
    return p - pos;
}

/**
 * Scan a literal value.
 *   Literal   ::= QuotedString | "null" | "true" | "false" | Number | "Infinity" | "-Infinity"
 */
JsonPatchCode Lexer::scanLiteral(const QueryOptions &options, QueryValue &value) {
    value.reset();
    size_t start = pos;
    if (atEnd()) return fail(JSONPATCH_EXPECTING_VALUE, pos, pos);

    if (peek() == '\'') {
        jp::string str;
        JsonPatchCode rc = scanQuotedString(str);
        if (rc != JSONPATCH_SUCCESS) return rc;
        value.getJValue().SetString(str.c_str(), static_cast<rapidjson::SizeType>(str.length()), allocator);
        return JSONPATCH_SUCCESS;
    }
    if (matchString("null")) return JSONPATCH_SUCCESS;
    if (matchString("true")) {
        value.getJValue().SetBool(true);
        return JSONPATCH_SUCCESS;
    }
    if (matchString("false")) {
        value.getJValue().SetBool(false);
        return JSONPATCH_SUCCESS;
    }

    bool is_integer;
    size_t len = numberTokenLength(is_integer);
    if (len > 0) {
        JsonPatchCode rc = literal_parse_number(query.substr(pos, len), is_integer, options.useDecimal, value);
        if (rc != JSONPATCH_SUCCESS) return fail(rc, start, start + len);
        pos += len;
        return JSONPATCH_SUCCESS;
    }

    bool negative = query.substr(pos, 9) == "-Infinity";
    if (negative || query.substr(pos, 8) == "Infinity") {
        len = negative ? 9 : 8;
        if (!options.allowNanAndInfinity) {
            return fail(negative ? JSONPATCH_NEGATIVE_INFINITY_NOT_ALLOWED : JSONPATCH_INFINITY_NOT_ALLOWED,
                        start, start + len);
        }
        literal_set_infinity(negative, options.useDecimal, value);
        pos += len;
        return JSONPATCH_SUCCESS;
    }
    return fail(JSONPATCH_EXPECTING_VALUE, pos, pos);
}

QueryOptions QueryOptions::fromConfig() {
    QueryOptions options;
    options.allowNanAndInfinity = jsonpatch_is_allow_nan_and_infinity();
    options.useDecimal = jsonpatch_is_use_decimal();
    return options;
}

STATIC int64_t clamp_slice_bound(int64_t v, const int64_t len, const int64_t lower, const int64_t upper) {
    if (v < 0) {
        v += len;
        if (v < lower) v = lower;
    } else if (v > upper) {
        v = upper;
    }
    return v;
}

JsonPatchCode SliceSpec::indices(const size_t size, int64_t &first, int64_t &incr, size_t &count) const {
    if (hasStep && step == 0) return JSONPATCH_SLICE_STEP_ZERO;
    int64_t s = hasStep ? step : 1;
    int64_t len = static_cast<int64_t>(size);
    int64_t lower = s < 0 ? -1 : 0;
    int64_t upper = s < 0 ? len - 1 : len;
    int64_t b = hasStart ? clamp_slice_bound(start, len, lower, upper) : (s < 0 ? upper : lower);
    int64_t e = hasStop ? clamp_slice_bound(stop, len, lower, upper) : (s < 0 ? lower : upper);
    first = b;
    incr = s;
    if (s > 0) {
        count = b < e ? (static_cast<uint64_t>(e - b) - 1) / static_cast<uint64_t>(s) + 1 : 0;
    } else {
        uint64_t mag = uint64_t(0) - static_cast<uint64_t>(s);
        count = b > e ? (static_cast<uint64_t>(b - e) - 1) / mag + 1 : 0;
    }
    return JSONPATCH_SUCCESS;
}

NodeKey NodeKey::makeProperty(const std::string_view &name) {
    NodeKey key;
    key.type = PROPERTY;
    key.name.assign(name.data(), name.length());
    return key;
}

NodeKey NodeKey::makeIndex(const int64_t index) {
    NodeKey key;
    key.type = INDEX;
    key.index = index;
    return key;
}

NodeKey NodeKey::makeSlice(const SliceSpec &slice) {
    NodeKey key;
    key.type = SLICE;
    key.slice = slice;
    return key;
}

bool NodeKey::operator==(const NodeKey &other) const {
    if (type != other.type) return false;
    switch (type) {
        case PROPERTY: return name == other.name;
        case INDEX: return index == other.index;
        case SLICE:
            return slice.hasStart == other.slice.hasStart && slice.hasStop == other.slice.hasStop &&
                   slice.hasStep == other.slice.hasStep &&
                   (!slice.hasStart || slice.start == other.slice.start) &&
                   (!slice.hasStop || slice.stop == other.slice.stop) &&
                   (!slice.hasStep || slice.step == other.slice.step);
    }
    return false;
}

/**
 * Normalize an array index, negative values count from the end. Returns false if the index is out of range.
 */
STATIC bool normalize_index(int64_t index, const size_t size, size_t &pos) {
    int64_t len = static_cast<int64_t>(size);
    if (index < 0) index += len;
    if (index < 0 || index >= len) return false;
    pos = static_cast<size_t>(index);
    return true;
}

STATIC JValue::MemberIterator find_member(JValue &obj, const jp::string &name) {
    JValue key(rapidjson::StringRef(name.c_str(), static_cast<rapidjson::SizeType>(name.length())));
    return obj.FindMember(key);
}

bool Selector::isPresent(const Node &node) {
    JValue &c = *node.container;
    switch (node.key.type) {
        case NodeKey::PROPERTY:
            return c.IsObject() && find_member(c, node.key.name) != c.MemberEnd();
        case NodeKey::INDEX: {
            size_t pos;
            return c.IsArray() && normalize_index(node.key.index, c.Size(), pos);
        }
        case NodeKey::SLICE:
            return true;
    }
    return false;
}

JValue& jsonpatch_node_value(const Node &node) {
    JValue &c = *node.container;
    if (node.key.type == NodeKey::PROPERTY) {
        auto it = find_member(c, node.key.name);
        ValkeyModule_Assert(it != c.MemberEnd());
        return it->value;
    }
    ValkeyModule_Assert(node.key.type == NodeKey::INDEX);
    size_t pos = 0;
    bool found = normalize_index(node.key.index, c.Size(), pos);
    ValkeyModule_Assert(found);
    return c[static_cast<rapidjson::SizeType>(pos)];
}

JsonPatchCode Selector::setError(const JsonPatchCode code, const size_t start, const size_t end,
                                 const std::string_view &detail) {
    error = code;
    errorDetail.assign(detail.data(), detail.length());
    errStart = start;
    errEnd = end;
    TRACE("ERROR", "query error " << code << " at " << start << ".." << end << ": " << errorDetail)
    return code;
}

void Selector::makeDiagnostic(const char *filename, SyntaxDiagnostic &diag) const {
    jsonpatch_make_diagnostic(error, errorDetail, lex.query, errStart, errEnd, filename, diag);
}

void Selector::init(const std::string_view &query, const QueryOptions &opts) {
    lex.init(query);
    options = opts;
    stepStart = 0;
    resultSet.clear();
    error = JSONPATCH_SUCCESS;
    errorDetail.clear();
    errStart = errEnd = 0;
}

JsonPatchCode Selector::selectNodes(const NodeList &nodes, const std::string_view &query, const QueryOptions &opts) {
    init(query, opts);
    CHECK_QUERY_STRING_SIZE(query);
    resultSet = nodes;
    JsonPatchCode rc = parseQuery(resultSet, opts.relative, opts.mapping, opts.allowSlice);
    if (rc == JSONPATCH_SUCCESS && !lex.atEnd()) rc = setError(JSONPATCH_EXPECTING_END_OF_QUERY, lex.pos, lex.pos);
    if (rc != JSONPATCH_SUCCESS) resultSet.clear();
    return rc;
}

JsonPatchCode Selector::filterNodes(const NodeList &nodes, const std::string_view &query, const QueryOptions &opts) {
    init(query, opts);
    CHECK_QUERY_STRING_SIZE(query);
    resultSet = nodes;
    JsonPatchCode rc = parseFilterExpr(resultSet);
    if (rc == JSONPATCH_SUCCESS && !lex.atEnd()) rc = setError(JSONPATCH_EXPECTING_END_OF_QUERY, lex.pos, lex.pos);
    if (rc != JSONPATCH_SUCCESS) resultSet.clear();
    return rc;
}

/**
 *   Query               ::= Entry ["?"] {Step}
 *   Entry               ::= "$" | "@"
 */
JsonPatchCode Selector::parseQuery(NodeList &nodes, const bool relative, const bool mapping, const bool allow_slice) {
    CHECK_RECURSION_DEPTH();
    size_t entry = lex.pos;
    if (!lex.match(relative ? '@' : '$')) {
        return setError(relative ? JSONPATCH_EXPECTING_RELATIVE_QUERY : JSONPATCH_EXPECTING_ABSOLUTE_QUERY,
                        entry, entry);
    }
    bool optional = false;
    if (lex.peek() == '?') {
        if (mapping) return setError(JSONPATCH_OPTIONAL_MARKER_NOT_ALLOWED, lex.pos, lex.pos + 1);
        lex.pos++;
        optional = true;
    }
    return parseSteps(nodes, optional, mapping, allow_slice);
}

/**
 *   Step                ::= "." Key | "[" Bracket "]"
 *
 * When no step follows, every key is checked against its container. With the optional marker, keys that do
 * not exist are dropped.
 */
JsonPatchCode Selector::parseSteps(NodeList &nodes, const bool optional, const bool mapping, const bool allow_slice) {
    JsonPatchCode rc;
    while (true) {
        stepStart = lex.pos;
        if (lex.match('.')) {
            rc = parseDotStep(nodes, optional);
        } else if (lex.match('[')) {
            rc = parseBracketStep(nodes, optional, mapping);
        } else {
            break;
        }
        if (rc != JSONPATCH_SUCCESS) return rc;
    }

    stepStart = lex.pos;
    for (auto &node : nodes) {
        rc = checkKey(node, allow_slice);
        if (rc != JSONPATCH_SUCCESS) return rc;
    }
    if (optional) {
        nodes.erase(std::remove_if(nodes.begin(), nodes.end(),
                                   [](const Node &node) { return !isPresent(node); }),
                    nodes.end());
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode Selector::parseDotStep(NodeList &nodes, const bool optional) {
    jp::string name;
    JsonPatchCode rc = lex.scanKey(name);
    if (rc != JSONPATCH_SUCCESS) return lexError(rc);
    NodeKey key = NodeKey::makeProperty(name);
    NodeList next;
    rc = expandKeys(nodes, optional, &key, next);
    if (rc != JSONPATCH_SUCCESS) return rc;
    nodes.swap(next);
    return JSONPATCH_SUCCESS;
}

/**
 *   Bracket             ::= QuotedString | Slice | Index | FilterExpr
 */
JsonPatchCode Selector::parseBracketStep(NodeList &nodes, const bool optional, const bool mapping) {
    JsonPatchCode rc;
    NodeList next;
    if (lex.peek() == '\'') {
        jp::string name;
        rc = lex.scanQuotedString(name);
        if (rc != JSONPATCH_SUCCESS) return lexError(rc);
        NodeKey key = NodeKey::makeProperty(name);
        rc = expandKeys(nodes, optional, &key, next);
    } else if (lex.indexTokenLength(true) > 0 || lex.peek() == ':') {
        NodeKey key;
        rc = parseIndexOrSlice(mapping, key);
        if (rc != JSONPATCH_SUCCESS) return rc;
        rc = expandKeys(nodes, optional, &key, next);
    } else {
        if (mapping) return setError(JSONPATCH_FILTER_NOT_ALLOWED, lex.pos, lex.pos);
        rc = expandKeys(nodes, optional, nullptr, next);
        if (rc != JSONPATCH_SUCCESS) return rc;
        rc = parseFilterExpr(next);
    }
    if (rc != JSONPATCH_SUCCESS) return rc;

    if (!lex.match(']')) return setError(JSONPATCH_EXPECTING_CLOSING_BRACKET, lex.pos, lex.pos);
    nodes.swap(next);
    return JSONPATCH_SUCCESS;
}

/**
 *   Slice               ::= [Index] ":" [Index] [":" [Integer]]
 *   Index               ::= "start" | "end" | Integer
 */
JsonPatchCode Selector::parseIndexOrSlice(const bool mapping, NodeKey &key) {
    JsonPatchCode rc;
    size_t len = lex.indexTokenLength(true);
    size_t colon = lex.pos + len;
    if (colon >= lex.query.length() || lex.query[colon] != ':') {
        int64_t index;
        rc = lex.scanIndex(len, JSONPATCH_INDEX_TOO_BIG, index);
        if (rc != JSONPATCH_SUCCESS) return lexError(rc);
        key = NodeKey::makeIndex(index);
        return JSONPATCH_SUCCESS;
    }
    if (mapping) return setError(JSONPATCH_SLICE_NOT_ALLOWED, colon, colon + 1);

    SliceSpec slice;
    if (len > 0) {
        rc = lex.scanIndex(len, JSONPATCH_START_TOO_BIG, slice.start);
        if (rc != JSONPATCH_SUCCESS) return lexError(rc);
        slice.hasStart = true;
    }
    lex.pos++;  // skip ':'
    len = lex.indexTokenLength(true);
    if (len > 0) {
        rc = lex.scanIndex(len, JSONPATCH_STOP_TOO_BIG, slice.stop);
        if (rc != JSONPATCH_SUCCESS) return lexError(rc);
        slice.hasStop = true;
    }
    if (lex.match(':')) {
        len = lex.indexTokenLength(false);
        if (len > 0) {
            rc = lex.scanIndex(len, JSONPATCH_STEP_TOO_BIG, slice.step);
            if (rc != JSONPATCH_SUCCESS) return lexError(rc);
            slice.hasStep = true;
        }
    }
    key = NodeKey::makeSlice(slice);
    return JSONPATCH_SUCCESS;
}

/**
 *   FilterExpr          ::= ["!"] RelativeQuery [{SPACE} ComparisonOp {SPACE} ComparisonValue]
 *                           [{SPACE} "&&" {SPACE} FilterExpr]
 *
 * Each clause narrows the candidates kept by the previous one. The relative query of a clause runs in
 * single-result mode, so it yields exactly one node per candidate and lhs[i] belongs to candidates[i].
 */
JsonPatchCode Selector::parseFilterExpr(NodeList &candidates) {
    CHECK_RECURSION_DEPTH();
    JsonPatchCode rc;
    while (true) {
        bool negate = lex.match('!');
        NodeList lhs = candidates;
        rc = parseQuery(lhs, true, true, false);
        if (rc != JSONPATCH_SUCCESS) return rc;
        ValkeyModule_Assert(lhs.size() == candidates.size());

        jp::vector<size_t> pairs;
        for (size_t i = 0; i < lhs.size(); i++) {
            if (isPresent(lhs[i]) != negate) pairs.push_back(i);
        }

        size_t save = lex.pos;
        lex.skipSpaces();
        size_t op_start = lex.pos;
        Operator op = lex.scanOperator();
        NodeList survivors;
        if (op == OP_NONE) {
            lex.pos = save;
            for (size_t i : pairs) survivors.push_back(candidates[i]);
        } else if (negate) {
            return setError(JSONPATCH_UNEXPECTED_OPERATOR, op_start, lex.pos);
        } else {
            TRACE("DEBUG", "parseFilterExpr operator " << literal_operator_name(op) << " over "
                << pairs.size() << " nodes")
            lex.skipSpaces();
            rc = parseComparison(candidates, lhs, pairs, op, op_start, survivors);
            if (rc != JSONPATCH_SUCCESS) return rc;
        }
        candidates.swap(survivors);

        save = lex.pos;
        lex.skipSpaces();
        if (!lex.matchString("&&")) {
            lex.pos = save;
            return JSONPATCH_SUCCESS;
        }
        lex.skipSpaces();
    }
}

/**
 *   ComparisonValue     ::= Literal | RelativeQuery
 *
 * A relative right-hand side runs over the candidates whose left-hand key exists, and a candidate is kept only
 * if the right-hand key exists too.
 */
JsonPatchCode Selector::parseComparison(const NodeList &nodes, const NodeList &lhs, const jp::vector<size_t> &pairs,
                                        const Operator op, const size_t op_start, NodeList &survivors) {
    JsonPatchCode rc;
    bool result;
    jp::string kinds;
    if (lex.peek() == '@') {
        NodeList rhs;
        for (size_t i : pairs) rhs.push_back(nodes[i]);
        rc = parseQuery(rhs, true, true, false);
        if (rc != JSONPATCH_SUCCESS) return rc;
        for (size_t k = 0; k < pairs.size(); k++) {
            if (!isPresent(rhs[k])) continue;
            rc = literal_compare(jsonpatch_node_value(lhs[pairs[k]]), op, jsonpatch_node_value(rhs[k]),
                                 result, kinds);
            if (rc != JSONPATCH_SUCCESS) return setError(rc, op_start, op_start + strlen(literal_operator_name(op)),
                                                         kinds);
            if (result) survivors.push_back(nodes[pairs[k]]);
        }
        return JSONPATCH_SUCCESS;
    }

    QueryValue value;
    rc = lex.scanLiteral(options, value);
    if (rc != JSONPATCH_SUCCESS) return lexError(rc);
    for (size_t i : pairs) {
        rc = literal_compare(jsonpatch_node_value(lhs[i]), op, value, result, kinds);
        if (rc != JSONPATCH_SUCCESS) return setError(rc, op_start, op_start + strlen(literal_operator_name(op)),
                                                     kinds);
        if (result) survivors.push_back(nodes[i]);
    }
    return JSONPATCH_SUCCESS;
}

/**
 * Dereference every node and build the next node list. With a key, each container gets that key. Without one,
 * each container is expanded into one node per member name or array index, in order.
 */
JsonPatchCode Selector::expandKeys(const NodeList &nodes, const bool optional, const NodeKey *key, NodeList &result) {
    result.clear();
    jp::vector<JValue*> targets;
    for (auto &node : nodes) {
        targets.clear();
        JsonPatchCode rc = getTargets(node, optional, targets);
        if (rc != JSONPATCH_SUCCESS) return rc;
        for (JValue *target : targets) {
            if (key != nullptr) {
                result.push_back(Node(target, *key));
            } else if (target->IsObject()) {
                for (auto m = target->MemberBegin(); m != target->MemberEnd(); ++m) {
                    std::string_view name(m->name.GetString(), m->name.GetStringLength());
                    result.push_back(Node(target, NodeKey::makeProperty(name)));
                }
            } else {
                for (rapidjson::SizeType i = 0; i < target->Size(); i++) {
                    result.push_back(Node(target, NodeKey::makeIndex(i)));
                }
            }
        }
    }
    TRACE("DEBUG", "expandKeys " << nodes.size() << " nodes into " << result.size())
    return JSONPATCH_SUCCESS;
}

/**
 * Resolve a node to the containers it addresses. A slice addresses every selected element.
 */
JsonPatchCode Selector::getTargets(const Node &node, const bool optional, jp::vector<JValue*> &targets) {
    JsonPatchCode rc = checkKey(node, true);
    if (rc != JSONPATCH_SUCCESS) return rc;

    JValue &c = *node.container;
    size_t first = targets.size();
    switch (node.key.type) {
        case NodeKey::PROPERTY: {
            auto it = find_member(c, node.key.name);
            if (it == c.MemberEnd()) {
                if (optional) return JSONPATCH_SUCCESS;
                return setError(JSONPATCH_KEY_NOT_FOUND, stepStart, lex.pos, node.key.name);
            }
            targets.push_back(&it->value);
            break;
        }
        case NodeKey::INDEX: {
            size_t pos;
            if (!normalize_index(node.key.index, c.Size(), pos)) {
                if (optional) return JSONPATCH_SUCCESS;
                return setError(JSONPATCH_INDEX_OUT_OF_ARRAY_BOUNDARIES, stepStart, lex.pos);
            }
            targets.push_back(&c[static_cast<rapidjson::SizeType>(pos)]);
            break;
        }
        case NodeKey::SLICE: {
            int64_t start, step;
            size_t count;
            rc = node.key.slice.indices(c.Size(), start, step, count);
            if (rc != JSONPATCH_SUCCESS) return setError(rc, stepStart, lex.pos);
            for (size_t k = 0; k < count; k++) {
                int64_t i = start + static_cast<int64_t>(k) * step;
                targets.push_back(&c[static_cast<rapidjson::SizeType>(i)]);
            }
            break;
        }
    }

    for (size_t i = first; i < targets.size(); i++) {
        if (!targets[i]->IsObject() && !targets[i]->IsArray()) {
            return setError(JSONPATCH_NOT_A_CONTAINER, stepStart, lex.pos, dom_kind_name(*targets[i]));
        }
    }
    return JSONPATCH_SUCCESS;
}

/**
 * Check a key against its container. Object keys must be property names. Array keys must be indexes, or
 * slices when allowed.
 */
JsonPatchCode Selector::checkKey(const Node &node, const bool allow_slice) {
    const JValue &c = *node.container;
    if (c.IsObject()) {
        if (node.key.type == NodeKey::INDEX) return setError(JSONPATCH_OBJECT_KEY_IS_INDEX, stepStart, lex.pos);
        if (node.key.type == NodeKey::SLICE) return setError(JSONPATCH_OBJECT_KEY_IS_SLICE, stepStart, lex.pos);
    } else if (c.IsArray()) {
        if (allow_slice) {
            if (node.key.type == NodeKey::PROPERTY)
                return setError(JSONPATCH_ARRAY_SLICE_INDEX_IS_STRING, stepStart, lex.pos);
        } else {
            if (node.key.type == NodeKey::PROPERTY)
                return setError(JSONPATCH_ARRAY_INDEX_IS_STRING, stepStart, lex.pos);
            if (node.key.type == NodeKey::SLICE)
                return setError(JSONPATCH_ARRAY_INDEX_IS_SLICE, stepStart, lex.pos);
        }
    } else {
        return setError(JSONPATCH_NOT_A_CONTAINER, stepStart, lex.pos, dom_kind_name(c));
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode jsonpatch_load_query_value(const std::string_view &text, const QueryOptions &options,
                                         QueryValue &value, SyntaxDiagnostic &diag) {
    Lexer lex;
    lex.init(text);
    JsonPatchCode rc = lex.scanLiteral(options, value);
    if (rc == JSONPATCH_SUCCESS && !lex.atEnd()) {
        rc = JSONPATCH_EXPECTING_END_OF_QUERY;
        lex.errStart = lex.errEnd = lex.pos;
    }
    if (rc != JSONPATCH_SUCCESS) {
        value.reset();
        jsonpatch_make_diagnostic(rc, std::string_view(), text, lex.errStart, lex.errEnd, nullptr, diag);
    }
    return rc;
}
