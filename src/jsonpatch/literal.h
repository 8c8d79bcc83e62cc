/**
 * Query literals and value comparison.
 *
 * A literal is a scalar that appears in query text: the right-hand side of a filter comparison, or a standalone
 * query value. Literals are held by QueryValue, which wraps either a rapidjson scalar or, in decimal mode, an
 * arbitrary-precision decimal from libmpdec. Document values never hold decimals.
 *
 * Comparison rules:
 * 1. "==" and "!=" are total. Values of different kinds are unequal. true and false are one kind and all numbers
 *    are one kind. Arrays and objects compare by deep value equality.
 * 2. Ordering is defined for number/number, string/string (bytewise, which is code point order for UTF-8) and
 *    bool/bool. Any other pairing fails with JSONPATCH_NOT_ORDERABLE.
 * 3. If either side is a decimal, numbers are compared as decimals.
 *
 * Every public interface method declared in this file should be prefixed with "literal_".
 */
#ifndef VALKEYJSONPATCH_LITERAL_H_
#define VALKEYJSONPATCH_LITERAL_H_

#include <mpdecimal.h>
#include "jsonpatch/dom.h"

typedef enum {
    OP_NONE = 0,
    OP_LT,
    OP_LE,
    OP_EQ,
    OP_NE,
    OP_GE,
    OP_GT
} Operator;

const char *literal_operator_name(Operator op);

class QueryValue {
 public:
    QueryValue() : value(), decimal(nullptr) {}
    ~QueryValue() { reset(); }

    void reset();
    bool isDecimal() const { return decimal != nullptr; }
    JValue& getJValue() { return value; }
    const JValue& getJValue() const { return value; }
    const mpd_t *getDecimal() const { return decimal; }
    // Takes ownership of dec, which must have been created by mpd_qnew.
    void setDecimal(mpd_t *dec);
    const char *kindName() const;

 private:
    QueryValue(const QueryValue&);             // disable copy constructor
    QueryValue& operator=(const QueryValue&);  // disable assignment operator
    JValue value;
    mpd_t *decimal;
};

/**
 * Route libmpdec allocations through the JSON allocator. Must be called once at load time, before any
 * decimal is created.
 */
void literal_init();

/**
 * Convert a numeral matching -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][-+]?[0-9]+)? into a value.
 * Integers are stored as int64, else uint64. Anything else becomes a decimal when use_decimal is set
 * and a double otherwise.
 * @param value - OUTPUT param
 * @return JSONPATCH_SUCCESS, JSONPATCH_BIG_NUMBER_REQUIRES_DECIMAL if the double is not finite,
 *         JSONPATCH_NUMBER_TOO_BIG if the decimal exponent overflows.
 */
JsonPatchCode literal_parse_number(const std::string_view &numeral, const bool is_integer, const bool use_decimal,
                                   QueryValue &value);

/* Set value to positive or negative infinity, as a decimal when use_decimal is set. */
void literal_set_infinity(const bool negative, const bool use_decimal, QueryValue &value);

/**
 * Deep value equality. Numbers compare by value across int64, uint64 and double.
 */
bool literal_values_equal(const JValue &a, const JValue &b);

/**
 * Evaluate "lhs op rhs".
 * @param result - OUTPUT param, outcome of the comparison
 * @param kinds - OUTPUT param, set to "<kind> and <kind>" when the pair cannot be ordered
 * @return JSONPATCH_SUCCESS or JSONPATCH_NOT_ORDERABLE
 */
JsonPatchCode literal_compare(const JValue &lhs, const Operator op, const JValue &rhs, bool &result,
                              jp::string &kinds);
JsonPatchCode literal_compare(const JValue &lhs, const Operator op, const QueryValue &rhs, bool &result,
                              jp::string &kinds);

/* Serialize a query value. Decimals are written in scientific notation, infinities as Infinity/-Infinity. */
void literal_serialize(const QueryValue &value, rapidjson::StringBuffer &oss);

#endif  // VALKEYJSONPATCH_LITERAL_H_
