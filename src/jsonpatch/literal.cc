#include "jsonpatch/literal.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

static const double TWO_POW_63 = 9223372036854775808.0;
static const double TWO_POW_64 = 18446744073709551616.0;

typedef enum {
    KIND_NULL = 0,
    KIND_NUMBER,
    KIND_STRING,
    KIND_ARRAY,
    KIND_OBJECT
} ValueKind;

STATIC ValueKind kind_of(const JValue &v) {
    switch (v.GetType()) {
        case rapidjson::kNullType: return KIND_NULL;
        case rapidjson::kFalseType:
        case rapidjson::kTrueType:  // booleans compare as the numbers 0 and 1
        case rapidjson::kNumberType: return KIND_NUMBER;
        case rapidjson::kStringType: return KIND_STRING;
        case rapidjson::kArrayType: return KIND_ARRAY;
        case rapidjson::kObjectType: return KIND_OBJECT;
        default: ValkeyModule_Assert(false);
    }
    return KIND_NULL;
}

const char *literal_operator_name(Operator op) {
    switch (op) {
        case OP_LT: return "<";
        case OP_LE: return "<=";
        case OP_EQ: return "==";
        case OP_NE: return "!=";
        case OP_GE: return ">=";
        case OP_GT: return ">";
        default: break;
    }
    return "";
}

STATIC void *literal_calloc(size_t nmemb, size_t size) {
    if (size != 0 && nmemb > SIZE_MAX / size) return nullptr;
    void *ptr = dom_alloc(nmemb * size);
    if (ptr) memset(ptr, 0, nmemb * size);
    return ptr;
}

void literal_init() {
    mpd_mallocfunc = dom_alloc;
    mpd_reallocfunc = dom_realloc;
    mpd_callocfunc = literal_calloc;
    mpd_free = dom_free;
}

void QueryValue::reset() {
    if (decimal) {
        mpd_del(decimal);
        decimal = nullptr;
    }
    value.SetNull();
}

void QueryValue::setDecimal(mpd_t *dec) {
    reset();
    decimal = dec;
}

const char *QueryValue::kindName() const {
    return isDecimal() ? "number" : dom_kind_name(value);
}

/**
 * Parse a numeral into a new decimal under the maximum context, so the value is exact.
 */
STATIC JsonPatchCode new_decimal(const jp::string &numeral, mpd_t **dec) {
    mpd_context_t ctx;
    mpd_maxcontext(&ctx);
    uint32_t status = 0;
    *dec = mpd_qnew();
    ValkeyModule_Assert(*dec != nullptr);
    mpd_qset_string(*dec, numeral.c_str(), &ctx, &status);
    if ((status & (MPD_Overflow | MPD_Conversion_syntax)) || mpd_isinfinite(*dec)) {
        mpd_del(*dec);
        *dec = nullptr;
        return JSONPATCH_NUMBER_TOO_BIG;
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode literal_parse_number(const std::string_view &numeral, const bool is_integer, const bool use_decimal,
                                   QueryValue &value) {
    value.reset();
    jp::string text(numeral.data(), numeral.length());
    if (is_integer) {
        errno = 0;
        char *end = nullptr;
        long long i64 = strtoll(text.c_str(), &end, 10);
        if (errno == 0) {
            value.getJValue().SetInt64(static_cast<int64_t>(i64));
            return JSONPATCH_SUCCESS;
        }
        if (text[0] != '-') {
            errno = 0;
            unsigned long long u64 = strtoull(text.c_str(), &end, 10);
            if (errno == 0) {
                value.getJValue().SetUint64(static_cast<uint64_t>(u64));
                return JSONPATCH_SUCCESS;
            }
        }
    }

    if (use_decimal) {
        mpd_t *dec;
        JsonPatchCode rc = new_decimal(text, &dec);
        if (rc != JSONPATCH_SUCCESS) return rc;
        value.setDecimal(dec);
        return JSONPATCH_SUCCESS;
    }

    double d = strtod(text.c_str(), nullptr);
    if (!std::isfinite(d)) return JSONPATCH_BIG_NUMBER_REQUIRES_DECIMAL;
    value.getJValue().SetDouble(d);
    return JSONPATCH_SUCCESS;
}

void literal_set_infinity(const bool negative, const bool use_decimal, QueryValue &value) {
    value.reset();
    if (use_decimal) {
        mpd_t *dec = mpd_qnew();
        ValkeyModule_Assert(dec != nullptr);
        mpd_setspecial(dec, negative ? MPD_NEG : MPD_POS, MPD_INF);
        value.setDecimal(dec);
    } else {
        double inf = std::numeric_limits<double>::infinity();
        value.getJValue().SetDouble(negative ? -inf : inf);
    }
}

/**
 * Three-way comparison of a double against an integer, without losing precision on either side.
 * The double must not be NaN.
 */
STATIC int compare_double_integer(const double d, const JValue &x) {
    if (x.IsInt64()) {
        int64_t i = x.GetInt64();
        if (d < -TWO_POW_63) return -1;
        if (d >= TWO_POW_63) return 1;
        if (jsonpatch_is_int64(d)) {
            int64_t di = static_cast<int64_t>(d);
            return di < i ? -1 : (di > i ? 1 : 0);
        }
        double t = std::trunc(d);
        int64_t ti = static_cast<int64_t>(t);
        if (ti < i) return -1;
        if (ti > i) return 1;
        return d < t ? -1 : 1;
    }
    // uint64 beyond the int64 range
    uint64_t u = x.GetUint64();
    if (d < TWO_POW_63) return -1;
    if (d >= TWO_POW_64) return 1;
    uint64_t du = static_cast<uint64_t>(d);  // doubles in this range are integral
    return du < u ? -1 : (du > u ? 1 : 0);
}

STATIC const JValue &bool_as_number(const JValue &v, JValue &scratch) {
    if (!v.IsBool()) return v;
    scratch.SetInt64(v.GetBool() ? 1 : 0);
    return scratch;
}

/**
 * Three-way comparison of two numbers. Booleans count as 0 and 1.
 * @return false if the pair is unordered, i.e. one of them is NaN.
 */
STATIC bool compare_numbers(const JValue &lhs, const JValue &rhs, int &cmp) {
    JValue lscratch, rscratch;
    const JValue &a = bool_as_number(lhs, lscratch);
    const JValue &b = bool_as_number(rhs, rscratch);
    if (a.IsDouble() || b.IsDouble()) {
        if (a.IsDouble() && std::isnan(a.GetDouble())) return false;
        if (b.IsDouble() && std::isnan(b.GetDouble())) return false;
        if (a.IsDouble() && b.IsDouble()) {
            double x = a.GetDouble();
            double y = b.GetDouble();
            cmp = x < y ? -1 : (x > y ? 1 : 0);
        } else if (a.IsDouble()) {
            cmp = compare_double_integer(a.GetDouble(), b);
        } else {
            cmp = -compare_double_integer(b.GetDouble(), a);
        }
        return true;
    }
    if (a.IsInt64() && b.IsInt64()) {
        int64_t x = a.GetInt64();
        int64_t y = b.GetInt64();
        cmp = x < y ? -1 : (x > y ? 1 : 0);
    } else if (a.IsUint64() && b.IsUint64()) {
        uint64_t x = a.GetUint64();
        uint64_t y = b.GetUint64();
        cmp = x < y ? -1 : (x > y ? 1 : 0);
    } else {
        // one side is a negative int64, the other a uint64 beyond the int64 range
        cmp = a.IsUint64() ? 1 : -1;
    }
    return true;
}

STATIC void number_to_decimal(const JValue &v, mpd_t *dec) {
    mpd_context_t ctx;
    mpd_maxcontext(&ctx);
    uint32_t status = 0;
    if (v.IsBool()) {
        mpd_qset_i64(dec, v.GetBool() ? 1 : 0, &ctx, &status);
    } else if (v.IsInt64()) {
        mpd_qset_i64(dec, v.GetInt64(), &ctx, &status);
    } else if (v.IsUint64()) {
        mpd_qset_u64(dec, v.GetUint64(), &ctx, &status);
    } else {
        double d = v.GetDouble();
        if (std::isnan(d)) {
            mpd_setspecial(dec, MPD_POS, MPD_NAN);
        } else if (std::isinf(d)) {
            mpd_setspecial(dec, d < 0 ? MPD_NEG : MPD_POS, MPD_INF);
        } else {
            char buf[BUF_SIZE_DOUBLE_JSON];
            jsonpatch_double_to_string(d, buf, sizeof(buf));
            mpd_qset_string(dec, buf, &ctx, &status);
        }
    }
    ValkeyModule_Assert(!(status & MPD_Errors));
}

STATIC bool compare_number_decimal(const JValue &a, const mpd_t *b, int &cmp) {
    mpd_t *dec = mpd_qnew();
    ValkeyModule_Assert(dec != nullptr);
    number_to_decimal(a, dec);
    uint32_t status = 0;
    int c = mpd_qcmp(dec, b, &status);
    mpd_del(dec);
    if (c == INT_MAX) return false;  // NaN
    cmp = c;
    return true;
}

bool literal_values_equal(const JValue &a, const JValue &b) {
    ValueKind ka = kind_of(a);
    if (ka != kind_of(b)) return false;
    switch (ka) {
        case KIND_NULL: return true;
        case KIND_NUMBER: {
            int cmp;
            return compare_numbers(a, b, cmp) && cmp == 0;
        }
        case KIND_STRING:
            return a.GetStringLength() == b.GetStringLength() &&
                   memcmp(a.GetString(), b.GetString(), a.GetStringLength()) == 0;
        case KIND_ARRAY: {
            if (a.Size() != b.Size()) return false;
            for (rapidjson::SizeType i = 0; i < a.Size(); i++) {
                if (!literal_values_equal(a[i], b[i])) return false;
            }
            return true;
        }
        case KIND_OBJECT: {
            if (a.MemberCount() != b.MemberCount()) return false;
            for (auto m = a.MemberBegin(); m != a.MemberEnd(); ++m) {
                auto it = b.FindMember(m->name);
                if (it == b.MemberEnd() || !literal_values_equal(m->value, it->value)) return false;
            }
            return true;
        }
    }
    return false;
}

STATIC bool apply_ordering(const Operator op, const int cmp) {
    switch (op) {
        case OP_LT: return cmp < 0;
        case OP_LE: return cmp <= 0;
        case OP_EQ: return cmp == 0;
        case OP_NE: return cmp != 0;
        case OP_GE: return cmp >= 0;
        case OP_GT: return cmp > 0;
        default: ValkeyModule_Assert(false);
    }
    return false;
}

STATIC JsonPatchCode not_orderable(const char *lhs_kind, const char *rhs_kind, jp::string &kinds) {
    kinds = lhs_kind;
    kinds += " and ";
    kinds += rhs_kind;
    return JSONPATCH_NOT_ORDERABLE;
}

JsonPatchCode literal_compare(const JValue &lhs, const Operator op, const JValue &rhs, bool &result,
                              jp::string &kinds) {
    result = false;
    if (op == OP_EQ || op == OP_NE) {
        bool eq = literal_values_equal(lhs, rhs);
        result = (op == OP_EQ) ? eq : !eq;
        return JSONPATCH_SUCCESS;
    }

    ValueKind kl = kind_of(lhs);
    if (kl != kind_of(rhs)) return not_orderable(dom_kind_name(lhs), dom_kind_name(rhs), kinds);
    switch (kl) {
        case KIND_NUMBER: {
            int cmp;
            // NaN is unordered, every ordering is false
            result = compare_numbers(lhs, rhs, cmp) && apply_ordering(op, cmp);
            return JSONPATCH_SUCCESS;
        }
        case KIND_STRING: {
            size_t llen = lhs.GetStringLength();
            size_t rlen = rhs.GetStringLength();
            int cmp = memcmp(lhs.GetString(), rhs.GetString(), std::min(llen, rlen));
            if (cmp == 0) cmp = llen < rlen ? -1 : (llen > rlen ? 1 : 0);
            result = apply_ordering(op, cmp);
            return JSONPATCH_SUCCESS;
        }
        case KIND_ARRAY: {
            // lexicographic, the first unequal pair decides
            rapidjson::SizeType n = std::min(lhs.Size(), rhs.Size());
            for (rapidjson::SizeType i = 0; i < n; i++) {
                if (!literal_values_equal(lhs[i], rhs[i])) return literal_compare(lhs[i], op, rhs[i], result, kinds);
            }
            int cmp = lhs.Size() < rhs.Size() ? -1 : (lhs.Size() > rhs.Size() ? 1 : 0);
            result = apply_ordering(op, cmp);
            return JSONPATCH_SUCCESS;
        }
        default:
            return not_orderable(dom_kind_name(lhs), dom_kind_name(rhs), kinds);
    }
}

JsonPatchCode literal_compare(const JValue &lhs, const Operator op, const QueryValue &rhs, bool &result,
                              jp::string &kinds) {
    if (!rhs.isDecimal()) return literal_compare(lhs, op, rhs.getJValue(), result, kinds);

    result = false;
    if (!lhs.IsNumber() && !lhs.IsBool()) {
        if (op == OP_EQ || op == OP_NE) {
            result = (op == OP_NE);
            return JSONPATCH_SUCCESS;
        }
        return not_orderable(dom_kind_name(lhs), rhs.kindName(), kinds);
    }
    int cmp;
    if (compare_number_decimal(lhs, rhs.getDecimal(), cmp)) {
        result = apply_ordering(op, cmp);
    } else {
        result = (op == OP_NE);
    }
    return JSONPATCH_SUCCESS;
}

void literal_serialize(const QueryValue &value, rapidjson::StringBuffer &oss) {
    if (!value.isDecimal()) {
        dom_serialize_value(value.getJValue(), true, oss);
        return;
    }
    char *s = mpd_to_sci(value.getDecimal(), 1);
    ValkeyModule_Assert(s != nullptr);
    for (const char *p = s; *p; p++) oss.Put(*p);
    mpd_free(s);
}
