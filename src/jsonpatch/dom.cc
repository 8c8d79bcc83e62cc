#include "jsonpatch/dom.h"
#include <cstring>
#include <ostream>
#include <streambuf>
#include <string>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

// the one true allocator
RapidJsonAllocator allocator;

/**
 * We want to avoid all redundant creations of an allocator -- for performance reasons.
 * So we use the constructor to detect that situation. If you trip this trap, then you let a
 * rapidjson allocator instance get defaulted somewhere in your code.
 */
RapidJsonAllocator::RapidJsonAllocator() {
    ValkeyModule_Assert(this == &allocator);  // Only this one is allowed :)
}

JParser& JParser::Parse(const char *json, size_t len, const bool allow_nan_and_infinity) {
    if (allow_nan_and_infinity) {
        RJParser::Parse<rapidjson::kParseFullPrecisionFlag | rapidjson::kParseNanAndInfFlag>(json, len);
    } else {
        RJParser::Parse<rapidjson::kParseFullPrecisionFlag>(json, len);
    }
    return *this;
}

JsonPatchCode dom_parse_value(const char *json_buf, const size_t buf_len, const bool allow_nan_and_infinity,
                              const char *filename, JParser &parser, SyntaxDiagnostic &diag) {
    if (parser.Parse(json_buf, buf_len, allow_nan_and_infinity).HasParseError()) {
        size_t offset = parser.GetErrorOffset();
        jsonpatch_make_diagnostic(JSONPATCH_JSON_PARSE_ERROR, GetParseError_En(parser.GetParseError()),
                                  std::string_view(json_buf, buf_len), offset, offset, filename, diag);
        return JSONPATCH_JSON_PARSE_ERROR;
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode dom_parse(const char *json_buf, const size_t buf_len, const bool allow_nan_and_infinity,
                        const char *filename, JDocument **doc, SyntaxDiagnostic &diag) {
    *doc = nullptr;
    JParser parser;
    JsonPatchCode rc = dom_parse_value(json_buf, buf_len, allow_nan_and_infinity, filename, parser, diag);
    if (rc != JSONPATCH_SUCCESS) return rc;
    *doc = new JDocument();
    (*doc)->SetJValue(parser.GetJValue());
    return JSONPATCH_SUCCESS;
}

void dom_free_doc(JDocument *doc) {
    ValkeyModule_Assert(doc != nullptr);
    delete doc;
}

void dom_serialize_value(const JValue &val, const bool allow_nan_and_infinity, rapidjson::StringBuffer &oss) {
    bool ok;
    if (allow_nan_and_infinity) {
        rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>, rapidjson::CrtAllocator,
                          rapidjson::kWriteNanAndInfFlag> writer(oss);
        ok = val.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(oss);
        ok = val.Accept(writer);
    }
    // NaN and Infinity only get into a document when they are allowed.
    ValkeyModule_Assert(ok);
}

void dom_serialize(const JDocument *doc, const bool allow_nan_and_infinity, rapidjson::StringBuffer &oss) {
    dom_serialize_value(doc->GetJValue(), allow_nan_and_infinity, oss);
}

const char *dom_kind_name(const JValue &val) {
    switch (val.GetType()) {
        case rapidjson::kNullType: return "null";
        case rapidjson::kFalseType:
        case rapidjson::kTrueType: return "bool";
        case rapidjson::kNumberType: return "number";
        case rapidjson::kStringType: return "string";
        case rapidjson::kArrayType: return "array";
        case rapidjson::kObjectType: return "object";
        default: ValkeyModule_Assert(false);
    }
    return "";
}

//
// Dump a JValue with redaction. Only kinds, sizes and addresses are written, never content.
//
STATIC void dump_redacted(std::ostream& os, const JValue &v, size_t level, int index) {
    for (size_t i = 0; i < (3 * level); ++i) os << ' ';  // Indent
    os << "@" << reinterpret_cast<const void *>(&v) << " ";
    if (index != -1) os << '[' << index << ']' << ' ';
    if (v.IsString()) {
        os << "String of length " << v.GetStringLength() << "\n";
    } else if (v.IsObject()) {
        os << "Object with " << v.MemberCount() << " Members\n";
        index = 0;
        for (auto m = v.MemberBegin(); m != v.MemberEnd(); ++m) {
            dump_redacted(os, m->value, level+1, index);
            index++;
        }
    } else if (v.IsArray()) {
        os << "Array with " << v.Size() << " Members\n";
        for (size_t i = 0; i < v.Size(); ++i) {
            dump_redacted(os, v[i], level+1, static_cast<int>(i));
        }
    } else {
        os << "<" << dom_kind_name(v) << ">\n";
    }
}

//
// This class creates an ostream to the Valkey Log. Each line of output is a single call to the ValkeyLog function
//
class ValkeyLogStreamBuf : public std::streambuf {
    std::string line;
    ValkeyModuleCtx *ctx;
    const char *level;

 public:
    ValkeyLogStreamBuf(ValkeyModuleCtx *_ctx, const char *_level) : ctx(_ctx), level(_level) {}
    ~ValkeyLogStreamBuf() {
        if (!line.empty()) {
            ValkeyModule_Log(ctx, level, "%s", line.c_str());
        }
    }
    std::streamsize xsputn(const char *p, std::streamsize n) override {
        for (std::streamsize i = 0; i < n; ++i) {
            overflow(p[i]);
        }
        return n;
    }
    int overflow(int c) override {
        if (c == '\n' || c == EOF) {
            ValkeyModule_Log(ctx, level, "%s", line.c_str());
            line.resize(0);
        } else {
            line += static_cast<char>(c);
        }
        return c;
    }
};

void dom_dump_redacted(const JValue &val, ValkeyModuleCtx *ctx, const char *level) {
    ValkeyLogStreamBuf b(ctx, level);
    std::ostream buf(&b);
    dump_redacted(buf, val, 0, -1);
}
