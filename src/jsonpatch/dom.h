/**
 * DOM (Document Object Model) interface for JSON.
 * The DOM module provides the following functions:
 * 1. Parsing and validating an input JSON string buffer into a document (the decoder).
 * 2. Serializing a value back into a JSON string (the encoder).
 * 3. Small value helpers shared by the selector and the patch executor.
 *
 * Design Considerations:
 * 1. Memory management: All memory management must be handled by the JSON allocator.
 *    - For memories allocated by our own code, use dom_alloc, dom_free and dom_realloc.
 *    - For objects allocated by RapidJSON, a custom allocator class is passed as template argument, so that
 *      RapidJSON allocates through the JSON allocator under the hood.
 * 2. Interface methods should not have Valkey module types such as ValkeyModuleCtx or ValkeyModuleString,
 *    because that would make unit tests hard to write. Logging helpers are the exception.
 *
 * Coding Conventions & Best Practices:
 * 1. Error handling: If a method may fail, the return type should be enum JsonPatchCode.
 * 2. Output parameters: Output parameters should be placed at the end and are initialized by the method.
 * 3. Every public interface method declared in this file should be prefixed with "dom_".
 */

#ifndef VALKEYJSONPATCH_DOM_H_
#define VALKEYJSONPATCH_DOM_H_

#include <stdlib.h>
#include <string_view>
#include "jsonpatch/util.h"
#include "jsonpatch/alloc.h"
#include "jsonpatch/rapidjson_includes.h"

extern "C" {
#define VALKEYMODULE_EXPERIMENTAL_API
#include <./include/valkeymodule.h>
}

/**
 * This is a custom allocator for RapidJSON. It delegates memory management to the JSON allocator, so that
 * memory allocated by the underlying RapidJSON library is correctly reported to the Valkey engine.
 */
class RapidJsonAllocator {
 public:
    RapidJsonAllocator();

    void *Malloc(size_t size) {
        return dom_alloc(size);
    }

    void *Realloc(void *originalPtr, size_t /*originalSize*/, size_t newSize) {
        return dom_realloc(originalPtr, newSize);
    }

    static void Free(void *ptr) RAPIDJSON_NOEXCEPT {
        dom_free(ptr);
    }

    bool operator==(const RapidJsonAllocator&) const RAPIDJSON_NOEXCEPT {
        return true;
    }

    bool operator!=(const RapidJsonAllocator&) const RAPIDJSON_NOEXCEPT {
        return false;
    }

    static const bool kNeedFree = true;
};

/**
 * We wrap the RapidJSON objects (RJxxxxx) with our own objects (Jxxxxx) to hide the allocator plumbing.
 *
 *  RJValue (JValue):   A JSON value, a node of the tree. Many of the RapidJSON value functions require an
 *                      allocator. You must use the global "allocator".
 *
 *  RJParser (JParser): Holds a JValue into which a JSON string is parsed. Typically created on the run-time
 *                      stack, filled by Parse and then moved into its destination.
 *
 *  JDocument:          The root wrapper. A one-element array holding the whole document at index 0, so that
 *                      the document itself is addressable as (root wrapper, 0) and can be replaced in place.
 */
typedef rapidjson::GenericValue<rapidjson::UTF8<>, RapidJsonAllocator> RJValue;
// A JValue is an RJValue without any local augmentation of change.
typedef RJValue JValue;

extern RapidJsonAllocator allocator;

struct JDocument : JValue {
    JDocument() : JValue(rapidjson::kArrayType) {
        PushBack(JValue(), allocator);
    }
    JValue& GetJValue() { return (*this)[0]; }
    const JValue& GetJValue() const { return (*this)[0]; }
    // Moves rhs into the document, rhs is left null.
    void SetJValue(JValue &rhs) { (*this)[0] = rhs; }
    void *operator new(size_t size) { return dom_alloc(size); }
    void operator delete(void *ptr) { return dom_free(ptr); }

 private:
    void *operator new[](size_t);       // Not defined anywhere, causes link error if used
    void operator delete[](void *);     // Not defined anywhere, causes link error if used
};

typedef rapidjson::GenericDocument<rapidjson::UTF8<>, RapidJsonAllocator> RJParser;

/**
 * A JParser privately inherits from RJParser, which inherits from RJValue. You must use the
 * GetJValue() member to access the post Parse value.
 */
struct JParser : RJParser {
    JParser() : RJParser(&allocator) {}
    //
    // Make these inner routines publicly visible
    //
    using RJParser::HasParseError;
    using RJParser::GetParseError;
    using RJParser::GetErrorOffset;
    // Access the contained JValue
    JValue& GetJValue() { return *this; }
    //
    // Parse with full precision. NaN and Infinity are accepted only when allowed.
    //
    JParser& Parse(const char *json, size_t len, const bool allow_nan_and_infinity);
};

/* Parse input JSON string, validate syntax, and return a document object.
 * The input string does not have to be NULL terminated.
 *
 * @param filename - name reported in the diagnostic, may be nullptr.
 * @param doc - OUTPUT param, pointer to document pointer. The caller is responsible for calling
 *        dom_free_doc(JDocument*) to free the memory after it's consumed.
 * @param diag - OUTPUT param, filled with the position and message of a syntax error.
 * @return JSONPATCH_SUCCESS for success, JSONPATCH_JSON_PARSE_ERROR for failure.
 */
JsonPatchCode dom_parse(const char *json_buf, const size_t buf_len, const bool allow_nan_and_infinity,
                        const char *filename, JDocument **doc, SyntaxDiagnostic &diag);

/* Parse a JSON string into a parser object living on the caller's stack. Same error contract as dom_parse. */
JsonPatchCode dom_parse_value(const char *json_buf, const size_t buf_len, const bool allow_nan_and_infinity,
                              const char *filename, JParser &parser, SyntaxDiagnostic &diag);

/* Free a document object */
void dom_free_doc(JDocument *doc);

/**
 * Serialize a value into the given string buffer, in compact format.
 * @param oss - output stream
 */
void dom_serialize_value(const JValue &val, const bool allow_nan_and_infinity, rapidjson::StringBuffer &oss);

/**
 * Serialize a document (the wrapped value, not the root wrapper) into the given string buffer.
 */
void dom_serialize(const JDocument *doc, const bool allow_nan_and_infinity, rapidjson::StringBuffer &oss);

/**
 * Name of the kind of a value: "null", "bool", "number", "string", "array" or "object".
 */
const char *dom_kind_name(const JValue &val);

/**
 * Dump the structure of a value to the Valkey log, one line per value. Strings and numbers are redacted,
 * only kinds and sizes are logged.
 */
void dom_dump_redacted(const JValue &val, ValkeyModuleCtx *ctx, const char *level);

#endif  // VALKEYJSONPATCH_DOM_H_
