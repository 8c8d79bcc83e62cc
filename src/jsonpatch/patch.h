/**
 * Patch executor. Applies an ordered list of patch operations to a document.
 *
 * A patch operation is a JSON object:
 *   {"op": "<name>", "path": "<absolute query>", "value": <any>, "expr": "<filter>"}
 * where "value" is required by append, extend, insert, set and update, and "expr" by assert. The operations
 * are given either as a single object or as an array of objects.
 *
 *   append   push a copy of value onto each addressed array
 *   assert   fail unless the filter expr keeps every addressed node, in order
 *   clear    remove every member or element of each addressed object or array
 *   del      remove each addressed entry, slices allowed
 *   extend   push a copy of each element of the array value onto each addressed array
 *   insert   insert a copy of value at each addressed array position
 *   reverse  reverse each addressed array in place
 *   set      replace each addressed entry, slices allowed, missing object keys are created
 *   update   merge the members of the object value into each addressed object
 *
 * Each path is resolved against the current state of the document, starting from the root wrapper. del and
 * insert process the addressed nodes in reverse order so that an edit at a higher index never shifts a lower
 * index that is still pending. Operations are not atomic: when operation k fails, operations before k stay
 * applied.
 */
#ifndef VALKEYJSONPATCH_PATCH_H_
#define VALKEYJSONPATCH_PATCH_H_

#include "jsonpatch/dom.h"
#include "jsonpatch/selector.h"

class PatchExecutor {
 public:
    PatchExecutor()
            : selector()
            , options()
            , failedIndex(0)
            , error(JSONPATCH_SUCCESS)
            , errorDetail()
            , diagnostic()
            , positioned(false)
    {}

    /**
     * Apply the operations to the document.
     * @param operations - an operation object or an array of them
     * @param opts - literal settings used by path and expr queries
     * @return JSONPATCH_SUCCESS, or the code of the first failing operation
     */
    JsonPatchCode apply(JDocument &doc, const JValue &operations, const QueryOptions &opts);

    JsonPatchCode getError() const { return error; }
    const jp::string& getErrorDetail() const { return errorDetail; }
    // Position of the failing operation within the operation list.
    size_t getFailedIndex() const { return failedIndex; }
    // True if the error is a syntax error of a path or expr, with a diagnostic.
    bool hasDiagnostic() const { return positioned; }
    const SyntaxDiagnostic& getDiagnostic() const { return diagnostic; }
    // Error text for the reply, positioned errors include line and column.
    jp::string getErrorMessage() const;

 private:
    PatchExecutor(const PatchExecutor&);             // disable copy constructor
    PatchExecutor& operator=(const PatchExecutor&);  // disable assignment operator

    enum PatchOp {
        PATCH_UNKNOWN = 0,
        PATCH_APPEND,
        PATCH_ASSERT,
        PATCH_CLEAR,
        PATCH_DEL,
        PATCH_EXTEND,
        PATCH_INSERT,
        PATCH_REVERSE,
        PATCH_SET,
        PATCH_UPDATE
    };

    JsonPatchCode applyOperation(JDocument &doc, const JValue &operation);
    JsonPatchCode resolve(JDocument &doc, const std::string_view &path, const bool allow_slice, NodeList &nodes);
    JsonPatchCode getStringMember(const JValue &operation, const char *name, std::string_view &out);
    JsonPatchCode getValueMember(const JValue &operation, const JValue *&value);
    JsonPatchCode getNodeValue(const Node &node, JValue *&value);

    JsonPatchCode append(const NodeList &nodes, const JValue &value);
    JsonPatchCode extend(const NodeList &nodes, const JValue &value);
    JsonPatchCode insert(JDocument &doc, NodeList &nodes, const JValue &value);
    JsonPatchCode set(const NodeList &nodes, const JValue &value);
    JsonPatchCode clear(const NodeList &nodes);
    JsonPatchCode del(JDocument &doc, NodeList &nodes);
    JsonPatchCode reverse(const NodeList &nodes);
    JsonPatchCode update(const NodeList &nodes, const JValue &value);
    JsonPatchCode assertFilter(const NodeList &nodes, const std::string_view &expr);

    JsonPatchCode setError(const JsonPatchCode code, const std::string_view &detail = std::string_view());
    JsonPatchCode setQueryError(const char *filename);

    Selector selector;
    QueryOptions options;
    size_t failedIndex;
    JsonPatchCode error;
    jp::string errorDetail;
    SyntaxDiagnostic diagnostic;
    bool positioned;
};

/**
 * Order nodes for removal and insertion: descending by container, then by position inside the container.
 * Negative indexes count from the end. Earlier positions stay valid while later ones are modified.
 */
void patch_sort_descending(NodeList &nodes);

#endif  // VALKEYJSONPATCH_PATCH_H_
