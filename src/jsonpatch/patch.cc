#include "jsonpatch/patch.h"
#include "jsonpatch/jsonpatch.h"
#include <algorithm>
#include <functional>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

static const char *PATH_FILENAME = "<path>";
static const char *EXPR_FILENAME = "<expr>";

// Operation names in PatchOp order, starting at PATCH_APPEND.
static const struct {
    const char *name;
    bool needsValue;
} patchOps[] = {
    {"append", true},
    {"assert", false},
    {"clear", false},
    {"del", false},
    {"extend", true},
    {"insert", true},
    {"reverse", false},
    {"set", true},
    {"update", true},
};

STATIC JValue::MemberIterator find_member(JValue &obj, const JValue &name) {
    return obj.FindMember(name);
}

/**
 * Insert a value into an array at the given position, moving the value. Elements at and after pos shift right.
 */
STATIC void array_insert(JValue &arr, const size_t pos, JValue &value) {
    arr.PushBack(value, allocator);
    for (size_t i = arr.Size() - 1; i > pos; i--) {
        arr[static_cast<rapidjson::SizeType>(i)].Swap(arr[static_cast<rapidjson::SizeType>(i - 1)]);
    }
}

/**
 * Clamp an insert position into [0, size]. Negative positions count from the end.
 */
STATIC size_t insert_position(int64_t index, const size_t size) {
    int64_t len = static_cast<int64_t>(size);
    if (index < 0) {
        index += len;
        if (index < 0) index = 0;
    } else if (index > len) {
        index = len;
    }
    return static_cast<size_t>(index);
}

STATIC int64_t key_position(const Node &node) {
    if (node.key.type != NodeKey::INDEX || !node.container->IsArray()) return 0;
    int64_t index = node.key.index;
    return index < 0 ? index + static_cast<int64_t>(node.container->Size()) : index;
}

void patch_sort_descending(NodeList &nodes) {
    std::stable_sort(nodes.begin(), nodes.end(), [](const Node &a, const Node &b) {
        if (a.container != b.container) return std::greater<const JValue *>()(a.container, b.container);
        int64_t pa = key_position(a);
        int64_t pb = key_position(b);
        if (pa != pb) return pa > pb;
        return a.key.name > b.key.name;
    });
}

JsonPatchCode PatchExecutor::setError(const JsonPatchCode code, const std::string_view &detail) {
    error = code;
    errorDetail.assign(detail.data(), detail.length());
    positioned = false;
    return code;
}

/**
 * Take over the error of the last query. Syntax errors keep their position within the query text.
 */
JsonPatchCode PatchExecutor::setQueryError(const char *filename) {
    setError(selector.getError(), selector.getErrorDetail());
    if (jsonpatch_is_syntax_error(error)) {
        selector.makeDiagnostic(filename, diagnostic);
        positioned = true;
    }
    return error;
}

jp::string PatchExecutor::getErrorMessage() const {
    if (positioned) return jsonpatch_format_diagnostic(diagnostic);
    return jsonpatch_error_message(error, errorDetail);
}

JsonPatchCode PatchExecutor::apply(JDocument &doc, const JValue &operations, const QueryOptions &opts) {
    options = opts;
    failedIndex = 0;
    setError(JSONPATCH_SUCCESS);

    if (operations.IsObject()) return applyOperation(doc, operations);
    if (!operations.IsArray()) return setError(JSONPATCH_OPERATION_NOT_OBJECT, dom_kind_name(operations));

    for (rapidjson::SizeType i = 0; i < operations.Size(); i++) {
        failedIndex = i;
        const JValue &operation = operations[i];
        if (!operation.IsObject()) return setError(JSONPATCH_OPERATION_NOT_OBJECT, dom_kind_name(operation));
        JsonPatchCode rc = applyOperation(doc, operation);
        if (rc != JSONPATCH_SUCCESS) return rc;
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::getStringMember(const JValue &operation, const char *name, std::string_view &out) {
    auto it = operation.FindMember(name);
    if (it == operation.MemberEnd()) return setError(JSONPATCH_MISSING_MEMBER, name);
    if (!it->value.IsString()) return setError(JSONPATCH_MEMBER_NOT_STRING, name);
    out = std::string_view(it->value.GetString(), it->value.GetStringLength());
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::getValueMember(const JValue &operation, const JValue *&value) {
    auto it = operation.FindMember("value");
    if (it == operation.MemberEnd()) return setError(JSONPATCH_MISSING_MEMBER, "value");
    value = &it->value;
    return JSONPATCH_SUCCESS;
}

/**
 * Dereference a node whose key must exist.
 */
JsonPatchCode PatchExecutor::getNodeValue(const Node &node, JValue *&value) {
    if (!Selector::isPresent(node)) {
        if (node.key.type == NodeKey::PROPERTY) return setError(JSONPATCH_KEY_NOT_FOUND, node.key.name);
        return setError(JSONPATCH_INDEX_OUT_OF_ARRAY_BOUNDARIES);
    }
    value = &jsonpatch_node_value(node);
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::resolve(JDocument &doc, const std::string_view &path, const bool allow_slice,
                                     NodeList &nodes) {
    NodeList root;
    root.push_back(Node(&doc, NodeKey::makeIndex(0)));
    QueryOptions opts = options;
    opts.allowSlice = allow_slice;
    opts.mapping = false;
    opts.relative = false;
    if (selector.selectNodes(root, path, opts) != JSONPATCH_SUCCESS) return setQueryError(PATH_FILENAME);
    nodes = selector.getResultSet();
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::applyOperation(JDocument &doc, const JValue &operation) {
    std::string_view op_name;
    std::string_view path;
    JsonPatchCode rc = getStringMember(operation, "op", op_name);
    if (rc != JSONPATCH_SUCCESS) return rc;
    rc = getStringMember(operation, "path", path);
    if (rc != JSONPATCH_SUCCESS) return rc;

    PatchOp op = PATCH_UNKNOWN;
    bool needs_value = false;
    for (size_t i = 0; i < sizeof(patchOps) / sizeof(patchOps[0]); i++) {
        if (op_name == patchOps[i].name) {
            op = static_cast<PatchOp>(PATCH_APPEND + i);
            needs_value = patchOps[i].needsValue;
            break;
        }
    }
    if (op == PATCH_UNKNOWN) return setError(JSONPATCH_UNKNOWN_OPERATION, op_name);

    const JValue *value = nullptr;
    std::string_view expr;
    if (needs_value) {
        rc = getValueMember(operation, value);
        if (rc != JSONPATCH_SUCCESS) return rc;
    } else if (op == PATCH_ASSERT) {
        rc = getStringMember(operation, "expr", expr);
        if (rc != JSONPATCH_SUCCESS) return rc;
    }

    NodeList nodes;
    rc = resolve(doc, path, op == PATCH_DEL || op == PATCH_SET, nodes);
    if (rc != JSONPATCH_SUCCESS) return rc;

    if (jsonpatch_is_instrument_enabled_patch()) {
        ValkeyModule_Log(nullptr, "warning", "applying patch op %.*s at path %.*s to %zu nodes of doc %p",
                         static_cast<int>(op_name.length()), op_name.data(),
                         static_cast<int>(path.length()), path.data(), nodes.size(), static_cast<void *>(&doc));
    }

    switch (op) {
        case PATCH_APPEND: rc = append(nodes, *value); break;
        case PATCH_ASSERT: rc = assertFilter(nodes, expr); break;
        case PATCH_CLEAR: rc = clear(nodes); break;
        case PATCH_DEL: rc = del(doc, nodes); break;
        case PATCH_EXTEND: rc = extend(nodes, *value); break;
        case PATCH_INSERT: rc = insert(doc, nodes, *value); break;
        case PATCH_REVERSE: rc = reverse(nodes); break;
        case PATCH_SET: rc = set(nodes, *value); break;
        case PATCH_UPDATE: rc = update(nodes, *value); break;
        default: ValkeyModule_Assert(false);
    }

    if (rc != JSONPATCH_SUCCESS && jsonpatch_is_instrument_enabled_patch()) {
        ValkeyModule_Log(nullptr, "warning", "patch op %.*s failed with code %d, document structure:",
                         static_cast<int>(op_name.length()), op_name.data(), static_cast<int>(rc));
        dom_dump_redacted(doc.GetJValue(), nullptr, "warning");
    }
    return rc;
}

JsonPatchCode PatchExecutor::append(const NodeList &nodes, const JValue &value) {
    for (auto &node : nodes) {
        JValue *target;
        JsonPatchCode rc = getNodeValue(node, target);
        if (rc != JSONPATCH_SUCCESS) return rc;
        if (!target->IsArray()) return setError(JSONPATCH_JSON_ELEMENT_NOT_ARRAY, dom_kind_name(*target));
        JValue copy(value, allocator);
        target->PushBack(copy, allocator);
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::extend(const NodeList &nodes, const JValue &value) {
    if (!value.IsArray()) return setError(JSONPATCH_VALUE_NOT_ARRAY, dom_kind_name(value));
    for (auto &node : nodes) {
        JValue *target;
        JsonPatchCode rc = getNodeValue(node, target);
        if (rc != JSONPATCH_SUCCESS) return rc;
        if (!target->IsArray()) return setError(JSONPATCH_JSON_ELEMENT_NOT_ARRAY, dom_kind_name(*target));
        for (auto &v : value.GetArray()) {
            JValue copy(v, allocator);
            target->PushBack(copy, allocator);
        }
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::insert(JDocument &doc, NodeList &nodes, const JValue &value) {
    patch_sort_descending(nodes);
    for (auto &node : nodes) {
        if (node.container == &doc) return setError(JSONPATCH_CANNOT_MODIFY_ROOT);
        if (!node.container->IsArray()) return setError(JSONPATCH_JSON_ELEMENT_NOT_ARRAY,
                                                        dom_kind_name(*node.container));
        JValue copy(value, allocator);
        array_insert(*node.container, insert_position(node.key.index, node.container->Size()), copy);
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::set(const NodeList &nodes, const JValue &value) {
    for (auto &node : nodes) {
        JValue &c = *node.container;
        switch (node.key.type) {
            case NodeKey::PROPERTY: {
                JValue name(node.key.name.c_str(), static_cast<rapidjson::SizeType>(node.key.name.length()),
                            allocator);
                JValue copy(value, allocator);
                auto it = find_member(c, name);
                if (it != c.MemberEnd()) {
                    it->value = copy;
                } else {
                    c.AddMember(name, copy, allocator);
                }
                break;
            }
            case NodeKey::INDEX: {
                JValue *target;
                JsonPatchCode rc = getNodeValue(node, target);
                if (rc != JSONPATCH_SUCCESS) return rc;
                JValue copy(value, allocator);
                *target = copy;
                break;
            }
            case NodeKey::SLICE: {
                if (!value.IsArray()) return setError(JSONPATCH_VALUE_NOT_ARRAY, dom_kind_name(value));
                int64_t first, step;
                size_t count;
                JsonPatchCode rc = node.key.slice.indices(c.Size(), first, step, count);
                if (rc != JSONPATCH_SUCCESS) return setError(rc);
                if (step == 1) {
                    // Replace the range, which may grow or shrink the array.
                    size_t begin = static_cast<size_t>(first);
                    size_t end = begin + count;
                    JValue result(rapidjson::kArrayType);
                    result.Reserve(static_cast<rapidjson::SizeType>(c.Size() - count + value.Size()), allocator);
                    for (size_t i = 0; i < begin; i++) result.PushBack(c[static_cast<rapidjson::SizeType>(i)],
                                                                       allocator);
                    for (auto &v : value.GetArray()) {
                        JValue copy(v, allocator);
                        result.PushBack(copy, allocator);
                    }
                    for (size_t i = end; i < c.Size(); i++) result.PushBack(c[static_cast<rapidjson::SizeType>(i)],
                                                                            allocator);
                    c.Swap(result);
                } else {
                    if (value.Size() != count) {
                        jp::stringstream ss;
                        ss << "value has " << value.Size() << " elements, slice has " << count;
                        return setError(JSONPATCH_SLICE_SIZE_MISMATCH, ss.str());
                    }
                    for (size_t k = 0; k < count; k++) {
                        int64_t i = first + static_cast<int64_t>(k) * step;
                        JValue copy(value[static_cast<rapidjson::SizeType>(k)], allocator);
                        c[static_cast<rapidjson::SizeType>(i)] = copy;
                    }
                }
                break;
            }
        }
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::clear(const NodeList &nodes) {
    for (auto &node : nodes) {
        JValue *target;
        JsonPatchCode rc = getNodeValue(node, target);
        if (rc != JSONPATCH_SUCCESS) return rc;
        if (target->IsObject()) {
            target->RemoveAllMembers();
        } else if (target->IsArray()) {
            target->Clear();
        } else {
            return setError(JSONPATCH_NOT_A_CONTAINER, dom_kind_name(*target));
        }
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::del(JDocument &doc, NodeList &nodes) {
    patch_sort_descending(nodes);
    for (auto &node : nodes) {
        if (node.container == &doc) return setError(JSONPATCH_CANNOT_MODIFY_ROOT);
        JValue &c = *node.container;
        switch (node.key.type) {
            case NodeKey::PROPERTY: {
                JValue name(rapidjson::StringRef(node.key.name.c_str(),
                                                 static_cast<rapidjson::SizeType>(node.key.name.length())));
                auto it = find_member(c, name);
                if (it == c.MemberEnd()) return setError(JSONPATCH_KEY_NOT_FOUND, node.key.name);
                c.EraseMember(it);
                break;
            }
            case NodeKey::INDEX: {
                JValue *target;
                JsonPatchCode rc = getNodeValue(node, target);
                if (rc != JSONPATCH_SUCCESS) return rc;
                c.Erase(target);
                break;
            }
            case NodeKey::SLICE: {
                int64_t first, step;
                size_t count;
                JsonPatchCode rc = node.key.slice.indices(c.Size(), first, step, count);
                if (rc != JSONPATCH_SUCCESS) return setError(rc);
                if (count == 0) break;
                // Erase from the highest index down so the pending indexes stay valid.
                int64_t last = first + static_cast<int64_t>(count - 1) * step;
                int64_t lo = std::min(first, last);
                int64_t incr = step < 0 ? -step : step;
                for (int64_t k = static_cast<int64_t>(count) - 1; k >= 0; k--) {
                    c.Erase(c.Begin() + (lo + k * incr));
                }
                break;
            }
        }
    }
    return JSONPATCH_SUCCESS;
}

JsonPatchCode PatchExecutor::reverse(const NodeList &nodes) {
    for (auto &node : nodes) {
        JValue *target;
        JsonPatchCode rc = getNodeValue(node, target);
        if (rc != JSONPATCH_SUCCESS) return rc;
        if (!target->IsArray()) return setError(JSONPATCH_JSON_ELEMENT_NOT_ARRAY, dom_kind_name(*target));
        rapidjson::SizeType size = target->Size();
        for (rapidjson::SizeType i = 0; i < size / 2; i++) {
            (*target)[i].Swap((*target)[size - 1 - i]);
        }
    }
    return JSONPATCH_SUCCESS;
}

/**
 * Existing keys keep their position and take the new value, new keys are appended in the value's order.
 */
JsonPatchCode PatchExecutor::update(const NodeList &nodes, const JValue &value) {
    if (!value.IsObject()) return setError(JSONPATCH_VALUE_NOT_OBJECT, dom_kind_name(value));
    for (auto &node : nodes) {
        JValue *target;
        JsonPatchCode rc = getNodeValue(node, target);
        if (rc != JSONPATCH_SUCCESS) return rc;
        if (!target->IsObject()) return setError(JSONPATCH_JSON_ELEMENT_NOT_OBJECT, dom_kind_name(*target));
        for (auto m = value.MemberBegin(); m != value.MemberEnd(); ++m) {
            JValue copy(m->value, allocator);
            auto it = find_member(*target, m->name);
            if (it != target->MemberEnd()) {
                it->value = copy;
            } else {
                JValue name(m->name, allocator);
                target->AddMember(name, copy, allocator);
            }
        }
    }
    return JSONPATCH_SUCCESS;
}

/**
 * The filter runs over the addressed nodes and must keep all of them, in the same order.
 */
JsonPatchCode PatchExecutor::assertFilter(const NodeList &nodes, const std::string_view &expr) {
    QueryOptions opts = options;
    opts.allowSlice = false;
    opts.mapping = false;
    opts.relative = true;
    if (selector.filterNodes(nodes, expr, opts) != JSONPATCH_SUCCESS) return setQueryError(EXPR_FILENAME);
    if (selector.getResultSet() != nodes) {
        jp::stringstream ss;
        ss << selector.getResultSet().size() << " of " << nodes.size() << " nodes matched";
        return setError(JSONPATCH_ASSERTION_FAILED, ss.str());
    }
    return JSONPATCH_SUCCESS;
}
