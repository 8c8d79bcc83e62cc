/**
 * This file implements the Valkey Module interfaces.
 *
 * When the module is loaded, it does the following:
 * 1. register the JSONPATCH module.
 * 2. register the module configs.
 * 3. register commands that are all prefixed with "JSONPATCH.".
 *
 * Documents are ordinary Valkey string keys holding JSON text. Every command decodes the document, works on the
 * decoded tree and, for JSONPATCH.APPLY, stores the re-encoded tree back into the key.
 *
 * Design Considerations:
 * 1. Query evaluation is delegated to the Selector, patching to the PatchExecutor.
 * 2. Shared utility/helper code should reside in the UTIL module.
 * 3. The first line of every command handler should be: "ValkeyModule_AutoMemory(ctx);". This is for enabling
 *    auto memory management for the command.
 * 4. Every write command must support replication. Call "ValkeyModule_ReplicateVerbatim(ctx)" to tell Valkey to
 *    replicate the command.
 *
 * Coding Conventions & Best Practices:
 * 1. Every command handler is named as Command_JsonPatchXXX, where XXX is command name.
 * 2. Command arguments processing code is separated out into helper structs named as XXXCmdArgs, and helper
 *    methods named as parseXXXCmdArgs, where XXX is command name.
 */

#include "jsonpatch/jsonpatch.h"
#include "jsonpatch/dom.h"
#include "jsonpatch/literal.h"
#include "jsonpatch/selector.h"
#include "jsonpatch/patch.h"
#include "jsonpatch/rapidjson_includes.h"
#include "jsonpatch/memory.h"
#include <climits>
#include <cstring>
#include <memory>
#include <strings.h>

#define MODULE_VERSION 10000
#define MODULE_NAME "jsonpatch"

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

static const char *DOCUMENT_FILENAME = "<document>";
static const char *PATCH_FILENAME = "<patch>";
static const char *QUERY_FILENAME = "<query>";

// module config params

#define DEFAULT_MAX_PARSER_RECURSION_DEPTH 200
static size_t config_max_parser_recursion_depth = DEFAULT_MAX_PARSER_RECURSION_DEPTH;

#define DEFAULT_MAX_QUERY_STRING_SIZE (128 * 1024)  // 128KB
static size_t config_max_query_string_size = DEFAULT_MAX_QUERY_STRING_SIZE;

static int config_allow_nan_and_infinity = 0;
static int config_use_decimal = 0;

// instrumentation configs
static int instrument_enabled_patch = 0;

size_t jsonpatch_get_max_parser_recursion_depth() {
    return config_max_parser_recursion_depth;
}

size_t jsonpatch_get_max_query_string_size() {
    return config_max_query_string_size;
}

bool jsonpatch_is_allow_nan_and_infinity() {
    return config_allow_nan_and_infinity == 1;
}

bool jsonpatch_is_use_decimal() {
    return config_use_decimal == 1;
}

bool jsonpatch_is_instrument_enabled_patch() {
    return instrument_enabled_patch == 1;
}

#define REGISTER_BOOL_CONFIG(ctx, name, default_val, privdata, getfn, setfn) { \
    if (ValkeyModule_RegisterBoolConfig(ctx, name, default_val, VALKEYMODULE_CONFIG_DEFAULT, \
        getfn, setfn, nullptr, privdata) == VALKEYMODULE_ERR) { \
        ValkeyModule_Log(ctx, "warning", "Failed to register module config \"%s\".", name); \
        return VALKEYMODULE_ERR; \
    } \
}

#define REGISTER_NUMERIC_CONFIG(ctx, name, default_val, flag, min, max, privdata, getfn, setfn) { \
    if (ValkeyModule_RegisterNumericConfig(ctx, name, default_val, flag, min, max, \
        getfn, setfn, nullptr, privdata) == VALKEYMODULE_ERR ) { \
        ValkeyModule_Log(ctx, "warning", "Failed to register module config \"%s\".", name); \
        return VALKEYMODULE_ERR; \
    } \
}

/* ============================== Helper Methods ============================== */

typedef std::unique_ptr<JDocument, void (*)(JDocument*)> DocumentPtr;

/* Reply with a positioned error, e.g. "SYNTAXERR Expecting value (<query>, line 1, column 6)". */
STATIC int reply_with_diagnostic(ValkeyModuleCtx *ctx, const SyntaxDiagnostic &diag) {
    jp::string msg = jsonpatch_format_diagnostic(diag);
    return ValkeyModule_ReplyWithError(ctx, msg.c_str());
}

STATIC int reply_with_code(ValkeyModuleCtx *ctx, const JsonPatchCode code, const std::string_view &detail) {
    jp::string msg = jsonpatch_error_message(code, detail);
    return ValkeyModule_ReplyWithError(ctx, msg.c_str());
}

/* Reply with the error of a failed query. Syntax errors carry their position within the query. */
STATIC int reply_with_query_error(ValkeyModuleCtx *ctx, const Selector &selector) {
    if (jsonpatch_is_syntax_error(selector.getError())) {
        SyntaxDiagnostic diag;
        selector.makeDiagnostic(QUERY_FILENAME, diag);
        return reply_with_diagnostic(ctx, diag);
    }
    return reply_with_code(ctx, selector.getError(), selector.getErrorDetail());
}

/* Open the key and decode the JSON document it holds.
 * @param key - OUTPUT parameter, pointer to ValkeyModuleKey pointer.
 * @param doc - OUTPUT parameter, the decoded document.
 * @param diag - OUTPUT parameter, filled if the document is not valid JSON.
 */
STATIC JsonPatchCode load_document(ValkeyModuleCtx *ctx, ValkeyModuleString *rmKey, const bool readOnly,
                                   ValkeyModuleKey **key, DocumentPtr &doc, SyntaxDiagnostic &diag) {
    *key = static_cast<ValkeyModuleKey*>(ValkeyModule_OpenKey(ctx, rmKey,
                                        readOnly?  VALKEYMODULE_READ : VALKEYMODULE_READ | VALKEYMODULE_WRITE));
    int type = ValkeyModule_KeyType(*key);
    if (type == VALKEYMODULE_KEYTYPE_EMPTY) return JSONPATCH_DOCUMENT_KEY_NOT_FOUND;
    if (type != VALKEYMODULE_KEYTYPE_STRING) return JSONPATCH_NOT_A_STRING_KEY;

    size_t len;
    const char *json = ValkeyModule_StringDMA(*key, &len, VALKEYMODULE_READ);
    JDocument *parsed;
    JsonPatchCode rc = dom_parse(json, len, jsonpatch_is_allow_nan_and_infinity(), DOCUMENT_FILENAME, &parsed,
                                 diag);
    if (rc != JSONPATCH_SUCCESS) return rc;
    doc.reset(parsed);
    return JSONPATCH_SUCCESS;
}

STATIC int reply_with_load_error(ValkeyModuleCtx *ctx, const JsonPatchCode rc, const SyntaxDiagnostic &diag) {
    if (rc == JSONPATCH_JSON_PARSE_ERROR) return reply_with_diagnostic(ctx, diag);
    return ValkeyModule_ReplyWithError(ctx, jsonpatch_code_to_message(rc));
}

/* Reply with the key half of a node: an integer, a property name or the slice text "start:stop:step". */
STATIC void reply_with_node_key(ValkeyModuleCtx *ctx, const NodeKey &key) {
    switch (key.type) {
        case NodeKey::PROPERTY:
            ValkeyModule_ReplyWithStringBuffer(ctx, key.name.c_str(), key.name.length());
            break;
        case NodeKey::INDEX:
            if (key.index == INT64_MIN) {
                ValkeyModule_ReplyWithSimpleString(ctx, "start");
            } else if (key.index == INT64_MAX) {
                ValkeyModule_ReplyWithSimpleString(ctx, "end");
            } else {
                ValkeyModule_ReplyWithLongLong(ctx, key.index);
            }
            break;
        case NodeKey::SLICE: {
            jp::stringstream ss;
            if (key.slice.hasStart) ss << key.slice.start;
            ss << ":";
            if (key.slice.hasStop) ss << key.slice.stop;
            ss << ":";
            if (key.slice.hasStep) ss << key.slice.step;
            jp::string text = ss.str();
            ValkeyModule_ReplyWithStringBuffer(ctx, text.c_str(), text.length());
            break;
        }
    }
}

/* ============================= Command Arguments ============================ */

typedef struct {
    ValkeyModuleString *key;
    const char *patch;
    size_t patch_len;
} ApplyCmdArgs;

STATIC JsonPatchCode parseApplyCmdArgs(ValkeyModuleString **argv, const int argc, ApplyCmdArgs *args) {
    memset(args, 0, sizeof(ApplyCmdArgs));
    if (argc != 3) return JSONPATCH_WRONG_NUM_ARGS;
    args->key = argv[1];
    args->patch = ValkeyModule_StringPtrLen(argv[2], &args->patch_len);
    return JSONPATCH_SUCCESS;
}

typedef struct {
    ValkeyModuleString *key;
    std::string_view query;
    bool allow_slice;
} SelectCmdArgs;

STATIC JsonPatchCode parseSelectCmdArgs(ValkeyModuleString **argv, const int argc, SelectCmdArgs *args) {
    args->key = nullptr;
    args->allow_slice = false;
    if (argc < 3 || argc > 4) return JSONPATCH_WRONG_NUM_ARGS;
    args->key = argv[1];
    size_t len;
    const char *query = ValkeyModule_StringPtrLen(argv[2], &len);
    args->query = std::string_view(query, len);
    if (argc == 4) {
        const char *opt = ValkeyModule_StringPtrLen(argv[3], &len);
        if (strcasecmp(opt, "ALLOWSLICE") != 0) return JSONPATCH_COMMAND_SYNTAX_ERROR;
        args->allow_slice = true;
    }
    return JSONPATCH_SUCCESS;
}

/* ============================= Command Handlers ============================= */

/**
 * JSONPATCH.APPLY <key> <patch-json>
 */
int Command_JsonPatchApply(ValkeyModuleCtx *ctx, ValkeyModuleString **argv, int argc) {
    ValkeyModule_AutoMemory(ctx);

    ApplyCmdArgs args;
    JsonPatchCode rc = parseApplyCmdArgs(argv, argc, &args);
    if (rc == JSONPATCH_WRONG_NUM_ARGS) return ValkeyModule_WrongArity(ctx);

    ValkeyModuleKey *key;
    DocumentPtr doc(nullptr, dom_free_doc);
    SyntaxDiagnostic diag;
    rc = load_document(ctx, args.key, false, &key, doc, diag);
    if (rc != JSONPATCH_SUCCESS) return reply_with_load_error(ctx, rc, diag);

    JParser parser;
    rc = dom_parse_value(args.patch, args.patch_len, jsonpatch_is_allow_nan_and_infinity(), PATCH_FILENAME, parser,
                         diag);
    if (rc != JSONPATCH_SUCCESS) return reply_with_diagnostic(ctx, diag);

    PatchExecutor executor;
    rc = executor.apply(*doc, parser.GetJValue(), QueryOptions::fromConfig());
    if (rc != JSONPATCH_SUCCESS) {
        jp::string msg = executor.getErrorMessage();
        return ValkeyModule_ReplyWithError(ctx, msg.c_str());
    }

    rapidjson::StringBuffer oss;
    dom_serialize(doc.get(), jsonpatch_is_allow_nan_and_infinity(), oss);
    ValkeyModuleString *value = ValkeyModule_CreateString(ctx, oss.GetString(), oss.GetSize());
    if (ValkeyModule_StringSet(key, value) == VALKEYMODULE_ERR) {
        return ValkeyModule_ReplyWithError(ctx, jsonpatch_code_to_message(JSONPATCH_NOT_A_STRING_KEY));
    }

    ValkeyModule_ReplicateVerbatim(ctx);
    return ValkeyModule_ReplyWithSimpleString(ctx, "OK");
}

/**
 * JSONPATCH.SELECT <key> <query> [ALLOWSLICE]
 *
 * Reply: an array of [container-json, key] pairs, one per selected node.
 */
int Command_JsonPatchSelect(ValkeyModuleCtx *ctx, ValkeyModuleString **argv, int argc) {
    ValkeyModule_AutoMemory(ctx);

    SelectCmdArgs args;
    JsonPatchCode rc = parseSelectCmdArgs(argv, argc, &args);
    if (rc != JSONPATCH_SUCCESS) {
        if (rc == JSONPATCH_WRONG_NUM_ARGS)
            return ValkeyModule_WrongArity(ctx);
        else
            return ValkeyModule_ReplyWithError(ctx, jsonpatch_code_to_message(rc));
    }

    ValkeyModuleKey *key;
    DocumentPtr doc(nullptr, dom_free_doc);
    SyntaxDiagnostic diag;
    rc = load_document(ctx, args.key, true, &key, doc, diag);
    if (rc != JSONPATCH_SUCCESS) return reply_with_load_error(ctx, rc, diag);

    QueryOptions options = QueryOptions::fromConfig();
    options.allowSlice = args.allow_slice;
    NodeList root;
    root.push_back(Node(doc.get(), NodeKey::makeIndex(0)));
    Selector selector;
    rc = selector.selectNodes(root, args.query, options);
    if (rc != JSONPATCH_SUCCESS) return reply_with_query_error(ctx, selector);

    const NodeList &nodes = selector.getResultSet();
    ValkeyModule_ReplyWithArray(ctx, nodes.size());
    for (auto &node : nodes) {
        ValkeyModule_ReplyWithArray(ctx, 2);
        rapidjson::StringBuffer oss;
        dom_serialize_value(*node.container, options.allowNanAndInfinity, oss);
        ValkeyModule_ReplyWithStringBuffer(ctx, oss.GetString(), oss.GetSize());
        reply_with_node_key(ctx, node.key);
    }
    return VALKEYMODULE_OK;
}

/**
 * JSONPATCH.FILTER <key> <filter>
 *
 * Reply: the number of document nodes kept by the filter, 0 or 1.
 */
int Command_JsonPatchFilter(ValkeyModuleCtx *ctx, ValkeyModuleString **argv, int argc) {
    ValkeyModule_AutoMemory(ctx);
    if (argc != 3) return ValkeyModule_WrongArity(ctx);

    ValkeyModuleKey *key;
    DocumentPtr doc(nullptr, dom_free_doc);
    SyntaxDiagnostic diag;
    JsonPatchCode rc = load_document(ctx, argv[1], true, &key, doc, diag);
    if (rc != JSONPATCH_SUCCESS) return reply_with_load_error(ctx, rc, diag);

    size_t len;
    const char *query = ValkeyModule_StringPtrLen(argv[2], &len);
    QueryOptions options = QueryOptions::fromConfig();
    options.relative = true;
    NodeList root;
    root.push_back(Node(doc.get(), NodeKey::makeIndex(0)));
    Selector selector;
    rc = selector.filterNodes(root, std::string_view(query, len), options);
    if (rc != JSONPATCH_SUCCESS) return reply_with_query_error(ctx, selector);
    return ValkeyModule_ReplyWithLongLong(ctx, selector.getResultSet().size());
}

/**
 * JSONPATCH.VALUE <literal>
 *
 * Reply: the JSON encoding of the literal.
 */
int Command_JsonPatchValue(ValkeyModuleCtx *ctx, ValkeyModuleString **argv, int argc) {
    ValkeyModule_AutoMemory(ctx);
    if (argc != 2) return ValkeyModule_WrongArity(ctx);

    size_t len;
    const char *text = ValkeyModule_StringPtrLen(argv[1], &len);
    QueryValue value;
    SyntaxDiagnostic diag;
    JsonPatchCode rc = jsonpatch_load_query_value(std::string_view(text, len), QueryOptions::fromConfig(), value,
                                                  diag);
    if (rc != JSONPATCH_SUCCESS) {
        diag.filename = QUERY_FILENAME;
        return reply_with_diagnostic(ctx, diag);
    }

    rapidjson::StringBuffer oss;
    literal_serialize(value, oss);
    return ValkeyModule_ReplyWithStringBuffer(ctx, oss.GetString(), oss.GetSize());
}

/* ================================ Module Configs ============================ */

int Config_GetBoolConfig(const char *name, void *privdata) {
    VALKEYMODULE_NOT_USED(name);
    return *static_cast<int*>(privdata);
}

int Config_SetBoolConfig(const char *name, int val, void *privdata, ValkeyModuleString **err) {
    VALKEYMODULE_NOT_USED(name);
    VALKEYMODULE_NOT_USED(err);
    *static_cast<int*>(privdata) = val;
    return VALKEYMODULE_OK;
}

long long Config_GetSizeConfig(const char *name, void *privdata) {
    VALKEYMODULE_NOT_USED(name);
    return *static_cast<size_t*>(privdata);
}

int Config_SetSizeConfig(const char *name, long long val, void *privdata, ValkeyModuleString **err) {
    VALKEYMODULE_NOT_USED(name);
    VALKEYMODULE_NOT_USED(err);
    *static_cast<size_t*>(privdata) = val;
    return VALKEYMODULE_OK;
}

int registerModuleConfigs(ValkeyModuleCtx *ctx) {
    REGISTER_BOOL_CONFIG(ctx, "allow-nan-and-infinity", 0, &config_allow_nan_and_infinity,
                         Config_GetBoolConfig, Config_SetBoolConfig)
    REGISTER_BOOL_CONFIG(ctx, "use-decimal", 0, &config_use_decimal,
                         Config_GetBoolConfig, Config_SetBoolConfig)
    REGISTER_BOOL_CONFIG(ctx, "enable-instrument-patch", 0, &instrument_enabled_patch,
                         Config_GetBoolConfig, Config_SetBoolConfig)

    REGISTER_NUMERIC_CONFIG(ctx, "max-parser-recursion-depth", DEFAULT_MAX_PARSER_RECURSION_DEPTH,
                            VALKEYMODULE_CONFIG_DEFAULT, 0, INT_MAX, &config_max_parser_recursion_depth,
                            Config_GetSizeConfig, Config_SetSizeConfig)
    REGISTER_NUMERIC_CONFIG(ctx, "max-query-string-size", DEFAULT_MAX_QUERY_STRING_SIZE,
                            VALKEYMODULE_CONFIG_DEFAULT, 0, INT_MAX, &config_max_query_string_size,
                            Config_GetSizeConfig, Config_SetSizeConfig)

    ValkeyModule_LoadConfigs(ctx);
    return VALKEYMODULE_OK;
}

/* ================================ Module OnLoad ============================= */

STATIC bool create_command(ValkeyModuleCtx *ctx, const char *name, ValkeyModuleCmdFunc handler, const char *flags,
                           const char *categories) {
    if (ValkeyModule_CreateCommand(ctx, name, handler, flags, 1, 1, 1) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to create command %s.", name);
        return false;
    }
    if (ValkeyModule_SetCommandACLCategories(ValkeyModule_GetCommand(ctx, name), categories) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to set command category for %s.", name);
        return false;
    }
    return true;
}

extern "C" int ValkeyModule_OnLoad(ValkeyModuleCtx *ctx) {
    // Register the module
    if (ValkeyModule_Init(ctx, MODULE_NAME, MODULE_VERSION, VALKEYMODULE_APIVER_1) == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to initialize module %s version %d", MODULE_NAME, MODULE_VERSION);
        return VALKEYMODULE_ERR;
    }

    memory_init();
    literal_init();

    const char *cmdflg_readonly        = "fast readonly";
    const char *cmdflg_slow_write_deny = "write deny-oom";
    char jsonpatch_category[] = "jsonpatch";

    if (ValkeyModule_AddACLCategory(ctx, jsonpatch_category) == VALKEYMODULE_ERR)
        return VALKEYMODULE_ERR;

    const char *cat_readonly        = "jsonpatch read fast";
    const char *cat_slow_write_deny = "jsonpatch write slow";

    // Register commands
    if (!create_command(ctx, "JSONPATCH.APPLY", Command_JsonPatchApply, cmdflg_slow_write_deny,
                        cat_slow_write_deny)) return VALKEYMODULE_ERR;
    if (!create_command(ctx, "JSONPATCH.SELECT", Command_JsonPatchSelect, cmdflg_readonly, cat_readonly))
        return VALKEYMODULE_ERR;
    if (!create_command(ctx, "JSONPATCH.FILTER", Command_JsonPatchFilter, cmdflg_readonly, cat_readonly))
        return VALKEYMODULE_ERR;

    // JSONPATCH.VALUE takes no key
    if (ValkeyModule_CreateCommand(ctx, "JSONPATCH.VALUE", Command_JsonPatchValue, cmdflg_readonly, 0, 0, 0)
        == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to create command JSONPATCH.VALUE.");
        return VALKEYMODULE_ERR;
    }
    if (ValkeyModule_SetCommandACLCategories(ValkeyModule_GetCommand(ctx, "JSONPATCH.VALUE"), cat_readonly)
        == VALKEYMODULE_ERR) {
        ValkeyModule_Log(ctx, "warning", "Failed to set command category for JSONPATCH.VALUE.");
        return VALKEYMODULE_ERR;
    }

    if (registerModuleConfigs(ctx) == VALKEYMODULE_ERR) return VALKEYMODULE_ERR;

    return VALKEYMODULE_OK;
}
