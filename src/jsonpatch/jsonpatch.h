#ifndef VALKEYJSONPATCH_JSONPATCH_H_
#define VALKEYJSONPATCH_JSONPATCH_H_

#include <stddef.h>

size_t jsonpatch_get_max_parser_recursion_depth();
size_t jsonpatch_get_max_query_string_size();

bool jsonpatch_is_allow_nan_and_infinity();
bool jsonpatch_is_use_decimal();

bool jsonpatch_is_instrument_enabled_patch();

#endif  // VALKEYJSONPATCH_JSONPATCH_H_
