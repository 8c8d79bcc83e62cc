/**
 * The DOM allocator. rapidjson values, documents and the decimal literals created while evaluating queries
 * are allocated here, on top of the tracked memory_xxx functions.
 */
#ifndef VALKEYJSONPATCH_ALLOC_H_
#define VALKEYJSONPATCH_ALLOC_H_

#include <stddef.h>

#include "jsonpatch/memory.h"

void *dom_alloc(size_t size);
void dom_free(void *ptr);
void *dom_realloc(void *orig_ptr, size_t new_size);

#endif  // VALKEYJSONPATCH_ALLOC_H_
