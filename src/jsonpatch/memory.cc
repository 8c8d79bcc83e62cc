#include <stdlib.h>
#include <string.h>

#include <atomic>

#include "jsonpatch/memory.h"

extern "C" {
#define VALKEYMODULE_EXPERIMENTAL_API
#include <./include/valkeymodule.h>
}

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

void *(*memory_alloc)(size_t size);
void (*memory_free)(void *ptr);
void *(*memory_realloc)(void *orig_ptr, size_t new_size);

static std::atomic<size_t> totalMemoryUsage;

size_t memory_usage() {
    return totalMemoryUsage;
}

STATIC void *memory_alloc_tracked(size_t size) {
    void *ptr = ValkeyModule_Alloc(size);
    totalMemoryUsage += ValkeyModule_MallocSize(ptr);
    return ptr;
}

STATIC void memory_free_tracked(void *ptr) {
    if (!ptr) return;
    size_t sz = ValkeyModule_MallocSize(ptr);
    ValkeyModule_Assert(sz <= totalMemoryUsage);
    totalMemoryUsage -= sz;
    ValkeyModule_Free(ptr);
}

STATIC void *memory_realloc_tracked(void *ptr, size_t new_size) {
    if (ptr) {
        size_t old_size = ValkeyModule_MallocSize(ptr);
        ValkeyModule_Assert(old_size <= totalMemoryUsage);
        totalMemoryUsage -= old_size;
    }
    ptr = ValkeyModule_Realloc(ptr, new_size);
    totalMemoryUsage += ValkeyModule_MallocSize(ptr);
    return ptr;
}

void memory_init() {
    memory_alloc = memory_alloc_tracked;
    memory_free = memory_free_tracked;
    memory_realloc = memory_realloc_tracked;
}
