#include "jsonpatch/memory.h"
#include "jsonpatch/alloc.h"

void *dom_alloc(size_t size) {
    return memory_alloc(size);
}

void dom_free(void *ptr) {
    memory_free(ptr);
}

void *dom_realloc(void *orig_ptr, size_t new_size) {
    // rapidjson shrinks to zero through Realloc, treat that as a free.
    if (new_size == 0 && orig_ptr != nullptr) {
        dom_free(orig_ptr);
        return nullptr;
    }
    if (orig_ptr == nullptr) return dom_alloc(new_size);
    return memory_realloc(orig_ptr, new_size);
}
