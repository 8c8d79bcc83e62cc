/**
 * Low-level memory interface. Every allocation made by the module, including STL containers, goes through
 * the memory_xxx function pointers so that it is charged to the Valkey allocator and counted in
 * memory_usage().
 */
#ifndef VALKEYJSONPATCH_MEMORY_H_
#define VALKEYJSONPATCH_MEMORY_H_

#include <stddef.h>

#include <vector>
#include <string>
#include <string_view>
#include <sstream>

//
// All functions in the module (outside of memory.cc) should use these to allocate memory
// instead of the ValkeyModule_xxxx functions.
//
extern void *(*memory_alloc)(size_t size);
extern void (*memory_free)(void *ptr);
extern void *(*memory_realloc)(void *orig_ptr, size_t new_size);

//
// Point the memory_xxx functions at the Valkey allocator. Must be called once the ValkeyModule_xxx
// pointers are resolved, i.e., from OnLoad or from the unit test harness.
//
void memory_init();

//
// Bytes currently allocated through memory_alloc.
//
size_t memory_usage();

//
// STL containers that allocate through memory_alloc.
//
namespace jp
{
template <typename T> class stl_allocator : public std::allocator<T> {
 public:
    typedef T value_type;
    stl_allocator() = default;
    stl_allocator(std::allocator<T>&) {}
    stl_allocator(std::allocator<T>&&) {}
    template <class U> constexpr stl_allocator(const stl_allocator<U>&) noexcept {}

    T *allocate(std::size_t n) { return static_cast<T *>(memory_alloc(n*sizeof(T))); }
    void deallocate(T *p, std::size_t n) { (void)n; memory_free(p); }
};

template<class Elm> using vector = std::vector<Elm, stl_allocator<Elm>>;

typedef std::basic_string<char, std::char_traits<char>, stl_allocator<char>> string;
typedef std::basic_stringstream<char, std::char_traits<char>, stl_allocator<char>> stringstream;

}  // namespace jp

#endif  // VALKEYJSONPATCH_MEMORY_H_
