#pragma once

#include <cstdint>

// Layout shared with the compiler's %List record:
// { i8* data, i32 length, i32 element_size, i64 reserved, i1 is_pointer }
struct ArxList {
  void* data;
  int32_t length;
  int32_t element_size;
  int64_t reserved;
  bool is_pointer;
};

extern "C" {

// Wraps an element buffer of `length` * `element_size` bytes. Takes
// ownership of `data`. `is_pointer` marks elements that are themselves
// pointers (strings, lists).
auto core_list_create(
    void* data, int32_t length, int32_t element_size, bool is_pointer)
    -> ArxList*;

auto core_list_len(const ArxList* list) -> int32_t;

// Address of element `index` for scalar lists; the stored pointer itself for
// pointer lists. Aborts the program on an out-of-range index.
auto core_list_get(const ArxList* list, int32_t index) -> void*;

auto core_string_equal(const char* lhs, const char* rhs) -> bool;

// Newly allocated concatenation. Never freed: the language has no
// deallocation.
auto core_string_concat(const char* lhs, const char* rhs) -> char*;

auto core_string_length(const char* text) -> int32_t;

auto core_int_to_string(int32_t value) -> char*;
auto core_float_to_string(double value) -> char*;

// Print the value followed by a newline.
void core_print_str(const char* text);
void core_print_int(int32_t value);
void core_print_float(double value);
void core_print_bool(bool value);
}
