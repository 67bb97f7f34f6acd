#include "core.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

[[noreturn]] void Fail(const char* message) {
  std::fprintf(stderr, "arx runtime error: %s\n", message);
  std::fflush(stdout);
  std::exit(1);
}

auto AllocateOrFail(std::size_t size) -> void* {
  void* memory = std::malloc(size == 0 ? 1 : size);
  if (memory == nullptr) {
    Fail("out of memory");
  }
  return memory;
}

template <typename T>
auto DuplicateFormatted(const char* format, T value) -> char* {
  int size = std::snprintf(nullptr, 0, format, value);
  if (size < 0) {
    Fail("cannot format value");
  }
  auto* buffer =
      static_cast<char*>(AllocateOrFail(static_cast<std::size_t>(size) + 1));
  std::snprintf(buffer, static_cast<std::size_t>(size) + 1, format, value);
  return buffer;
}

}  // namespace

extern "C" {

auto core_list_create(
    void* data, int32_t length, int32_t element_size, bool is_pointer)
    -> ArxList* {
  if (length < 0 || element_size < 0) {
    Fail("invalid list dimensions");
  }
  auto* list = static_cast<ArxList*>(AllocateOrFail(sizeof(ArxList)));
  list->data = data;
  list->length = length;
  list->element_size = element_size;
  list->reserved = 0;
  list->is_pointer = is_pointer;
  return list;
}

auto core_list_len(const ArxList* list) -> int32_t {
  if (list == nullptr) {
    Fail("length of a null list");
  }
  return list->length;
}

auto core_list_get(const ArxList* list, int32_t index) -> void* {
  if (list == nullptr) {
    Fail("index into a null list");
  }
  if (index < 0 || index >= list->length) {
    std::fprintf(
        stderr, "arx runtime error: list index %d out of range [0, %d)\n",
        index, list->length);
    std::fflush(stdout);
    std::exit(1);
  }
  auto* slot = static_cast<char*>(list->data) +
               static_cast<std::ptrdiff_t>(index) * list->element_size;
  if (list->is_pointer) {
    void* stored = nullptr;
    std::memcpy(&stored, slot, sizeof(stored));
    return stored;
  }
  return slot;
}

auto core_string_equal(const char* lhs, const char* rhs) -> bool {
  if (lhs == nullptr || rhs == nullptr) {
    return lhs == rhs;
  }
  return std::strcmp(lhs, rhs) == 0;
}

auto core_string_concat(const char* lhs, const char* rhs) -> char* {
  std::size_t lhs_len = lhs == nullptr ? 0 : std::strlen(lhs);
  std::size_t rhs_len = rhs == nullptr ? 0 : std::strlen(rhs);
  auto* out = static_cast<char*>(AllocateOrFail(lhs_len + rhs_len + 1));
  if (lhs_len != 0) {
    std::memcpy(out, lhs, lhs_len);
  }
  if (rhs_len != 0) {
    std::memcpy(out + lhs_len, rhs, rhs_len);
  }
  out[lhs_len + rhs_len] = '\0';
  return out;
}

auto core_string_length(const char* text) -> int32_t {
  return text == nullptr ? 0 : static_cast<int32_t>(std::strlen(text));
}

auto core_int_to_string(int32_t value) -> char* {
  return DuplicateFormatted("%d", value);
}

auto core_float_to_string(double value) -> char* {
  return DuplicateFormatted("%g", value);
}

void core_print_str(const char* text) {
  std::printf("%s\n", text == nullptr ? "" : text);
}

void core_print_int(int32_t value) {
  std::printf("%d\n", value);
}

void core_print_float(double value) {
  std::printf("%g\n", value);
}

void core_print_bool(bool value) {
  std::printf("%s\n", value ? "true" : "false");
}

}  // extern "C"
