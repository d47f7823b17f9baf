/**
 * @file
 * @brief Object header layout shared by runtime translation units.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include "runtime/TypeTag.h"

namespace objkit::rt::detail {

struct ObjectHeader {
  uint32_t mark{0};
  uint32_t tag{0};
  std::size_t size{0}; // total allocation size including header
  ObjectHeader* next{nullptr};
};

inline ObjectHeader* header_of(void* obj) {
  return reinterpret_cast<ObjectHeader*>(static_cast<unsigned char*>(obj) - sizeof(ObjectHeader)); // NOLINT
}

inline TypeTag tag_of(void* obj) { return static_cast<TypeTag>(header_of(obj)->tag); }

// Debug tracing switch (OBJKIT_RT_DEBUG), refreshed by gc_reset_for_tests()
bool debug_enabled();

}
