/***
 * Name: objkit::rt object inspection helpers (impl)
 * Purpose: Defaulting on null/empty and exact tag checks over runtime handles.
 */
#include "runtime/ObjectUtil.h"
#include "runtime/Runtime.h"
#include "runtime/Validator.h"
#include "runtime/c_api.h"
#include "runtime/detail/RuntimeIntrospection.h"
#include "objkit/exceptions/invalid_argument_error.h"
#include <cstdio>

namespace objkit::rt {

void* default_if_null_or_empty(void* value, void* default_value) {
  return is_not_null_or_empty(value) ? value : default_value;
}

bool is_boolean(void* value) { return type_of(value) == TypeTag::Bool; }

bool is_integer(void* value) { return type_of(value) == TypeTag::Int; }

bool is_array(void* value) {
  if (value == nullptr) {
    if (detail::debug_enabled()) { std::fprintf(stderr, "[runtime] is_array: rejected null object\n"); }
    throw exceptions::InvalidArgumentError("object can't be null!");
  }
  return detail::tag_of(value) == TypeTag::Array;
}

} // namespace objkit::rt

extern "C" int objkit_is_null_or_empty(void* value) { return ::objkit::rt::is_null_or_empty(value) ? 1 : 0; }
extern "C" void* objkit_default_if_null_or_empty(void* value, void* default_value) {
  return ::objkit::rt::default_if_null_or_empty(value, default_value);
}
extern "C" int objkit_is_boolean(void* value) { return ::objkit::rt::is_boolean(value) ? 1 : 0; }
extern "C" int objkit_is_integer(void* value) { return ::objkit::rt::is_integer(value) ? 1 : 0; }
// Null is checked here so the C++ exception never reaches a C caller
extern "C" int objkit_is_array(void* value) {
  if (value == nullptr) { return -1; }
  return ::objkit::rt::is_array(value) ? 1 : 0;
}
