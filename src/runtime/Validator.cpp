/***
 * Name: objkit::rt emptiness predicate (impl)
 * Purpose: Decide whether a runtime value is null or empty.
 */
#include "runtime/Validator.h"
#include "runtime/Runtime.h"

namespace objkit::rt {

bool is_null_or_empty(void* value) {
  const auto tag = type_of(value);
  if (!tag) { return true; }
  switch (*tag) {
    case TypeTag::String: return string_is_blank(value);
    case TypeTag::List: return list_len(value) == 0U;
    case TypeTag::Dict: return dict_len(value) == 0U;
    case TypeTag::Array: return array_len(value) == 0U;
    default: return false;
  }
}

bool is_not_null_or_empty(void* value) { return !is_null_or_empty(value); }

} // namespace objkit::rt
