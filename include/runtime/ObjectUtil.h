/***
 * Name: objkit::rt object inspection helpers
 * Purpose: Defaulting and exact type-identity checks over runtime handles.
 * Theory of Operation:
 *   - Type checks compare the header tag exactly; a Long is not an Int and a List is
 *     not an Array.
 *   - is_boolean/is_integer accept null and answer false. is_array treats null as a
 *     caller error and throws InvalidArgumentError; callers rely on that distinction.
 */
#pragma once

namespace objkit::rt {
    // Returns default_value when value is null or empty (see Validator.h), value otherwise.
    void *default_if_null_or_empty(void *value, void *default_value);

    bool is_boolean(void *value);

    // 32-bit Int only; Byte, Short, Long and floating boxes do not match.
    bool is_integer(void *value);

    // Any element kind, primitive or Ref. Throws exceptions::InvalidArgumentError on null.
    bool is_array(void *value);
} // namespace objkit::rt
