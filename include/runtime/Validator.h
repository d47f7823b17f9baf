/***
 * Name: objkit::rt emptiness predicate
 * Purpose: Library-wide notion of "null or empty" for runtime values.
 * Theory of Operation:
 *   - null is empty.
 *   - String: empty when blank (no bytes, or ASCII whitespace only).
 *   - List, Dict, Array: empty when the length is zero.
 *   - Boxed scalars and Objects are never empty.
 */
#pragma once

namespace objkit::rt {
    bool is_null_or_empty(void *value);

    bool is_not_null_or_empty(void *value);
} // namespace objkit::rt
