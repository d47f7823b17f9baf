/***
 * Name: objkit::rt::TypeTag, ElementKind
 * Purpose: Tags used by the runtime to identify heap object kinds and array element kinds.
 */
#pragma once

#include <cstdint>

namespace objkit::rt {
    enum class TypeTag : uint32_t {
        String = 1,
        Bool = 2,
        Byte = 3,
        Short = 4,
        Int = 5, // 32-bit signed
        Long = 6, // 64-bit signed
        Float = 7,
        Double = 8,
        Char = 9,
        List = 10,
        Dict = 11,
        Object = 12,
        Array = 13
    };

    enum class ElementKind : uint32_t {
        Bool = 1,
        Byte = 2,
        Short = 3,
        Int = 4,
        Long = 5,
        Float = 6,
        Double = 7,
        Char = 8,
        Ref = 9 // handles to other runtime objects
    };

    // Stable lower-case name for logs and diagnostics ("int", "array", ...).
    const char *type_name(TypeTag tag);
} // namespace objkit::rt
