/***
 * Name: objkit::rt (Runtime API)
 * Purpose: Boxed-object runtime: heap objects with a type-tagged header, managed by a
 *          precise mark-sweep collector with an explicit root set.
 * Theory of Operation:
 *   - Every object is an opaque handle (void*) pointing at its payload; the header
 *     preceding the payload carries the TypeTag used for runtime type identity.
 *   - nullptr is the null value. Accessors are total: a null handle or an
 *     out-of-range index yields a zero value and mutators ignore it.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "runtime/TypeTag.h"
#include "runtime/GCStats.h"
#include "runtime/GC.h"

namespace objkit::rt {
    // Type identity; std::nullopt for a null handle
    std::optional<TypeTag> type_of(void *obj);

    // String objects (opaque, UTF-8 bytes plus trailing NUL)
    void *string_new(const char *data, std::size_t len);

    // String length in bytes
    std::size_t string_len(void *str);

    const char *string_data(void *str);

    void *string_from_cstr(const char *cstr);

    // Unicode code point length helper
    std::size_t string_charlen(void *str);

    // Content equality; two null handles compare equal
    bool string_eq(void *a, void *b);

    // True when the string is empty or holds only ASCII whitespace
    bool string_is_blank(void *str);

    // Boxed primitives (opaque heap objects with value payloads)
    void *box_bool(bool value);

    bool box_bool_value(void *obj);

    void *box_byte(int8_t value);

    int8_t box_byte_value(void *obj);

    void *box_short(int16_t value);

    int16_t box_short_value(void *obj);

    void *box_int(int32_t value);

    int32_t box_int_value(void *obj);

    void *box_long(int64_t value);

    int64_t box_long_value(void *obj);

    void *box_float(float value);

    float box_float_value(void *obj);

    void *box_double(double value);

    double box_double_value(void *obj);

    void *box_char(char32_t value);

    char32_t box_char_value(void *obj);

    // List operations (opaque list of ptr values)
    void *list_new(std::size_t capacity);

    // Appends elem; reallocates when full and stores the new list in *list_slot
    void list_push_slot(void **list_slot, void *elem);

    std::size_t list_len(void *list);

    void *list_get(void *list, std::size_t index);

    void list_set(void *list, std::size_t index, void *value);

    // Dict operations (opaque hash map from ptr->ptr; string keys also match by content)
    void *dict_new(std::size_t capacity);

    void dict_set(void **dict_slot, void *key, void *value);

    void *dict_get(void *dict, void *key);

    std::size_t dict_len(void *dict);

    // Object operations (fixed-size field table of ptr values)
    void *object_new(std::size_t field_count);

    void object_set(void *obj, std::size_t index, void *value);

    void *object_get(void *obj, std::size_t index);

    std::size_t object_field_count(void *obj);

    // Arrays (fixed length, zero initialised, elements stored unboxed for primitive kinds)
    void *array_new(ElementKind kind, std::size_t len);

    std::size_t array_len(void *arr);

    std::optional<ElementKind> array_element_kind(void *arr);

    bool array_is_primitive(void *arr);

    // Integral kinds: Bool, Byte, Short, Int, Long, Char. Stores narrow to the element width.
    void array_set_long(void *arr, std::size_t index, int64_t value);

    int64_t array_get_long(void *arr, std::size_t index);

    // Floating kinds: Float, Double
    void array_set_double(void *arr, std::size_t index, double value);

    double array_get_double(void *arr, std::size_t index);

    // Ref kind only
    void array_set_ref(void *arr, std::size_t index, void *value);

    void *array_get_ref(void *arr, std::size_t index);
} // namespace objkit::rt
