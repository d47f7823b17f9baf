// objkit runtime C API for external embedders (C-compatible)
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// GC controls
void objkit_gc_collect(void);
void objkit_gc_set_threshold(size_t bytes);
void objkit_gc_register_root(void** addr);
void objkit_gc_unregister_root(void** addr);

// Boxing
void* objkit_box_bool(bool v);
void* objkit_box_int(int32_t v);
void* objkit_box_long(int64_t v);
void* objkit_box_double(double v);

// Strings
void* objkit_string_new(const char* data, size_t len);
uint64_t objkit_string_len(void* s);

// Lists
void* objkit_list_new(uint64_t cap);
void objkit_list_push(void** list_slot, void* elem);
uint64_t objkit_list_len(void* list);

// Arrays; element_kind uses the ElementKind numbering, unknown kinds return NULL
void* objkit_array_new(uint32_t element_kind, uint64_t len);
uint64_t objkit_array_len(void* arr);

#ifdef __cplusplus
}
#endif

// Object inspection (C linkage). Predicates return 1/0.
#ifdef __cplusplus
extern "C" {
#endif
int objkit_is_null_or_empty(void* value);
void* objkit_default_if_null_or_empty(void* value, void* default_value);
int objkit_is_boolean(void* value);
int objkit_is_integer(void* value);
int objkit_is_array(void* value); // -1 for a NULL handle
#ifdef __cplusplus
}
#endif
