/***
 * Name: objkit::rt (Runtime impl)
 * Purpose: Precise mark-sweep GC and the boxed, string, list, dict, object and array kinds.
 */
#include "runtime/All.h"
#include "runtime/detail/RuntimeIntrospection.h"
#include "runtime/c_api.h"
#include "objkit/exceptions/invalid_argument_error.h"
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <vector>

namespace objkit::rt {

using detail::ObjectHeader;
using detail::header_of;
using detail::tag_of;

// GC and runtime tuning constants
static constexpr std::size_t kDefaultListCapacity = 4;
static constexpr std::size_t kMinDictCapacity = 8;
static constexpr std::size_t kDefaultThresholdBytes = 1ULL << 20U;

struct StringPayload { std::size_t len{}; /* char data[] follows */ };
struct ArrayPayload { std::size_t kind{}; std::size_t len{}; /* element data[] follows */ };

static std::mutex g_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static ObjectHeader* g_head = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::vector<void**> g_roots; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static RuntimeStats g_stats; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

static std::size_t threshold_from_env() {
  const char* raw = std::getenv("OBJKIT_GC_THRESHOLD");
  if (raw == nullptr || *raw == '\0') { return kDefaultThresholdBytes; }
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(raw, &end, 10);
  if (end == raw || *end != '\0' || parsed == 0ULL) {
    std::fprintf(stderr, "[runtime] ignoring invalid OBJKIT_GC_THRESHOLD='%s'\n", raw);
    return kDefaultThresholdBytes;
  }
  return static_cast<std::size_t>(parsed);
}

static std::size_t g_threshold = threshold_from_env(); // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<bool> g_debug{std::getenv("OBJKIT_RT_DEBUG") != nullptr}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

bool detail::debug_enabled() { return g_debug.load(std::memory_order_relaxed); }

// Segregated free lists for small object sizes (total bytes including header)
static constexpr std::size_t kClassSizes[] = { 64, 128, 256, 512, 1024, 2048, 4096 };
static constexpr int kNumClasses = static_cast<int>(sizeof(kClassSizes) / sizeof(kClassSizes[0]));
static std::vector<ObjectHeader*> g_free_lists[kNumClasses]; // NOLINT

// Payload bytes for `fixed` header bytes plus `count` elements of `elem` bytes. Throws when the
// total allocation (object header included) would not fit in size_t.
static std::size_t checked_payload_size(const char* what, std::size_t fixed, std::size_t count, std::size_t elem) {
  constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
  if (count > (kMax - sizeof(ObjectHeader) - fixed) / elem) {
    throw exceptions::InvalidArgumentError(std::string(what) + ": length too large");
  }
  return fixed + (count * elem);
}

static inline int class_index_for(std::size_t total) {
  for (int i = 0; i < kNumClasses; ++i) { if (total <= kClassSizes[i]) return i; }
  return -1;
}

// Caller must hold g_mu. Freed blocks are reused only when their size class fits.
static void* alloc_raw(std::size_t size, TypeTag tag) {
  std::size_t total = sizeof(ObjectHeader) + size;
  unsigned char* mem = nullptr;
  const int ci = class_index_for(total);
  if (ci >= 0) {
    total = kClassSizes[ci];
    if (!g_free_lists[ci].empty()) {
      mem = reinterpret_cast<unsigned char*>(g_free_lists[ci].back()); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      g_free_lists[ci].pop_back();
    }
  }
  if (mem == nullptr) { mem = static_cast<unsigned char*>(::operator new(total)); }
  auto* header = reinterpret_cast<ObjectHeader*>(mem); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  header->mark = 0;
  header->tag = static_cast<uint32_t>(tag);
  header->size = total;
  header->next = g_head;
  g_head = header;
  g_stats.numAllocated++;
  g_stats.bytesAllocated += total;
  g_stats.bytesLive += total;
  g_stats.peakBytesLive = std::max(g_stats.peakBytesLive, g_stats.bytesLive);
  if (g_debug.load(std::memory_order_relaxed)) { std::fprintf(stderr, "[runtime] alloc tag=%s size=%zu\n", type_name(tag), total); }
  return mem + sizeof(ObjectHeader); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

static void free_obj(ObjectHeader* header) {
  g_stats.numFreed++;
  g_stats.bytesLive -= header->size;
  if (g_debug.load(std::memory_order_relaxed)) {
    std::fprintf(stderr, "[runtime] free_obj tag=%s size=%zu\n", type_name(static_cast<TypeTag>(header->tag)), header->size);
  }
  const int ci = class_index_for(header->size);
  if (ci >= 0) {
    g_free_lists[ci].push_back(header);
  } else {
    ::operator delete(header);
  }
}

static void* payload_of(ObjectHeader* header) {
  return reinterpret_cast<unsigned char*>(header) + sizeof(ObjectHeader); // NOLINT
}

static void* array_data(void* arr) {
  return static_cast<unsigned char*>(arr) + sizeof(ArrayPayload); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

// Per-tag helpers push interior handles onto the mark stack
static inline void push_children(ObjectHeader* header, std::vector<ObjectHeader*>& work) {
  auto push = [&work](void* child) {
    if (child == nullptr) { return; }
    ObjectHeader* h = header_of(child);
    if (h->mark == 0U) { h->mark = 1; work.push_back(h); }
  };
  auto* meta = static_cast<std::size_t*>(payload_of(header));
  switch (static_cast<TypeTag>(header->tag)) {
    case TypeTag::List: {
      const std::size_t len = meta[0];
      auto* const* items = reinterpret_cast<void* const*>(meta + 2); // NOLINT
      for (std::size_t i = 0; i < len; ++i) { push(items[i]); }
      break;
    }
    case TypeTag::Dict: {
      const std::size_t cap = meta[1];
      auto* const* keys = reinterpret_cast<void* const*>(meta + 3); // NOLINT
      auto* const* vals = keys + cap;
      for (std::size_t i = 0; i < cap; ++i) {
        if (keys[i] != nullptr) { push(keys[i]); push(vals[i]); }
      }
      break;
    }
    case TypeTag::Object: {
      const std::size_t fields = meta[0];
      auto* const* vals = reinterpret_cast<void* const*>(meta + 1); // NOLINT
      for (std::size_t i = 0; i < fields; ++i) { push(vals[i]); }
      break;
    }
    case TypeTag::Array: {
      auto* ap = static_cast<ArrayPayload*>(payload_of(header));
      if (static_cast<ElementKind>(ap->kind) != ElementKind::Ref) { break; }
      auto* const* items = static_cast<void* const*>(array_data(ap));
      for (std::size_t i = 0; i < ap->len; ++i) { push(items[i]); }
      break;
    }
    default:
      break; // no interior pointers
  }
}

static void mark_from_roots() {
  std::vector<ObjectHeader*> work;
  for (void* const* slot : g_roots) {
    void* const ptr = *slot;
    if (ptr == nullptr) { continue; }
    ObjectHeader* h = header_of(ptr);
    if (h->mark == 0U) { h->mark = 1; work.push_back(h); }
  }
  while (!work.empty()) {
    ObjectHeader* h = work.back();
    work.pop_back();
    push_children(h, work);
  }
}

static void sweep() {
  ObjectHeader* prev = nullptr; ObjectHeader* cur = g_head;
  std::size_t reclaimed = 0;
  while (cur != nullptr) {
    if (cur->mark == 0U) {
      ObjectHeader* dead = cur;
      cur = cur->next;
      if (prev != nullptr) { prev->next = cur; } else { g_head = cur; }
      reclaimed += dead->size;
      free_obj(dead);
    } else {
      cur->mark = 0; // clear for next cycle
      prev = cur;
      cur = cur->next;
    }
  }
  g_stats.lastReclaimedBytes = static_cast<uint64_t>(reclaimed);
}

static void collect_locked() {
  g_stats.numCollections++;
  mark_from_roots();
  sweep();
  if (g_debug.load(std::memory_order_relaxed)) {
    std::fprintf(stderr, "[runtime] gc cycle=%llu reclaimed=%llu live=%llu\n",
                 static_cast<unsigned long long>(g_stats.numCollections),
                 static_cast<unsigned long long>(g_stats.lastReclaimedBytes),
                 static_cast<unsigned long long>(g_stats.bytesLive));
  }
}

void gc_collect() {
  const std::lock_guard<std::mutex> lock(g_mu);
  collect_locked();
}

bool gc_maybe_collect() {
  const std::lock_guard<std::mutex> lock(g_mu);
  if (g_stats.bytesLive <= g_threshold) { return false; }
  collect_locked();
  return true;
}

void gc_set_threshold(std::size_t bytes) {
  const std::lock_guard<std::mutex> lock(g_mu);
  g_threshold = bytes;
}

std::size_t gc_threshold() {
  const std::lock_guard<std::mutex> lock(g_mu);
  return g_threshold;
}

void gc_register_root(void** addr) {
  if (addr == nullptr) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  g_roots.push_back(addr);
}

void gc_unregister_root(void** addr) {
  const std::lock_guard<std::mutex> lock(g_mu);
  auto iter = std::find(g_roots.begin(), g_roots.end(), addr);
  if (iter != g_roots.end()) { g_roots.erase(iter); }
}

RuntimeStats gc_stats() {
  const std::lock_guard<std::mutex> lock(g_mu);
  return g_stats;
}

void gc_reset_for_tests() {
  const std::lock_guard<std::mutex> lock(g_mu);
  ObjectHeader* cur = g_head; g_head = nullptr;
  while (cur != nullptr) { ObjectHeader* nextHeader = cur->next; ::operator delete(cur); cur = nextHeader; }
  for (auto& freeList : g_free_lists) {
    for (ObjectHeader* h : freeList) { ::operator delete(h); }
    freeList.clear();
  }
  g_roots.clear();
  g_stats = {};
  g_threshold = threshold_from_env();
  g_debug.store(std::getenv("OBJKIT_RT_DEBUG") != nullptr, std::memory_order_relaxed);
}

// Type identity
const char* type_name(TypeTag tag) {
  switch (tag) {
    case TypeTag::String: return "str";
    case TypeTag::Bool: return "bool";
    case TypeTag::Byte: return "byte";
    case TypeTag::Short: return "short";
    case TypeTag::Int: return "int";
    case TypeTag::Long: return "long";
    case TypeTag::Float: return "float";
    case TypeTag::Double: return "double";
    case TypeTag::Char: return "char";
    case TypeTag::List: return "list";
    case TypeTag::Dict: return "dict";
    case TypeTag::Object: return "object";
    case TypeTag::Array: return "array";
  }
  return "unknown";
}

std::optional<TypeTag> type_of(void* obj) {
  if (obj == nullptr) { return std::nullopt; }
  return tag_of(obj);
}

// Strings
void* string_new(const char* data, std::size_t len) {
  const std::lock_guard<std::mutex> lock(g_mu);
  const std::size_t payloadSize = sizeof(StringPayload) + len + 1; // include NUL
  auto* payloadBytes = static_cast<unsigned char*>(alloc_raw(payloadSize, TypeTag::String));
  auto* plen = reinterpret_cast<std::size_t*>(payloadBytes); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  *plen = len;
  char* buf = reinterpret_cast<char*>(plen + 1); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (len != 0U && data != nullptr) { std::memcpy(buf, data, len); }
  buf[len] = '\0'; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return payloadBytes;
}

std::size_t string_len(void* str) {
  if (str == nullptr) { return 0; }
  return *static_cast<std::size_t*>(str);
}

const char* string_data(void* str) {
  if (str == nullptr) { return nullptr; }
  auto* plen = static_cast<std::size_t*>(str);
  return reinterpret_cast<const char*>(plen + 1); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

void* string_from_cstr(const char* cstr) {
  if (cstr == nullptr) { return string_new("", 0); }
  return string_new(cstr, std::strlen(cstr));
}

static std::size_t utf8_codepoint_count(const char* data, std::size_t n) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < n; ) {
    const auto c = static_cast<unsigned char>(data[i]);
    if ((c & 0x80U) == 0) { ++i; ++count; continue; }
    if ((c & 0xE0U) == 0xC0U && (i+1)<n) { i += 2; ++count; continue; }
    if ((c & 0xF0U) == 0xE0U && (i+2)<n) { i += 3; ++count; continue; }
    if ((c & 0xF8U) == 0xF0U && (i+3)<n) { i += 4; ++count; continue; }
    ++i; ++count; // invalid, advance 1 byte
  }
  return count;
}

std::size_t string_charlen(void* str) {
  if (str == nullptr) { return 0; }
  return utf8_codepoint_count(string_data(str), string_len(str));
}

bool string_eq(void* a, void* b) {
  if (a == b) { return true; }
  if (a == nullptr || b == nullptr) { return false; }
  const std::size_t la = string_len(a);
  if (la != string_len(b)) { return false; }
  return la == 0 || std::memcmp(string_data(a), string_data(b), la) == 0;
}

bool string_is_blank(void* str) {
  const char* d = string_data(str);
  const std::size_t n = string_len(str);
  for (std::size_t i = 0; i < n; ++i) {
    switch (d[i]) {
      case ' ': case '\t': case '\n': case '\r': case '\f': case '\v': continue;
      default: return false;
    }
  }
  return true;
}

// Boxed primitives
template <typename T>
static void* box_value(T value, TypeTag tag) {
  const std::lock_guard<std::mutex> lock(g_mu);
  auto* bytes = static_cast<unsigned char*>(alloc_raw(sizeof(T), tag));
  std::memcpy(bytes, &value, sizeof(value));
  return bytes;
}

template <typename T>
static T unbox_value(void* obj) {
  if (obj == nullptr) { return T{}; }
  T out{}; std::memcpy(&out, obj, sizeof(out)); return out;
}

void* box_bool(bool value) { return box_value<uint8_t>(value ? 1U : 0U, TypeTag::Bool); }
bool box_bool_value(void* obj) { return unbox_value<uint8_t>(obj) != 0U; }
void* box_byte(int8_t value) { return box_value(value, TypeTag::Byte); }
int8_t box_byte_value(void* obj) { return unbox_value<int8_t>(obj); }
void* box_short(int16_t value) { return box_value(value, TypeTag::Short); }
int16_t box_short_value(void* obj) { return unbox_value<int16_t>(obj); }
void* box_int(int32_t value) { return box_value(value, TypeTag::Int); }
int32_t box_int_value(void* obj) { return unbox_value<int32_t>(obj); }
void* box_long(int64_t value) { return box_value(value, TypeTag::Long); }
int64_t box_long_value(void* obj) { return unbox_value<int64_t>(obj); }
void* box_float(float value) { return box_value(value, TypeTag::Float); }
float box_float_value(void* obj) { return unbox_value<float>(obj); }
void* box_double(double value) { return box_value(value, TypeTag::Double); }
double box_double_value(void* obj) { return unbox_value<double>(obj); }
void* box_char(char32_t value) { return box_value(value, TypeTag::Char); }
char32_t box_char_value(void* obj) { return unbox_value<char32_t>(obj); }

// Lists: [len, cap, items...]
static void* list_new_locked(std::size_t capacity) {
  const std::size_t payloadSize = checked_payload_size("list_new", sizeof(std::size_t) * 2, capacity, sizeof(void*));
  auto* bytes = static_cast<unsigned char*>(alloc_raw(payloadSize, TypeTag::List));
  auto* meta = reinterpret_cast<std::size_t*>(bytes); // NOLINT
  meta[0] = 0; meta[1] = capacity;
  auto** items = reinterpret_cast<void**>(meta + 2); // NOLINT
  for (std::size_t i = 0; i < capacity; ++i) { items[i] = nullptr; }
  return bytes;
}

void* list_new(std::size_t capacity) {
  const std::lock_guard<std::mutex> lock(g_mu);
  return list_new_locked(capacity);
}

void list_push_slot(void** list_slot, void* elem) {
  if (list_slot == nullptr) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  if (*list_slot == nullptr) { *list_slot = list_new_locked(kDefaultListCapacity); }
  auto* meta = static_cast<std::size_t*>(*list_slot);
  const std::size_t len = meta[0];
  const std::size_t cap = meta[1];
  auto** items = reinterpret_cast<void**>(meta + 2); // NOLINT
  if (len >= cap) {
    const std::size_t newCap = (cap == 0U) ? kDefaultListCapacity : (cap * 2U);
    void* grown = list_new_locked(newCap);
    auto* newMeta = static_cast<std::size_t*>(grown);
    auto** newItems = reinterpret_cast<void**>(newMeta + 2); // NOLINT
    for (std::size_t i = 0; i < len; ++i) { newItems[i] = items[i]; }
    newMeta[0] = len;
    *list_slot = grown;
    meta = newMeta; items = newItems;
  }
  items[len] = elem;
  meta[0] = len + 1;
}

std::size_t list_len(void* list) {
  if (list == nullptr) { return 0; }
  return static_cast<const std::size_t*>(list)[0];
}

void* list_get(void* list, std::size_t index) {
  if (list == nullptr) { return nullptr; }
  const auto* meta = static_cast<const std::size_t*>(list);
  if (index >= meta[0]) { return nullptr; }
  auto* const* items = reinterpret_cast<void* const*>(meta + 2); // NOLINT
  return items[index];
}

void list_set(void* list, std::size_t index, void* value) {
  if (list == nullptr) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  auto* meta = static_cast<std::size_t*>(list);
  if (index >= meta[0]) { return; }
  auto** items = reinterpret_cast<void**>(meta + 2); // NOLINT
  items[index] = value;
}

// Dicts: [len, cap, ver, keys[cap], vals[cap]], open addressing with linear probing.
// String keys hash and compare by content; every other key by pointer identity.
static std::size_t ptr_hash(void* p) {
  auto v = reinterpret_cast<std::uintptr_t>(p);
  v ^= v >> 33; v *= 0xff51afd7ed558ccdULL; v ^= v >> 33; v *= 0xc4ceb9fe1a85ec53ULL; v ^= v >> 33;
  return static_cast<std::size_t>(v);
}

static std::size_t key_hash(void* key) {
  if (key == nullptr || tag_of(key) != TypeTag::String) { return ptr_hash(key); }
  uint64_t h = 14695981039346656037ULL; // FNV-1a
  const char* d = string_data(key);
  for (std::size_t i = 0, n = string_len(key); i < n; ++i) {
    h ^= static_cast<unsigned char>(d[i]);
    h *= 1099511628211ULL;
  }
  return static_cast<std::size_t>(h);
}

static bool key_equal(void* a, void* b) {
  if (a == b) { return true; }
  if (a == nullptr || b == nullptr) { return false; }
  return tag_of(a) == TypeTag::String && tag_of(b) == TypeTag::String && string_eq(a, b);
}

static std::size_t round_up_pow2(std::size_t n) {
  constexpr std::size_t kTopBit = std::numeric_limits<std::size_t>::max() / 2 + 1;
  if (n > kTopBit) { throw exceptions::InvalidArgumentError("dict_new: capacity too large"); }
  std::size_t cap = kMinDictCapacity;
  while (cap < n) { cap <<= 1U; }
  return cap;
}

static void* dict_new_locked(std::size_t capacity) {
  capacity = round_up_pow2(capacity);
  const std::size_t payloadSize = checked_payload_size("dict_new", sizeof(std::size_t) * 3, capacity, 2 * sizeof(void*));
  auto* bytes = static_cast<unsigned char*>(alloc_raw(payloadSize, TypeTag::Dict));
  auto* meta = reinterpret_cast<std::size_t*>(bytes); // NOLINT
  meta[0] = 0; meta[1] = capacity; meta[2] = 0; // len, cap, ver
  auto** keys = reinterpret_cast<void**>(meta + 3); // NOLINT
  for (std::size_t i = 0; i < 2 * capacity; ++i) { keys[i] = nullptr; }
  return bytes;
}

void* dict_new(std::size_t capacity) {
  const std::lock_guard<std::mutex> lock(g_mu);
  return dict_new_locked(capacity);
}

// Null keys are not storable: a null key slot marks an empty bucket.
static void dict_insert_locked(void* dict, void* key, void* value) {
  auto* meta = static_cast<std::size_t*>(dict);
  const std::size_t cap = meta[1];
  auto** keys = reinterpret_cast<void**>(meta + 3); // NOLINT
  auto** vals = keys + cap;
  std::size_t idx = key_hash(key) & (cap - 1);
  while (keys[idx] != nullptr && !key_equal(keys[idx], key)) { idx = (idx + 1) & (cap - 1); }
  if (keys[idx] == nullptr) { meta[0]++; }
  keys[idx] = key;
  vals[idx] = value;
  meta[2]++;
}

void dict_set(void** dict_slot, void* key, void* value) {
  if (dict_slot == nullptr || key == nullptr) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  if (*dict_slot == nullptr) { *dict_slot = dict_new_locked(kMinDictCapacity); }
  auto* meta = static_cast<std::size_t*>(*dict_slot);
  const std::size_t len = meta[0];
  const std::size_t cap = meta[1];
  // grow if load factor > 0.7
  if ((len + 1) * 10 > cap * 7) {
    void* grown = dict_new_locked(cap * 2);
    auto** keys = reinterpret_cast<void**>(meta + 3); // NOLINT
    auto** vals = keys + cap;
    for (std::size_t i = 0; i < cap; ++i) {
      if (keys[i] != nullptr) { dict_insert_locked(grown, keys[i], vals[i]); }
    }
    static_cast<std::size_t*>(grown)[2] = meta[2] + 1;
    *dict_slot = grown;
  }
  dict_insert_locked(*dict_slot, key, value);
}

void* dict_get(void* dict, void* key) {
  if (dict == nullptr || key == nullptr) { return nullptr; }
  auto* meta = static_cast<std::size_t*>(dict);
  const std::size_t cap = meta[1];
  auto** keys = reinterpret_cast<void**>(meta + 3); // NOLINT
  auto** vals = keys + cap;
  std::size_t idx = key_hash(key) & (cap - 1);
  for (std::size_t steps = 0; steps < cap; ++steps) {
    void* k = keys[idx];
    if (k == nullptr) { break; }
    if (key_equal(k, key)) { return vals[idx]; }
    idx = (idx + 1) & (cap - 1);
  }
  return nullptr;
}

std::size_t dict_len(void* dict) {
  if (dict == nullptr) { return 0; }
  return static_cast<const std::size_t*>(dict)[0];
}

// Objects (fixed-size field table)
void* object_new(std::size_t field_count) {
  const std::lock_guard<std::mutex> lock(g_mu);
  const std::size_t payloadSize = checked_payload_size("object_new", sizeof(std::size_t), field_count, sizeof(void*));
  auto* bytes = static_cast<unsigned char*>(alloc_raw(payloadSize, TypeTag::Object));
  auto* meta = reinterpret_cast<std::size_t*>(bytes); // NOLINT
  meta[0] = field_count;
  auto** vals = reinterpret_cast<void**>(meta + 1); // NOLINT
  for (std::size_t i = 0; i < field_count; ++i) { vals[i] = nullptr; }
  return bytes;
}

void object_set(void* obj, std::size_t index, void* value) {
  if (obj == nullptr) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  auto* meta = static_cast<std::size_t*>(obj);
  if (index >= meta[0]) { return; }
  auto** vals = reinterpret_cast<void**>(meta + 1); // NOLINT
  vals[index] = value;
}

void* object_get(void* obj, std::size_t index) {
  if (obj == nullptr) { return nullptr; }
  auto* meta = static_cast<std::size_t*>(obj);
  if (index >= meta[0]) { return nullptr; }
  auto* const* vals = reinterpret_cast<void* const*>(meta + 1); // NOLINT
  return vals[index];
}

std::size_t object_field_count(void* obj) {
  if (obj == nullptr) { return 0; }
  return static_cast<const std::size_t*>(obj)[0];
}

// Arrays
static std::size_t element_size(ElementKind kind) {
  switch (kind) {
    case ElementKind::Bool:
    case ElementKind::Byte: return 1;
    case ElementKind::Short: return 2;
    case ElementKind::Int:
    case ElementKind::Float:
    case ElementKind::Char: return 4;
    case ElementKind::Long:
    case ElementKind::Double: return 8;
    case ElementKind::Ref: return sizeof(void*);
  }
  return sizeof(void*);
}

static bool is_integral_kind(ElementKind kind) {
  switch (kind) {
    case ElementKind::Bool: case ElementKind::Byte: case ElementKind::Short:
    case ElementKind::Int: case ElementKind::Long: case ElementKind::Char: return true;
    default: return false;
  }
}

// Returns the payload when arr is an Array whose index is in range, else nullptr
static ArrayPayload* array_checked(void* arr, std::size_t index) {
  if (arr == nullptr || tag_of(arr) != TypeTag::Array) { return nullptr; }
  auto* ap = static_cast<ArrayPayload*>(arr);
  return index < ap->len ? ap : nullptr;
}

void* array_new(ElementKind kind, std::size_t len) {
  const std::lock_guard<std::mutex> lock(g_mu);
  const std::size_t dataSize = checked_payload_size("array_new", sizeof(ArrayPayload), len, element_size(kind)) - sizeof(ArrayPayload);
  void* arr = alloc_raw(sizeof(ArrayPayload) + dataSize, TypeTag::Array);
  auto* ap = static_cast<ArrayPayload*>(arr);
  ap->kind = static_cast<std::size_t>(kind);
  ap->len = len;
  if (dataSize != 0U) { std::memset(array_data(arr), 0, dataSize); }
  return arr;
}

std::size_t array_len(void* arr) {
  if (arr == nullptr || tag_of(arr) != TypeTag::Array) { return 0; }
  return static_cast<ArrayPayload*>(arr)->len;
}

std::optional<ElementKind> array_element_kind(void* arr) {
  if (arr == nullptr || tag_of(arr) != TypeTag::Array) { return std::nullopt; }
  return static_cast<ElementKind>(static_cast<ArrayPayload*>(arr)->kind);
}

bool array_is_primitive(void* arr) {
  const auto kind = array_element_kind(arr);
  return kind.has_value() && *kind != ElementKind::Ref;
}

void array_set_long(void* arr, std::size_t index, int64_t value) {
  ArrayPayload* ap = array_checked(arr, index);
  if (ap == nullptr) { return; }
  const auto kind = static_cast<ElementKind>(ap->kind);
  if (!is_integral_kind(kind)) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  auto* slot = static_cast<unsigned char*>(array_data(arr)) + (index * element_size(kind)); // NOLINT
  switch (kind) {
    case ElementKind::Bool: { const uint8_t v = value != 0 ? 1U : 0U; std::memcpy(slot, &v, sizeof(v)); break; }
    case ElementKind::Byte: { const auto v = static_cast<int8_t>(value); std::memcpy(slot, &v, sizeof(v)); break; }
    case ElementKind::Short: { const auto v = static_cast<int16_t>(value); std::memcpy(slot, &v, sizeof(v)); break; }
    case ElementKind::Int: { const auto v = static_cast<int32_t>(value); std::memcpy(slot, &v, sizeof(v)); break; }
    case ElementKind::Char: { const auto v = static_cast<char32_t>(value); std::memcpy(slot, &v, sizeof(v)); break; }
    default: std::memcpy(slot, &value, sizeof(value)); break;
  }
}

int64_t array_get_long(void* arr, std::size_t index) {
  ArrayPayload* ap = array_checked(arr, index);
  if (ap == nullptr) { return 0; }
  const auto kind = static_cast<ElementKind>(ap->kind);
  if (!is_integral_kind(kind)) { return 0; }
  const auto* slot = static_cast<const unsigned char*>(array_data(arr)) + (index * element_size(kind)); // NOLINT
  switch (kind) {
    case ElementKind::Bool: { uint8_t v{}; std::memcpy(&v, slot, sizeof(v)); return v != 0U ? 1 : 0; }
    case ElementKind::Byte: { int8_t v{}; std::memcpy(&v, slot, sizeof(v)); return v; }
    case ElementKind::Short: { int16_t v{}; std::memcpy(&v, slot, sizeof(v)); return v; }
    case ElementKind::Int: { int32_t v{}; std::memcpy(&v, slot, sizeof(v)); return v; }
    case ElementKind::Char: { char32_t v{}; std::memcpy(&v, slot, sizeof(v)); return static_cast<int64_t>(v); }
    default: { int64_t v{}; std::memcpy(&v, slot, sizeof(v)); return v; }
  }
}

void array_set_double(void* arr, std::size_t index, double value) {
  ArrayPayload* ap = array_checked(arr, index);
  if (ap == nullptr) { return; }
  const auto kind = static_cast<ElementKind>(ap->kind);
  const std::lock_guard<std::mutex> lock(g_mu);
  auto* slot = static_cast<unsigned char*>(array_data(arr)) + (index * element_size(kind)); // NOLINT
  if (kind == ElementKind::Float) {
    const auto v = static_cast<float>(value); std::memcpy(slot, &v, sizeof(v));
  } else if (kind == ElementKind::Double) {
    std::memcpy(slot, &value, sizeof(value));
  }
}

double array_get_double(void* arr, std::size_t index) {
  ArrayPayload* ap = array_checked(arr, index);
  if (ap == nullptr) { return 0.0; }
  const auto kind = static_cast<ElementKind>(ap->kind);
  const auto* slot = static_cast<const unsigned char*>(array_data(arr)) + (index * element_size(kind)); // NOLINT
  if (kind == ElementKind::Float) { float v{}; std::memcpy(&v, slot, sizeof(v)); return v; }
  if (kind == ElementKind::Double) { double v{}; std::memcpy(&v, slot, sizeof(v)); return v; }
  return 0.0;
}

void array_set_ref(void* arr, std::size_t index, void* value) {
  ArrayPayload* ap = array_checked(arr, index);
  if (ap == nullptr || static_cast<ElementKind>(ap->kind) != ElementKind::Ref) { return; }
  const std::lock_guard<std::mutex> lock(g_mu);
  static_cast<void**>(array_data(arr))[index] = value;
}

void* array_get_ref(void* arr, std::size_t index) {
  ArrayPayload* ap = array_checked(arr, index);
  if (ap == nullptr || static_cast<ElementKind>(ap->kind) != ElementKind::Ref) { return nullptr; }
  return static_cast<void**>(array_data(arr))[index];
}

} // namespace objkit::rt

// ===== C ABI wrappers =====

extern "C" void objkit_gc_collect(void) { ::objkit::rt::gc_collect(); }
extern "C" void objkit_gc_set_threshold(size_t bytes) { ::objkit::rt::gc_set_threshold(bytes); }
extern "C" void objkit_gc_register_root(void** addr) { ::objkit::rt::gc_register_root(addr); }
extern "C" void objkit_gc_unregister_root(void** addr) { ::objkit::rt::gc_unregister_root(addr); }

extern "C" void* objkit_box_bool(bool v) { return ::objkit::rt::box_bool(v); }
extern "C" void* objkit_box_int(int32_t v) { return ::objkit::rt::box_int(v); }
extern "C" void* objkit_box_long(int64_t v) { return ::objkit::rt::box_long(v); }
extern "C" void* objkit_box_double(double v) { return ::objkit::rt::box_double(v); }

extern "C" void* objkit_string_new(const char* data, size_t len) { return ::objkit::rt::string_new(data, len); }
extern "C" uint64_t objkit_string_len(void* s) { return static_cast<uint64_t>(::objkit::rt::string_len(s)); }

// Oversized requests come back as NULL; exceptions stay on the C++ side.
extern "C" void* objkit_list_new(uint64_t cap) {
  try {
    return ::objkit::rt::list_new(static_cast<std::size_t>(cap));
  } catch (const ::objkit::exceptions::InvalidArgumentError&) {
    return nullptr;
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}
extern "C" void objkit_list_push(void** list_slot, void* elem) { ::objkit::rt::list_push_slot(list_slot, elem); }
extern "C" uint64_t objkit_list_len(void* list) { return static_cast<uint64_t>(::objkit::rt::list_len(list)); }

extern "C" void* objkit_array_new(uint32_t element_kind, uint64_t len) {
  using ::objkit::rt::ElementKind;
  if (element_kind < static_cast<uint32_t>(ElementKind::Bool) || element_kind > static_cast<uint32_t>(ElementKind::Ref)) {
    return nullptr;
  }
  try {
    return ::objkit::rt::array_new(static_cast<ElementKind>(element_kind), static_cast<std::size_t>(len));
  } catch (const ::objkit::exceptions::InvalidArgumentError&) {
    return nullptr;
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}
extern "C" uint64_t objkit_array_len(void* arr) { return static_cast<uint64_t>(::objkit::rt::array_len(arr)); }
