/**
 * Inspection benchmark: times the type checks and the emptiness predicate over a mixed heap.
 * Usage: bench_inspect [iters] [size]
 */
#include "runtime/All.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace objkit::rt;

int main(int argc, char** argv) {
  std::size_t iters = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 200000;
  std::size_t size  = (argc > 2) ? static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10)) : 24;

  gc_reset_for_tests();
  void* values = list_new(8);
  gc_register_root(&values);
  std::string s(size, 'x');
  list_push_slot(&values, string_new(s.c_str(), s.size()));
  list_push_slot(&values, string_from_cstr(""));
  list_push_slot(&values, box_int(7));
  list_push_slot(&values, box_long(7));
  list_push_slot(&values, box_bool(true));
  list_push_slot(&values, box_double(0.5));
  list_push_slot(&values, array_new(ElementKind::Int, size));
  list_push_slot(&values, array_new(ElementKind::Ref, 0));
  list_push_slot(&values, list_new(0));
  const std::size_t n = list_len(values);

  auto run = [&](const char* label, auto&& op) {
    std::size_t hits = 0;
    const auto t0 = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) {
      if (op(list_get(values, i % n))) { ++hits; }
    }
    const auto t1 = std::chrono::steady_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
    std::cout << "[" << label << "]"
              << " iters=" << iters
              << " time_us=" << us
              << " hits=" << hits
              << "\n";
  };

  run("is_boolean", [](void* v) { return is_boolean(v); });
  run("is_integer", [](void* v) { return is_integer(v); });
  run("is_array", [](void* v) { return is_array(v); });
  run("is_null_or_empty", [](void* v) { return is_null_or_empty(v); });
  run("default_if_null_or_empty", [&values](void* v) { return default_if_null_or_empty(v, values) == values; });

  gc_collect();
  auto st = gc_stats();
  std::cout << "[gc]"
            << " collections=" << st.numCollections
            << " bytes_alloc=" << st.bytesAllocated
            << " bytes_live=" << st.bytesLive
            << " peak_live=" << st.peakBytesLive
            << " last_reclaimed=" << st.lastReclaimedBytes
            << "\n";
  gc_unregister_root(&values);
  return 0;
}
