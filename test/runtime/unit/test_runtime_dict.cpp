/***
 * Name: test_runtime_dict
 * Purpose: Drive dict_set through the rehash path; check string-content and identity keys.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include "runtime/All.h"
#include <cstdint>
#include "objkit/exceptions/invalid_argument_error.h"

using namespace objkit::rt;

TEST(RuntimeDict, RehashAndLookup) {
  gc_reset_for_tests();
  void* d = nullptr;
  // Insert > 0.7 * cap (cap starts at 8 when created), so insert 6+ entries
  for (int i = 0; i < 40; ++i) {
    char buf[8]; std::snprintf(buf, sizeof(buf), "k%02d", i);
    dict_set(&d, string_from_cstr(buf), box_int(i));
  }
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(dict_len(d), 40u);
  for (int i = 0; i < 40; ++i) {
    char buf[8]; std::snprintf(buf, sizeof(buf), "k%02d", i);
    void* v = dict_get(d, string_from_cstr(buf));
    ASSERT_NE(v, nullptr) << buf;
    EXPECT_EQ(box_int_value(v), i);
  }
}

TEST(RuntimeDict, StringKeysMatchByContent) {
  gc_reset_for_tests();
  void* d = dict_new(8);
  dict_set(&d, string_from_cstr("a"), box_int(1));
  dict_set(&d, string_from_cstr("a"), box_int(2));
  EXPECT_EQ(dict_len(d), 1u);
  EXPECT_EQ(box_int_value(dict_get(d, string_from_cstr("a"))), 2);
  EXPECT_EQ(dict_get(d, string_from_cstr("b")), nullptr);
}

TEST(RuntimeDict, NonStringKeysMatchByIdentity) {
  gc_reset_for_tests();
  void* d = dict_new(8);
  void* k1 = box_int(7);
  void* k2 = box_int(7);
  dict_set(&d, k1, string_from_cstr("one"));
  EXPECT_NE(dict_get(d, k1), nullptr);
  EXPECT_EQ(dict_get(d, k2), nullptr);
}

TEST(RuntimeDict, NullKeyIgnored) {
  gc_reset_for_tests();
  void* d = dict_new(8);
  dict_set(&d, nullptr, box_int(1));
  EXPECT_EQ(dict_len(d), 0u);
  EXPECT_EQ(dict_get(d, nullptr), nullptr);
  EXPECT_EQ(dict_len(nullptr), 0u);
}

TEST(RuntimeDict, OversizedCapacityIsRejected) {
  gc_reset_for_tests();
  EXPECT_THROW(dict_new(SIZE_MAX), objkit::exceptions::InvalidArgumentError);
  EXPECT_THROW(dict_new(SIZE_MAX / 2 + 2), objkit::exceptions::InvalidArgumentError);
  // Rounds up to a power of two that fits, but the slot table does not
  EXPECT_THROW(dict_new(SIZE_MAX / 4), objkit::exceptions::InvalidArgumentError);
  EXPECT_EQ(gc_stats().numAllocated, 0u);
  void* d = dict_new(8);
  dict_set(&d, box_int(1), box_int(2));
  EXPECT_EQ(dict_len(d), 1u);
}
