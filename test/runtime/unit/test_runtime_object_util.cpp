/***
 * Name: test_runtime_object_util
 * Purpose: Validate default_if_null_or_empty and the exact type-identity checks.
 */
#include <gtest/gtest.h>
#include <cstring>
#include "runtime/All.h"
#include "objkit/exceptions/invalid_argument_error.h"

using namespace objkit::rt;
using objkit::exceptions::InvalidArgumentError;

TEST(RuntimeObjectUtil, DefaultIfNullOrEmptyNullValue) {
  gc_reset_for_tests();
  EXPECT_EQ(default_if_null_or_empty(nullptr, nullptr), nullptr);

  void* empty = string_from_cstr("");
  EXPECT_EQ(default_if_null_or_empty(nullptr, empty), empty);

  void* zz = string_from_cstr("zz");
  void* out = default_if_null_or_empty(nullptr, zz);
  ASSERT_EQ(out, zz);
  EXPECT_STREQ(string_data(out), "zz");
}

TEST(RuntimeObjectUtil, DefaultIfNullOrEmptyKeepsNonEmptyValue) {
  gc_reset_for_tests();
  void* abc = string_from_cstr("abc");
  void* zz = string_from_cstr("zz");
  EXPECT_EQ(default_if_null_or_empty(abc, zz), abc);
  EXPECT_EQ(default_if_null_or_empty(abc, nullptr), abc);

  void* t = box_bool(true);
  EXPECT_EQ(default_if_null_or_empty(t, zz), t);
  void* f = box_bool(false);
  EXPECT_EQ(default_if_null_or_empty(f, zz), f);
  void* zero = box_int(0);
  EXPECT_EQ(default_if_null_or_empty(zero, zz), zero);
}

TEST(RuntimeObjectUtil, DefaultIfNullOrEmptyFallsBackOnEmptyContainers) {
  gc_reset_for_tests();
  void* fallback = string_from_cstr("fallback");
  EXPECT_EQ(default_if_null_or_empty(string_from_cstr(""), fallback), fallback);
  EXPECT_EQ(default_if_null_or_empty(string_from_cstr("  \t"), fallback), fallback);
  EXPECT_EQ(default_if_null_or_empty(list_new(4), fallback), fallback);
  EXPECT_EQ(default_if_null_or_empty(dict_new(8), fallback), fallback);
  EXPECT_EQ(default_if_null_or_empty(array_new(ElementKind::Int, 0), fallback), fallback);

  void* one = nullptr;
  list_push_slot(&one, box_int(1));
  EXPECT_EQ(default_if_null_or_empty(one, fallback), one);
  void* arr = array_new(ElementKind::Double, 1);
  EXPECT_EQ(default_if_null_or_empty(arr, fallback), arr);
}

TEST(RuntimeObjectUtil, IsBoolean) {
  gc_reset_for_tests();
  EXPECT_FALSE(is_boolean(nullptr));
  EXPECT_TRUE(is_boolean(box_bool(true)));
  EXPECT_TRUE(is_boolean(box_bool(false)));
  EXPECT_FALSE(is_boolean(box_int(1)));
  EXPECT_FALSE(is_boolean(box_byte(1)));
  EXPECT_FALSE(is_boolean(string_from_cstr("true")));
  EXPECT_FALSE(is_boolean(array_new(ElementKind::Bool, 1)));
}

TEST(RuntimeObjectUtil, IsIntegerMatchesOnly32BitInt) {
  gc_reset_for_tests();
  EXPECT_FALSE(is_integer(nullptr));
  EXPECT_TRUE(is_integer(box_int(1)));
  EXPECT_TRUE(is_integer(box_int(-2147483647 - 1)));
  EXPECT_FALSE(is_integer(box_long(1)));
  EXPECT_FALSE(is_integer(box_short(1)));
  EXPECT_FALSE(is_integer(box_byte(1)));
  EXPECT_FALSE(is_integer(box_double(1.0)));
  EXPECT_FALSE(is_integer(box_float(1.0F)));
  EXPECT_FALSE(is_integer(box_char(U'1')));
  EXPECT_FALSE(is_integer(box_bool(true)));
  EXPECT_FALSE(is_integer(string_from_cstr("1")));
}

TEST(RuntimeObjectUtil, IsArrayRejectsNull) {
  gc_reset_for_tests();
  EXPECT_THROW((void)is_array(nullptr), InvalidArgumentError);
  try {
    (void)is_array(nullptr);
    FAIL() << "is_array(nullptr) returned instead of throwing";
  } catch (const InvalidArgumentError& e) {
    EXPECT_STREQ(e.what(), "object can't be null!");
  }
}

TEST(RuntimeObjectUtil, IsArrayAcceptsEveryElementKind) {
  gc_reset_for_tests();
  void* ints = array_new(ElementKind::Int, 3);
  array_set_long(ints, 0, 1);
  array_set_long(ints, 1, 2);
  array_set_long(ints, 2, 3);
  EXPECT_TRUE(is_array(ints));
  EXPECT_TRUE(is_array(array_new(ElementKind::Int, 0)));
  const ElementKind kinds[] = { ElementKind::Bool, ElementKind::Byte, ElementKind::Short, ElementKind::Int,
                                ElementKind::Long, ElementKind::Float, ElementKind::Double, ElementKind::Char,
                                ElementKind::Ref };
  for (ElementKind k : kinds) {
    EXPECT_TRUE(is_array(array_new(k, 2))) << "kind=" << static_cast<unsigned>(k);
  }
}

TEST(RuntimeObjectUtil, IsArrayFalseForNonArrays) {
  gc_reset_for_tests();
  EXPECT_FALSE(is_array(string_from_cstr("not an array")));
  void* lst = nullptr;
  list_push_slot(&lst, box_int(1));
  EXPECT_FALSE(is_array(lst));
  EXPECT_FALSE(is_array(dict_new(8)));
  EXPECT_FALSE(is_array(object_new(2)));
  EXPECT_FALSE(is_array(box_int(1)));
}
