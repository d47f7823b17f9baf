/***
 * Name: test_runtime_boxed
 * Purpose: Validate boxed primitive allocations, accessors and type tags.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "runtime/Runtime.h"

using namespace objkit::rt;

TEST(RuntimeBoxed, RoundTripEveryWidth) {
  gc_reset_for_tests();
  EXPECT_TRUE(box_bool_value(box_bool(true)));
  EXPECT_FALSE(box_bool_value(box_bool(false)));
  EXPECT_EQ(box_byte_value(box_byte(-7)), -7);
  EXPECT_EQ(box_short_value(box_short(-30000)), -30000);
  EXPECT_EQ(box_int_value(box_int(std::numeric_limits<int32_t>::max())), std::numeric_limits<int32_t>::max());
  EXPECT_EQ(box_long_value(box_long(1234567890123LL)), 1234567890123LL);
  EXPECT_FLOAT_EQ(box_float_value(box_float(2.5F)), 2.5F);
  EXPECT_NEAR(box_double_value(box_double(3.14159)), 3.14159, 1e-9);
  EXPECT_EQ(static_cast<uint32_t>(box_char_value(box_char(U'\u00e9'))), 0xE9U);
}

TEST(RuntimeBoxed, TagsAreExact) {
  gc_reset_for_tests();
  EXPECT_EQ(type_of(box_bool(true)).value(), TypeTag::Bool);
  EXPECT_EQ(type_of(box_byte(1)).value(), TypeTag::Byte);
  EXPECT_EQ(type_of(box_short(1)).value(), TypeTag::Short);
  EXPECT_EQ(type_of(box_int(1)).value(), TypeTag::Int);
  EXPECT_EQ(type_of(box_long(1)).value(), TypeTag::Long);
  EXPECT_EQ(type_of(box_float(1.0F)).value(), TypeTag::Float);
  EXPECT_EQ(type_of(box_double(1.0)).value(), TypeTag::Double);
  EXPECT_EQ(type_of(box_char(U'a')).value(), TypeTag::Char);
  EXPECT_FALSE(type_of(nullptr).has_value());
}

TEST(RuntimeBoxed, NullHandlesReadAsZero) {
  gc_reset_for_tests();
  EXPECT_FALSE(box_bool_value(nullptr));
  EXPECT_EQ(box_int_value(nullptr), 0);
  EXPECT_EQ(box_long_value(nullptr), 0);
  EXPECT_EQ(box_double_value(nullptr), 0.0);
}

TEST(RuntimeBoxed, TypeNames) {
  EXPECT_STREQ(type_name(TypeTag::Int), "int");
  EXPECT_STREQ(type_name(TypeTag::Long), "long");
  EXPECT_STREQ(type_name(TypeTag::Bool), "bool");
  EXPECT_STREQ(type_name(TypeTag::Array), "array");
  EXPECT_STREQ(type_name(TypeTag::String), "str");
}
