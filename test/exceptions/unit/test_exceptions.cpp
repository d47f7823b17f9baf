/***
 * Name: test_exceptions
 * Purpose: Exception hierarchy keeps messages and is catchable through its bases.
 */
#include <gtest/gtest.h>
#include <exception>
#include <string>
#include <cstdint>
#include "objkit/exceptions/invalid_argument_error.h"
#include "runtime/All.h"

using objkit::exceptions::InvalidArgumentError;
using objkit::exceptions::ObjkitException;

TEST(Exceptions, InvalidArgumentErrorMessage) {
  const InvalidArgumentError err("object can't be null!");
  EXPECT_STREQ(err.what(), "object can't be null!");
}

TEST(Exceptions, CatchableAsBase) {
  try {
    throw InvalidArgumentError(std::string("bad handle"));
  } catch (const ObjkitException& e) {
    EXPECT_STREQ(e.what(), "bad handle");
    return;
  }
  FAIL() << "InvalidArgumentError did not derive from ObjkitException";
}

TEST(Exceptions, CatchableAsStdException) {
  EXPECT_THROW(throw InvalidArgumentError("x"), std::exception);
}

TEST(Exceptions, OversizedAllocationNamesOperation) {
  objkit::rt::gc_reset_for_tests();
  try {
    (void)objkit::rt::array_new(objkit::rt::ElementKind::Long, SIZE_MAX);
  } catch (const ObjkitException& e) {
    EXPECT_STREQ(e.what(), "array_new: length too large");
    return;
  }
  FAIL() << "array_new accepted an oversized length";
}
