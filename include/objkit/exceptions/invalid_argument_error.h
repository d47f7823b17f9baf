/***
 * Name: objkit::exceptions::InvalidArgumentError
 * Purpose: Raised when a runtime call refuses its argument: a null handle passed to
 *   is_array, or a list/dict/object/array length whose allocation size overflows size_t.
 * Theory of Operation: Thrown before any allocation happens, so the heap and GC
 *   counters are unchanged; the C wrappers map it to NULL or -1.
 */
#pragma once

#include "objkit/exceptions/objkit_exception.h"

#include <string>
#include <utility>

namespace objkit {
namespace exceptions {

class InvalidArgumentError : public ObjkitException {
 public:
  explicit InvalidArgumentError(std::string msg) noexcept : ObjkitException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace objkit
