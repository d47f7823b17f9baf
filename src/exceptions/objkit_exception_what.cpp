/***
 * Name: objkit::exceptions::ObjkitException::what
 * Purpose: Diagnostic text, e.g. "object can't be null!" from is_array or
 *   "dict_new: capacity too large" from an oversized allocation.
 * Outputs: Pointer owned by the exception object
 */
#include "objkit/exceptions/objkit_exception.h"

namespace objkit::exceptions {

const char* ObjkitException::what() const noexcept { return message_.c_str(); }

}  // namespace objkit::exceptions
