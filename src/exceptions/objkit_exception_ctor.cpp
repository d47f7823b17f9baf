/***
 * Name: objkit::exceptions::ObjkitException::ObjkitException
 * Purpose: Take ownership of the diagnostic built by the throwing runtime call.
 */
#include "objkit/exceptions/objkit_exception.h"

#include <utility>

namespace objkit {
namespace exceptions {

ObjkitException::ObjkitException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace objkit
