/***
 * Name: objkit::exceptions::ObjkitException
 * Purpose: Common root of the errors the objkit runtime raises from C++ entry points.
 *   Catch it to handle any refusal by the runtime; the C API never lets one escape.
 * Inputs: Message naming the refusing operation (e.g. "array_new: length too large")
 * Outputs: what() text
 * Theory of Operation: Only concrete subclasses are thrown, hence the protected ctor.
 */
#pragma once

#include <exception>
#include <string>

namespace objkit {
namespace exceptions {

class ObjkitException : public std::exception {
 public:
  virtual ~ObjkitException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit ObjkitException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace objkit
