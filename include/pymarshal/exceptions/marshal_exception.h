/***
 * Name: pymarshal::exceptions::MarshalException
 * Purpose: Base class for all pymarshal exceptions; library code throws only types derived from it.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception so callers can catch broadly,
 *   while each error kind of the codec is a distinct marker type below this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pymarshal {
namespace exceptions {

class MarshalException : public std::exception {
 public:
  explicit MarshalException(std::string msg) noexcept;
  virtual ~MarshalException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  std::string message_;
};

}  // namespace exceptions
}  // namespace pymarshal
