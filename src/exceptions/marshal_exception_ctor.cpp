/***
 * Name: pymarshal::exceptions::MarshalException::MarshalException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pymarshal/exceptions/marshal_exception.h"

#include <utility>

namespace pymarshal {
namespace exceptions {

MarshalException::MarshalException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pymarshal
