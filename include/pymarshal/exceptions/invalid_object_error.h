/***
 * Name: pymarshal::exceptions::InvalidObjectError
 * Purpose: Structurally invalid object (NULL in container, unhashable key, unrepresentable shape).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from MarshalException.
 */
#pragma once

#include "pymarshal/exceptions/marshal_exception.h"

namespace pymarshal {
namespace exceptions {

class InvalidObjectError : public MarshalException {
 public:
  using MarshalException::MarshalException;
};

}  // namespace exceptions
}  // namespace pymarshal
