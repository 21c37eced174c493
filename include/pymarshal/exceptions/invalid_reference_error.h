/***
 * Name: pymarshal::exceptions::InvalidReferenceError
 * Purpose: Reference index never stored, reused, skipped, or flag on a non-referenceable tag.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from MarshalException.
 */
#pragma once

#include "pymarshal/exceptions/marshal_exception.h"

namespace pymarshal {
namespace exceptions {

class InvalidReferenceError : public MarshalException {
 public:
  using MarshalException::MarshalException;
};

}  // namespace exceptions
}  // namespace pymarshal
