/***
 * Name: pymarshal::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from MarshalException.
 */
#pragma once

#include "pymarshal/exceptions/marshal_exception.h"

namespace pymarshal {
namespace exceptions {

class FileReadError : public MarshalException {
 public:
  using MarshalException::MarshalException;
};

}  // namespace exceptions
}  // namespace pymarshal
