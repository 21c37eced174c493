/***
 * Name: pymarshal::exceptions::FileWriteError
 * Purpose: Exception for filesystem write failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from MarshalException.
 */
#pragma once

#include "pymarshal/exceptions/marshal_exception.h"

namespace pymarshal {
namespace exceptions {

class FileWriteError : public MarshalException {
 public:
  using MarshalException::MarshalException;
};

}  // namespace exceptions
}  // namespace pymarshal
