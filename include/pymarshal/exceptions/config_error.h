/***
 * Name: pymarshal::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from MarshalException.
 */
#pragma once

#include "pymarshal/exceptions/marshal_exception.h"

namespace pymarshal {
namespace exceptions {

class ConfigError : public MarshalException {
 public:
  using MarshalException::MarshalException;
};

}  // namespace exceptions
}  // namespace pymarshal
