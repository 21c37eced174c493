/***
 * Name: pymarshal::exceptions (umbrella)
 * Purpose: Include every pymarshal exception type.
 */
#pragma once

#include "pymarshal/exceptions/config_error.h"
#include "pymarshal/exceptions/file_read_error.h"
#include "pymarshal/exceptions/file_write_error.h"
#include "pymarshal/exceptions/invalid_object_error.h"
#include "pymarshal/exceptions/invalid_reference_error.h"
#include "pymarshal/exceptions/invalid_utf8_error.h"
#include "pymarshal/exceptions/malformed_numeric_error.h"
#include "pymarshal/exceptions/marshal_exception.h"
#include "pymarshal/exceptions/pyc_header_error.h"
#include "pymarshal/exceptions/recursion_limit_error.h"
#include "pymarshal/exceptions/trailing_bytes_error.h"
#include "pymarshal/exceptions/unexpected_eof_error.h"
#include "pymarshal/exceptions/unknown_type_tag_error.h"
#include "pymarshal/exceptions/unsupported_version_error.h"
