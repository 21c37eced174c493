/***
 * Name: pymarshal::numeric (float text)
 * Purpose: Parse and produce the decimal text carried by TYPE_FLOAT / TYPE_COMPLEX.
 * Inputs: ASCII text from the stream, or a double to render
 * Outputs: Parsed double, or repr-style text
 * Theory of Operation:
 *   Parsing validates the accepted grammar by hand ([+-] digits [. digits]
 *   [e [+-] digits], or inf/infinity/nan in any case) and converts with
 *   std::from_chars. Formatting reproduces the interpreter's repr(): shortest
 *   round-trip digits, positional for exponents in [-4, 16), scientific with a
 *   signed two-digit exponent otherwise, and ".0" on integral values.
 */
#pragma once

#include <string>
#include <string_view>

namespace pymarshal::numeric {

/*** ParseFloatText: Throws MalformedNumericError when text is not a float literal. */
double ParseFloatText(std::string_view text);

std::string FormatFloatText(double value);

}  // namespace pymarshal::numeric
