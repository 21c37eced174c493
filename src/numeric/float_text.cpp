/***
 * Name: pymarshal::numeric (float text)
 * Purpose: Strict float literal parsing and repr()-compatible formatting.
 */
#include "pymarshal/numeric/float_text.h"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

#include "pymarshal/exceptions/malformed_numeric_error.h"

namespace pymarshal::numeric {

namespace {

bool equalsIgnoreCase(std::string_view text, std::string_view word) {
  if (text.size() != word.size()) {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) != word[i]) {
      return false;
    }
  }
  return true;
}

std::size_t skipDigits(std::string_view text, std::size_t pos) {
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

bool isDecimalLiteral(std::string_view body) {
  std::size_t pos = skipDigits(body, 0);
  const std::size_t intDigits = pos;
  std::size_t fracDigits = 0;
  if (pos < body.size() && body[pos] == '.') {
    const std::size_t start = ++pos;
    pos = skipDigits(body, pos);
    fracDigits = pos - start;
  }
  if (intDigits + fracDigits == 0) {
    return false;
  }
  if (pos < body.size() && (body[pos] == 'e' || body[pos] == 'E')) {
    ++pos;
    if (pos < body.size() && (body[pos] == '+' || body[pos] == '-')) {
      ++pos;
    }
    const std::size_t start = pos;
    pos = skipDigits(body, pos);
    if (pos == start) {
      return false;
    }
  }
  return pos == body.size();
}

[[noreturn]] void malformed(std::string_view text) {
  throw exceptions::MalformedNumericError("invalid float literal '" + std::string(text) + "'");
}

}  // namespace

double ParseFloatText(std::string_view text) {
  std::string_view body = text;
  bool negative = false;
  if (!body.empty() && (body.front() == '+' || body.front() == '-')) {
    negative = body.front() == '-';
    body.remove_prefix(1);
  }
  if (equalsIgnoreCase(body, "inf") || equalsIgnoreCase(body, "infinity")) {
    return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
  }
  if (equalsIgnoreCase(body, "nan")) {
    return negative ? -std::numeric_limits<double>::quiet_NaN() : std::numeric_limits<double>::quiet_NaN();
  }
  if (!isDecimalLiteral(body)) {
    malformed(text);
  }
  double value = 0.0;
  const auto result = std::from_chars(body.data(), body.data() + body.size(), value);
  // Out-of-range literals saturate to inf / 0 as strtod does.
  if (result.ec == std::errc::result_out_of_range) {
    const std::size_t expPos = body.find_first_of("eE");
    const bool tiny = expPos != std::string_view::npos ? body.find('-', expPos) != std::string_view::npos
                                                       : body.front() == '0' || body.front() == '.';
    value = tiny ? 0.0 : std::numeric_limits<double>::infinity();
  } else if (result.ec != std::errc() || result.ptr != body.data() + body.size()) {
    malformed(text);
  }
  return negative ? -value : value;
}

std::string FormatFloatText(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value < 0 ? "-inf" : "inf";
  }
  std::array<char, 64> buf{};
  const auto result = std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::scientific);
  const std::string_view sci(buf.data(), static_cast<std::size_t>(result.ptr - buf.data()));

  // sci looks like "-d.ddde+XX"; split into sign, significant digits and exponent.
  std::string out;
  std::size_t pos = 0;
  if (sci[pos] == '-') {
    out += '-';
    ++pos;
  }
  std::string digits;
  const std::size_t ePos = sci.find('e');
  for (std::size_t i = pos; i < ePos; ++i) {
    if (sci[i] != '.') {
      digits += sci[i];
    }
  }
  int exponent = 0;
  std::string_view expText = sci.substr(ePos + 1);
  if (expText.front() == '+') {
    expText.remove_prefix(1);
  }
  if (std::from_chars(expText.data(), expText.data() + expText.size(), exponent).ec != std::errc()) {
    exponent = 0;
  }

  constexpr int kMinPositional = -4;
  constexpr int kMaxPositional = 16;
  if (exponent >= kMinPositional && exponent < kMaxPositional) {
    if (exponent < 0) {
      out += "0.";
      out.append(static_cast<std::size_t>(-exponent - 1), '0');
      out += digits;
    } else {
      const auto intLen = static_cast<std::size_t>(exponent) + 1;
      if (digits.size() <= intLen) {
        out += digits;
        out.append(intLen - digits.size(), '0');
        out += ".0";
      } else {
        out += digits.substr(0, intLen);
        out += '.';
        out += digits.substr(intLen);
      }
    }
    return out;
  }
  out += digits.substr(0, 1);
  if (digits.size() > 1) {
    out += '.';
    out += digits.substr(1);
  }
  out += exponent < 0 ? "e-" : "e+";
  const int absExp = exponent < 0 ? -exponent : exponent;
  if (absExp < 10) {
    out += '0';
  }
  out += std::to_string(absExp);
  return out;
}

}  // namespace pymarshal::numeric
