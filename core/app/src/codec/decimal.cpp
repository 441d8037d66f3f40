#include "copytrader/codec/decimal.hpp"

#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

namespace copytrader {
namespace codec {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// [+-]? digits [. digits?]? | [+-]? . digits, then [eE][+-]?digits.
// Rejects hex, inf, nan and locale-specific separators up front.
bool isPlainDecimal(const std::string& s) {
  std::size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
    ++i;
  }

  std::size_t mantissa_digits = 0;
  while (i < s.size() && isDigit(s[i])) {
    ++i;
    ++mantissa_digits;
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && isDigit(s[i])) {
      ++i;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) {
    return false;
  }

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
      ++i;
    }
    std::size_t exponent_digits = 0;
    while (i < s.size() && isDigit(s[i])) {
      ++i;
      ++exponent_digits;
    }
    if (exponent_digits == 0) {
      return false;
    }
  }
  return i == s.size();
}

}  // namespace

bool parseDecimal(const std::string& text, double& out) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last &&
         std::isspace(static_cast<unsigned char>(text[first]))) {
    ++first;
  }
  while (last > first &&
         std::isspace(static_cast<unsigned char>(text[last - 1]))) {
    --last;
  }

  const std::string trimmed = text.substr(first, last - first);
  if (!isPlainDecimal(trimmed)) {
    return false;
  }

  // Classic locale: '.' is the decimal point whatever the process locale.
  std::istringstream in(trimmed);
  in.imbue(std::locale::classic());
  double value = 0.0;
  in >> value;
  if (in.fail() || !std::isfinite(value)) {
    return false;
  }

  out = value;
  return true;
}

double parseClosedPnl(const std::string& text) {
  double value = 0.0;
  if (!parseDecimal(text, value)) {
    return 0.0;
  }
  return value;
}

}  // namespace codec
}  // namespace copytrader
