#include "string.h"
#include <errno.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

using std::string;
using std::string_view;

namespace rhbase {

enum class ParsedInt {
  OK,
  TOO_SMALL,
  TOO_LARGE,
  INVALID,
};

static bool isASCIIDigit(char c) {
  return c >= '0' && c <= '9';
}

static ParsedInt parseDecimal(const string& s, int min, int max, int& value) {
  bool negative = !s.empty() && s[0] == '-';
  // strtoll would also accept leading spaces and '+'.
  if (!isASCIIDigit(s.c_str()[negative ? 1 : 0])) {
    return ParsedInt::INVALID;
  }
  char* end = nullptr;
  errno = 0;
  long long longValue = strtoll(s.c_str(), &end, 10);
  if (*end != '\0') {
    return ParsedInt::INVALID;
  } else if (errno == ERANGE) {
    return negative ? ParsedInt::TOO_SMALL : ParsedInt::TOO_LARGE;
  } else if (longValue < min) {
    return ParsedInt::TOO_SMALL;
  } else if (longValue > max) {
    return ParsedInt::TOO_LARGE;
  }
  value = static_cast<int>(longValue);
  return ParsedInt::OK;
}

int parseIntInRange(const string& s, int min, int max, int defValue, int options) {
  if (min > max) {
    throw std::invalid_argument("parseIntInRange: min > max");
  }
  int value = defValue;
  switch (parseDecimal(s, min, max, value)) {
    case ParsedInt::OK:
      return value;
    case ParsedInt::TOO_SMALL:
      return options & MIN_IF_TOO_SMALL ? min : defValue;
    case ParsedInt::TOO_LARGE:
      return options & MAX_IF_TOO_LARGE ? max : defValue;
    case ParsedInt::INVALID:
      break;
  }
  return defValue;
}

string_view trim(string_view s) {
  constexpr string_view SPACES = " \t\n\r\f\v";
  size_t start = s.find_first_not_of(SPACES);
  if (start == string_view::npos) {
    return string_view();
  }
  return s.substr(start, s.find_last_not_of(SPACES) - start + 1);
}

}  // namespace rhbase
