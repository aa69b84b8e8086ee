#ifndef RHBASE_STRING_H
#define RHBASE_STRING_H

#include <string>
#include <string_view>

namespace rhbase {

// Flags for parseIntInRange. By default, an out-of-range value is treated as invalid.
enum ParseIntInRangeOptions {
  DEF_IF_TOO_SMALL = 0,
  MIN_IF_TOO_SMALL = 1,
  DEF_IF_TOO_LARGE = 0,
  MAX_IF_TOO_LARGE = 2,
};

// Parses s as a base 10 int in [min, max]. Only digits with an optional leading '-' are accepted, so " 1", "+1" and
// "1_000" are invalid.
// Returns defValue if s is invalid, and defValue, min or max if the value is out of range, depending on options.
int parseIntInRange(const std::string& s, int min, int max, int defValue,
                    int options = DEF_IF_TOO_SMALL | DEF_IF_TOO_LARGE);

// Removes ASCII whitespace at both ends of s.
std::string_view trim(std::string_view s);

}  // namespace rhbase

#endif
