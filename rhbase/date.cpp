#include "date.h"
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include "error.h"
#include "log.h"

using std::string;
using std::string_view;

namespace rhbase {

constexpr string_view ISO8601_PATTERN = "####-##-##T##:##:##Z";

Date Date::frozenValueOfNow;

Date Date::fromTimeT(time_t t) {
  Date date;
  date.m_seconds = static_cast<int64_t>(t);
  return date;
}

Date::Date(int year, int month, int day, int hour, int minute, int second) {
  if (year < 1 || year > 9999) {
    return;
  }
  tm fields{};
  fields.tm_year = year - 1900;
  fields.tm_mon = month - 1;
  fields.tm_mday = day;
  fields.tm_hour = hour;
  fields.tm_min = minute;
  fields.tm_sec = second;
  time_t t = timegm(&fields);
  // timegm normalizes out-of-range fields (February 30 becomes March 2), which is detected here.
  if (fields.tm_year != year - 1900 || fields.tm_mon != month - 1 || fields.tm_mday != day || fields.tm_hour != hour ||
      fields.tm_min != minute || fields.tm_sec != second) {
    return;
  }
  m_seconds = static_cast<int64_t>(t);
}

Date Date::fromISO8601(string_view s) {
  bool matchesPattern = s.size() == ISO8601_PATTERN.size();
  for (size_t i = 0; matchesPattern && i < s.size(); i++) {
    matchesPattern = ISO8601_PATTERN[i] == '#' ? s[i] >= '0' && s[i] <= '9' : s[i] == ISO8601_PATTERN[i];
  }
  if (!matchesPattern) {
    throw ParseError("Invalid ISO8601 date '" + string(s) + "'");
  }
  auto number = [s](size_t position, size_t length) {
    int value = 0;
    for (char c : s.substr(position, length)) {
      value = value * 10 + (c - '0');
    }
    return value;
  };
  Date date(number(0, 4), number(5, 2), number(8, 2), number(11, 2), number(14, 2), number(17, 2));
  if (date.isNull()) {
    throw ParseError("Out of range ISO8601 date '" + string(s) + "'");
  }
  return date;
}

Date Date::operator+(const DateDiff& diff) const {
  RH_ASSERT(!isNull());
  return fromTimeT(static_cast<time_t>(m_seconds + diff.seconds()));
}

time_t Date::toTimeT() const {
  RH_ASSERT(!isNull());
  return static_cast<time_t>(m_seconds);
}

string Date::toISO8601() const {
  if (isNull()) {
    return string();
  }
  time_t t = toTimeT();
  tm fields{};
  gmtime_r(&t, &fields);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &fields);
  return buffer;
}

Date Date::now() {
  return frozenValueOfNow.isNull() ? fromTimeT(time(nullptr)) : frozenValueOfNow;
}

void Date::setFrozenValueOfNow(const Date& d) {
  RH_ASSERT(!d.isNull());
  frozenValueOfNow = d;
}

}  // namespace rhbase
