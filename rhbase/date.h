// Timestamps of revisions, in UTC with a granularity of 1 second.
#ifndef RHBASE_DATE_H
#define RHBASE_DATE_H

#include <time.h>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

namespace rhbase {

class DateDiff {
public:
  static DateDiff fromSeconds(int64_t seconds) { return DateDiff(seconds); }

  explicit DateDiff(int64_t seconds) : m_seconds(seconds) {}
  int64_t seconds() const { return m_seconds; }

private:
  int64_t m_seconds = 0;
};

// Two revisions saved during the same second have equal dates.
// A default-constructed Date is null. The null date compares lower than all other dates.
class Date {
public:
  static Date fromTimeT(time_t t);
  // Parses "YYYY-MM-DDTHH:MM:SSZ".
  // Throws: ParseError.
  static Date fromISO8601(std::string_view s);

  Date() = default;
  // The result is null if the fields do not form a valid date, e.g. February 30.
  Date(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

  bool operator==(const Date& d) const { return m_seconds == d.m_seconds; }
  bool operator!=(const Date& d) const { return m_seconds != d.m_seconds; }
  bool operator<(const Date& d) const { return m_seconds < d.m_seconds; }
  bool operator<=(const Date& d) const { return m_seconds <= d.m_seconds; }
  bool operator>(const Date& d) const { return m_seconds > d.m_seconds; }
  bool operator>=(const Date& d) const { return m_seconds >= d.m_seconds; }
  // Not supported for null dates.
  Date operator+(const DateDiff& diff) const;

  bool isNull() const { return m_seconds == NULL_SECONDS; }
  // Not supported for null dates.
  time_t toTimeT() const;
  // "2001-02-03T04:05:06Z", or "" for the null date.
  std::string toISO8601() const;

  // Current time, unless a value was frozen with setFrozenValueOfNow.
  static Date now();
  static void setFrozenValueOfNow(const Date& d);

private:
  static constexpr int64_t NULL_SECONDS = std::numeric_limits<int64_t>::min();

  // Seconds since 1970-01-01T00:00:00Z.
  int64_t m_seconds = NULL_SECONDS;

  static Date frozenValueOfNow;
};

inline std::ostream& operator<<(std::ostream& os, const Date& date) {
  return os << (date.isNull() ? "(null date)" : date.toISO8601());
}

}  // namespace rhbase

#endif
