// Logging to std::cerr with some context (file and line).
// Usage:
//   RH_INFO << "Loaded " << revisions.size() << " revisions";
//   RH_WARNING << "Document '" << slug << "' has no current revision";
//   RH_ERROR << "Something wrong is happening";
//   RH_FATAL << "Something wrong happened and the process will end now";
//
// RH_ASSERT is similar to assert but allows extra logging.
//   RH_ASSERT(revisionIt != revisions.end()) << "revid=" << revid;
//
// RH_ASSERT_EQ is a specialization for equality tests that prints values in case of failure.
//   RH_ASSERT_EQ(entries.size(), 3U) << "page=" << page;

#ifndef RHBASE_LOG_H
#define RHBASE_LOG_H

#include <cstdlib>
#include <iostream>
#include <ostream>

// Defined outside of rhbase so that operator<<(ostream&, Date) in rhbase does not hide overloads in the global
// namespace.
namespace rhbase_internal_log {

enum class LogLevel {
  INFO,
  WARNING,
  ERROR,
  FATAL,
};

struct EndOfLog {};

struct EndOfNonFatalLog : public EndOfLog {
  ~EndOfNonFatalLog() { std::cerr << '\n'; }
};

struct EndOfFatalLog : public EndOfLog {
  [[noreturn]] ~EndOfFatalLog() {
    std::cerr << '\n';
    exit(1);
  }
};

std::ostream& getLogStream(const EndOfLog&);
std::ostream& printLogLinePrefix(LogLevel level, const char* fileName, const EndOfLog&);

template <class X, class Y>
bool assertEqShouldFail(const X& x, const Y& y, const char* assertionText, const char* fileName) {
  if (!(x == y)) {
    printLogLinePrefix(LogLevel::FATAL, fileName, EndOfLog())
        << "Assertion " << assertionText << " failed (" << x << " != " << y << ") ";
    return true;
  }
  return false;
}

}  // namespace rhbase_internal_log

#define RH_INTERNAL_STRINGIFY1(x) #x
#define RH_INTERNAL_STRINGIFY2(x) RH_INTERNAL_STRINGIFY1(x)
#define RH_HERE __FILE__ ":" RH_INTERNAL_STRINGIFY2(__LINE__)
#define RH_INTERNAL_LOG(level, endClass)                                                                 \
  ::rhbase_internal_log::printLogLinePrefix(::rhbase_internal_log::LogLevel::level, RH_HERE, \
                                            ::rhbase_internal_log::endClass())

#define RH_INFO RH_INTERNAL_LOG(INFO, EndOfNonFatalLog)
#define RH_WARNING RH_INTERNAL_LOG(WARNING, EndOfNonFatalLog)
#define RH_ERROR RH_INTERNAL_LOG(ERROR, EndOfNonFatalLog)

#define RH_FATAL RH_INTERNAL_LOG(FATAL, EndOfFatalLog)

#define RH_ASSERT(condition) \
  if (!(condition)) RH_FATAL << "Assertion " #condition " failed "

#define RH_ASSERT_EQ(x, y)                                                     \
  if (::rhbase_internal_log::assertEqShouldFail(x, y, #x " == " #y, RH_HERE)) \
  ::rhbase_internal_log::getLogStream(::rhbase_internal_log::EndOfFatalLog())

#endif
