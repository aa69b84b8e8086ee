#include "log.h"
#include <cstring>
#include <iostream>
#include <ostream>

namespace rhbase_internal_log {

std::ostream& getLogStream(const EndOfLog&) {
  return std::cerr;
}

static const char* getLevelPrefix(LogLevel level) {
  switch (level) {
    case LogLevel::INFO:
      return "[INFO ";
    case LogLevel::WARNING:
      return "[WARNING ";
    case LogLevel::ERROR:
      return "[ERROR ";
    case LogLevel::FATAL:
      return "[FATAL ";
  }
  return "[";
}

std::ostream& printLogLinePrefix(LogLevel level, const char* fileName, const EndOfLog&) {
  // fileName is RH_HERE, so the base name keeps the line number.
  const char* baseName = fileName + strlen(fileName);
  for (; baseName > fileName && *(baseName - 1) != '/'; baseName--) {}
  return std::cerr << getLevelPrefix(level) << baseName << "] ";
}

}  // namespace rhbase_internal_log
