#include "error.h"
#include <cstring>
#include <string>

using std::string;

namespace rhbase {

static string describeErrorNumber(int errorNumber) {
  char buffer[0x100];
  buffer[0] = '\0';
  // The GNU version of strerror_r may return a static string without filling buffer.
  const char* description = strerror_r(errorNumber, buffer, sizeof(buffer));
  return description != nullptr && *description != '\0' ? description : "errno " + std::to_string(errorNumber);
}

SystemError::SystemError(const string& operation, int errorNumber)
    : Error(operation + " failed: " + describeErrorNumber(errorNumber)), m_errorNumber(errorNumber) {}

}  // namespace rhbase
