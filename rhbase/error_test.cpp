#include "error.h"
#include <errno.h>
#include <string>
#include "log.h"
#include "unittest.h"

using std::string;

namespace rhbase {

class ErrorTest : public rhbase::Test {
  RH_TEST_CASE(systemErrorMessage) {
    SystemError error("open('/missing')", ENOENT);
    RH_ASSERT_EQ(error.errorNumber(), ENOENT);
    string message = error.what();
    string prefix = "open('/missing') failed: ";
    RH_ASSERT_EQ(message.substr(0, prefix.size()), prefix);
    RH_ASSERT(message.size() > prefix.size()) << message;
  }

  RH_TEST_CASE(systemErrorWithoutErrorNumber) {
    SystemError error("Cannot remove '/tmp/x'");
    RH_ASSERT_EQ(error.errorNumber(), 0);
    RH_ASSERT_EQ(string(error.what()), "Cannot remove '/tmp/x'");
  }

  RH_TEST_CASE(fileNotFoundIsSystemError) {
    bool exceptionThrown = false;
    try {
      throw FileNotFoundError("Cannot open 'history.sqlite': file not found");
    } catch (const SystemError& error) {
      exceptionThrown = true;
      RH_ASSERT_EQ(error.errorNumber(), 0);
    }
    RH_ASSERT(exceptionThrown);
  }
};

}  // namespace rhbase

int main() {
  rhbase::ErrorTest().run();
  return 0;
}
