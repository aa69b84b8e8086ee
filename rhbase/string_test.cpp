#include "string.h"
#include <climits>
#include <string>
#include "log.h"
#include "unittest.h"

using std::string;

namespace rhbase {

class StringTest : public rhbase::Test {
  RH_TEST_CASE(parseIntInRangeSyntax) {
    RH_ASSERT_EQ(parseIntInRange("42", INT_MIN, INT_MAX, 0), 42);
    RH_ASSERT_EQ(parseIntInRange("-7", INT_MIN, INT_MAX, 0), -7);
    RH_ASSERT_EQ(parseIntInRange("007", INT_MIN, INT_MAX, 0), 7);
    RH_ASSERT_EQ(parseIntInRange("-2147483648", INT_MIN, INT_MAX, 0), INT_MIN);
    for (const char* invalidValue : {"", "-", " 1", "1 ", "+1", "1_000", "1.5", "0x10", "abc"}) {
      RH_ASSERT_EQ(parseIntInRange(invalidValue, INT_MIN, INT_MAX, 123), 123) << invalidValue;
    }
  }

  RH_TEST_CASE(parseIntInRange) {
    RH_ASSERT_EQ(parseIntInRange("5", 1, 10, 3), 5);
    RH_ASSERT_EQ(parseIntInRange("x", 1, 10, 3), 3);
    RH_ASSERT_EQ(parseIntInRange("+5", 1, 10, 3), 3);
    RH_ASSERT_EQ(parseIntInRange("0", 1, 10, 3), 3);
    RH_ASSERT_EQ(parseIntInRange("11", 1, 10, 3), 3);
    RH_ASSERT_EQ(parseIntInRange("0", 1, 10, 3, MIN_IF_TOO_SMALL), 1);
    RH_ASSERT_EQ(parseIntInRange("11", 1, 10, 3, MIN_IF_TOO_SMALL), 3);
    RH_ASSERT_EQ(parseIntInRange("11", 1, 10, 3, MAX_IF_TOO_LARGE), 10);
    RH_ASSERT_EQ(parseIntInRange("5000000000", 1, INT_MAX, 3, MAX_IF_TOO_LARGE), INT_MAX);
    RH_ASSERT_EQ(parseIntInRange("99999999999999999999", 1, INT_MAX, 3, MAX_IF_TOO_LARGE), INT_MAX);
    RH_ASSERT_EQ(parseIntInRange("-99999999999999999999", 1, 10, 3, MIN_IF_TOO_SMALL), 1);
  }

  RH_TEST_CASE(trim) {
    RH_ASSERT_EQ(trim(""), "");
    RH_ASSERT_EQ(trim("   "), "");
    RH_ASSERT_EQ(trim("all"), "all");
    RH_ASSERT_EQ(trim(" all\t"), "all");
    RH_ASSERT_EQ(trim("\n12 34\r\n"), "12 34");
  }
};

}  // namespace rhbase

int main() {
  rhbase::StringTest().run();
  return 0;
}
