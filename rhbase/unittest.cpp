#include "unittest.h"
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include "log.h"

using std::string;

namespace rhbase {

int Test::registerTestCase(const char* name, std::function<void()> function) {
  for (const TestCase& testCase : m_testCases) {
    RH_ASSERT(testCase.name != name) << "Duplicate test case '" << name << "'";
  }
  m_testCases.push_back({name, std::move(function)});
  return 0;
}

void Test::run(const string& testName) {
  int numTestCasesRun = 0;
  for (const TestCase& testCase : m_testCases) {
    if (!testName.empty() && testCase.name != testName) {
      continue;
    }
    setUp();
    try {
      testCase.function();
    } catch (const std::exception& error) {
      RH_FATAL << "Test case '" << testCase.name << "' failed with an exception: " << error.what();
    }
    tearDown();
    numTestCasesRun++;
  }
  RH_ASSERT(numTestCasesRun > 0) << "No test case named '" << testName << "'";
}

}  // namespace rhbase
