// Minimal unit test framework. Test cases are methods declared with RH_TEST_CASE in a class derived from rhbase::Test.
// They run in declaration order, each one between setUp() and tearDown(). The first failing assertion aborts the
// program, so does an exception escaping from a test case.
//
//   class DocumentPathTest : public rhbase::Test {
//     RH_TEST_CASE(parse) { RH_ASSERT_EQ(parseDocumentPath("fr/docs/Web").locale, "fr"); }
//   };
//   int main() {
//     DocumentPathTest().run();
//     return 0;
//   }

#ifndef RHBASE_UNITTEST_H
#define RHBASE_UNITTEST_H

#include <functional>
#include <string>
#include <vector>

#define RH_TEST_CASE(x)                                                                 \
  int m_testCaseRegistration##x = registerTestCase(#x, [this]() { testCase##x(); }); \
  void testCase##x()

namespace rhbase {

class Test {
public:
  virtual ~Test() = default;

  // Runs all test cases, or only the one named testName if it is not empty.
  void run(const std::string& testName = std::string());

protected:
  virtual void setUp() {}
  virtual void tearDown() {}

  // Called by RH_TEST_CASE. The return value is only there to allow the call in a member initializer.
  int registerTestCase(const char* name, std::function<void()> function);

private:
  struct TestCase {
    std::string name;
    std::function<void()> function;
  };
  std::vector<TestCase> m_testCases;
};

}  // namespace rhbase

#endif
