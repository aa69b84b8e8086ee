// Command line parsing for the tools.
//
// parseArgs takes a list of (name, pointer) pairs. A name starting with '-' declares a flag, other names declare
// positional arguments, which are all mandatory and filled in declaration order:
//   int main(int argc, char** argv) {
//     std::string documentPath;
//     std::optional<std::string> limit;  // Stays unset if --limit is not passed.
//     bool authenticated = false;        // Set to true if --authenticated is passed.
//     rhbase::parseArgs(argc, argv, "--limit", &limit, "--authenticated", &authenticated, "path", &documentPath);
//   }
//
// Accepted syntaxes:
//   history_page --limit=20 fr/docs/Web
//   history_page --limit 20 fr/docs/Web      # The value can be the next argument.
//   history_page -limit=all fr/docs/Web      # One dash is enough.
//   history_page fr/docs/Web --authenticated # Flags and positional arguments can be mixed.
//   history_page --page -1 fr/docs/Web       # Negative numbers are values, not flags.
//   history_page -- --strange-path--         # Nothing after "--" is a flag.
//   history_page --help                      # Prints the usage and exits.
//
// Appending ",required" to a flag name makes the flag mandatory with a non-empty value:
//   rhbase::parseArgs(argc, argv, "--database,required", &databasePath);
#ifndef RHBASE_ARGS_PARSER_H
#define RHBASE_ARGS_PARSER_H

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "error.h"

namespace rhbase {

// Invalid command line. Mistakes in the declaration of arguments throw std::invalid_argument instead.
class FlagParsingError : public Error {
public:
  using Error::Error;
};

class ArgsParser;

// Set of flags declared by a library, passed to parseArgs as a pointer among the other arguments. Example:
//   class StoreFlags : public rhbase::FlagsConsumer {
//   public:
//     void declareFlags(rhbase::ArgsParser& parser) override { parser.addArgs("--database", &m_database); }
//   private:
//     std::string m_database;
//   };
class FlagsConsumer {
public:
  virtual void declareFlags(ArgsParser& parser) = 0;

protected:
  ~FlagsConsumer() = default;
};

class ArgsParser {
public:
  template <typename T, typename... Args>
  void addArgs(const char* name, T* value, Args... args) {
    if (value == nullptr) {
      throw std::invalid_argument(std::string("Null pointer for argument '") + name + "'");
    }
    addArg(name, value);
    addArgs(args...);
  }

  template <typename... Args>
  void addArgs(FlagsConsumer* consumer, Args... args) {
    if (consumer == nullptr) {
      throw std::invalid_argument("Null flags consumer");
    }
    consumer->declareFlags(*this);
    addArgs(args...);
  }

  void addArgs() {}

  // Throws: FlagParsingError.
  void run(int argc, const char* const* argv);

private:
  using SetValueCallback = std::function<void(const std::string&)>;

  struct Arg {
    // Without the leading dashes for flags.
    std::string name;
    bool isFlag = false;
    // False for boolean flags.
    bool takesValue = true;
    bool required = false;
    // Last value found on the command line.
    std::optional<std::string> value;
    SetValueCallback setValue;
  };

  void declare(const char* spec, bool takesValue, SetValueCallback setValue);
  Arg* findFlag(std::string_view name);
  Arg* findUnsetPositionalArg();
  // Checks that required arguments are present and passes values to the callbacks.
  void assignValues();
  [[noreturn]] void printUsage(const char* binary) const;

  void addArg(const char* name, std::string* value);
  // Only for flags.
  void addArg(const char* name, std::optional<std::string>* value);
  // Only for flags, which do not take a value.
  void addArg(const char* name, bool* value);

  // In declaration order.
  std::vector<Arg> m_args;
};

template <typename... Args>
void parseArgs(int argc, const char* const* argv, Args... args) {
  ArgsParser parser;
  parser.addArgs(args...);
  parser.run(argc, argv);
}

}  // namespace rhbase

#endif
