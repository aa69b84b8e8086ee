#include "args_parser.h"
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "error.h"

using std::string;
using std::string_view;

namespace rhbase {

// "-" and negative numbers such as "-12" are values. "--" is a flag with an empty name.
static bool looksLikeFlag(string_view arg) {
  return arg.size() >= 2 && arg[0] == '-' && arg.find_first_not_of("0123456789", 1) != string_view::npos;
}

static string_view removeDashes(string_view flag) {
  flag.remove_prefix(flag.size() >= 2 && flag[1] == '-' ? 2 : 1);
  return flag;
}

// "DATABASE" for "database", "DRY_RUN" for "dry-run".
static string getPlaceholder(const string& flagName) {
  string placeholder;
  for (char c : flagName) {
    placeholder += c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return placeholder;
}

void ArgsParser::declare(const char* spec, bool takesValue, SetValueCallback setValue) {
  string_view specView(spec);
  Arg arg;
  arg.takesValue = takesValue;
  arg.setValue = std::move(setValue);
  if (looksLikeFlag(specView)) {
    string_view name = removeDashes(specView);
    size_t comma = name.find(',');
    if (comma != string_view::npos) {
      if (name.substr(comma + 1) != "required") {
        throw std::invalid_argument("Invalid flag attribute in '" + string(spec) + "'");
      }
      arg.required = true;
      name = name.substr(0, comma);
    }
    if (name.empty() || name[0] == '-' || name.find('=') != string_view::npos) {
      throw std::invalid_argument("Invalid flag name '" + string(spec) + "'");
    } else if (findFlag(name) != nullptr) {
      throw std::invalid_argument("Duplicate flag '" + string(spec) + "'");
    }
    arg.isFlag = true;
    arg.name = string(name);
  } else if (specView.empty() || specView[0] == '-') {
    throw std::invalid_argument("Invalid argument name '" + string(spec) + "'");
  } else if (!takesValue) {
    throw std::invalid_argument("Positional argument '" + string(spec) + "' cannot be a boolean");
  } else {
    arg.name = string(spec);
    arg.required = true;
  }
  m_args.push_back(std::move(arg));
}

ArgsParser::Arg* ArgsParser::findFlag(string_view name) {
  for (Arg& arg : m_args) {
    if (arg.isFlag && arg.name == name) {
      return &arg;
    }
  }
  return nullptr;
}

ArgsParser::Arg* ArgsParser::findUnsetPositionalArg() {
  for (Arg& arg : m_args) {
    if (!arg.isFlag && !arg.value) {
      return &arg;
    }
  }
  return nullptr;
}

void ArgsParser::addArg(const char* name, string* value) {
  declare(name, true, [value](const string& rawValue) { *value = rawValue; });
}

void ArgsParser::addArg(const char* name, std::optional<string>* value) {
  if (!looksLikeFlag(name)) {
    throw std::invalid_argument("Positional argument '" + string(name) + "' cannot be optional");
  }
  declare(name, true, [value](const string& rawValue) { *value = rawValue; });
}

void ArgsParser::addArg(const char* name, bool* value) {
  declare(name, false, [value](const string&) { *value = true; });
}

void ArgsParser::assignValues() {
  for (Arg& arg : m_args) {
    if (!arg.value) {
      if (!arg.required) {
        continue;
      } else if (arg.isFlag) {
        throw FlagParsingError("Missing required flag --" + arg.name);
      }
      throw FlagParsingError("Missing argument " + arg.name);
    } else if (arg.isFlag && arg.required && arg.value->empty()) {
      throw FlagParsingError("Empty value for required flag --" + arg.name);
    }
    arg.setValue(*arg.value);
  }
}

void ArgsParser::printUsage(const char* binary) const {
  string_view binaryName(binary);
  size_t lastSlash = binaryName.rfind('/');
  if (lastSlash != string_view::npos) {
    binaryName.remove_prefix(lastSlash + 1);
  }
  std::cerr << "Usage: " << binaryName;
  for (const Arg& arg : m_args) {
    if (arg.isFlag) {
      string usage = "--" + arg.name;
      if (arg.takesValue) {
        usage += "=" + getPlaceholder(arg.name);
      }
      std::cerr << ' ' << (arg.required ? usage : "[" + usage + "]");
    }
  }
  for (const Arg& arg : m_args) {
    if (!arg.isFlag) {
      std::cerr << ' ' << arg.name;
    }
  }
  std::cerr << '\n';
  exit(0);
}

void ArgsParser::run(int argc, const char* const* argv) {
  bool endOfFlags = false;
  for (int i = 1; i < argc; i++) {
    string_view token(argv[i]);
    if (endOfFlags || !looksLikeFlag(token)) {
      Arg* positionalArg = findUnsetPositionalArg();
      if (positionalArg == nullptr) {
        throw FlagParsingError("Too many arguments");
      }
      positionalArg->value = string(token);
      continue;
    }
    string_view name = removeDashes(token);
    if (name.empty()) {
      endOfFlags = true;
      continue;
    }
    std::optional<string_view> inlineValue;
    size_t equalSign = name.find('=');
    if (equalSign != string_view::npos) {
      inlineValue = name.substr(equalSign + 1);
      name = name.substr(0, equalSign);
    }
    Arg* flag = findFlag(name);
    if (flag == nullptr) {
      if (name == "help") {
        printUsage(argv[0]);
      }
      throw FlagParsingError("Invalid flag --" + string(name));
    }
    if (!flag->takesValue) {
      if (inlineValue) {
        throw FlagParsingError("Flag --" + flag->name + " does not take a value");
      }
      flag->value = string();
    } else if (inlineValue) {
      flag->value = string(*inlineValue);
    } else if (i + 1 < argc && !looksLikeFlag(argv[i + 1])) {
      i++;
      flag->value = string(argv[i]);
    } else {
      throw FlagParsingError("Missing value for flag --" + flag->name);
    }
  }
  assignValues();
}

}  // namespace rhbase
