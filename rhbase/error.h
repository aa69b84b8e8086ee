#ifndef RHBASE_ERROR_H
#define RHBASE_ERROR_H

#include <stdexcept>
#include <string>

namespace rhbase {

// Base class for all exceptions thrown by rhbase and by the libraries built on it.
class Error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

// Non-recoverable error due to a logical error on the client side (function call breaking some preconditions).
class InvalidStateError : public Error {
public:
  using Error::Error;
};

// Error of a system call.
class SystemError : public Error {
public:
  using Error::Error;
  // Message "<operation> failed: <description of errorNumber>", e.g. SystemError("mkstemp", errno).
  SystemError(const std::string& operation, int errorNumber);

  // errno value, or 0 if unknown.
  int errorNumber() const { return m_errorNumber; }

private:
  int m_errorNumber = 0;
};

// Some file was not found.
class FileNotFoundError : public SystemError {
public:
  using SystemError::SystemError;
};

// Invalid string input.
class ParseError : public Error {
public:
  using Error::Error;
};

}  // namespace rhbase

#endif
