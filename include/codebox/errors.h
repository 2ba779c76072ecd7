#ifndef INCLUDE_CODEBOX_ERRORS_H_
#define INCLUDE_CODEBOX_ERRORS_H_

#include <stdexcept>
#include <string>

class CodeboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// No runtime bound to the requested language; nothing was executed.
class UnsupportedLanguageError : public CodeboxError {
 public:
  explicit UnsupportedLanguageError(const std::string& language) :
      CodeboxError("Unsupported language: " + language) {}
};

// The platform could not provide a sandbox (pipes, fork, box directory,
// missing interpreter). Not a verdict on the submitted code.
class SandboxError : public CodeboxError {
 public:
  using CodeboxError::CodeboxError;
};

#endif  // INCLUDE_CODEBOX_ERRORS_H_
