#ifndef INCLUDE_CODEBOX_RUNTIME_H_
#define INCLUDE_CODEBOX_RUNTIME_H_

#include <string>

#include <nlohmann/json.hpp>
#include <codebox/language.h>
#include <codebox/execution_result.h>

// Executes code of one (or more) languages under isolation.
// Implementations must be safe to call from many threads at once.
class LanguageRuntime {
 public:
  virtual ~LanguageRuntime() = default;

  // Conservative pre-check; never executes the code.
  // false means the code can not run successfully.
  virtual bool Validate(const std::string& code, Language lang) const = 0;

  // Failures of the code itself are reported in the result; platform
  // failures throw SandboxError. timeout_ms <= 0 selects the configured default.
  virtual ExecutionResult Execute(const std::string& code, Language lang, long timeout_ms,
                                  const nlohmann::json& ext) const = 0;
  ExecutionResult Execute(const std::string& code, Language lang, long timeout_ms) const {
    return Execute(code, lang, timeout_ms, nlohmann::json::object());
  }
};

#endif  // INCLUDE_CODEBOX_RUNTIME_H_
