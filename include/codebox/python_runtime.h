#ifndef INCLUDE_CODEBOX_PYTHON_RUNTIME_H_
#define INCLUDE_CODEBOX_PYTHON_RUNTIME_H_

#include <memory>

#include <codebox/config.h>
#include <codebox/runtime.h>

class CodePolicy;

// One python3 process per call.
// ext: "entry_point" (string), "args" (array), "kwargs" (object)
class PythonRuntime : public LanguageRuntime {
  RuntimeConfig config_;
  std::shared_ptr<const CodePolicy> policy_;
 public:
  explicit PythonRuntime(RuntimeConfig config = {}); // throws std::invalid_argument on a bad blocked pattern
  ~PythonRuntime() override;

  bool Validate(const std::string& code, Language lang) const override;
  using LanguageRuntime::Execute;
  ExecutionResult Execute(const std::string& code, Language lang, long timeout_ms,
                          const nlohmann::json& ext) const override;
};

#endif  // INCLUDE_CODEBOX_PYTHON_RUNTIME_H_
