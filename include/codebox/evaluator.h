#ifndef INCLUDE_CODEBOX_EVALUATOR_H_
#define INCLUDE_CODEBOX_EVALUATOR_H_

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>
#include <codebox/language.h>
#include <codebox/registry.h>
#include <codebox/execution_result.h>

#define ENUM_EVALUATOR_RUN_STATUS_ \
  X(UNKNOWN, "unknown") \
  X(SUCCESS, "success") \
  X(FAIL, "fail")
enum class EvaluatorRunStatus {
#define X(name, str) name,
  ENUM_EVALUATOR_RUN_STATUS_
#undef X
};

const char* EvaluatorRunStatusName(EvaluatorRunStatus);

constexpr int kRunErrorCode = 500;

// A code evaluator defines `entry_point(turn)` returning
// {"score": number, "reason": string} (or EvalOutput in Python).
struct CodeEvaluator {
  std::string code;
  Language language = Language::PYTHON;
  long timeout_ms = 5000;
  std::string entry_point = "exec_evaluation";
};

struct EvaluatorOutput {
  EvaluatorRunStatus status = EvaluatorRunStatus::UNKNOWN;
  std::optional<double> score;
  std::string reasoning;
  // set if status == FAIL
  int error_code = 0;
  std::string error_message;
  std::string stdout_text;

  nlohmann::json ToJson() const;
};

// Maps an execution result onto an evaluator output.
EvaluatorOutput ToEvaluatorOutput(const ExecutionResult&);

// Validate of the runtime plus a check that the code defines entry_point.
// Throws UnsupportedLanguageError / SandboxError like the runtimes do.
bool ValidateCodeEvaluator(const RuntimeRegistry&, const CodeEvaluator&);

// Throws UnsupportedLanguageError / SandboxError like the runtimes do.
EvaluatorOutput RunCodeEvaluator(const RuntimeRegistry&, const CodeEvaluator&,
                                 const nlohmann::json& turn);

// Runs the evaluator once per turn with at most max_parallel executions in
// flight. Outputs keep the order of turns; an exception only fails its own turn.
std::vector<EvaluatorOutput> RunCodeEvaluatorBatch(
    const RuntimeRegistry&, const CodeEvaluator&,
    const std::vector<nlohmann::json>& turns, int max_parallel = 1);

#endif  // INCLUDE_CODEBOX_EVALUATOR_H_
