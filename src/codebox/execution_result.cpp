#include <codebox/execution_result.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

const char kTimeoutError[] = "timeout";

ExecutionResult::ExecutionResult(std::string out, std::string err, std::string return_value,
                                 std::optional<std::string> error, const Stats& stats) :
    stdout_(std::move(out)), stderr_(std::move(err)), return_value_(std::move(return_value)),
    success_(!error), error_(std::move(error)), stats_(stats) {}

ExecutionResult ExecutionResult::Success(std::string out, std::string err, std::string return_value,
                                         const Stats& stats) {
  return ExecutionResult(std::move(out), std::move(err), std::move(return_value), std::nullopt, stats);
}

ExecutionResult ExecutionResult::Failure(std::string error, std::string out, std::string err,
                                         const Stats& stats) {
  if (error.empty()) throw std::invalid_argument("a failed execution needs an error description");
  return ExecutionResult(std::move(out), std::move(err), "", std::move(error), stats);
}

ExecutionResult ExecutionResult::Timeout(std::string out, std::string err, const Stats& stats) {
  return Failure(kTimeoutError, std::move(out), std::move(err), stats);
}

nlohmann::json ExecutionResult::ToJson() const {
  return {
    {"stdout", stdout_},
    {"stderr", stderr_},
    {"ret_val", return_value_},
    {"success", success_},
    {"error", error_ ? nlohmann::json(*error_) : nlohmann::json(nullptr)},
  };
}
