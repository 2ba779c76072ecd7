#ifndef INCLUDE_CODEBOX_EXECUTION_RESULT_H_
#define INCLUDE_CODEBOX_EXECUTION_RESULT_H_

#include <string>
#include <optional>

#include <nlohmann/json_fwd.hpp>

extern const char kTimeoutError[];

// termination details of the sandboxed process, for logging and the CLI
struct ExecutionStats {
  int exit_code = 0;
  int term_signal = 0;
  long elapsed_us = 0;
  bool output_truncated = false;
};

// Outcome of one execution attempt.
// success implies !error; !success implies a non-empty error.
class ExecutionResult {
 public:
  using Stats = ExecutionStats;

  static ExecutionResult Success(std::string out, std::string err, std::string return_value,
                                 const Stats& stats = {});
  // throws std::invalid_argument if error is empty
  static ExecutionResult Failure(std::string error, std::string out = "", std::string err = "",
                                 const Stats& stats = {});
  static ExecutionResult Timeout(std::string out, std::string err, const Stats& stats = {});

  const std::string& Stdout() const { return stdout_; }
  const std::string& Stderr() const { return stderr_; }
  const std::string& ReturnValue() const { return return_value_; }
  bool IsSuccess() const { return success_; }
  const std::optional<std::string>& Error() const { return error_; }
  bool IsTimeout() const { return error_ && *error_ == kTimeoutError; }
  const Stats& GetStats() const { return stats_; }

  // {"stdout", "stderr", "ret_val", "success", "error"}
  nlohmann::json ToJson() const;

 private:
  ExecutionResult(std::string out, std::string err, std::string return_value,
                  std::optional<std::string> error, const Stats& stats);

  std::string stdout_, stderr_, return_value_;
  bool success_;
  std::optional<std::string> error_;
  Stats stats_;
};

#endif  // INCLUDE_CODEBOX_EXECUTION_RESULT_H_
