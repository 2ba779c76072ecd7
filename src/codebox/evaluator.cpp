#include <codebox/evaluator.h>

#include <atomic>
#include <thread>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include "policy.h"

namespace {

const char* kEvaluatorRunStatusTable[] = {
#define X(name, str) str,
  ENUM_EVALUATOR_RUN_STATUS_
#undef X
};

EvaluatorOutput FailedOutput(int code, std::string message, std::string out = "") {
  EvaluatorOutput ret;
  ret.status = EvaluatorRunStatus::FAIL;
  ret.error_code = code;
  ret.error_message = std::move(message);
  ret.stdout_text = std::move(out);
  return ret;
}

} // namespace

const char* EvaluatorRunStatusName(EvaluatorRunStatus status) {
  return kEvaluatorRunStatusTable[(int)status];
}

nlohmann::json EvaluatorOutput::ToJson() const {
  nlohmann::json ret = {
    {"status", EvaluatorRunStatusName(status)},
    {"stdout", stdout_text},
  };
  if (status == EvaluatorRunStatus::FAIL) {
    ret["evaluator_run_error"] = {{"code", error_code}, {"message", error_message}};
  } else {
    ret["evaluator_result"] = {
      {"score", score ? nlohmann::json(*score) : nlohmann::json(nullptr)},
      {"reasoning", reasoning},
    };
  }
  return ret;
}

EvaluatorOutput ToEvaluatorOutput(const ExecutionResult& result) {
  if (!result.IsSuccess()) {
    // the error of a code failure may be terse; the captured stderr is the fallback
    std::string message = result.Error().value_or("");
    if (message.empty()) message = result.Stderr();
    return FailedOutput(kRunErrorCode, message, result.Stdout());
  }
  EvaluatorOutput ret;
  ret.status = EvaluatorRunStatus::SUCCESS;
  ret.stdout_text = result.Stdout();
  const std::string& value = result.ReturnValue();
  if (value.empty()) return ret;
  auto doc = nlohmann::json::parse(value, nullptr, false);
  if (doc.is_object()) {
    if (auto it = doc.find("score"); it != doc.end() && it->is_number()) ret.score = it->get<double>();
    if (auto it = doc.find("reason"); it != doc.end() && !it->is_null()) {
      ret.reasoning = it->is_string() ? it->get<std::string>() : it->dump();
    }
  } else if (doc.is_number()) {
    ret.score = doc.get<double>();
  } else {
    ret.reasoning = value;
  }
  return ret;
}

bool ValidateCodeEvaluator(const RuntimeRegistry& registry, const CodeEvaluator& evaluator) {
  auto runtime = registry.Resolve(evaluator.language);
  if (auto reason = CheckEntryPoint(evaluator.code, evaluator.language, evaluator.entry_point)) {
    spdlog::debug("Code evaluator rejected: {}", *reason);
    return false;
  }
  return runtime->Validate(evaluator.code, evaluator.language);
}

EvaluatorOutput RunCodeEvaluator(const RuntimeRegistry& registry, const CodeEvaluator& evaluator,
                                 const nlohmann::json& turn) {
  auto runtime = registry.Resolve(evaluator.language);
  nlohmann::json ext = {
    {"entry_point", evaluator.entry_point},
    {"args", nlohmann::json::array({turn})},
  };
  ExecutionResult result = runtime->Execute(evaluator.code, evaluator.language, evaluator.timeout_ms, ext);
  spdlog::debug("Code evaluator finished: language={} success={} elapsed_us={}",
                LanguageName(evaluator.language), result.IsSuccess(), result.GetStats().elapsed_us);
  return ToEvaluatorOutput(result);
}

std::vector<EvaluatorOutput> RunCodeEvaluatorBatch(
    const RuntimeRegistry& registry, const CodeEvaluator& evaluator,
    const std::vector<nlohmann::json>& turns, int max_parallel) {
  std::vector<EvaluatorOutput> ret(turns.size());
  std::atomic_size_t next = 0;
  auto worker = [&]() {
    for (size_t i; (i = next++) < turns.size();) {
      try {
        ret[i] = RunCodeEvaluator(registry, evaluator, turns[i]);
      } catch (const std::exception& e) {
        spdlog::warn("Code evaluator failed on turn {}: {}", i, e.what());
        ret[i] = FailedOutput(kRunErrorCode, e.what());
      }
    }
  };
  size_t workers = std::min<size_t>(std::max(max_parallel, 1), turns.size());
  std::vector<std::thread> threads;
  for (size_t i = 0; i < workers; i++) threads.emplace_back(worker);
  for (auto& i : threads) i.join();
  return ret;
}
