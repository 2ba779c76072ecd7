#include <codebox/python_runtime.h>

#include <regex>

#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include "harness.h"
#include "paths.h"
#include "policy.h"
#include "uid_pool.h"
#include "utils.h"

namespace {

// argv: user code, payload, result file
constexpr char kHarness[] = R"(import asyncio
import inspect
import json
import os
import sys
import traceback


class EvalOutput:
    def __init__(self, score, reason=""):
        self.score = score
        self.reason = reason


def _write(path, doc):
    with open(path, "w", encoding="utf-8") as f:
        json.dump(doc, f, ensure_ascii=False)


def _describe(exc):
    msg = str(exc)
    return type(exc).__name__ + ": " + msg if msg else type(exc).__name__


def _serialize(value):
    if value is None:
        return ""
    if isinstance(value, str):
        return value
    if isinstance(value, EvalOutput):
        value = {"score": value.score, "reason": value.reason}
    return json.dumps(value, ensure_ascii=False, allow_nan=False)


async def _await(awaitable):
    return await awaitable


def main(code_path, payload_path, result_path):
    with open(payload_path, encoding="utf-8") as f:
        payload = json.load(f)
    with open(code_path, encoding="utf-8") as f:
        source = f.read()
    scope = {"__name__": "__evaluator__", "EvalOutput": EvalOutput, "json": json}
    try:
        exec(compile(source, "<evaluator>", "exec"), scope)
        entry = payload.get("entry_point")
        if entry:
            func = scope.get(entry)
            if not callable(func):
                _write(result_path, {"ok": False, "kind": "entry_point",
                                     "message": entry + " is not defined"})
                return 1
            value = func(*payload.get("args", []), **payload.get("kwargs", {}))
        else:
            value = scope.get("evaluation_result")
        if inspect.isawaitable(value):
            value = asyncio.run(_await(value))
    except BaseException as exc:
        traceback.print_exc()
        _write(result_path, {"ok": False, "kind": "exception", "message": _describe(exc)})
        return 1
    try:
        text = _serialize(value)
    except Exception as exc:
        _write(result_path, {"ok": False, "kind": "serialization", "message": _describe(exc)})
        return 1
    _write(result_path, {"ok": True, "value": text})
    return 0


if __name__ == "__main__":
    code = main(*sys.argv[1:4])
    sys.stdout.flush()
    sys.stderr.flush()
    # threads left behind by the user code must not keep the process alive
    os._exit(code)
)";

// argv: user code; compiles without executing
constexpr char kSyntaxCheck[] = R"(import sys
with open(sys.argv[1], encoding="utf-8") as f:
    source = f.read()
try:
    compile(source, "<evaluator>", "exec", dont_inherit=True)
except (SyntaxError, ValueError) as e:
    print(e, file=sys.stderr)
    sys.exit(1)
)";

std::optional<std::string> ParseExt(const nlohmann::json& ext, nlohmann::json& payload) {
  static const std::regex kIdentifier(R"([A-Za-z_][A-Za-z0-9_]*)");
  payload = nlohmann::json::object();
  if (ext.is_null()) return std::nullopt;
  if (!ext.is_object()) return "invalid ext: expected an object";
  if (auto it = ext.find("entry_point"); it != ext.end() && !it->is_null()) {
    if (!it->is_string()) return "invalid ext: entry_point must be a string";
    auto name = it->get<std::string>();
    if (!std::regex_match(name, kIdentifier)) {
      return "invalid ext: entry_point '" + name + "' is not an identifier";
    }
    payload["entry_point"] = name;
  }
  if (auto it = ext.find("args"); it != ext.end() && !it->is_null()) {
    if (!it->is_array()) return "invalid ext: args must be an array";
    payload["args"] = *it;
  }
  if (auto it = ext.find("kwargs"); it != ext.end() && !it->is_null()) {
    if (!it->is_object()) return "invalid ext: kwargs must be an object";
    payload["kwargs"] = *it;
  }
  return std::nullopt;
}

void CheckLanguage(Language lang) {
  if (lang != Language::PYTHON) throw UnsupportedLanguageError(LanguageName(lang));
}

} // namespace

PythonRuntime::PythonRuntime(RuntimeConfig config) :
    config_(std::move(config)),
    policy_(std::make_shared<CodePolicy>(config_.blocked_patterns)) {}

PythonRuntime::~PythonRuntime() = default;

bool PythonRuntime::Validate(const std::string& code, Language lang) const {
  CheckLanguage(lang);
  if (auto reason = policy_->Check(code)) {
    spdlog::debug("Python validation rejected: {}", *reason);
    return false;
  }
  fs::path python = RequireExecutable(config_.python_path);
  UidLease uid;
  BoxDir box(config_.box_root, "py-check", uid.Uid());
  if (!WriteFile(BoxUserCode(box.Path(), lang), code)) {
    throw SandboxError("cannot write code into box " + box.Path().string());
  }
  SandboxOptions opt = HarnessOptions(config_, box.Path(), uid.Uid(),
                                      config_.validate_timeout_ms * 1000, python);
  opt.command = {python, "-I", "-B", "-c", kSyntaxCheck, BoxUserCode(box.Path(), lang, true)};
  opt.vss = config_.python_memory_mb * 1024;
  SandboxResult res = SandboxExec(opt);
  if (res.timed_out) spdlog::warn("Python validation timed out after {}ms", config_.validate_timeout_ms);
  return !res.timed_out && !res.term_signal && res.exit_code == 0;
}

ExecutionResult PythonRuntime::Execute(const std::string& code, Language lang, long timeout_ms,
                                       const nlohmann::json& ext) const {
  CheckLanguage(lang);
  if (auto reason = policy_->Check(code)) {
    return ExecutionResult::Failure(*reason);
  }
  nlohmann::json payload;
  if (auto error = ParseExt(ext, payload)) return ExecutionResult::Failure(*error);
  fs::path python = RequireExecutable(config_.python_path);

  UidLease uid;
  BoxDir box(config_.box_root, "py", uid.Uid());
  const fs::path& dir = box.Path();
  if (!WriteFile(BoxUserCode(dir, lang), code) ||
      !WriteFile(BoxHarness(dir, lang), kHarness) ||
      !WriteFile(BoxPayload(dir), payload.dump())) {
    throw SandboxError("cannot write files into box " + dir.string());
  }
  SandboxOptions opt = HarnessOptions(config_, dir, uid.Uid(),
                                      EffectiveWallTime(config_, timeout_ms), python);
  // -I: ignore PYTHON* variables and user site; -u: unbuffered, so output
  // written before a kill is not lost
  opt.command = {python, "-I", "-B", "-u", BoxHarness(dir, lang, true),
                 BoxUserCode(dir, lang, true), BoxPayload(dir, true), BoxResult(dir, true)};
  opt.vss = config_.python_memory_mb * 1024;
  return CollectResult(SandboxExec(opt), BoxResult(dir), config_.max_file_kib * 1024);
}
