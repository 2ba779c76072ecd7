#include <codebox/js_runtime.h>

#include <regex>

#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include "harness.h"
#include "paths.h"
#include "policy.h"
#include "uid_pool.h"
#include "utils.h"

namespace {

// argv: user code, payload, result file.
// The user code runs as a script in the global scope, so its top-level
// declarations are visible to the entry point lookup but not the harness locals.
constexpr char kHarness[] = R"('use strict';
const fs = require('fs');
const vm = require('vm');

const [codePath, payloadPath, resultPath] = process.argv.slice(2);
let finished = false;

function write(doc) {
  if (finished) return;
  finished = true;
  fs.writeFileSync(resultPath, JSON.stringify(doc));
}

function describe(err) {
  if (err instanceof Error) return err.name + ': ' + err.message;
  return 'Uncaught ' + String(err);
}

function fail(kind, err) {
  if (err && err.stack) process.stderr.write(err.stack + '\n');
  write({ ok: false, kind, message: typeof err === 'string' ? err : describe(err) });
  process.exitCode = 1;
}

function serialize(value) {
  if (value === undefined || value === null) return '';
  if (typeof value === 'string') return value;
  const text = JSON.stringify(value);
  if (text === undefined) throw new TypeError('a ' + typeof value + ' has no JSON representation');
  return text;
}

process.on('uncaughtException', (err) => {
  fail('exception', err);
  process.exit(1);
});
process.on('unhandledRejection', (err) => {
  fail('exception', err);
  process.exit(1);
});

async function main() {
  const payload = JSON.parse(fs.readFileSync(payloadPath, 'utf8'));
  const source = fs.readFileSync(codePath, 'utf8');
  let value;
  try {
    vm.runInThisContext(source, { filename: 'evaluator.js' });
    const entry = payload.entry_point;
    if (entry) {
      const func = vm.runInThisContext(`typeof ${entry} === 'function' ? ${entry} : undefined`);
      if (typeof func !== 'function') {
        fail('entry_point', entry + ' is not defined');
        return;
      }
      value = await func(...(payload.args || []));
    } else {
      value = await vm.runInThisContext(
        "typeof evaluation_result === 'undefined' ? undefined : evaluation_result");
    }
  } catch (err) {
    fail('exception', err);
    return;
  }
  let text;
  try {
    text = serialize(value);
  } catch (err) {
    fail('serialization', err);
    return;
  }
  write({ ok: true, value: text });
}

// pending timers or handles of the user code must not keep the process alive
main().then(() => process.exit(), (err) => {
  fail('exception', err);
  process.exit(1);
});
)";

std::optional<std::string> ParseExt(const nlohmann::json& ext, nlohmann::json& payload) {
  static const std::regex kIdentifier(R"([A-Za-z_$][A-Za-z0-9_$]*)");
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
    return "invalid ext: kwargs is not supported for JS";
  }
  return std::nullopt;
}

void CheckLanguage(Language lang) {
  if (lang != Language::JAVASCRIPT) throw UnsupportedLanguageError(LanguageName(lang));
}

} // namespace

JavaScriptRuntime::JavaScriptRuntime(RuntimeConfig config) :
    config_(std::move(config)),
    policy_(std::make_shared<CodePolicy>(config_.blocked_patterns)) {}

JavaScriptRuntime::~JavaScriptRuntime() = default;

bool JavaScriptRuntime::Validate(const std::string& code, Language lang) const {
  CheckLanguage(lang);
  if (auto reason = policy_->Check(code)) {
    spdlog::debug("JS validation rejected: {}", *reason);
    return false;
  }
  fs::path node = RequireExecutable(config_.node_path);
  UidLease uid;
  BoxDir box(config_.box_root, "js-check", uid.Uid());
  if (!WriteFile(BoxUserCode(box.Path(), lang), code)) {
    throw SandboxError("cannot write code into box " + box.Path().string());
  }
  SandboxOptions opt = HarnessOptions(config_, box.Path(), uid.Uid(),
                                      config_.validate_timeout_ms * 1000, node);
  opt.command = {node, "--check", BoxUserCode(box.Path(), lang, true)};
  SandboxResult res = SandboxExec(opt);
  if (res.timed_out) spdlog::warn("JS validation timed out after {}ms", config_.validate_timeout_ms);
  return !res.timed_out && !res.term_signal && res.exit_code == 0;
}

ExecutionResult JavaScriptRuntime::Execute(const std::string& code, Language lang, long timeout_ms,
                                           const nlohmann::json& ext) const {
  CheckLanguage(lang);
  if (auto reason = policy_->Check(code)) {
    return ExecutionResult::Failure(*reason);
  }
  nlohmann::json payload;
  if (auto error = ParseExt(ext, payload)) return ExecutionResult::Failure(*error);
  fs::path node = RequireExecutable(config_.node_path);

  UidLease uid;
  BoxDir box(config_.box_root, "js", uid.Uid());
  const fs::path& dir = box.Path();
  if (!WriteFile(BoxUserCode(dir, lang), code) ||
      !WriteFile(BoxHarness(dir, lang), kHarness) ||
      !WriteFile(BoxPayload(dir), payload.dump())) {
    throw SandboxError("cannot write files into box " + dir.string());
  }
  SandboxOptions opt = HarnessOptions(config_, dir, uid.Uid(),
                                      EffectiveWallTime(config_, timeout_ms), node);
  // V8 reserves far more address space than it uses, so the heap is capped
  // through V8 instead of RLIMIT_AS
  opt.command = {node};
  if (config_.node_heap_mb) {
    opt.command.push_back("--max-old-space-size=" + std::to_string(config_.node_heap_mb));
  }
  opt.command.insert(opt.command.end(), {BoxHarness(dir, lang, true), BoxUserCode(dir, lang, true),
                                         BoxPayload(dir, true), BoxResult(dir, true)});
  return CollectResult(SandboxExec(opt), BoxResult(dir), config_.max_file_kib * 1024);
}
