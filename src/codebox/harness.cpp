#include "harness.h"

#include <cstdlib>
#include <limits>
#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include "paths.h"
#include "utils.h"

SandboxOptions HarnessOptions(const RuntimeConfig& config, const fs::path& box, int uid,
                              long wall_time_us, const fs::path& interpreter) {
  SandboxOptions opt;
  opt.helper = config.jail_helper.string();
  opt.boxdir = box.string();
  opt.workdir = BoxWorkdir(box, true).string();
  opt.uid = opt.gid = uid;
  opt.dirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  // e.g. /opt/node/bin/node -> /opt/node
  std::error_code ec;
  fs::path prefix = fs::canonical(interpreter, ec).parent_path().parent_path();
  if (!ec && prefix.has_relative_path() &&
      std::none_of(opt.dirs.begin(), opt.dirs.end(), [&](const std::string& dir) {
        return prefix.string().compare(0, dir.size() + 1, dir + "/") == 0 || prefix == dir;
      })) {
    opt.dirs.push_back(prefix.string());
  }
  opt.FilterDirs();
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.envs.push_back("HOME=" + opt.workdir);
  opt.envs.push_back("TMPDIR=" + opt.workdir);
  opt.envs.push_back("LANG=C.UTF-8");
  opt.wall_time = wall_time_us;
  // the wall time is the limit; this only stops threads burning cpu in parallel
  opt.cpu_time = wall_time_us + 1'000'000;
  opt.fsize = config.max_file_kib;
  opt.file_num = config.max_open_files;
  opt.proc_num = config.max_processes;
  opt.output_limit = config.max_output_kib * 1024;
  return opt;
}

long EffectiveWallTime(const RuntimeConfig& config, long timeout_ms) {
  if (timeout_ms <= 0) timeout_ms = config.default_timeout_ms;
  return timeout_ms * 1000;
}

fs::path RequireExecutable(const std::string& name) {
  fs::path ret = FindExecutable(name);
  if (ret.empty()) throw SandboxError("interpreter not found: " + name);
  return ret;
}

ExecutionResult CollectResult(SandboxResult&& res, const fs::path& result_file, size_t limit) {
  ExecutionResult::Stats stats;
  stats.exit_code = res.exit_code;
  stats.term_signal = res.term_signal;
  stats.elapsed_us = res.real_us;
  stats.output_truncated = res.output_truncated;
  auto failure = [&](const std::string& error) {
    return ExecutionResult::Failure(error, std::move(res.out), std::move(res.err), stats);
  };

  if (res.timed_out) return ExecutionResult::Timeout(std::move(res.out), std::move(res.err), stats);
  if (res.killed) return failure("cancelled");
  if (res.term_signal) return failure(SignalDescription(res.term_signal));

  nlohmann::json doc;
  if (!limit) limit = std::numeric_limits<size_t>::max();
  // written by the sandboxed code; a symlink could point anywhere
  std::error_code ec;
  if (fs::is_symlink(result_file, ec)) {
    spdlog::warn("Result file {} is a symlink", result_file.c_str());
  } else if (auto content = ReadFile(result_file, limit)) {
    doc = nlohmann::json::parse(*content, nullptr, false);
  }
  bool has_doc = doc.is_object() && doc.contains("ok") && doc["ok"].is_boolean();
  if (has_doc && !doc["ok"].get<bool>()) {
    std::string kind = doc.value("kind", std::string());
    std::string message = doc.value("message", std::string());
    if (message.empty()) message = "unknown error";
    if (kind == "serialization") message = "return value is not serializable: " + message;
    return failure(message);
  }
  if (res.exit_code != 0) return failure("exited with code " + std::to_string(res.exit_code));
  if (!has_doc || !doc.contains("value") || !doc["value"].is_string()) {
    return failure("exited without producing a result");
  }
  return ExecutionResult::Success(std::move(res.out), std::move(res.err),
                                  doc["value"].get<std::string>(), stats);
}
