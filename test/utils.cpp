#include "utils.h"

#include <signal.h>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <thread>

fs::path kTestBoxRoot;
const char kEngineSecretName[] = "CODEBOX_ENGINE_SECRET";
const char kEngineSecretValue[] = "codebox-engine-secret-5d1e";

RuntimeConfig TestConfig() {
  RuntimeConfig config;
  config.box_root = kTestBoxRoot;
  return config;
}

RuntimeConfig PermissiveConfig() {
  RuntimeConfig config = TestConfig();
  config.blocked_patterns.clear();
  return config;
}

bool ProcessAlive(pid_t pid) {
  if (kill(pid, 0) < 0) return errno != ESRCH;
  // a zombie still accepts signals; it is not running anymore
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  if (!fin) return false;
  std::string stat((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  size_t pos = stat.rfind(')');
  if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
  return stat[pos + 2] != 'Z';
}

bool ProcessGone(pid_t pid, long timeout_ms) {
  Stopwatch watch;
  while (ProcessAlive(pid)) {
    if (watch.ElapsedMs() >= timeout_ms) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

namespace {

// NUL-separated fields of /proc/<pid>/<name>
std::vector<std::string> ProcFields(const fs::path& file) {
  std::ifstream fin(file);
  std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  std::vector<std::string> ret;
  for (size_t pos = 0; pos < content.size();) {
    size_t end = content.find('\0', pos);
    if (end == std::string::npos) end = content.size();
    ret.push_back(content.substr(pos, end - pos));
    pos = end + 1;
  }
  return ret;
}

} // namespace

std::vector<pid_t> FindProcesses(const std::string& marker) {
  std::vector<pid_t> ret;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator("/proc", ec)) {
    std::string name = entry.path().filename();
    if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;
    pid_t pid = std::stoi(name);
    auto args = ProcFields(entry.path() / "cmdline");
    if (std::find(args.begin(), args.end(), marker) != args.end() && ProcessAlive(pid)) {
      ret.push_back(pid);
    }
  }
  return ret;
}

bool MarkedProcessesGone(const std::string& marker, long timeout_ms) {
  Stopwatch watch;
  while (!FindProcesses(marker).empty()) {
    if (watch.ElapsedMs() >= timeout_ms) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

bool EnvironContains(pid_t pid, const std::string& var) {
  auto vars = ProcFields("/proc/" + std::to_string(pid) + "/environ");
  return std::find(vars.begin(), vars.end(), var) != vars.end();
}

size_t BoxCount() {
  std::error_code ec;
  return std::distance(fs::directory_iterator(kTestBoxRoot, ec), fs::directory_iterator());
}
