#include "config.h"

#include <fstream>
#include <sstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

const char kDefaultConfigPath[] = "/etc/codebox.conf";

namespace {

std::vector<std::string> SplitPatterns(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream ss(str);
  for (std::string item; std::getline(ss, item, ';');) {
    size_t l = item.find_first_not_of(" \t"), r = item.find_last_not_of(" \t");
    if (l == std::string::npos) continue;
    ret.push_back(item.substr(l, r - l + 1));
  }
  return ret;
}

} // namespace

bool ParseConfig(std::istream& in, RuntimeConfig& config) {
  tortellini::ini ini;
  in >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) config.box_root = box_root;
  std::string jail_helper = ini[""]["jail_helper"] | "";
  if (jail_helper.size()) config.jail_helper = jail_helper;
  config.python_path = ini[""]["python_path"] | config.python_path;
  config.node_path = ini[""]["node_path"] | config.node_path;
  config.default_timeout_ms = ini[""]["default_timeout_ms"] | config.default_timeout_ms;
  config.validate_timeout_ms = ini[""]["validate_timeout_ms"] | config.validate_timeout_ms;
  config.max_output_kib = ini[""]["max_output_kib"] | config.max_output_kib;
  config.max_file_kib = ini[""]["max_file_kib"] | config.max_file_kib;
  config.max_open_files = ini[""]["max_open_files"] | config.max_open_files;
  config.max_processes = ini[""]["max_processes"] | config.max_processes;
  config.python_memory_mb = ini[""]["python_memory_mb"] | config.python_memory_mb;
  config.node_heap_mb = ini[""]["node_heap_mb"] | config.node_heap_mb;
  std::string blocked = ini["policy"]["blocked"] | "";
  if (blocked == "none") {
    config.blocked_patterns.clear();
  } else if (blocked.size()) {
    config.blocked_patterns = SplitPatterns(blocked);
  }

  if (config.default_timeout_ms <= 0 || config.validate_timeout_ms <= 0) {
    spdlog::error("Timeouts must be positive");
    return false;
  }
  if (config.max_output_kib < 0 || config.max_file_kib < 0 || config.max_open_files < 0 ||
      config.max_processes < 0 || config.python_memory_mb < 0 || config.node_heap_mb < 0) {
    spdlog::error("Limits must not be negative");
    return false;
  }
  return true;
}

bool ParseConfigFile(const fs::path& conf_path, RuntimeConfig& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  return ParseConfig(fin, config);
}
