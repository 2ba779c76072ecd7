#ifndef INCLUDE_CODEBOX_CONFIG_H_
#define INCLUDE_CODEBOX_CONFIG_H_

#include <string>
#include <vector>
#include <filesystem>

// Regular expressions (case-insensitive) of operations refused in evaluator code
std::vector<std::string> DefaultBlockedPatterns();
// codebox-jail as built next to the library
std::filesystem::path DefaultJailHelper();

struct RuntimeConfig {
  std::filesystem::path box_root = "/tmp/codebox";
  std::filesystem::path jail_helper = DefaultJailHelper();
  std::string python_path = "python3";
  std::string node_path = "node";
  long default_timeout_ms = 5000; // used when a call passes a non-positive timeout
  long validate_timeout_ms = 5000;
  // 0 = no limit
  long max_output_kib = 1024; // per captured stream
  long max_file_kib = 64 * 1024;
  int max_open_files = 256;
  int max_processes = 64; // processes and threads of one sandbox
  long python_memory_mb = 1024; // address space
  long node_heap_mb = 512; // V8 old space
  std::vector<std::string> blocked_patterns = DefaultBlockedPatterns();
};

#endif  // INCLUDE_CODEBOX_CONFIG_H_
