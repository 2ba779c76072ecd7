#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>
#include <sys/types.h>

#include <gtest/gtest.h>
#include <codebox/config.h>

namespace fs = std::filesystem;

extern fs::path kTestBoxRoot;
// present in the initial environment of the test binary (see setup.cpp)
extern const char kEngineSecretName[], kEngineSecretValue[];

// default policy, boxes under kTestBoxRoot
RuntimeConfig TestConfig();
// no blocked patterns, for tests that need os/sys
RuntimeConfig PermissiveConfig();

bool ProcessAlive(pid_t pid);
// polls until the process is dead or timeout_ms elapsed
bool ProcessGone(pid_t pid, long timeout_ms = 1000);
// live processes having marker as one of their arguments
std::vector<pid_t> FindProcesses(const std::string& marker);
// polls until no such process is left or timeout_ms elapsed
bool MarkedProcessesGone(const std::string& marker, long timeout_ms = 1000);
// whether /proc/<pid>/environ holds the given variable
bool EnvironContains(pid_t pid, const std::string& var);
// number of entries left under kTestBoxRoot
size_t BoxCount();

class Stopwatch {
  std::chrono::steady_clock::time_point start_;
 public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}
  long ElapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
  }
};

#endif // TEST_UTILS_H_
