#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

constexpr fs::perms kPerm700 = fs::perms::owner_all;
constexpr fs::perms kPerm755 = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                               fs::perms::others_read | fs::perms::others_exec;

// async-signal-safe; used between fork and exec
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);
// nullopt if the file does not exist, can not be read, or is larger than limit bytes
std::optional<std::string> ReadFile(const fs::path&, size_t limit);

// Searches PATH if name has no slash; empty path if not found or not executable
fs::path FindExecutable(const std::string& name);

std::string ToLower(std::string);
// "killed by signal 9 (Killed)"
std::string SignalDescription(int sig);

#endif  // CODEBOX_UTILS_H_
