#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <codebox/language.h>

int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, minfd, ~0U, 0) == 0) return 0;
#endif
  // no close_range (kernel < 5.9); close up to the descriptor limit
  struct rlimit lim;
  if (getrlimit(RLIMIT_NOFILE, &lim) < 0) return -1;
  long maxfd = lim.rlim_cur == RLIM_INFINITY ? 65536 : (long)lim.rlim_cur;
  for (long fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

std::optional<Language> ParseLanguage(const std::string& str) {
  std::string name = ToLower(str);
  static const std::pair<const char*, Language> kAliases[] = {
#define X(name, canonical) {#name, Language::name}, {canonical, Language::name},
    ENUM_LANGUAGE_
#undef X
    {"python3", Language::PYTHON},
    {"py", Language::PYTHON},
    {"javascript", Language::JAVASCRIPT},
    {"node", Language::JAVASCRIPT},
    {"typescript", Language::TYPESCRIPT},
    {"ts", Language::TYPESCRIPT},
  };
  for (auto& [alias, lang] : kAliases) {
    if (name == ToLower(alias)) return lang;
  }
  return std::nullopt;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

std::optional<std::string> ReadFile(const fs::path& path, size_t limit) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec || size > limit) return std::nullopt;
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return std::nullopt;
  std::ostringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

fs::path FindExecutable(const std::string& name) {
  auto is_exec = [](const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
  };
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) {
    return is_exec(name) ? fs::absolute(name) : fs::path();
  }
  const char* env_path = getenv("PATH");
  std::istringstream ss(env_path ? env_path : "/usr/local/bin:/usr/bin:/bin");
  for (std::string dir; std::getline(ss, dir, ':');) {
    if (dir.empty()) continue;
    fs::path candidate = fs::path(dir) / name;
    if (is_exec(candidate)) return candidate;
  }
  return {};
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string SignalDescription(int sig) {
  return "killed by signal " + std::to_string(sig) + " (" + strsignal(sig) + ")";
}
