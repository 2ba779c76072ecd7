#include "paths.h"

#include <unistd.h>
#include <atomic>
#include <string>

#include <spdlog/spdlog.h>
#include <codebox/config.h>
#include <codebox/errors.h>
#include "utils.h"

namespace {

std::atomic_long box_seq = 0;

inline std::string CodeExtension(Language lang) {
  switch (lang) {
    case Language::PYTHON: return ".py";
    case Language::JAVASCRIPT: return ".js";
    case Language::TYPESCRIPT: return ".ts";
  }
  __builtin_unreachable();
}

inline fs::path BoxRoot(const fs::path& box, bool inside_box) {
  return inside_box ? fs::path("/") : box;
}

// Removes the empty directories left by the bind mounts. Never deletes
// anything non-empty: a mount that leaked out of the jail is left alone.
void RemoveMountPoints(const fs::path& dir, int depth) {
  std::error_code ec;
  if (depth > 0) {
    for (auto& entry : fs::directory_iterator(dir, ec)) {
      if (entry.is_directory(ec) && !entry.is_symlink(ec)) RemoveMountPoints(entry.path(), depth - 1);
    }
  }
  if (!fs::remove(dir, ec) && ec) {
    spdlog::warn("Failed removing {}: {}", dir.c_str(), ec.message());
  }
}

void RemoveBox(const fs::path& box) {
  RemoveAll(BoxWorkdir(box));
  RemoveMountPoints(box, 8);
}

} // namespace

fs::path DefaultJailHelper() {
  return CODEBOX_JAIL_HELPER;
}

BoxDir::BoxDir(const fs::path& root, const char* prefix, int uid) {
  if (!CreateDirs(root)) {
    throw SandboxError("cannot create box root " + root.string());
  }
  path_ = root / (std::string(prefix) + "-" + std::to_string(getpid()) + "-" + std::to_string(++box_seq));
  std::error_code ec;
  // must not exist yet; a leftover of a crashed run with the same pid is wiped first
  if (fs::exists(path_, ec)) RemoveBox(path_);
  if (!fs::create_directory(path_, ec) || ec) {
    throw SandboxError("cannot create box " + path_.string() + ": " + ec.message());
  }
  fs::permissions(path_, kPerm755, ec);
  fs::path workdir = BoxWorkdir(path_);
  if (!CreateDirs(workdir, kPerm700) || chown(workdir.c_str(), uid, uid) < 0) {
    RemoveBox(path_);
    throw SandboxError("cannot create workdir in box " + path_.string());
  }
  spdlog::debug("Created box {} for uid {}", path_.c_str(), uid);
}

BoxDir::~BoxDir() {
  RemoveBox(path_);
}

fs::path BoxWorkdir(const fs::path& box, bool inside_box) {
  return BoxRoot(box, inside_box) / "workdir";
}

fs::path BoxUserCode(const fs::path& box, Language lang, bool inside_box) {
  return BoxWorkdir(box, inside_box) / ("main" + CodeExtension(lang));
}

fs::path BoxHarness(const fs::path& box, Language lang, bool inside_box) {
  return BoxWorkdir(box, inside_box) / ("harness" + CodeExtension(lang));
}

fs::path BoxPayload(const fs::path& box, bool inside_box) {
  return BoxWorkdir(box, inside_box) / "payload.json";
}

fs::path BoxResult(const fs::path& box, bool inside_box) {
  return BoxWorkdir(box, inside_box) / "result.json";
}
