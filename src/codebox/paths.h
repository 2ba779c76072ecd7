#ifndef CODEBOX_PATHS_H_
#define CODEBOX_PATHS_H_

#include <filesystem>

#include <codebox/language.h>

namespace fs = std::filesystem;

// Root of the chroot of one execution; removed on destruction. The command
// only writes into its workdir, which belongs to uid and nobody else.
class BoxDir {
  fs::path path_;
 public:
  // throws SandboxError
  BoxDir(const fs::path& root, const char* prefix, int uid);
  ~BoxDir();
  BoxDir(const BoxDir&) = delete;
  BoxDir& operator=(const BoxDir&) = delete;

  const fs::path& Path() const { return path_; }
};

// files inside a box; inside_box gives the path as seen from the chroot
fs::path BoxWorkdir(const fs::path& box, bool inside_box = false);
fs::path BoxUserCode(const fs::path& box, Language lang, bool inside_box = false);
fs::path BoxHarness(const fs::path& box, Language lang, bool inside_box = false);
fs::path BoxPayload(const fs::path& box, bool inside_box = false);
fs::path BoxResult(const fs::path& box, bool inside_box = false);

#endif  // CODEBOX_PATHS_H_
