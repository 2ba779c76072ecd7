#ifndef CODEBOX_JAIL_H_
#define CODEBOX_JAIL_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>
#include "sandbox_options.h"

// cjail context built from SandboxOptions; points into the options, so they
// must outlive it and stay unmodified.
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  explicit CJailCtxClass(const SandboxOptions&);
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;

  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }
};

// Runs the command and blocks until everything in its pid namespace is gone.
JailReport JailExec(const SandboxOptions&);

#endif  // CODEBOX_JAIL_H_
