#include "jail.h"

#include <errno.h>

CJailCtxClass::CJailCtxClass(const SandboxOptions& opt) : mnt_list_(mnt_list_new()) {
  struct cjail_ctx& ctx = ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  ctx.fd_input = kJailInputFd;
  ctx.fd_output = kJailOutputFd;
  ctx.fd_error = kJailErrorFd;
  for (auto& i : opt.command) argv_buf_.push_back(i.data());
  argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(argv_buf_.data());
  for (auto& i : opt.envs) env_buf_.push_back(i.data());
  env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(env_buf_.data());
  ctx.chroot = opt.boxdir.data();
  ctx.working_dir = opt.workdir.data();
  ctx.cpuset = nullptr;
  ctx.uid = opt.uid;
  ctx.gid = opt.gid;
  ctx.rlim_as = opt.vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = opt.file_num;
  ctx.rlim_fsize = opt.fsize;
  ctx.rlim_proc = opt.proc_num;
  ctx.lim_time.tv_sec = opt.wall_time / 1'000'000;
  ctx.lim_time.tv_usec = opt.wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = opt.cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = opt.cpu_time % 1'000'000;
  // mnt_list_add keeps pointers into mnt_buf_ and str_buf_, so no reallocation
  mnt_buf_.reserve(opt.dirs.size());
  str_buf_.reserve(opt.dirs.size());
  for (auto& i : opt.dirs) {
    mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = mnt_buf_.back();
    str_buf_.push_back("bind");
    mnt_ctx.type = str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = i.data();
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = mnt_list_;
}

JailReport JailExec(const SandboxOptions& opt) {
  CJailCtxClass ctx(opt);
  struct cjail_result res = {};
  JailReport ret = {};
  if (cjail_exec(&ctx.GetCtx(), &res) < 0) {
    ret.error = errno;
    return ret;
  }
  ret.timekill = res.timekill;
  ret.oomkill = res.oomkill;
  ret.si_code = res.info.si_code;
  ret.status = res.info.si_status;
  return ret;
}
