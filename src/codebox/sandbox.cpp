#include "sandbox.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <filesystem>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codebox/errors.h>
#include "utils.h"

namespace fs = std::filesystem;

namespace {

constexpr int kTickMs = 10;
// cjail enforces the wall time itself; the supervisor steps in after this
constexpr long kJailGraceMs = 1000;
// how long output and the report are drained after teardown started
constexpr long kDrainGraceMs = 1000;
constexpr size_t kReadChunk = 65536;
constexpr int kKillRounds = 50;
// descriptors handed to the child are kept above this so that the dup2
// sequence onto 0-6 never clobbers one of them
constexpr int kChildFdBase = 10;
constexpr int kExecErrorFd = 6;

// Everything the child needs, prepared before fork: only async-signal-safe
// calls are allowed between fork and exec.
struct ChildSetup {
  char* const* argv;
  char* const* envp;
  int option_fd, report_fd, null_fd, out_fd, err_fd, exec_fd;
  sigset_t mask;
  struct sigaction dfl;
};

[[noreturn]] void ChildFailed(int fd) {
  int err = errno;
  if (write(fd, &err, sizeof(err)) < 0) _exit(126);
  _exit(127);
}

[[noreturn]] void RunChild(const ChildSetup& s) {
  // no PR_SET_PDEATHSIG: if we die, codebox-jail still enforces the time
  // limits and cleans up the jail before it exits
  setpgid(0, 0);
  sigprocmask(SIG_SETMASK, &s.mask, nullptr);
  sigaction(SIGPIPE, &s.dfl, nullptr);
  if (dup2(s.option_fd, kJailOptionFd) < 0 || dup2(s.report_fd, kJailReportFd) < 0 ||
      dup2(s.null_fd, kJailInputFd) < 0 || dup2(s.out_fd, kJailOutputFd) < 0 ||
      dup2(s.err_fd, kJailErrorFd) < 0 || dup2(s.exec_fd, kExecErrorFd) < 0) {
    ChildFailed(s.exec_fd);
  }
  // closed by a successful exec, so the parent reads EOF
  fcntl(kExecErrorFd, F_SETFD, FD_CLOEXEC);
  CloseFrom(kExecErrorFd + 1);
  execve(s.argv[0], s.argv, s.envp);
  ChildFailed(kExecErrorFd);
}

int LiftFd(int fd) {
  if (fd < 0) return fd;
  int ret = fcntl(fd, F_DUPFD_CLOEXEC, kChildFdBase);
  close(fd);
  return ret;
}

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

inline void Append(std::string& buf, const char* data, size_t len, long limit, bool& truncated) {
  if (limit > 0 && buf.size() + len > (size_t)limit) {
    size_t room = (size_t)limit > buf.size() ? (size_t)limit - buf.size() : 0;
    buf.append(data, room);
    truncated = true;
    return;
  }
  buf.append(data, len);
}

// where a path inside the box lives on this side of the chroot
fs::path HostPath(const SandboxOptions& opt, const std::string& inside) {
  for (auto& dir : opt.dirs) {
    if (inside == dir || inside.compare(0, dir.size() + 1, dir + "/") == 0) return inside;
  }
  return fs::path(opt.boxdir) / fs::path(inside).relative_path();
}

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

} // namespace

bool KillUid(int uid, int gid) {
  for (int round = 0; round < kKillRounds; round++) {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid == 0) {
      // raw syscalls: glibc's setresuid synchronizes threads, which a forked
      // child of a threaded process must not rely on
      if (syscall(SYS_setresgid, gid, gid, gid) < 0 || syscall(SYS_setresuid, uid, uid, uid) < 0) {
        _exit(2);
      }
      // everything this uid may signal, except ourselves
      if (kill(-1, SIGKILL) < 0 && errno == ESRCH) _exit(0);
      _exit(1);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
      if (errno != EINTR) return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) == 2) return false;
    if (WEXITSTATUS(status) == 0) return true;
    // killed processes may still be zombies waiting for their reaper
    usleep(1000);
  }
  return false;
}

Sandbox::Sandbox(const SandboxOptions& opt) :
    pid_(-1), uid_(opt.uid), gid_(opt.gid),
    out_fd_(-1), err_fd_(-1), report_fd_(-1),
    wall_time_(opt.wall_time), output_limit_(opt.output_limit),
    kill_requested_(false), reaped_(false) {
  if (opt.command.empty() || opt.command[0].empty() || opt.command[0][0] != '/') {
    throw SandboxError("sandbox command must start with an absolute path");
  }
  std::error_code ec;
  if (opt.boxdir.empty() || !fs::is_directory(opt.boxdir, ec)) {
    throw SandboxError("sandbox box is not a directory: " + opt.boxdir);
  }
  if (opt.helper.empty() || access(opt.helper.c_str(), X_OK) < 0) {
    throw SandboxError("jail helper not found: " + opt.helper);
  }
  if (fs::path cmd = HostPath(opt, opt.command[0]); access(cmd.c_str(), X_OK) < 0) {
    spdlog::warn("Sandbox cannot execute {}: {}", opt.command[0], strerror(errno));
    throw SandboxError(fmt::format("cannot execute {}: {}", opt.command[0], strerror(errno)));
  }
  // mount points of the bind mounts
  for (auto& dir : opt.dirs) {
    if (!CreateDirs(fs::path(opt.boxdir) / fs::path(dir).relative_path())) {
      throw SandboxError("cannot create mount point for " + dir);
    }
  }
  std::vector<uint8_t> serial = opt.Serialize();
  long serial_size = serial.size();

  std::vector<char*> argv = {const_cast<char*>(opt.helper.c_str()), nullptr};
  std::vector<char*> envp = {nullptr};
  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  int option_pipe[2] = {-1, -1}, report_pipe[2] = {-1, -1};
  int null_fd = -1;
  auto fail = [&](const char* what) {
    int err = errno;
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &exec_pipe[0], &exec_pipe[1], &option_pipe[0], &option_pipe[1],
                    &report_pipe[0], &report_pipe[1], &null_fd}) {
      CloseFd(*fd);
    }
    spdlog::warn("Sandbox {} failed: errno={} {}", what, err, strerror(err));
    throw SandboxError(fmt::format("sandbox {} failed: {}", what, strerror(err)));
  };
  // O_CLOEXEC keeps sandboxes forked concurrently on other threads from
  // inheriting our pipe ends, which would hold off EOF
  if (pipe2(out_pipe, O_CLOEXEC) < 0) fail("pipe");
  if (pipe2(err_pipe, O_CLOEXEC) < 0) fail("pipe");
  if (pipe2(exec_pipe, O_CLOEXEC) < 0) fail("pipe");
  if (pipe2(option_pipe, O_CLOEXEC) < 0) fail("pipe");
  if (pipe2(report_pipe, O_CLOEXEC) < 0) fail("pipe");
  if ((null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0) fail("open /dev/null");
  // the options are written before the helper exists, so they must fit the pipe
  size_t option_size = sizeof(serial_size) + serial.size();
  if (option_size > 65536 && fcntl(option_pipe[1], F_SETPIPE_SZ, (int)option_size) < 0) {
    fail("fcntl F_SETPIPE_SZ");
  }
  if (!WriteAll(option_pipe[1], &serial_size, sizeof(serial_size)) ||
      !WriteAll(option_pipe[1], serial.data(), serial.size())) {
    fail("write options");
  }
  CloseFd(option_pipe[1]);
  option_pipe[0] = LiftFd(option_pipe[0]);
  report_pipe[1] = LiftFd(report_pipe[1]);
  out_pipe[1] = LiftFd(out_pipe[1]);
  err_pipe[1] = LiftFd(err_pipe[1]);
  exec_pipe[1] = LiftFd(exec_pipe[1]);
  null_fd = LiftFd(null_fd);
  if (option_pipe[0] < 0 || report_pipe[1] < 0 || out_pipe[1] < 0 || err_pipe[1] < 0 ||
      exec_pipe[1] < 0 || null_fd < 0) {
    fail("fcntl");
  }

  ChildSetup setup = {};
  setup.argv = argv.data();
  setup.envp = envp.data();
  setup.option_fd = option_pipe[0];
  setup.report_fd = report_pipe[1];
  setup.null_fd = null_fd;
  setup.out_fd = out_pipe[1];
  setup.err_fd = err_pipe[1];
  setup.exec_fd = exec_pipe[1];
  sigemptyset(&setup.mask);
  setup.dfl.sa_handler = SIG_DFL;
  sigemptyset(&setup.dfl.sa_mask);

  start_ = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) fail("fork");
  if (pid == 0) RunChild(setup);

  pid_ = pid;
  for (int* fd : {&option_pipe[0], &report_pipe[1], &out_pipe[1], &err_pipe[1],
                  &exec_pipe[1], &null_fd}) {
    CloseFd(*fd);
  }

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);
  if (n == (ssize_t)sizeof(child_errno)) {
    Reap_();
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);
    CloseFd(report_pipe[0]);
    spdlog::warn("Sandbox cannot execute {}: {}", opt.helper, strerror(child_errno));
    throw SandboxError(fmt::format("cannot execute {}: {}", opt.helper, strerror(child_errno)));
  }
  out_fd_ = out_pipe[0];
  err_fd_ = err_pipe[0];
  report_fd_ = report_pipe[0];
  for (int fd : {out_fd_, err_fd_, report_fd_}) fcntl(fd, F_SETFL, O_NONBLOCK);
  spdlog::debug("Sandbox pid={} uid={} boxdir={} command={}",
                pid_, uid_, opt.boxdir, fmt::format("{}", opt.command));
}

Sandbox::~Sandbox() {
  if (pid_ > 0 && !reaped_) {
    // codebox-jail is left alive until the jail is empty, so that it can not
    // orphan a command it has not handed to the uid yet
    Kill();
    try {
      Wait();
    } catch (const SandboxError& e) {
      spdlog::warn("Sandbox pid={} teardown: {}", pid_, e.what());
    }
  }
  CloseFd(out_fd_);
  CloseFd(err_fd_);
  CloseFd(report_fd_);
}

void Sandbox::Terminate_() {
  if (!KillUid(uid_, gid_)) spdlog::warn("Sandbox uid={}: processes survived teardown", uid_);
}

void Sandbox::Reap_() {
  std::lock_guard<std::mutex> lck(mtx_);
  if (reaped_) return;
  while (waitpid(pid_, nullptr, 0) < 0) {
    if (errno != EINTR) {
      spdlog::warn("waitpid {} failed: {}", pid_, strerror(errno));
      break;
    }
  }
  reaped_ = true;
}

void Sandbox::Kill() {
  kill_requested_ = true;
  Terminate_();
}

SandboxResult Sandbox::Wait() {
  using namespace std::chrono;
  SandboxResult ret;
  const auto deadline = start_ + microseconds(wall_time_) + milliseconds(kJailGraceMs);
  // set once the jail is gone or being torn down
  bool stopped = false;
  steady_clock::time_point drain_deadline;
  std::string report;
  bool report_overflow = false;
  std::vector<char> buf(kReadChunk);

  while (true) {
    auto now = steady_clock::now();
    if (!stopped) {
      if (kill_requested_) {
        ret.killed = stopped = true;
      } else if (report_fd_ < 0) {
        // codebox-jail is done; nothing may outlive the call
        stopped = true;
        Terminate_();
      } else if (wall_time_ > 0 && now >= deadline) {
        spdlog::warn("Sandbox pid={} outlived its wall time {}us", pid_, wall_time_);
        ret.timed_out = stopped = true;
        Terminate_();
      }
      if (stopped) drain_deadline = now + milliseconds(kDrainGraceMs);
    } else if (report_fd_ >= 0) {
      // catches a jailed process that switched to our uid after the last round
      Terminate_();
    }
    if (report_fd_ < 0 && out_fd_ < 0 && err_fd_ < 0) break;
    if (stopped && now >= drain_deadline) break;

    int timeout = kTickMs;
    if (!stopped && wall_time_ > 0) {
      long left = duration_cast<milliseconds>(deadline - now).count() + 1;
      timeout = (int)std::max(0L, std::min<long>(timeout, left));
    }
    struct pollfd fds[3];
    nfds_t nfds = 0;
    for (int fd : {out_fd_, err_fd_, report_fd_}) {
      if (fd >= 0) fds[nfds++] = {fd, POLLIN, 0};
    }
    int r = poll(fds, nfds, timeout);
    if (r < 0) {
      if (errno == EINTR) continue;
      throw SandboxError(fmt::format("poll failed: {}", strerror(errno)));
    }
    for (nfds_t i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      int& fd = fds[i].fd == out_fd_ ? out_fd_ : fds[i].fd == err_fd_ ? err_fd_ : report_fd_;
      ssize_t len = read(fd, buf.data(), buf.size());
      if (len > 0) {
        if (&fd == &report_fd_) {
          Append(report, buf.data(), len, sizeof(JailReport) + 1, report_overflow);
        } else {
          Append(&fd == &out_fd_ ? ret.out : ret.err, buf.data(), len, output_limit_,
                 ret.output_truncated);
        }
      } else if (len == 0 || (errno != EAGAIN && errno != EINTR)) {
        CloseFd(fd);
      }
    }
  }

  if (report_fd_ >= 0) {
    // codebox-jail itself is stuck
    {
      std::lock_guard<std::mutex> lck(mtx_);
      kill(pid_, SIGKILL);
    }
    Terminate_();
  }
  Reap_();
  CloseFd(out_fd_);
  CloseFd(err_fd_);
  CloseFd(report_fd_);
  ret.real_us = duration_cast<microseconds>(steady_clock::now() - start_).count();

  if (report.size() == sizeof(JailReport)) {
    JailReport jail;
    memcpy(&jail, report.data(), sizeof(jail));
    if (jail.error) {
      spdlog::warn("cjail_exec error: errno={} {}", jail.error, strerror(jail.error));
      throw SandboxError(fmt::format("cjail_exec failed: {}", strerror(jail.error)));
    }
    if (jail.timekill) ret.timed_out = true;
    if (jail.si_code == CLD_EXITED) {
      ret.exit_code = jail.status;
    } else {
      ret.term_signal = jail.status;
    }
    if (jail.oomkill && !ret.term_signal) ret.term_signal = SIGKILL;
  } else if (ret.killed || ret.timed_out) {
    ret.term_signal = SIGKILL;
  } else {
    throw SandboxError("codebox-jail exited without a report");
  }
  spdlog::debug("Sandbox pid={} finished: exit_code={} signal={} timeout={} real_us={}",
                pid_, ret.exit_code, ret.term_signal, ret.timed_out, ret.real_us);
  return ret;
}
