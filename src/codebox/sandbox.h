#ifndef CODEBOX_SANDBOX_H_
#define CODEBOX_SANDBOX_H_

#include <sys/types.h>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>

#include "sandbox_options.h"

struct SandboxResult {
  std::string out, err;
  int exit_code; // valid if term_signal == 0
  int term_signal;
  bool timed_out; // wall or cpu time exceeded
  bool killed; // Kill() was called
  bool output_truncated;
  long real_us;

  SandboxResult() :
      exit_code(0), term_signal(0),
      timed_out(false), killed(false), output_truncated(false),
      real_us(0) {}
};

// One command jailed by codebox-jail (cjail): chrooted into opt.boxdir,
// running as opt.uid in a pid namespace of its own. The constructor starts
// it; the destructor kills every process left under opt.uid and reaps the
// helper. opt.uid must not be shared with anything else while this lives.
class Sandbox {
  pid_t pid_; // codebox-jail
  int uid_, gid_;
  int out_fd_, err_fd_, report_fd_;
  long wall_time_, output_limit_;
  std::chrono::steady_clock::time_point start_;
  std::atomic_bool kill_requested_;
  std::mutex mtx_; // guards pid_ against reuse after reaping
  bool reaped_;

  void Terminate_();
  void Reap_();
 public:
  // throws SandboxError if the jail can not be started
  explicit Sandbox(const SandboxOptions&);
  ~Sandbox();
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // Captures output until the jail is gone, the wall time elapses or Kill()
  // is called. Call once. Throws SandboxError if cjail failed.
  SandboxResult Wait();
  // Terminates everything running in the jail; safe from any thread.
  void Kill();
  pid_t Pid() const { return pid_; }
};

inline SandboxResult SandboxExec(const SandboxOptions& opt) {
  return Sandbox(opt).Wait();
}

// Kills every process running as uid, including those that left the
// process group or session. Returns false if some could not be killed.
bool KillUid(int uid, int gid);

#endif  // CODEBOX_SANDBOX_H_
