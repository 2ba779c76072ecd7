#ifndef CODEBOX_SANDBOX_OPTIONS_H_
#define CODEBOX_SANDBOX_OPTIONS_H_

#include <cstdint>
#include <string>
#include <vector>

// Descriptors of codebox-jail as set up by Sandbox: the serialized options
// come in on kJailOptionFd and a JailReport goes out on kJailReportFd; the
// other three become stdin/stdout/stderr of the jailed command.
constexpr int kJailOptionFd = 0;
constexpr int kJailReportFd = 1;
constexpr int kJailInputFd = 3;
constexpr int kJailOutputFd = 4;
constexpr int kJailErrorFd = 5;

class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir; // chroot of the command
  std::vector<std::string> command; // command[0] absolute, resolved inside the box
  std::vector<std::string> envs; // the complete environment of the command
  // inside box (relative to boxdir but start with /)
  std::string workdir;
  int uid, gid;
  long wall_time, cpu_time; // us; 0 for no limit
  long vss; // KiB
  long fsize; // KiB
  int file_num;
  int proc_num; // counted per uid
  std::vector<std::string> dirs; // bind-mounted at the same path inside the box

  // not passed to the jail
  std::string helper; // codebox-jail binary
  long output_limit; // bytes kept per stream

  SandboxOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      vss(0),
      fsize(0),
      file_num(0),
      proc_num(0),
      output_limit(0) {}
  SandboxOptions(const std::vector<uint8_t>& serial);

  // drops dirs that do not exist on this machine
  void FilterDirs();
  // platform dependent, only intended for the same machine
  std::vector<uint8_t> Serialize() const;
};

// What codebox-jail writes back once the jailed command is gone.
struct JailReport {
  int error; // errno of a failed cjail_exec, 0 otherwise
  int timekill; // wall or cpu time exceeded
  int oomkill;
  int si_code; // CLD_EXITED, CLD_KILLED, CLD_DUMPED
  int status; // exit code or signal
};

#endif  // CODEBOX_SANDBOX_OPTIONS_H_
