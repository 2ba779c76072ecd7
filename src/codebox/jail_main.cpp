#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include "jail.h"

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

} // namespace

// codebox-jail: started by Sandbox with the descriptors of sandbox_options.h
int main() {
  long sz = 0;
  if (!ReadAll(kJailOptionFd, &sz, sizeof(sz)) || sz < 0) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(kJailOptionFd, buf.data(), sz)) return 1;
  SandboxOptions opt(buf);
  // cjail dups these onto 0-2 of the command; the originals must not leak
  for (int fd : {kJailInputFd, kJailOutputFd, kJailErrorFd}) {
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) < 0) return 1;
  }
  JailReport report = JailExec(opt);
  if (write(kJailReportFd, &report, sizeof(report)) < 0) return 1;
}
