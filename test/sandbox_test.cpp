#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <gtest/gtest.h>
#include <fmt/format.h>
#include <codebox/config.h>
#include <codebox/errors.h>
#include <codebox/paths.h>
#include <codebox/sandbox.h>
#include <codebox/uid_pool.h>
#include <codebox/utils.h>

#include "utils.h"

namespace {

class SandboxTest : public ::testing::Test {
 protected:
  UidLease uid;
  BoxDir box{kTestBoxRoot, "sb", uid.Uid()};

  // /bin/sh jailed in box
  SandboxOptions Shell(const std::string& script, long wall_time_ms = 5000) {
    SandboxOptions opt;
    opt.helper = DefaultJailHelper().string();
    opt.boxdir = box.Path().string();
    opt.workdir = BoxWorkdir(box.Path(), true).string();
    opt.uid = opt.gid = uid.Uid();
    opt.dirs = {"/usr", "/lib", "/lib64", "/bin"};
    opt.FilterDirs();
    opt.command = {"/bin/sh", "-c", script};
    opt.envs = {"PATH=/usr/bin:/bin"};
    opt.wall_time = wall_time_ms * 1000;
    opt.proc_num = 64;
    return opt;
  }
};

} // namespace

TEST_F(SandboxTest, CapturesOutputAndExitCode) {
  auto res = SandboxExec(Shell("echo out; echo err >&2; exit 3"));
  EXPECT_EQ(res.out, "out\n");
  EXPECT_EQ(res.err, "err\n");
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.term_signal, 0);
  EXPECT_FALSE(res.timed_out);
}

TEST_F(SandboxTest, WallTimeKeepsPartialOutput) {
  Stopwatch watch;
  auto res = SandboxExec(Shell("echo started; while :; do :; done", 500));
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.out, "started\n");
  EXPECT_NE(res.term_signal, 0);
  EXPECT_GE(watch.ElapsedMs(), 500);
  EXPECT_LT(watch.ElapsedMs(), 2500);
}

TEST_F(SandboxTest, TimeoutKillsDetachedDescendants) {
  auto res = SandboxExec(Shell("sleep 3141.59 & setsid sleep 3141.59 & echo started; wait", 500));
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.out, "started\n");
  EXPECT_TRUE(MarkedProcessesGone("3141.59"));
}

TEST_F(SandboxTest, LeftoverDescendantsDoNotHoldTheCall) {
  Stopwatch watch;
  auto res = SandboxExec(Shell("setsid sleep 2718.28 & echo started", 10000));
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.out, "started\n");
  EXPECT_LT(watch.ElapsedMs(), 3000);
  EXPECT_TRUE(MarkedProcessesGone("2718.28"));
}

TEST_F(SandboxTest, KillFromSupervisor) {
  Sandbox jail(Shell("echo running; setsid sleep 1414.21 & while :; do :; done", 0));
  std::thread supervisor([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    jail.Kill();
  });
  auto res = jail.Wait();
  supervisor.join();
  EXPECT_TRUE(res.killed);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.out, "running\n");
  EXPECT_TRUE(ProcessGone(jail.Pid()));
  EXPECT_TRUE(MarkedProcessesGone("1414.21"));
}

TEST_F(SandboxTest, DestructorTearsDown) {
  pid_t pid;
  {
    Sandbox jail(Shell("sleep 1732.05", 0));
    pid = jail.Pid();
    Stopwatch watch;
    while (FindProcesses("1732.05").empty() && watch.ElapsedMs() < 3000) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_FALSE(FindProcesses("1732.05").empty());
  }
  EXPECT_TRUE(ProcessGone(pid));
  EXPECT_TRUE(MarkedProcessesGone("1732.05"));
}

TEST_F(SandboxTest, CleanEnvironment) {
  ASSERT_TRUE(EnvironContains(getpid(), std::string(kEngineSecretName) + "=" + kEngineSecretValue));
  SandboxOptions opt = Shell("");
  opt.command = {FindExecutable("env").string()};
  opt.envs = {"ONLY=1"};
  auto res = SandboxExec(opt);
  EXPECT_EQ(res.out, "ONLY=1\n");
}

TEST_F(SandboxTest, DescriptorsAreNotInherited) {
  int fd = open("/dev/null", O_RDONLY);
  ASSERT_GE(fd, 0);
  ASSERT_EQ(dup2(fd, 200), 200);
  auto res = SandboxExec(Shell("if (echo x >&200); then echo open; else echo closed; fi"));
  EXPECT_EQ(res.out, "closed\n");
  close(200);
  close(fd);
}

TEST_F(SandboxTest, ChrootedAsLeasedUid) {
  auto res = SandboxExec(Shell(fmt::format(
      "pwd; id -u; [ -e {} ] && echo visible || echo hidden", kTestBoxRoot.string())));
  EXPECT_EQ(res.out, fmt::format("/workdir\n{}\nhidden\n", uid.Uid()));
}

TEST_F(SandboxTest, CannotSignalTheEngine) {
  auto res = SandboxExec(Shell(fmt::format("kill -9 {}; echo $?", getpid())));
  EXPECT_NE(res.out, "0\n");
  EXPECT_EQ(res.exit_code, 0);
}

TEST_F(SandboxTest, OutputLimit) {
  SandboxOptions opt = Shell("yes 0123456789 | head -c 100000; echo done >&2");
  opt.output_limit = 1000;
  auto res = SandboxExec(opt);
  EXPECT_EQ(res.out.size(), 1000u);
  EXPECT_TRUE(res.output_truncated);
  EXPECT_EQ(res.err, "done\n");
  EXPECT_EQ(res.exit_code, 0);
}

TEST_F(SandboxTest, InfrastructureFailures) {
  SandboxOptions missing = Shell("");
  missing.command = {"/nonexistent/interpreter"};
  EXPECT_THROW(SandboxExec(missing), SandboxError);
  SandboxOptions relative = Shell("true");
  relative.command = {"sh", "-c", "true"};
  EXPECT_THROW(SandboxExec(relative), SandboxError);
  SandboxOptions no_box = Shell("true");
  no_box.boxdir = (kTestBoxRoot / "nonexistent").string();
  EXPECT_THROW(SandboxExec(no_box), SandboxError);
  SandboxOptions no_helper = Shell("true");
  no_helper.helper = "/nonexistent/codebox-jail";
  EXPECT_THROW(SandboxExec(no_helper), SandboxError);
}

TEST(SandboxOptions, Serialize) {
  SandboxOptions opt;
  opt.boxdir = "/tmp/box";
  opt.command = {"/usr/bin/python3", "-c", std::string("a\0b", 3)};
  opt.envs = {"A=1", ""};
  opt.workdir = "/workdir";
  opt.uid = opt.gid = 50001;
  opt.wall_time = 1'500'000;
  opt.vss = 1 << 20;
  opt.proc_num = 64;
  opt.dirs = {"/usr", "/lib"};
  opt.helper = "/usr/libexec/codebox-jail";
  SandboxOptions copy(opt.Serialize());
  EXPECT_EQ(copy.boxdir, opt.boxdir);
  EXPECT_EQ(copy.command, opt.command);
  EXPECT_EQ(copy.envs, opt.envs);
  EXPECT_EQ(copy.workdir, opt.workdir);
  EXPECT_EQ(copy.uid, 50001);
  EXPECT_EQ(copy.wall_time, 1'500'000);
  EXPECT_EQ(copy.vss, 1 << 20);
  EXPECT_EQ(copy.proc_num, 64);
  EXPECT_EQ(copy.dirs, opt.dirs);
  // only meaningful on the supervising side
  EXPECT_TRUE(copy.helper.empty());
}

TEST(SandboxOptions, FilterDirs) {
  SandboxOptions opt;
  opt.dirs = {"/usr", "/nonexistent/dir", "/usr", kTestBoxRoot.string()};
  opt.FilterDirs();
  EXPECT_EQ(opt.dirs, std::vector<std::string>({"/usr", kTestBoxRoot.string()}));
}
