#ifndef _WIN32

#include "mender/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <thread>

#include <sched.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace mender {

namespace {

void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

// Everything the child needs, materialized before fork() so the child only
// performs async-signal-safe calls.
struct ExecPlan {
  std::vector<std::string> args;
  std::vector<std::string> envs;
  std::vector<char *> argv;
  std::vector<char *> envp;

  explicit ExecPlan(const ProcessSpec &spec) {
    args.push_back(spec.command);
    args.insert(args.end(), spec.argv.begin(), spec.argv.end());
    for (const auto &[k, v] : spec.env)
      envs.push_back(k + "=" + v);
    for (auto &s : args)
      argv.push_back(s.data());
    argv.push_back(nullptr);
    for (auto &e : envs)
      envp.push_back(e.data());
    envp.push_back(nullptr);
  }
};

void sleep_ms(long ms) {
  struct timespec ts;
  ts.tv_sec = ms / 1000;
  ts.tv_nsec = (ms % 1000) * 1000000L;
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

// Redirects stdio, applies the resource limits and execs. Never returns.
[[noreturn]] void exec_program(const ProcessSpec &spec, ExecPlan &plan,
                               int out_fd, int err_fd) {
  dup2(out_fd, STDOUT_FILENO);
  dup2(err_fd, STDERR_FILENO);
  if (out_fd != STDOUT_FILENO && out_fd != STDERR_FILENO)
    close(out_fd);
  if (err_fd != out_fd && err_fd != STDOUT_FILENO && err_fd != STDERR_FILENO)
    close(err_fd);
  int devnull = open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    dup2(devnull, STDIN_FILENO);
    if (devnull != STDIN_FILENO)
      close(devnull);
  }

  if (!spec.cwd.empty()) {
    if (chdir(spec.cwd.c_str()) != 0)
      _exit(127);
  }

  if (spec.max_memory_bytes > 0) {
    struct rlimit rl;
    rl.rlim_cur = spec.max_memory_bytes;
    rl.rlim_max = spec.max_memory_bytes;
    setrlimit(RLIMIT_AS, &rl);
  }
  if (spec.max_file_descriptors > 0) {
    struct rlimit rl;
    rl.rlim_cur = spec.max_file_descriptors;
    rl.rlim_max = spec.max_file_descriptors;
    setrlimit(RLIMIT_NOFILE, &rl);
  }
  // CPU limit sits one second above the wall-clock deadline so the parent's
  // SIGKILL is what normally ends a runaway child.
  if (spec.timeout_ms > 0) {
    struct rlimit rl;
    rl.rlim_cur = (spec.timeout_ms + 999) / 1000 + 1;
    rl.rlim_max = rl.rlim_cur + 1;
    setrlimit(RLIMIT_CPU, &rl);
  }

  execve(spec.command.c_str(), plan.argv.data(), plan.envp.data());
  _exit(127);
}

void close_pair(int fds[2]) {
  if (fds[0] >= 0)
    close(fds[0]);
  if (fds[1] >= 0)
    close(fds[1]);
  fds[0] = fds[1] = -1;
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return 1;
}

} // namespace

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    result.error_message = "spawn_failed";
    return result;
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    close_pair(out_pipe);
    result.error_message = "spawn_failed";
    return result;
  }

  ExecPlan plan(spec);
  pid_t pid = fork();
  if (pid < 0) {
    close_pair(out_pipe);
    close_pair(err_pipe);
    result.error_message = "spawn_failed";
    return result;
  }

  if (pid == 0) {
    setsid();
    exec_program(spec, plan, out_pipe[1], err_pipe[1]);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                   result.stdout_truncated);
    n = read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                   result.stderr_truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                   result.stdout_truncated);
  }
  while (true) {
    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                   result.stderr_truncated);
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.stdout_truncated)
    result.stdout_text += "(truncated)";
  if (result.stderr_truncated)
    result.stderr_text += "(truncated)";

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

std::string to_string(BackendFault fault) {
  switch (fault) {
  case BackendFault::none:
    return "none";
  case BackendFault::unreachable:
    return "unreachable";
  case BackendFault::image_missing:
    return "image_missing";
  case BackendFault::allocation_failed:
    return "allocation_failed";
  case BackendFault::api_error:
    return "api_error";
  }
  return "api_error";
}

bool isolate_network() {
#ifdef __linux__
  // Plain CLONE_NEWNET needs CAP_SYS_ADMIN; an unprivileged user namespace
  // grants it inside the new namespace on most distros.
  if (unshare(CLONE_NEWNET) == 0)
    return true;
  return unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0;
#else
  return false;
#endif
}

// ---------------------------------------------------------------------------
// Instance supervisor
// ---------------------------------------------------------------------------
//
// Every instance is a small supervisor process forked from the engine. It
// starts its own session, becomes a child subreaper, cuts the network off and
// forks the program into a process group of its own. When the program exits
// (or the engine sends SIGTERM) the supervisor SIGKILLs the program's group,
// then keeps killing and reaping every process that was reparented to it
// until none is left. Only then does it exit, with the program's status, so a
// reaped supervisor means nothing the program started is still holding the
// output pipe.
//
// The supervisor reports setup through a one-byte status pipe before the
// program runs.

namespace {

constexpr char kSetupOk = 'k';
constexpr char kSetupNoNetworkIsolation = 'n';
constexpr char kSetupForkFailed = 'f';

constexpr int kSetupTimeoutMs = 5000;
constexpr int kTerminateGraceMs = 500;
constexpr int kDrainGraceMs = 500;
constexpr int kReaderPollMs = 20;
constexpr int kSweepRounds = 1000;

volatile sig_atomic_t g_stop_requested = 0;

void on_stop_signal(int) { g_stop_requested = 1; }

void report_setup(int fd, char code) {
  while (write(fd, &code, 1) < 0 && errno == EINTR) {
  }
}

// Closes every descriptor above stderr except the two the supervisor keeps,
// so pipes of instances created concurrently by other threads are not held
// open by this one.
void close_inherited_fds(int keep_a, int keep_b) {
  auto close_span = [](unsigned first, unsigned last) {
    if (first > last)
      return;
#if defined(__linux__) && defined(SYS_close_range)
    if (syscall(SYS_close_range, first, last, 0) == 0)
      return;
#endif
    struct rlimit rl;
    unsigned cap = 4096;
    if (getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY)
      cap = static_cast<unsigned>(std::min<rlim_t>(rl.rlim_cur, 65536));
    for (unsigned fd = first; fd <= last && fd < cap; ++fd)
      close(static_cast<int>(fd));
  };
  const unsigned keep[2] = {static_cast<unsigned>(std::min(keep_a, keep_b)),
                            static_cast<unsigned>(std::max(keep_a, keep_b))};
  unsigned next = 3;
  for (unsigned fd : keep) {
    if (fd < next)
      continue;
    if (fd > next)
      close_span(next, fd - 1);
    next = fd + 1;
  }
  close_span(next, ~0u);
}

// SIGKILLs every current child of the supervisor, as listed by
// /proc/self/task/<pid>/children.
void kill_children() {
#ifdef __linux__
  char path[64] = "/proc/self/task/";
  std::size_t len = std::strlen(path);
  char digits[24];
  int nd = 0;
  for (pid_t p = getpid(); p > 0 && nd < 24; p /= 10)
    digits[nd++] = static_cast<char>('0' + p % 10);
  while (nd > 0)
    path[len++] = digits[--nd];
  const char suffix[] = "/children";
  std::memcpy(path + len, suffix, sizeof(suffix));

  const int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    return;
  pid_t current = 0;
  char buf[512];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    for (ssize_t i = 0; i < n; ++i) {
      if (buf[i] >= '0' && buf[i] <= '9') {
        current = current * 10 + (buf[i] - '0');
      } else if (current > 0) {
        ::kill(current, SIGKILL);
        current = 0;
      }
    }
  }
  if (current > 0)
    ::kill(current, SIGKILL);
  close(fd);
#endif
}

// Kills and reaps everything reparented to the supervisor. Returns once no
// child is left, or after kSweepRounds rounds.
void sweep_descendants() {
  for (int round = 0; round < kSweepRounds; ++round) {
    kill_children();
    bool reaped = false;
    while (true) {
      int st = 0;
      const pid_t w = waitpid(-1, &st, WNOHANG);
      if (w > 0) {
        reaped = true;
        continue;
      }
      if (w < 0 && errno == EINTR)
        continue;
      if (w < 0 && errno == ECHILD)
        return;
      break;
    }
    if (!reaped)
      sleep_ms(1);
  }
}

[[noreturn]] void supervise(const ProcessSpec &spec, ExecPlan &plan,
                            int out_fd, int status_fd, pid_t engine,
                            ProcessSandboxBackend::NetworkIsolator isolate) {
  setsid();
  close_inherited_fds(out_fd, status_fd);

  sigset_t none;
  sigemptyset(&none);
  sigprocmask(SIG_SETMASK, &none, nullptr);
  signal(SIGCHLD, SIG_DFL);
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGTERM, &sa, nullptr);

#ifdef __linux__
  prctl(PR_SET_PDEATHSIG, SIGTERM);
  if (getppid() != engine)
    _exit(1);
  prctl(PR_SET_CHILD_SUBREAPER, 1);
#else
  (void)engine;
#endif

  if (isolate != nullptr && !isolate()) {
    report_setup(status_fd, kSetupNoNetworkIsolation);
    _exit(1);
  }

  const pid_t program = fork();
  if (program < 0) {
    report_setup(status_fd, kSetupForkFailed);
    _exit(1);
  }
  if (program == 0) {
    close(status_fd);
    setpgid(0, 0);
    signal(SIGTERM, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
#ifdef __linux__
    prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
    exec_program(spec, plan, out_fd, out_fd);
  }
  setpgid(program, program);
  report_setup(status_fd, kSetupOk);
  close(status_fd);
  close(out_fd);

  // Observe the exit without reaping, so the program's pgid cannot be reused
  // before its group is killed.
  while (true) {
    if (g_stop_requested)
      ::kill(-program, SIGKILL);
    siginfo_t si;
    std::memset(&si, 0, sizeof(si));
    const int r = waitid(P_PID, static_cast<id_t>(program), &si,
                         WEXITED | WNOHANG | WNOWAIT);
    if (r == 0 && si.si_pid == program)
      break;
    if (r < 0 && errno != EINTR)
      break;
    sleep_ms(2);
  }
  ::kill(-program, SIGKILL);
  int status = 0;
  while (waitpid(program, &status, 0) < 0 && errno == EINTR) {
  }
  sweep_descendants();
  _exit(decode_status(status) & 0xff);
}

} // namespace

// ---------------------------------------------------------------------------
// ProcessSandboxBackend
// ---------------------------------------------------------------------------

struct ProcessSandboxBackend::Instance {
  pid_t pid{-1}; // supervisor; leader of its own process group
  int out_fd{-1};
  std::thread reader;
  std::atomic<bool> stop{false};
  std::atomic<bool> eof{false};
  std::mutex mu;
  std::string output;
  bool truncated{false};
  bool reaped{false};
  int status{0};
};

namespace {

void drain(std::shared_ptr<ProcessSandboxBackend::Instance> inst,
           std::size_t limit) {
  char buf[4096];
  while (!inst->stop.load()) {
    struct pollfd p;
    p.fd = inst->out_fd;
    p.events = POLLIN;
    p.revents = 0;
    const int r = poll(&p, 1, kReaderPollMs);
    if (r < 0 && errno == EINTR)
      continue;
    if (r < 0)
      break;
    if (r == 0)
      continue;
    const ssize_t n = read(inst->out_fd, buf, sizeof(buf));
    if (n < 0 && (errno == EINTR || errno == EAGAIN))
      continue;
    if (n <= 0)
      break;
    std::lock_guard<std::mutex> lk(inst->mu);
    append_limited(inst->output, buf, n, limit, inst->truncated);
  }
  inst->eof.store(true);
}

// Gives the reader up to grace_ms to reach EOF, then stops it and closes the
// pipe. Bounded whatever still holds the write end.
void finish_reader(ProcessSandboxBackend::Instance &inst, int grace_ms) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(grace_ms);
  while (!inst.eof.load() && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  inst.stop.store(true);
  if (inst.reader.joinable())
    inst.reader.join();
  if (inst.out_fd >= 0) {
    close(inst.out_fd);
    inst.out_fd = -1;
  }
}

// SIGTERM asks the supervisor to kill the program and sweep; SIGKILL on its
// group is the fallback when it does not exit within the grace period.
void terminate(ProcessSandboxBackend::Instance &inst) {
  if (inst.reaped)
    return;
  ::kill(inst.pid, SIGTERM);
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(kTerminateGraceMs);
  int status = 0;
  while (true) {
    const pid_t w = waitpid(inst.pid, &status, WNOHANG);
    if (w == inst.pid) {
      inst.reaped = true;
      inst.status = status;
      return;
    }
    if (w < 0 && errno != EINTR)
      break;
    if (std::chrono::steady_clock::now() >= deadline)
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  ::kill(-inst.pid, SIGKILL);
  ::kill(inst.pid, SIGKILL);
  while (waitpid(inst.pid, &status, 0) < 0 && errno == EINTR) {
  }
  inst.reaped = true;
  inst.status = status;
}

} // namespace

ProcessSandboxBackend::ProcessSandboxBackend(std::string interpreter,
                                             NetworkIsolator isolate)
    : interpreter_(std::move(interpreter)),
      isolate_(isolate != nullptr ? isolate : &isolate_network) {}

ProcessSandboxBackend::~ProcessSandboxBackend() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &[id, _] : instances_)
      ids.push_back(id);
  }
  for (const auto &id : ids)
    destroy(id);
}

std::shared_ptr<ProcessSandboxBackend::Instance>
ProcessSandboxBackend::find(const std::string &id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = instances_.find(id);
  return it == instances_.end() ? nullptr : it->second;
}

std::size_t ProcessSandboxBackend::live_instances() const {
  std::lock_guard<std::mutex> lk(mu_);
  return instances_.size();
}

CreateResult ProcessSandboxBackend::create(const SandboxSpec &spec) {
  CreateResult out;
  if (access(interpreter_.c_str(), X_OK) != 0) {
    out.fault = BackendFault::image_missing;
    out.message = "interpreter not executable: " + interpreter_;
    return out;
  }

  ProcessSpec ps;
  ps.command = interpreter_;
  ps.argv = {spec.staging_dir + "/" + spec.script_name};
  ps.cwd = spec.staging_dir;
  ps.env = {{"PATH", "/usr/local/bin:/usr/bin:/bin"},
            {"HOME", spec.staging_dir},
            {"LANG", "C.UTF-8"},
            {"PIP_NO_INDEX", "1"},
            {"PIP_DISABLE_PIP_VERSION_CHECK", "1"},
            {"PYTHONDONTWRITEBYTECODE", "1"},
            {"PYTHONUNBUFFERED", "1"},
            {"PYTHONIOENCODING", "utf-8"}};
  ps.timeout_ms = spec.timeout_ms;
  ps.max_memory_bytes = spec.memory_limit_mb * 1024ull * 1024ull;
  ps.max_file_descriptors = 64;

  int fds[2] = {-1, -1};
  int setup[2] = {-1, -1};
  if (pipe2(fds, O_CLOEXEC) != 0 || pipe2(setup, O_CLOEXEC) != 0) {
    const int err = errno;
    close_pair(fds);
    close_pair(setup);
    out.fault = BackendFault::allocation_failed;
    out.message = std::string("pipe: ") + std::strerror(err);
    return out;
  }

  ExecPlan plan(ps);
  const pid_t engine = getpid();
  pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close_pair(fds);
    close_pair(setup);
    out.fault = BackendFault::allocation_failed;
    out.message = std::string("fork: ") + std::strerror(err);
    return out;
  }
  if (pid == 0) {
    supervise(ps, plan, fds[1], setup[1], engine,
              spec.network_disabled ? isolate_ : nullptr);
  }
  close(fds[1]);
  close(setup[1]);

  auto inst = std::make_shared<Instance>();
  inst->pid = pid;
  inst->out_fd = fds[0];

  char code = 0;
  struct pollfd p;
  p.fd = setup[0];
  p.events = POLLIN;
  p.revents = 0;
  int r;
  while ((r = poll(&p, 1, kSetupTimeoutMs)) < 0 && errno == EINTR) {
  }
  ssize_t n = 0;
  if (r > 0) {
    while ((n = read(setup[0], &code, 1)) < 0 && errno == EINTR) {
    }
  }
  close(setup[0]);

  if (n != 1 || code != kSetupOk) {
    terminate(*inst);
    close(inst->out_fd);
    inst->out_fd = -1;
    if (n == 1 && code == kSetupNoNetworkIsolation) {
      out.fault = BackendFault::allocation_failed;
      out.message = "network isolation unavailable: could not create a "
                    "network namespace for the program";
    } else if (n == 1 && code == kSetupForkFailed) {
      out.fault = BackendFault::allocation_failed;
      out.message = "supervisor could not fork the program";
    } else {
      out.fault = BackendFault::api_error;
      out.message = r == 0 ? "sandbox setup did not report within " +
                                 std::to_string(kSetupTimeoutMs) + " ms"
                           : "sandbox supervisor exited during setup";
    }
    return out;
  }

  try {
    inst->reader = std::thread(drain, inst, spec.max_output_bytes);
  } catch (const std::system_error &e) {
    terminate(*inst);
    close(inst->out_fd);
    inst->out_fd = -1;
    out.fault = BackendFault::allocation_failed;
    out.message = std::string("reader thread: ") + e.what();
    return out;
  }

  std::lock_guard<std::mutex> lk(mu_);
  out.instance = "proc-" + std::to_string(next_id_++) + "-" + std::to_string(pid);
  instances_[out.instance] = std::move(inst);
  return out;
}

WaitResult ProcessSandboxBackend::wait(const std::string &instance,
                                       std::uint64_t timeout_ms) {
  WaitResult out;
  auto inst = find(instance);
  if (!inst) {
    out.fault = BackendFault::api_error;
    out.message = "unknown instance: " + instance;
    return out;
  }
  if (inst->reaped) {
    out.exited = true;
    out.exit_status = decode_status(inst->status);
    return out;
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  while (true) {
    int status = 0;
    pid_t w = waitpid(inst->pid, &status, WNOHANG);
    if (w == inst->pid) {
      inst->reaped = true;
      inst->status = status;
      out.exited = true;
      out.exit_status = decode_status(status);
      return out;
    }
    if (w < 0 && errno != EINTR) {
      out.fault = BackendFault::api_error;
      out.message = std::string("waitpid: ") + std::strerror(errno);
      return out;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      out.timed_out = true;
      return out;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

LogsResult ProcessSandboxBackend::logs(const std::string &instance) {
  LogsResult out;
  auto inst = find(instance);
  if (!inst) {
    out.fault = BackendFault::api_error;
    out.message = "unknown instance: " + instance;
    return out;
  }
  if (!inst->reaped) {
    out.fault = BackendFault::api_error;
    out.message = "instance still running: " + instance;
    return out;
  }
  finish_reader(*inst, kDrainGraceMs);
  std::lock_guard<std::mutex> lk(inst->mu);
  out.text = inst->output;
  if (inst->truncated)
    out.text += "(truncated)";
  return out;
}

void ProcessSandboxBackend::kill(const std::string &instance) {
  auto inst = find(instance);
  if (!inst)
    return;
  terminate(*inst);
}

void ProcessSandboxBackend::destroy(const std::string &instance) {
  std::shared_ptr<Instance> inst;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = instances_.find(instance);
    if (it == instances_.end())
      return;
    inst = std::move(it->second);
    instances_.erase(it);
  }
  terminate(*inst);
  finish_reader(*inst, kDrainGraceMs);
}

ProbeResult ProcessSandboxBackend::probe() {
  ProbeResult r;
  r.backend = "process";
  r.available = access(interpreter_.c_str(), X_OK) == 0;
  r.detail = r.available ? "interpreter " + interpreter_
                         : "interpreter not executable: " + interpreter_;
  r.capabilities = {"rlimit_as",          "rlimit_cpu",
                    "rlimit_nofile",      "process_group_kill",
                    "descendant_sweep",   "private_staging"};
  pid_t pid = fork();
  if (pid == 0) {
    _exit(isolate_() ? 0 : 1);
  }
  if (pid > 0) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
      r.capabilities.push_back("network_namespace");
    } else {
      r.capabilities.push_back("network_namespace_unavailable");
      r.available = false;
      r.detail += "; network isolation unavailable";
    }
  }
  return r;
}

} // namespace mender

#endif
