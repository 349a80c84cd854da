#ifndef _GNU_SOURCE
# define _GNU_SOURCE
#endif

#include "process.hpp"
#include "log.hpp"
#include "util.hpp"
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <tinyformat.h>
#include <unistd.h>

using std::string;
using std::vector;
using tfm::format;

namespace runbox {

// what the child reports through the exec pipe before dying
struct ExecFailure {
  int step;  // STEP_*
  int err;   // errno
};

static const int STEP_CHDIR = 1;
static const int STEP_EXEC = 2;

static const size_t READ_BUFFER_SIZE = 16384;

static void set_sigpipe_ignored() {
  signal(SIGPIPE, SIG_IGN);
}

// writing stdin of a child that already exited must not kill us
static void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, set_sigpipe_ignored);
}

static long now_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (long)ts.tv_sec * 1000 + ts.tv_nsec / 1000000;
}

static void close_fd(int& fd) {
  if (fd < 0) return;
  close(fd);
  fd = -1;
}

static void close_pipe(int fds[2]) {
  close_fd(fds[0]);
  close_fd(fds[1]);
}

static void kill_group(pid_t pid) {
  // the child is a process group leader. take its children down too
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL);
}

// returns true if the cap is hit. buf never grows beyond cap
static bool append_capped(string& buf, const char *data, size_t len, size_t cap) {
  if (buf.length() + len > cap) {
    buf.append(data, cap - buf.length());
    return true;
  }
  buf.append(data, len);
  return false;
}

static void wait_child(pid_t pid, int& status) {
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      log_error("waitpid %d failed", (int)pid);
      status = 0;
      break;
    }
  }
}

string signal_name(int sig) {
  switch (sig) {
    case SIGHUP: return "SIGHUP";
    case SIGINT: return "SIGINT";
    case SIGQUIT: return "SIGQUIT";
    case SIGILL: return "SIGILL";
    case SIGTRAP: return "SIGTRAP";
    case SIGABRT: return "SIGABRT";
    case SIGBUS: return "SIGBUS";
    case SIGFPE: return "SIGFPE";
    case SIGKILL: return "SIGKILL";
    case SIGUSR1: return "SIGUSR1";
    case SIGSEGV: return "SIGSEGV";
    case SIGUSR2: return "SIGUSR2";
    case SIGPIPE: return "SIGPIPE";
    case SIGALRM: return "SIGALRM";
    case SIGTERM: return "SIGTERM";
    case SIGXCPU: return "SIGXCPU";
    case SIGXFSZ: return "SIGXFSZ";
    case SIGSYS: return "SIGSYS";
  }
  return format("SIG%d", sig);
}

static ProcessOutcome empty_outcome() {
  ProcessOutcome result;
  result.launch_failed = false;
  result.exited = false;
  result.exit_code = 0;
  result.signaled = false;
  result.term_sig = 0;
  result.timed_out = false;
  result.truncated = false;
  result.elapsed_ms = 0;
  return result;
}

static ProcessOutcome launch_failure(const string& message) {
  ProcessOutcome result = empty_outcome();
  result.launch_failed = true;
  result.stderr_data = message;
  log_debug("launch failure: %s", message.c_str());
  return result;
}

ProcessRunner::ProcessRunner(long long max_output) : max_output_(max_output) {}

ProcessOutcome ProcessRunner::run(const string& command, const vector<string>& args, const string& cwd, long timeout_ms, const string& stdin_data) const {
  ignore_sigpipe();

  if (command.empty()) return launch_failure("cannot execute an empty command");

  {
    vector<string> full_cmd(1, command);
    full_cmd.insert(full_cmd.end(), args.begin(), args.end());
    log_debug("running: %s (cwd: %s, timeout: %ldms)", shell_escape(full_cmd).c_str(), cwd.c_str(), timeout_ms);
  }

  int in_fd[2] = {-1, -1}, out_fd[2] = {-1, -1}, err_fd[2] = {-1, -1}, exec_fd[2] = {-1, -1};
  // O_CLOEXEC: children forked by other workers must not hold our pipe ends
  if (pipe2(in_fd, O_CLOEXEC) != 0 || pipe2(out_fd, O_CLOEXEC) != 0 || pipe2(err_fd, O_CLOEXEC) != 0 || pipe2(exec_fd, O_CLOEXEC) != 0) {
    string message = format("cannot create pipe to run %s: %s", command, strerror(errno));
    close_pipe(in_fd);
    close_pipe(out_fd);
    close_pipe(err_fd);
    close_pipe(exec_fd);
    return launch_failure(message);
  }

  // prepare args. no allocation is allowed after fork
  vector<char *> argv;
  argv.push_back(const_cast<char *>(command.c_str()));
  for (size_t i = 0; i < args.size(); ++i) argv.push_back(const_cast<char *>(args[i].c_str()));
  argv.push_back(NULL);
  const char *cwd_cstr = cwd.empty() ? NULL : cwd.c_str();

  long start_time = now_ms();
  pid_t pid = fork();
  if (pid == -1) {
    string message = format("cannot fork to run %s: %s", command, strerror(errno));
    close_pipe(in_fd);
    close_pipe(out_fd);
    close_pipe(err_fd);
    close_pipe(exec_fd);
    return launch_failure(message);
  }

  if (pid == 0) {
    // child
    setpgid(0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);

    // ignored signals and the signal mask survive exec
    signal(SIGPIPE, SIG_DFL);
    sigset_t empty_set;
    sigemptyset(&empty_set);
    sigprocmask(SIG_SETMASK, &empty_set, NULL);

    // dup2 clears O_CLOEXEC on the new descriptors
    dup2(in_fd[0], STDIN_FILENO);
    dup2(out_fd[1], STDOUT_FILENO);
    dup2(err_fd[1], STDERR_FILENO);

    ExecFailure failure;
    if (cwd_cstr && chdir(cwd_cstr) != 0) {
      failure.step = STEP_CHDIR;
      failure.err = errno;
    } else {
      execvp(argv[0], &argv[0]);
      failure.step = STEP_EXEC;
      failure.err = errno;
    }
    ssize_t ignored = write(exec_fd[1], &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
  }

  // parent
  setpgid(pid, pid);  // also done by the child, whoever comes first
  close_fd(in_fd[0]);
  close_fd(out_fd[1]);
  close_fd(err_fd[1]);
  close_fd(exec_fd[1]);

  ProcessOutcome result = empty_outcome();

  { // exec_fd is closed by a successful exec, otherwise the child writes why it failed
    ExecFailure failure;
    ssize_t n;
    do {
      n = read(exec_fd[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    close_fd(exec_fd[0]);

    if (n == (ssize_t)sizeof(failure)) {
      int status = 0;
      wait_child(pid, status);
      close_pipe(in_fd);
      close_pipe(out_fd);
      close_pipe(err_fd);
      if (failure.step == STEP_CHDIR) {
        return launch_failure(format("cannot chdir to %s: %s", cwd, strerror(failure.err)));
      }
      return launch_failure(format("cannot execute %s: %s", command, strerror(failure.err)));
    }
  }

  if (stdin_data.empty()) {
    // nothing to feed. let the child see EOF right away
    close_fd(in_fd[1]);
  } else {
    fcntl(in_fd[1], F_SETFL, fcntl(in_fd[1], F_GETFL) | O_NONBLOCK);
  }

  long deadline = timeout_ms > LONG_MAX - start_time ? LONG_MAX : start_time + timeout_ms;
  size_t cap = (size_t)max_output_;
  size_t stdin_offset = 0;
  bool killed = false;
  char buf[READ_BUFFER_SIZE];

  while (!killed && (out_fd[0] >= 0 || err_fd[0] >= 0)) {
    long remaining = deadline - now_ms();
    if (remaining <= 0) {
      log_debug("%s timed out after %ldms, killing %d", command.c_str(), timeout_ms, (int)pid);
      result.timed_out = true;
      kill_group(pid);
      killed = true;
      break;
    }

    struct pollfd fds[3];
    int nfds = 0;
    int out_idx = -1, err_idx = -1, in_idx = -1;
    if (out_fd[0] >= 0) {
      out_idx = nfds;
      fds[nfds].fd = out_fd[0];
      fds[nfds].events = POLLIN;
      fds[nfds++].revents = 0;
    }
    if (err_fd[0] >= 0) {
      err_idx = nfds;
      fds[nfds].fd = err_fd[0];
      fds[nfds].events = POLLIN;
      fds[nfds++].revents = 0;
    }
    if (in_fd[1] >= 0) {
      in_idx = nfds;
      fds[nfds].fd = in_fd[1];
      fds[nfds].events = POLLOUT;
      fds[nfds++].revents = 0;
    }

    int ready = poll(fds, nfds, remaining > INT_MAX ? INT_MAX : (int)remaining);
    if (ready < 0) {
      if (errno == EINTR) continue;
      log_error("poll failed while running %s", command.c_str());
      kill_group(pid);
      killed = true;
      break;
    }
    if (ready == 0) continue;

    if (in_idx >= 0 && fds[in_idx].revents) {
      ssize_t n = write(in_fd[1], stdin_data.data() + stdin_offset, stdin_data.length() - stdin_offset);
      if (n > 0) stdin_offset += n;
      if (stdin_offset >= stdin_data.length()) {
        close_fd(in_fd[1]);
      } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
        // EPIPE: the child does not read its input
        log_debug("stop writing stdin of %s: %s", command.c_str(), strerror(errno));
        close_fd(in_fd[1]);
      }
    }

    int *stream_fds[2] = {out_fd, err_fd};
    int stream_idx[2] = {out_idx, err_idx};
    string *stream_bufs[2] = {&result.stdout_data, &result.stderr_data};
    for (int s = 0; s < 2 && !killed; ++s) {
      int idx = stream_idx[s];
      if (idx < 0 || !fds[idx].revents) continue;
      ssize_t n = read(stream_fds[s][0], buf, sizeof(buf));
      if (n > 0) {
        if (append_capped(*stream_bufs[s], buf, n, cap)) {
          log_debug("%s exceeded output limit (%lld bytes), killing %d", command.c_str(), max_output_, (int)pid);
          result.truncated = true;
          kill_group(pid);
          killed = true;
        }
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        close_fd(stream_fds[s][0]);
      }
    }
  }

  close_fd(in_fd[1]);
  close_fd(out_fd[0]);
  close_fd(err_fd[0]);

  // both streams are closed but the child may still be running
  int status = 0;
  if (!killed) {
    for (;;) {
      pid_t r = waitpid(pid, &status, WNOHANG);
      if (r == pid) break;
      if (r == -1 && errno != EINTR) {
        log_error("waitpid %d failed", (int)pid);
        break;
      }
      long remaining = deadline - now_ms();
      if (remaining <= 0) {
        log_debug("%s timed out after %ldms, killing %d", command.c_str(), timeout_ms, (int)pid);
        result.timed_out = true;
        kill_group(pid);
        killed = true;
        break;
      }
      usleep(remaining > 10 ? 10000 : remaining * 1000);
    }
  }
  if (killed) wait_child(pid, status);

  // whatever the program left running in the background goes with it.
  // the group id cannot be reused while a member is alive
  kill(-pid, SIGKILL);

  result.elapsed_ms = now_ms() - start_time;
  if (WIFEXITED(status)) {
    result.exited = true;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled = true;
    result.term_sig = WTERMSIG(status);
    result.signal = signal_name(result.term_sig);
  }

  log_debug("%s finished in %ldms: exited = %d, code = %d, signal = %s, timed out = %d, truncated = %d",
      command.c_str(), result.elapsed_ms, (int)result.exited, result.exit_code, result.signal.c_str(),
      (int)result.timed_out, (int)result.truncated);
  return result;
}

}
