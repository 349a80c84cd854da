#pragma once

#include <string>
#include <vector>

namespace runbox {

// argv builder. front() is the program
struct CommandLine : public std::vector<std::string> {
  CommandLine() {}
  explicit CommandLine(const std::vector<std::string>& args) : std::vector<std::string>(args) {}

  void append(const std::string& arg1) {
    push_back(arg1);
  }

  void append(const std::string& arg1, const std::string& arg2) {
    push_back(arg1);
    push_back(arg2);
  }

  void append(const std::vector<std::string>& args) {
    insert(end(), args.begin(), args.end());
  }

  std::string program() const { return empty() ? std::string() : front(); }
  std::vector<std::string> arguments() const {
    return empty() ? std::vector<std::string>() : std::vector<std::string>(begin() + 1, end());
  }
};

struct ProcessOutcome {
  bool launch_failed;  // fork, exec or chdir failed. stderr_data has the reason
  bool exited;         // exit_code is valid
  int exit_code;
  bool signaled;       // term_sig and signal are valid
  int term_sig;
  std::string signal;  // "SIGKILL", "SIGSEGV", ...
  bool timed_out;
  bool truncated;      // an output stream hit the cap
  long elapsed_ms;
  std::string stdout_data;
  std::string stderr_data;
};

class ProcessRunner {
  public:
    explicit ProcessRunner(long long max_output);

    // Run command with args in cwd. stdin_data is written to the child's
    // stdin, which is then closed. The process group is SIGKILLed when
    // timeout_ms passes or when stdout or stderr grows beyond max_output
    // bytes. The child is always reaped before returning.
    //
    // Expected failures (cannot start, non-zero exit, timeout) are
    // reported in the outcome, never thrown.
    ProcessOutcome run(const std::string& command, const std::vector<std::string>& args,
        const std::string& cwd, long timeout_ms, const std::string& stdin_data = "") const;

    ProcessOutcome run(const CommandLine& cmd, const std::string& cwd, long timeout_ms,
        const std::string& stdin_data = "") const {
      return run(cmd.program(), cmd.arguments(), cwd, timeout_ms, stdin_data);
    }

    long long max_output() const { return max_output_; }

  private:
    long long max_output_;
};

std::string signal_name(int sig);

}
