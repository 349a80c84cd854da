#include "pipeline.hpp"
#include "fs.hpp"
#include "log.hpp"
#include "util.hpp"
#include <tinyformat.h>

using std::string;
using std::vector;
using tfm::format;

namespace runbox {

Pipeline::Pipeline(const ProcessRunner& runner, const SandboxPrefix& sandbox, long timeout_ms)
  : runner_(runner), sandbox_(sandbox), timeout_ms_(timeout_ms) {}

CommandLine Pipeline::build_command(const vector<string>& cmd, const LanguageSpec& spec, const string& workspace) const {
  CommandLine result(escape_list(cmd, get_mappings(spec.src_name, spec.exe_name, workspace)));
  return sandbox_.wrap(result, workspace);
}

bool Pipeline::compile(const LanguageSpec& spec, const string& workspace, JobResult& result) const {
  if (spec.compile_cmd.empty()) {
    log_debug("skip compilation: %s has no compile command", spec.name.c_str());
    return true;
  }

  CommandLine cmd = build_command(spec.compile_cmd, spec, workspace);
  ProcessOutcome compiled = runner_.run(cmd, workspace, timeout_ms_);

  if (compiled.timed_out) {
    result = JobResult::compile_error("Compilation timed out", true);
    return false;
  }

  // a compiler that could not be started has no exit code and its
  // launch error in stderr_data
  if (!compiled.exited || compiled.exit_code != 0) {
    string message = compiled.stderr_data;
    if (message.empty()) message = compiled.stdout_data;
    if (message.empty()) message = "Compilation error";
    result = JobResult::compile_error(message);
    return false;
  }

  return true;
}

JobResult Pipeline::execute(const LanguageSpec& spec, const string& workspace, const string& stdin_data) const {
  CommandLine cmd = build_command(spec.run_cmd, spec, workspace);
  ProcessOutcome ran = runner_.run(cmd, workspace, timeout_ms_, stdin_data);

  if (ran.timed_out) return JobResult::run_error("Execution timed out", true);
  if (ran.launch_failed) return JobResult::run_error(ran.stderr_data);
  // non-zero exit codes belong to the user program
  return JobResult::completed(ran);
}

JobResult Pipeline::run(const LanguageSpec& spec, const string& workspace, const string& code, const string& stdin_data) const {
  log_debug("pipeline %s: %s", spec.name.c_str(), workspace.c_str());

  if (spec.run_cmd.empty()) {
    return JobResult::internal_error(format("no run command for %s", spec.name));
  }

  // written verbatim. callers supply the complete program
  string src_path = fs::join(workspace, spec.src_name);
  int n = fs::nwrite(src_path, code);
  if (n < 0 || (size_t)n != code.length()) {
    return JobResult::internal_error(format("fail to write code file to %s", src_path));
  }

  JobResult result;
  if (!compile(spec, workspace, result)) {
    log_debug("compilation failed: %s", result.message.c_str());
    return result;
  }
  return execute(spec, workspace, stdin_data);
}

}
