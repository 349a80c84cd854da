#include "sandbox.hpp"
#include "log.hpp"
#include "util.hpp"

using std::string;

namespace runbox {

CommandLine SandboxPrefix::wrap(const CommandLine& cmd, const string& workspace) const {
  if (!enabled) return cmd;

  CommandLine result;
  result.append(tool);
  result.append("--quiet");
  result.append("--private=" + workspace);
  result.append("--");
  result.append(cmd);
  return result;
}

SandboxPrefix detect_sandbox(bool wanted) {
  SandboxPrefix result;
#ifdef __linux__
  if (!wanted) {
    log_info("sandbox disabled by configuration");
    return result;
  }
  string path = which(RUNBOX_SANDBOX_TOOL);
  if (path.empty()) {
    log_info("%s not found; running without sandbox", RUNBOX_SANDBOX_TOOL);
    return result;
  }
  result.enabled = true;
  result.tool = path;
  log_info("%s detected at %s: will use it for sandboxing", RUNBOX_SANDBOX_TOOL, path.c_str());
#else
  (void)wanted;
  log_info("sandbox is only supported on Linux");
#endif
  return result;
}

}
