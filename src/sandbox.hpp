#pragma once

#include <string>
#include "process.hpp"

namespace runbox {

#define RUNBOX_SANDBOX_TOOL "firejail"

// Whether compile and run commands are wrapped with an external isolation
// tool. Decided once at startup, shared read-only by every job.
struct SandboxPrefix {
  bool enabled;
  std::string tool;  // full path of the tool when enabled

  SandboxPrefix() : enabled(false) {}

  // firejail --quiet --private=<workspace> -- <cmd...>
  // returns cmd unchanged when disabled
  CommandLine wrap(const CommandLine& cmd, const std::string& workspace) const;
};

// look up the isolation tool in PATH. Linux only
SandboxPrefix detect_sandbox(bool wanted);

}
