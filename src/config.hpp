#pragma once

#include <string>
#include <vector>

namespace runbox {

// executable names of the language toolchains
struct Toolchains {
  std::string cxx;
  std::string javac;
  std::string java;
  std::string python;
  std::string node;

  // key is one of "cxx", "javac", "java", "python", "node"
  bool set(const std::string& key, const std::string& exe);
};

// a day. larger limits would overflow the monotonic deadline
const long MAX_TIMEOUT_MS = 24L * 3600 * 1000;

struct Config {
  int concurrency;           // max pipelines running at the same time
  long timeout_ms;           // wall-clock limit of every stage
  long long max_output;      // bytes, per output stream
  std::string workspace_root;
  bool sandbox;              // detect and use firejail
  Toolchains toolchains;
};

Config default_config();

// RUNBOX_CONCURRENCY, RUNBOX_TIMEOUT_MS, RUNBOX_MAX_OUTPUT,
// RUNBOX_WORKSPACE_ROOT, RUNBOX_SANDBOX
void load_env_config(Config& config);

// returns human readable problems, empty if the config is usable
std::vector<std::string> check_config(const Config& config);

}
