#include "config.hpp"
#include "fs.hpp"
#include "log.hpp"
#include "util.hpp"
#include <cstdio>
#include <cstdlib>
#include <tinyformat.h>

using std::string;
using std::vector;
using tfm::format;

namespace runbox {

bool Toolchains::set(const string& key, const string& exe) {
  if (key == "cxx" || key == "g++" || key == "cpp") cxx = exe;
  else if (key == "javac") javac = exe;
  else if (key == "java") java = exe;
  else if (key == "python") python = exe;
  else if (key == "node") node = exe;
  else return false;
  return true;
}

Config default_config() {
  Config config;
  string home = getenv("HOME") ? getenv("HOME") : "/tmp";
  config.concurrency = 4;
  config.timeout_ms = 8000;
  config.max_output = 200 << 10;  // 200K
  config.workspace_root = fs::join(home, ".cache/runbox/tmp");
  config.sandbox = true;
  config.toolchains.cxx = "g++";
  config.toolchains.javac = "javac";
  config.toolchains.java = "java";
  config.toolchains.python = "python3";
  config.toolchains.node = "node";
  return config;
}

static bool parse_bool(const string& str, bool fallback) {
  string value = string_tolower(str);
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  return fallback;
}

void load_env_config(Config& config) {
  const char *value;
  if ((value = getenv("RUNBOX_CONCURRENCY")) && *value) config.concurrency = atoi(value);
  if ((value = getenv("RUNBOX_TIMEOUT_MS")) && *value) config.timeout_ms = atol(value);
  if ((value = getenv("RUNBOX_MAX_OUTPUT")) && *value) config.max_output = parse_bytes(value);
  if ((value = getenv("RUNBOX_WORKSPACE_ROOT")) && *value) config.workspace_root = value;
  if ((value = getenv("RUNBOX_SANDBOX")) && *value) config.sandbox = parse_bool(value, config.sandbox);
  log_debug("env config: concurrency = %d, timeout = %ldms, max output = %lld, workspace root = %s, sandbox = %d",
      config.concurrency, config.timeout_ms, config.max_output, config.workspace_root.c_str(), (int)config.sandbox);
}

vector<string> check_config(const Config& config) {
  vector<string> errors;

  if (config.concurrency <= 0) {
    errors.push_back(format("concurrency must be positive (got %d)", config.concurrency));
  }
  if (config.timeout_ms <= 0) {
    errors.push_back(format("timeout must be positive (got %ldms)", config.timeout_ms));
  } else if (config.timeout_ms > MAX_TIMEOUT_MS) {
    errors.push_back(format("timeout must not exceed %ldms (got %ldms)", MAX_TIMEOUT_MS, config.timeout_ms));
  }
  if (config.max_output <= 0) {
    errors.push_back(format("max output must be positive (got %lld bytes)", config.max_output));
  }
  if (config.workspace_root.empty()) {
    errors.push_back("workspace root is required");
  } else if (!fs::is_absolute(config.workspace_root)) {
    errors.push_back(format("workspace root (%s) must be an absolute path", config.workspace_root));
  }

  const Toolchains& t = config.toolchains;
  if (t.cxx.empty() || t.javac.empty() || t.java.empty() || t.python.empty() || t.node.empty()) {
    errors.push_back("toolchain executable names cannot be empty");
  }

  return errors;
}

}
