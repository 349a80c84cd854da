#include "workspace.hpp"
#include "fs.hpp"
#include "log.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <tinyformat.h>

using std::string;
using tfm::format;

namespace runbox {

// 128 bits
static const int WORKSPACE_NAME_LEN = 32;
static const int MAX_ALLOCATE_ATTEMPTS = 16;

WorkspaceManager::WorkspaceManager(const string& root) : root_(root) {}

bool WorkspaceManager::prepare_root(string& error) const {
  if (fs::mkdir_p(root_) < 0) {
    error = format("cannot mkdir: %s (%s)", root_, strerror(errno));
    return false;
  }
  if (!fs::is_writable_dir(root_)) {
    error = format("workspace root %s is not a writable directory", root_);
    return false;
  }
  log_debug("workspace root = %s", root_.c_str());
  return true;
}

string WorkspaceManager::allocate(string& error) const {
  for (int i = 0; i < MAX_ALLOCATE_ATTEMPTS; ++i) {
    string dest = fs::join(root_, get_random_hash(WORKSPACE_NAME_LEN));
    // mkdir fails on an existing name, so a path is never handed out twice
    if (::mkdir(dest.c_str(), 0700) == 0) {
      log_debug("allocated workspace %s", dest.c_str());
      return dest;
    }
    if (errno != EEXIST) {
      error = format("cannot create workspace %s: %s", dest, strerror(errno));
      return "";
    }
  }
  error = format("cannot create a unique workspace under %s", root_);
  return "";
}

void WorkspaceManager::release(const string& path) const {
  if (path.empty()) return;
  log_debug("cleaning: rm -rf %s", path.c_str());
  if (fs::rm_rf(path) != 0) {
    log_error("cannot remove workspace %s", path.c_str());
  }
}

ScopedWorkspace::ScopedWorkspace(const WorkspaceManager& manager, const string& path)
  : manager_(manager), path_(path) {}

ScopedWorkspace::~ScopedWorkspace() {
  manager_.release(path_);
}

}
