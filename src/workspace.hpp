#pragma once

#include <string>

namespace runbox {

class WorkspaceManager {
  public:
    explicit WorkspaceManager(const std::string& root);

    // mkdir -p the root and make sure it is writable.
    // returns false and sets error otherwise.
    bool prepare_root(std::string& error) const;

    // create a new uniquely named directory under root.
    // returns "" and sets error on failure.
    std::string allocate(std::string& error) const;

    // rm -rf. failures are logged, never reported.
    void release(const std::string& path) const;

    const std::string& root() const { return root_; }

  private:
    std::string root_;
};

// releases the workspace when going out of scope, on every exit path
class ScopedWorkspace {
  public:
    ScopedWorkspace(const WorkspaceManager& manager, const std::string& path);
    ~ScopedWorkspace();
    const std::string& path() const { return path_; }

  private:
    ScopedWorkspace(const ScopedWorkspace&);
    ScopedWorkspace& operator=(const ScopedWorkspace&);

    const WorkspaceManager& manager_;
    std::string path_;
};

}
