#pragma once

#include <functional>
#include <future>
#include <string>
#include "config.hpp"
#include "job_queue.hpp"
#include "language.hpp"
#include "process.hpp"
#include "result.hpp"
#include "sandbox.hpp"
#include "workspace.hpp"

namespace runbox {

struct JobRequest {
  std::string language;
  std::string code;
  std::string stdin_data;

  JobRequest() {}
  JobRequest(const std::string& language, const std::string& code, const std::string& stdin_data = "")
    : language(language), code(code), stdin_data(stdin_data) {}
};

struct Job {
  std::string id;         // also the workspace directory name
  JobRequest request;
  Language language;
  std::string workspace;
};

typedef std::function<void(const JobResult&)> JobCallback;

// returns false and sets reason if the request must be rejected
bool validate_request(const JobRequest& request, Language& language, std::string& reason);

class Engine {
  public:
    explicit Engine(const Config& config);
    ~Engine();

    // prepare the workspace root, detect the sandbox, start the workers.
    // returns false and sets error if the engine cannot work
    bool start(std::string& error);
    void stop();

    // done is called exactly once, from a worker, or right away when the
    // request is rejected or cannot be queued. returns true if queued
    bool submit(const JobRequest& request, const JobCallback& done);

    // submit, the result arrives through the future
    std::future<JobResult> enqueue(const JobRequest& request);

    // submit and wait
    JobResult execute(const JobRequest& request);

    int running_jobs() const { return queue_.running(); }
    size_t queued_jobs() const { return queue_.pending(); }
    const SandboxPrefix& sandbox() const { return sandbox_; }
    const Config& config() const { return config_; }
    const WorkspaceManager& workspaces() const { return workspaces_; }

  private:
    Engine(const Engine&);
    Engine& operator=(const Engine&);

    void run_job(const Job& job, const JobCallback& done);

    Config config_;
    WorkspaceManager workspaces_;
    ProcessRunner runner_;
    SandboxPrefix sandbox_;
    JobQueue queue_;
};

}
