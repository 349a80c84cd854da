#include "engine.hpp"
#include "fs.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include <exception>
#include <memory>

using std::string;

namespace runbox {

bool validate_request(const JobRequest& request, Language& language, string& reason) {
  if (request.language.empty() || request.code.empty()) {
    reason = "language and code are required";
    return false;
  }
  language = parse_language(request.language);
  if (language == LANG_UNKNOWN) {
    reason = "unsupported language";
    return false;
  }
  return true;
}

Engine::Engine(const Config& config)
  : config_(config),
    workspaces_(config.workspace_root),
    runner_(config.max_output),
    queue_(config.concurrency) {}

Engine::~Engine() {
  stop();
}

bool Engine::start(string& error) {
  // workers may be reading sandbox_ and using the root already
  if (queue_.started()) {
    error = "engine is already running";
    return false;
  }
  if (!workspaces_.prepare_root(error)) return false;
  sandbox_ = detect_sandbox(config_.sandbox);
  if (!queue_.start()) {
    error = "engine is already running";
    return false;
  }
  log_info("engine started: concurrency = %d, timeout = %ldms, max output = %lld bytes",
      config_.concurrency, config_.timeout_ms, config_.max_output);
  return true;
}

void Engine::stop() {
  queue_.stop();
}

bool Engine::submit(const JobRequest& request, const JobCallback& done) {
  Job job;
  string reason;
  if (!validate_request(request, job.language, reason)) {
    log_info("rejected: %s", reason.c_str());
    done(JobResult::rejected(reason));
    return false;
  }

  string error;
  job.workspace = workspaces_.allocate(error);
  if (job.workspace.empty()) {
    log_error("%s", error.c_str());
    done(JobResult::internal_error(error));
    return false;
  }
  job.id = fs::basename(job.workspace);
  job.request = request;

  if (!queue_.submit(std::bind(&Engine::run_job, this, job, done))) {
    workspaces_.release(job.workspace);
    done(JobResult::internal_error("job queue is not running"));
    return false;
  }
  log_debug("job %s (%s) queued", job.id.c_str(), language_name(job.language));
  return true;
}

void Engine::run_job(const Job& job, const JobCallback& done) {
  log_debug("job %s started", job.id.c_str());
  JobResult result;
  {
    ScopedWorkspace workspace(workspaces_, job.workspace);
    try {
      Pipeline pipeline(runner_, sandbox_, config_.timeout_ms);
      LanguageSpec spec = get_language_spec(job.language, config_.toolchains);
      result = pipeline.run(spec, workspace.path(), job.request.code, job.request.stdin_data);
    } catch (const std::exception& e) {
      log_error("job %s: %s", job.id.c_str(), e.what());
      result = JobResult::internal_error(e.what());
    } catch (...) {
      log_error("job %s: unknown exception", job.id.c_str());
      result = JobResult::internal_error("unknown error");
    }
  }  // the workspace is gone before anyone sees the result

  log_info("job %s finished: %s", job.id.c_str(), job_status_name(result.status));
  done(result);
}

static void deliver(std::shared_ptr<std::promise<JobResult> > promise, const JobResult& result) {
  promise->set_value(result);
}

std::future<JobResult> Engine::enqueue(const JobRequest& request) {
  std::shared_ptr<std::promise<JobResult> > promise(new std::promise<JobResult>());
  std::future<JobResult> future = promise->get_future();
  submit(request, std::bind(&deliver, promise, std::placeholders::_1));
  return future;
}

JobResult Engine::execute(const JobRequest& request) {
  return enqueue(request).get();
}

}
