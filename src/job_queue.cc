#include "job_queue.hpp"
#include "log.hpp"
#include <exception>
#include <omp.h>

namespace runbox {

JobQueue::JobQueue(int concurrency)
  : concurrency_(concurrency > 0 ? concurrency : 1), running_(0), started_(false), stopping_(false) {}

JobQueue::~JobQueue() {
  stop();
}

bool JobQueue::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) return false;
  started_ = true;
  stopping_ = false;
  host_thread_ = std::thread(&JobQueue::host_loop, this);
  return true;
}

bool JobQueue::submit(const JobClosure& job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ || stopping_) return false;
    jobs_.push_back(job);
    log_debug("job queued, %u pending", (unsigned)jobs_.size());
  }
  job_available_.notify_one();
  return true;
}

void JobQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ || stopping_) return;
    stopping_ = true;
  }
  job_available_.notify_all();
  if (host_thread_.joinable()) host_thread_.join();
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = false;
  stopping_ = false;
}

bool JobQueue::started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

int JobQueue::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

size_t JobQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

// the host thread is the master of an OpenMP team, one thread per slot
void JobQueue::host_loop() {
  omp_set_dynamic(0);
  #pragma omp parallel num_threads(concurrency_)
  worker_loop(omp_get_thread_num());
}

void JobQueue::worker_loop(int worker_id) {
  log_debug("worker %d started", worker_id);
  for (;;) {
    JobClosure job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      while (jobs_.empty() && !stopping_) job_available_.wait(lock);
      // stopping and drained
      if (jobs_.empty()) break;
      job = jobs_.front();
      jobs_.pop_front();
      ++running_;
    }

    // closures turn their own failures into results. whatever still
    // escapes must not take the worker down
    try {
      job();
    } catch (const std::exception& e) {
      log_error("job raised an exception: %s", e.what());
    } catch (...) {
      log_error("job raised an unknown exception");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --running_;
  }
  log_debug("worker %d stopped", worker_id);
}

}
