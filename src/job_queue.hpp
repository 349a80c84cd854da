#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace runbox {

typedef std::function<void()> JobClosure;

// FIFO of closures drained by a fixed team of workers. At most
// `concurrency` closures run at the same time.
class JobQueue {
  public:
    explicit JobQueue(int concurrency);
    ~JobQueue();

    bool start();

    // returns false if the queue is not running
    bool submit(const JobClosure& job);

    // runs everything already submitted, then joins the workers
    void stop();

    bool started() const;
    int running() const;
    size_t pending() const;
    int concurrency() const { return concurrency_; }

  private:
    JobQueue(const JobQueue&);
    JobQueue& operator=(const JobQueue&);

    void host_loop();
    void worker_loop(int worker_id);

    int concurrency_;
    int running_;
    bool started_;
    bool stopping_;

    mutable std::mutex mutex_;
    std::condition_variable job_available_;
    std::deque<JobClosure> jobs_;
    std::thread host_thread_;
};

}
