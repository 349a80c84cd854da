#pragma once

#include <string>

namespace runbox {

struct ProcessOutcome;

enum JobStatus {
  REJECTED,        // never entered a pipeline
  COMPILE_ERROR,
  RUN_ERROR,       // timed out or failed to start
  COMPLETED,       // ran to an exit code, which may be non-zero
  INTERNAL_ERROR
};

const char *job_status_name(JobStatus status);

struct JobResult {
  JobStatus status;
  std::string message;      // all but COMPLETED
  bool timed_out;
  // COMPLETED only
  std::string stdout_data;
  std::string stderr_data;
  bool has_exit_code;       // false if killed by a signal
  int exit_code;

  JobResult();

  static JobResult rejected(const std::string& reason);
  static JobResult compile_error(const std::string& message, bool timed_out = false);
  static JobResult run_error(const std::string& message, bool timed_out = false);
  static JobResult completed(const ProcessOutcome& outcome);
  static JobResult internal_error(const std::string& detail);
};

}
