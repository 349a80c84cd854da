#include "result.hpp"
#include "process.hpp"

using std::string;

namespace runbox {

const char *job_status_name(JobStatus status) {
  switch (status) {
    case REJECTED: return "REJECTED";
    case COMPILE_ERROR: return "COMPILE_ERROR";
    case RUN_ERROR: return "RUN_ERROR";
    case COMPLETED: return "COMPLETED";
    case INTERNAL_ERROR: return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

JobResult::JobResult()
  : status(INTERNAL_ERROR), timed_out(false), has_exit_code(false), exit_code(0) {}

JobResult JobResult::rejected(const string& reason) {
  JobResult result;
  result.status = REJECTED;
  result.message = reason;
  return result;
}

JobResult JobResult::compile_error(const string& message, bool timed_out) {
  JobResult result;
  result.status = COMPILE_ERROR;
  result.message = message;
  result.timed_out = timed_out;
  return result;
}

JobResult JobResult::run_error(const string& message, bool timed_out) {
  JobResult result;
  result.status = RUN_ERROR;
  result.message = message;
  result.timed_out = timed_out;
  return result;
}

JobResult JobResult::completed(const ProcessOutcome& outcome) {
  JobResult result;
  result.status = COMPLETED;
  result.stdout_data = outcome.stdout_data;
  result.stderr_data = outcome.stderr_data;
  result.has_exit_code = outcome.exited;
  result.exit_code = outcome.exit_code;
  return result;
}

JobResult JobResult::internal_error(const string& detail) {
  JobResult result;
  result.status = INTERNAL_ERROR;
  result.message = "Internal server error: " + detail;
  return result;
}

}
