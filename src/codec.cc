#include "codec.hpp"

using std::string;

namespace runbox {

static string get_string(const j::object& jo, const string& key) {
  j::object::const_iterator it = jo.find(key);
  if (it == jo.end() || !it->second.is<string>()) return "";
  return it->second.get<string>();
}

JobRequest parse_request(const j::value& value) {
  JobRequest request;
  if (!value.is<j::object>()) return request;
  const j::object& jo = value.get<j::object>();
  request.language = get_string(jo, "language");
  request.code = get_string(jo, "code");
  request.stdin_data = get_string(jo, "stdin");
  return request;
}

j::value to_response(const JobResult& result) {
  j::object jo;
  switch (result.status) {
    case COMPLETED:
      jo["stdout"] = j::value(result.stdout_data);
      jo["stderr"] = j::value(result.stderr_data);
      jo["exitCode"] = result.has_exit_code ? j::value((double)result.exit_code) : j::value();
      break;
    case COMPILE_ERROR:
      if (!result.timed_out) {
        jo["stderr"] = j::value(result.message);
        break;
      }
      jo["error"] = j::value(result.message);
      break;
    case REJECTED:
    case RUN_ERROR:
    case INTERNAL_ERROR:
      jo["error"] = j::value(result.message);
      break;
  }
  return j::value(jo);
}

}
