#pragma once

#include <picojson.h>
#include "engine.hpp"
#include "result.hpp"

namespace runbox {

namespace j = picojson;

// { "language": string, "code": string, "stdin": string }
// fields that are missing or not strings are left empty, validation
// happens in the engine
JobRequest parse_request(const j::value& value);

// One of:
//   { "error": string }
//   { "stderr": string }   compile errors reported by the toolchain
//   { "stdout": string, "stderr": string, "exitCode": number|null }
//
// Older clients expect compiler diagnostics in the { "stderr" } shape.
j::value to_response(const JobResult& result);

}
