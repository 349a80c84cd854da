#include <gtest/gtest.h>
#include <string>
#include "codec.hpp"
#include "process.hpp"

using std::string;
using namespace runbox;

static j::value parse(const string& json) {
  j::value value;
  string err = j::parse(value, json);
  EXPECT_EQ("", err);
  return value;
}

static ProcessOutcome exited_with(int code) {
  ProcessOutcome outcome = ProcessOutcome();
  outcome.exited = true;
  outcome.exit_code = code;
  outcome.stdout_data = "out";
  outcome.stderr_data = "err";
  return outcome;
}

TEST(Codec, ParseRequest) {
  JobRequest request = parse_request(parse("{\"language\":\"python\",\"code\":\"print(1)\",\"stdin\":\"3\\n\"}"));
  EXPECT_EQ("python", request.language);
  EXPECT_EQ("print(1)", request.code);
  EXPECT_EQ("3\n", request.stdin_data);
}

TEST(Codec, ParseRequestIgnoresBadFields) {
  JobRequest request = parse_request(parse("{\"language\":7,\"code\":null,\"extra\":true}"));
  EXPECT_EQ("", request.language);
  EXPECT_EQ("", request.code);
  EXPECT_EQ("", request.stdin_data);

  JobRequest not_object = parse_request(parse("[\"cpp\"]"));
  EXPECT_EQ("", not_object.language);
}

TEST(Codec, CompletedResponse) {
  j::value value = to_response(JobResult::completed(exited_with(3)));
  const j::object& jo = value.get<j::object>();
  EXPECT_EQ(3u, jo.size());
  EXPECT_EQ("out", jo.at("stdout").get<string>());
  EXPECT_EQ("err", jo.at("stderr").get<string>());
  EXPECT_EQ(3.0, jo.at("exitCode").get<double>());
}

TEST(Codec, SignaledResponseHasNullExitCode) {
  ProcessOutcome outcome = ProcessOutcome();
  outcome.signaled = true;
  outcome.term_sig = 11;
  outcome.signal = "SIGSEGV";
  j::value value = to_response(JobResult::completed(outcome));
  EXPECT_TRUE(value.get("exitCode").is<j::null>());
  EXPECT_EQ("{\"exitCode\":null,\"stderr\":\"\",\"stdout\":\"\"}", value.serialize());
}

TEST(Codec, CompileErrorResponse) {
  j::value value = to_response(JobResult::compile_error("main.cpp:1: error\n"));
  EXPECT_EQ("{\"stderr\":\"main.cpp:1: error\\n\"}", value.serialize());
}

TEST(Codec, CompileTimeoutResponse) {
  j::value value = to_response(JobResult::compile_error("Compilation timed out", true));
  EXPECT_EQ("{\"error\":\"Compilation timed out\"}", value.serialize());
}

TEST(Codec, ErrorResponses) {
  EXPECT_EQ("{\"error\":\"unsupported language\"}",
      to_response(JobResult::rejected("unsupported language")).serialize());
  EXPECT_EQ("{\"error\":\"Execution timed out\"}",
      to_response(JobResult::run_error("Execution timed out", true)).serialize());
  EXPECT_EQ("{\"error\":\"Internal server error: disk full\"}",
      to_response(JobResult::internal_error("disk full")).serialize());
}
