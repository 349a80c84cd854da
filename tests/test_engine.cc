#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include <tinyformat.h>
#include "codec.hpp"
#include "engine.hpp"
#include "fs.hpp"
#include "test_helpers.hpp"
#include "util.hpp"

using std::string;
using std::vector;
using namespace runbox;

namespace {

long wall_ms() {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  return tv.tv_sec * 1000L + tv.tv_usec / 1000;
}

class EngineTest : public ::testing::Test {
  protected:
    EngineTest() : root_(fs::join(tmp_.path(), "ws")), config_(test::fake_toolchain_config(root_)) {}

    virtual void SetUp() {
      engine_.reset(new Engine(config_));
      string error;
      ASSERT_TRUE(engine_->start(error)) << error;
    }

    virtual void TearDown() {
      engine_->stop();
    }

    JobResult execute(const string& language, const string& code, const string& stdin_data = "") {
      return engine_->execute(JobRequest(language, code, stdin_data));
    }

    test::TempDir tmp_;
    string root_;
    Config config_;
    std::unique_ptr<Engine> engine_;
};

struct CallbackCounter {
  std::atomic<int> calls;
  JobResult last;

  CallbackCounter() : calls(0) {}

  void done(const JobResult& result) {
    last = result;
    ++calls;
  }
};

void sample_running(const Engine *engine, std::atomic<bool> *stop, std::atomic<int> *peak) {
  while (!*stop) {
    int running = engine->running_jobs();
    if (running > *peak) *peak = running;
    usleep(2000);
  }
}

}

TEST(ValidateRequest, Rules) {
  Language language;
  string reason;
  EXPECT_FALSE(validate_request(JobRequest("", "print(1)"), language, reason));
  EXPECT_EQ("language and code are required", reason);
  EXPECT_FALSE(validate_request(JobRequest("python", ""), language, reason));
  EXPECT_EQ("language and code are required", reason);
  EXPECT_FALSE(validate_request(JobRequest("ruby", "puts 1"), language, reason));
  EXPECT_EQ("unsupported language", reason);
  EXPECT_TRUE(validate_request(JobRequest("Python", "print(1)"), language, reason));
  EXPECT_EQ(LANG_PYTHON, language);
}

TEST(EngineStart, FailsOnUnusableRoot) {
  test::TempDir tmp;
  string file = fs::join(tmp.path(), "file");
  ASSERT_TRUE(fs::touch(file));
  Engine engine(test::fake_toolchain_config(fs::join(file, "ws")));
  string error;
  EXPECT_FALSE(engine.start(error));
  EXPECT_FALSE(error.empty());
}

TEST_F(EngineTest, ExecutesAndCleansUp) {
  JobResult r = execute("python", "read a b; echo $((a + b))", "3 4\n");
  EXPECT_EQ(COMPLETED, r.status);
  EXPECT_EQ("7\n", r.stdout_data);
  EXPECT_EQ(0u, test::count_entries(root_));
}

TEST_F(EngineTest, CleansUpAfterEveryOutcome) {
  EXPECT_EQ(COMPILE_ERROR, execute("cpp", "echo boom >&2; exit 1").status);
  EXPECT_EQ(0u, test::count_entries(root_));

  EXPECT_EQ(RUN_ERROR, execute("cpp", "true").status);
  EXPECT_EQ(0u, test::count_entries(root_));

  EXPECT_EQ(COMPLETED, execute("node", "mkdir -p a/b; touch a/b/c; exit 1").status);
  EXPECT_EQ(0u, test::count_entries(root_));
}

TEST_F(EngineTest, TimeoutsAreCleanedUp) {
  engine_->stop();
  config_.timeout_ms = 300;
  engine_.reset(new Engine(config_));
  string error;
  ASSERT_TRUE(engine_->start(error)) << error;

  JobResult r = execute("python", "sleep 10");
  EXPECT_EQ(RUN_ERROR, r.status);
  EXPECT_EQ("Execution timed out", r.message);
  EXPECT_EQ(0u, test::count_entries(root_));
}

TEST_F(EngineTest, SecondStartLeavesRunningEngineAlone) {
  ASSERT_EQ(0, rmdir(root_.c_str()));
  string error;
  EXPECT_FALSE(engine_->start(error));
  EXPECT_EQ("engine is already running", error);
  // the root is not prepared again
  EXPECT_FALSE(fs::exists(root_));
  EXPECT_FALSE(engine_->sandbox().enabled);
}

TEST_F(EngineTest, JobsDoNotSeeEachOther) {
  EXPECT_EQ(COMPLETED, execute("python", "echo data > leftover").status);
  JobResult r = execute("python", "ls");
  EXPECT_EQ(COMPLETED, r.status);
  EXPECT_EQ("main.py\n", r.stdout_data);
}

TEST_F(EngineTest, RejectsBeforeAllocatingWorkspace) {
  // with the root gone, any allocation would turn into an internal error
  ASSERT_EQ(0, fs::rm_rf(root_));

  CallbackCounter counter;
  EXPECT_FALSE(engine_->submit(JobRequest("ruby", "puts 1"), std::bind(&CallbackCounter::done, &counter, std::placeholders::_1)));
  EXPECT_EQ(1, counter.calls.load());
  EXPECT_EQ(REJECTED, counter.last.status);
  EXPECT_EQ("unsupported language", counter.last.message);

  JobResult r = execute("", "");
  EXPECT_EQ(REJECTED, r.status);
  EXPECT_EQ("language and code are required", r.message);
  EXPECT_FALSE(fs::exists(root_));
}

TEST_F(EngineTest, InternalErrorWhenWorkspaceCannotBeCreated) {
  ASSERT_EQ(0, fs::rm_rf(root_));
  JobResult r = execute("python", "echo hi");
  EXPECT_EQ(INTERNAL_ERROR, r.status);
  EXPECT_EQ(0u, r.message.find("Internal server error: "));
  EXPECT_EQ(r.message, to_response(r).get("error").get<string>());
}

TEST_F(EngineTest, RespectsConcurrencyLimit) {
  const int jobs = 6;
  std::atomic<bool> stop(false);
  std::atomic<int> peak(0);
  std::thread sampler(sample_running, engine_.get(), &stop, &peak);

  long start = wall_ms();
  vector<std::future<JobResult> > futures;
  for (int i = 0; i < jobs; ++i) {
    futures.push_back(engine_->enqueue(JobRequest("python", "sleep 0.3; echo done")));
  }
  for (int i = 0; i < jobs; ++i) {
    JobResult r = futures[i].get();
    EXPECT_EQ(COMPLETED, r.status) << r.message;
    EXPECT_EQ("done\n", r.stdout_data);
  }
  long elapsed = wall_ms() - start;

  stop = true;
  sampler.join();

  // three waves of two
  EXPECT_GE(elapsed, 850);
  EXPECT_LE(peak.load(), config_.concurrency);
  EXPECT_EQ(0, engine_->running_jobs());
  EXPECT_EQ(0u, engine_->queued_jobs());
  EXPECT_EQ(0u, test::count_entries(root_));
}

TEST_F(EngineTest, FuturesKeepRequestOrder) {
  vector<std::future<JobResult> > futures;
  for (int i = 0; i < 5; ++i) {
    futures.push_back(engine_->enqueue(JobRequest("python", tfm::format("sleep 0.0%d; echo %d", 5 - i, i))));
  }
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(tfm::format("%d\n", i), futures[i].get().stdout_data);
  }
}

TEST_F(EngineTest, CallbackRunsOnce) {
  CallbackCounter counter;
  EXPECT_TRUE(engine_->submit(JobRequest("python", "echo once"), std::bind(&CallbackCounter::done, &counter, std::placeholders::_1)));
  engine_->stop();
  EXPECT_EQ(1, counter.calls.load());
  EXPECT_EQ("once\n", counter.last.stdout_data);
}

TEST_F(EngineTest, StoppedEngineReleasesWorkspace) {
  engine_->stop();
  JobResult r = execute("python", "echo hi");
  EXPECT_EQ(INTERNAL_ERROR, r.status);
  EXPECT_EQ("Internal server error: job queue is not running", r.message);
  EXPECT_EQ(0u, test::count_entries(root_));
}

namespace {

// the toolchains from the default configuration, when installed
class RealToolchainTest : public ::testing::Test {
  protected:
    RealToolchainTest() : config_(default_config()) {
      config_.workspace_root = fs::join(tmp_.path(), "ws");
      config_.sandbox = false;
      config_.timeout_ms = 60000;
      config_.concurrency = 1;
    }

    JobResult execute(const string& language, const string& code, const string& stdin_data) {
      Engine engine(config_);
      string error;
      if (!engine.start(error)) return JobResult::internal_error(error);
      return engine.execute(JobRequest(language, code, stdin_data));
    }

    test::TempDir tmp_;
    Config config_;
};

}

#define REQUIRE_TOOL(exe) \
  if (which(exe).empty()) GTEST_SKIP() << exe << " is not installed"

static void expect_output(const JobResult& r, const string& stdout_data) {
  EXPECT_EQ(COMPLETED, r.status) << r.message;
  EXPECT_EQ(stdout_data, r.stdout_data);
  EXPECT_EQ("", r.stderr_data);
  EXPECT_TRUE(r.has_exit_code);
  EXPECT_EQ(0, r.exit_code);
}

TEST_F(RealToolchainTest, CppLiteral) {
  REQUIRE_TOOL(config_.toolchains.cxx);
  expect_output(execute("cpp",
      "#include <cstdio>\n"
      "int main() { puts(\"hello\"); return 0; }\n", ""), "hello\n");
}

TEST_F(RealToolchainTest, CppSquare) {
  REQUIRE_TOOL(config_.toolchains.cxx);
  expect_output(execute("cpp",
      "#include <iostream>\n"
      "int main() { int n; std::cin >> n; std::cout << n * n << std::endl; return 0; }\n",
      "5"), "25\n");
}

TEST_F(RealToolchainTest, CppCompileError) {
  REQUIRE_TOOL(config_.toolchains.cxx);
  JobResult r = execute("cpp", "int main() { return undeclared; }\n", "");
  EXPECT_EQ(COMPILE_ERROR, r.status);
  EXPECT_NE(string::npos, r.message.find("undeclared"));
}

TEST_F(RealToolchainTest, JavaLiteral) {
  REQUIRE_TOOL(config_.toolchains.javac);
  REQUIRE_TOOL(config_.toolchains.java);
  expect_output(execute("java",
      "public class Main { public static void main(String[] a) { System.out.println(\"hello\"); } }\n", ""),
      "hello\n");
}

TEST_F(RealToolchainTest, JavaSquare) {
  REQUIRE_TOOL(config_.toolchains.javac);
  REQUIRE_TOOL(config_.toolchains.java);
  expect_output(execute("java",
      "import java.util.Scanner;\n"
      "public class Main {\n"
      "  public static void main(String[] a) {\n"
      "    int n = new Scanner(System.in).nextInt();\n"
      "    System.out.println(n * n);\n"
      "  }\n"
      "}\n", "5"), "25\n");
}

TEST_F(RealToolchainTest, JavaCompileError) {
  REQUIRE_TOOL(config_.toolchains.javac);
  JobResult r = execute("java", "public class Main { int x = undeclared; }\n", "");
  EXPECT_EQ(COMPILE_ERROR, r.status);
  EXPECT_NE(string::npos, r.message.find("undeclared"));
}

TEST_F(RealToolchainTest, PythonLiteral) {
  REQUIRE_TOOL(config_.toolchains.python);
  expect_output(execute("python", "print('hello')\n", ""), "hello\n");
}

TEST_F(RealToolchainTest, PythonSquare) {
  REQUIRE_TOOL(config_.toolchains.python);
  expect_output(execute("python", "n = int(input())\nprint(n * n)\n", "5"), "25\n");
}

TEST_F(RealToolchainTest, PythonExitCode) {
  REQUIRE_TOOL(config_.toolchains.python);
  JobResult r = execute("python", "import sys\nsys.stderr.write('oops\\n')\nsys.exit(2)\n", "");
  EXPECT_EQ(COMPLETED, r.status) << r.message;
  EXPECT_EQ("oops\n", r.stderr_data);
  EXPECT_EQ(2, r.exit_code);
}

TEST_F(RealToolchainTest, NodeLiteral) {
  REQUIRE_TOOL(config_.toolchains.node);
  expect_output(execute("node", "console.log('hello');\n", ""), "hello\n");
}

TEST_F(RealToolchainTest, NodeSquare) {
  REQUIRE_TOOL(config_.toolchains.node);
  expect_output(execute("node",
      "const n = parseInt(require('fs').readFileSync(0, 'utf8'), 10);\n"
      "console.log(n * n);\n", "5"), "25\n");
}

TEST_F(RealToolchainTest, NodeStderr) {
  REQUIRE_TOOL(config_.toolchains.node);
  JobResult r = execute("node", "console.error('oops');\n", "");
  EXPECT_EQ(COMPLETED, r.status) << r.message;
  EXPECT_EQ("", r.stdout_data);
  EXPECT_EQ("oops\n", r.stderr_data);
}
