#ifndef _GNU_SOURCE
# define _GNU_SOURCE
#endif

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <future>
#include <string>
#include <unistd.h>
#include <vector>
#include <picojson.h>
#include <tinyformat.h>

#include "codec.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "fs.hpp"
#include "language.hpp"
#include "log.hpp"
#include "process.hpp"
#include "sandbox.hpp"
#include "term.hpp"
#include "util.hpp"

using std::string;
using std::vector;
using tfm::format;
using namespace runbox;

#define fatal(...) { fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); exit(1); }

#define RUNBOX_VERSION "v0.1.0"

// time limit of "--version" style commands
#define VERSION_CMD_TIMEOUT_MS 10000

enum Action {
  ACTION_RUN,
  ACTION_REQUEST,
  ACTION_DIRECT,
  ACTION_CHECK,
  ACTION_COMPILER_VERSIONS,
  ACTION_ALL_COMPILER_VERSIONS,
  ACTION_LANGUAGES
};

struct Options {
  Config config;
  Action action;
  string language;
  string code_path;
  string stdin_path;
  bool pretty_print;
};

static void print_usage() {
  fprintf(stderr,
      "Compile, run and print response JSON:\n"
      "  runbox --language (or -l) cpp|java|python|node\n"
      "         --code (or -c) code-path\n"
      "         [--stdin (or -i) input-path]\n"
      "\n"
      "Read request JSON (an object or an array of objects) from stdin,\n"
      "run and print response JSON:\n"
      "  runbox --request (or -r)\n"
      "\n"
      "Compile, run, print output instead of JSON response (the \"direct mode\"):\n"
      "  runbox code-path\n"
      "\n"
      "Available options:\n"
      "  runbox [--workspace-root path]\n"
      "         [--threads (or -j) n] [--timeout ms] [--max-output bytes]\n"
      "         [--sandbox] [--no-sandbox]\n"
      "         [--toolchain cxx|javac|java|python|node executable] ...\n"
      "         [--pretty-print (or --pp)] [--debug]\n"
      "\n"
      "Check environment:\n"
      "  runbox --check\n"
      "\n"
      "Print compiler / interpreter versions:\n"
      "  runbox --compiler-versions      (only list toolchains installed)\n"
      "  runbox --all-compiler-versions  (including not installed ones)\n"
      "  runbox --languages\n"
      "\n"
      "Print infomation:\n"
      "  runbox --help (or -h)\n"
      "  runbox --version (or -v)\n"
      "\n"
      "Environment:\n"
      "  RUNBOX_CONCURRENCY RUNBOX_TIMEOUT_MS RUNBOX_MAX_OUTPUT\n"
      "  RUNBOX_WORKSPACE_ROOT RUNBOX_SANDBOX DEBUG\n"
      "\n");
  exit(0);
}

static void print_version() {
  printf("runbox %s\n", RUNBOX_VERSION);
  printf("\nthread support: %s\n",
#ifdef _OPENMP
    "yes"
#else
    "no"
#endif
  );
  exit(0);
}

static string get_full_path(const string& path) {
  if (path.empty() || fs::is_absolute(path)) return path;
  char *cwd = get_current_dir_name();
  if (!cwd) fatal("cannot get current directory");
  string result = fs::join(cwd, path);
  free(cwd);
  return result;
}

static Options parse_cli_options(int argc, const char *argv[]) {
  Options options;

  // default options
  {
    options.config = default_config();
    load_env_config(options.config);
    options.action = ACTION_RUN;
    options.pretty_print = isatty(STDOUT_FILENO);
  }

#define REQUIRE_NARGV(n) if (i + n >= argc) { \
  fatal("Option '%s' requires %d argument%s.", option.c_str(), n, n > 1 ? "s" : ""); }
#define NEXT_STRING_ARG string(argv[++i])
#define NEXT_NUMBER_ARG (atol(argv[++i]))

  for (int i = 1; i < argc; ++i) {
    string option;
    if (strncmp("--", argv[i], 2) == 0) {
      option = argv[i] + 2;
    } else if (strncmp("-", argv[i], 1) == 0) {
      option = argv[i] + 1;
    } else {
      // check "direct mode"
      option = argv[i];
      if (options.code_path.empty() && i == argc - 1 && language_from_path(option) != LANG_UNKNOWN) {
        options.code_path = option;
        options.language = language_name(language_from_path(option));
        options.action = ACTION_DIRECT;
        continue;
      } else {
        fatal("`%s` is not a valid option. Use `--help` for more information", argv[i]);
      }
    }

    if (option == "language" || option == "l") {
      REQUIRE_NARGV(1);
      options.language = NEXT_STRING_ARG;
    } else if (option == "code" || option == "c") {
      REQUIRE_NARGV(1);
      options.code_path = NEXT_STRING_ARG;
    } else if (option == "stdin" || option == "i") {
      REQUIRE_NARGV(1);
      options.stdin_path = NEXT_STRING_ARG;
    } else if (option == "request" || option == "r") {
      options.action = ACTION_REQUEST;
    } else if (option == "threads" || option == "jobs" || option == "j") {
      REQUIRE_NARGV(1);
      options.config.concurrency = NEXT_NUMBER_ARG;
    } else if (option == "timeout" || option == "t") {
      REQUIRE_NARGV(1);
      options.config.timeout_ms = NEXT_NUMBER_ARG;
    } else if (option == "max-output") {
      REQUIRE_NARGV(1);
      options.config.max_output = parse_bytes(NEXT_STRING_ARG);
    } else if (option == "workspace-root") {
      REQUIRE_NARGV(1);
      options.config.workspace_root = NEXT_STRING_ARG;
    } else if (option == "sandbox") {
      options.config.sandbox = true;
    } else if (option == "no-sandbox") {
      options.config.sandbox = false;
    } else if (option == "toolchain") {
      REQUIRE_NARGV(2);
      string key = NEXT_STRING_ARG;
      string exe = NEXT_STRING_ARG;
      if (!options.config.toolchains.set(key, exe)) fatal("'%s' is not a valid toolchain name", key.c_str());
    } else if (option == "pretty-print" || option == "pp") {
      options.pretty_print = true;
    } else if (option == "debug") {
      set_debug_level(10);  // show info, warn, error
    } else if (option == "check") {
      options.action = ACTION_CHECK;
    } else if (option == "compiler-versions" || option == "cvs") {
      options.action = ACTION_COMPILER_VERSIONS;
    } else if (option == "all-compiler-versions" || option == "acvs") {
      options.action = ACTION_ALL_COMPILER_VERSIONS;
    } else if (option == "languages") {
      options.action = ACTION_LANGUAGES;
    } else if (option == "help" || option == "h") {
      print_usage();
    } else if (option == "version" || option == "v") {
      print_version();
    } else {
      fatal("'%s' is not a valid option", argv[i]);
    }
  }

#undef NEXT_NUMBER_ARG
#undef NEXT_STRING_ARG
#undef REQUIRE_NARGV

  options.config.workspace_root = get_full_path(options.config.workspace_root);

  log_debug("workspace-root = %s", options.config.workspace_root.c_str());
  log_debug("debug-level = %d", debug_level);

  return options;
}

static void check_options(const Options& options) {
  vector<string> errors = check_config(options.config);

  if (options.action == ACTION_RUN || options.action == ACTION_DIRECT) {
    if (options.code_path.empty()) {
      errors.push_back("--code is required");
    } else if (fs::is_dir(options.code_path) || !fs::is_accessible(options.code_path, R_OK)) {
      errors.push_back("--code (" + options.code_path + ") is not accessible");
    }
    if (options.language.empty()) errors.push_back("--language is required");
    if (!options.stdin_path.empty() && !fs::is_accessible(options.stdin_path, R_OK)) {
      errors.push_back("--stdin (" + options.stdin_path + ") is not accessible");
    }
  }

  if (errors.size() > 0) {
    for (int i = 0; i < (int)errors.size(); ++i) {
      fprintf(stderr, "%s\n", errors[i].c_str());
    }
    fprintf(stderr, "--help will show valid options\n");
    exit(1);
  }
}

static void print_checkpoint(const string& name, bool passed, const string& solution) {
  term::set(term::attr::BOLD, term::fg::WHITE, passed ? term::bg::GREEN : term::bg::RED);
  printf(passed ? " Y " : " N ");
  term::set();
  term::set(term::attr::BOLD);
  printf(" %s\n", name.c_str());
  term::set();
  if (!passed) {
    string indented = solution;
    string_replacei(indented, "\n", "\n    ");
    printf("    %s\n\n", indented.c_str());
  }
}

static void print_checkfail(const string& name, const string& message, char symbol = '!') {
  term::set(term::attr::BOLD, term::fg::WHITE, symbol == 'W' ? term::bg::YELLOW : term::bg::RED);
  printf(" %c ", symbol);
  term::set();
  term::set(term::attr::BOLD);
  printf(" %s\n", name.c_str());
  term::set();
  string indented = message;
  string_replacei(indented, "\n", "\n    ");
  printf("    %s\n\n", indented.c_str());
}

static void check_toolchain(const string& key, const string& exe, const string& language) {
  print_checkpoint(
      format("%s (%s) is installed", exe, key),
      !which(exe).empty(),
      format("%s is required to run %s code. Install it or point\n"
             "runbox to another executable:\n\n"
             "  runbox --toolchain %s /path/to/%s ...", exe, language, key, exe));
}

static void do_check(const Config& config) {
  { // workspace
    WorkspaceManager workspaces(config.workspace_root);
    string error;
    bool ok = workspaces.prepare_root(error);
    print_checkpoint(
        format("workspace root %s is writable", config.workspace_root),
        ok,
        error + "\nPick another directory with --workspace-root or RUNBOX_WORKSPACE_ROOT.");
  }

  { // toolchains
    const Toolchains& t = config.toolchains;
    check_toolchain("cxx", t.cxx, "cpp");
    check_toolchain("javac", t.javac, "java");
    check_toolchain("java", t.java, "java");
    check_toolchain("python", t.python, "python");
    check_toolchain("node", t.node, "node");
  }

  { // sandbox
    if (!config.sandbox) {
      print_checkfail(
          "sandbox is disabled",
          "Programs run without " RUNBOX_SANDBOX_TOOL ". Remove --no-sandbox\n"
          "or RUNBOX_SANDBOX=0 to enable it.", 'W');
    } else if (which(RUNBOX_SANDBOX_TOOL).empty()) {
      print_checkfail(
          RUNBOX_SANDBOX_TOOL " not found",
          "Programs will run without isolation. Install " RUNBOX_SANDBOX_TOOL "\n"
          "to restrict them to their workspace.", 'W');
    } else {
      print_checkpoint(RUNBOX_SANDBOX_TOOL " is installed", true, "");
    }
  }

  exit(0);
}

static void fetch_compiler_versions(vector<j::value>& result, const Config& config, bool only_present = true) {
  ProcessRunner runner(config.max_output);
  vector<Language> languages = supported_languages();
  for (size_t i = 0; i < languages.size(); ++i) {
    LanguageSpec spec = get_language_spec(languages[i], config.toolchains);

    // scan version string from the output
    // if no version found, hide the compiler from output list
    CommandLine version_cmd(spec.version_cmd);
    ProcessOutcome outcome = runner.run(version_cmd, "", VERSION_CMD_TIMEOUT_MS);
    string version = outcome.launch_failed ? "" : scan_version_string(outcome.stdout_data + "\n" + outcome.stderr_data);

    j::object jo;
    if (!version.empty()) {
      jo["version"] = j::value(version);
    } else {
      if (only_present) continue;
    }

    if (!spec.compile_cmd.empty()) jo["compileCmd"] = j::value(shell_escape(spec.compile_cmd));
    jo["runCmd"] = j::value(shell_escape(spec.run_cmd));
    jo["name"] = j::value(spec.compile_cmd.empty() ? spec.run_cmd[0] : spec.compile_cmd[0]);
    jo["language"] = j::value(spec.name);
    result.push_back(j::value(jo));
  }
}

static void print_compiler_versions(const Options& opts, bool only_present = true) {
  vector<j::value> arr;
  fetch_compiler_versions(arr, opts.config, only_present);
  printf("%s", j::value(arr).serialize(opts.pretty_print).c_str());
  exit(0);
}

static void print_languages(const Options& opts) {
  vector<j::value> arr;
  vector<Language> languages = supported_languages();
  for (size_t i = 0; i < languages.size(); ++i) {
    LanguageSpec spec = get_language_spec(languages[i], opts.config.toolchains);
    j::object jo;
    jo["name"] = j::value(spec.name);
    jo["srcName"] = j::value(spec.src_name);
    if (!spec.compile_cmd.empty()) jo["compileCmd"] = j::value(shell_escape(spec.compile_cmd));
    jo["runCmd"] = j::value(shell_escape(spec.run_cmd));
    arr.push_back(j::value(jo));
  }
  printf("%s", j::value(arr).serialize(opts.pretty_print).c_str());
  exit(0);
}

static void start_engine(Engine& engine) {
  string error;
  if (!engine.start(error)) fatal("%s", error.c_str());
}

static int run_request_mode(const Options& opts) {
  string input = fs::read(stdin);
  j::value request;
  string err = j::parse(request, input);
  if (!err.empty()) fatal("cannot parse request JSON: %s", err.c_str());

  Engine engine(opts.config);
  start_engine(engine);

  if (request.is<j::array>()) {
    // all requests go into the queue before waiting for any of them
    const j::array& items = request.get<j::array>();
    vector<std::future<JobResult> > futures;
    for (size_t i = 0; i < items.size(); ++i) {
      futures.push_back(engine.enqueue(parse_request(items[i])));
    }
    j::array responses;
    for (size_t i = 0; i < futures.size(); ++i) {
      responses.push_back(to_response(futures[i].get()));
    }
    printf("%s", j::value(responses).serialize(opts.pretty_print).c_str());
  } else {
    JobResult result = engine.execute(parse_request(request));
    printf("%s", to_response(result).serialize(opts.pretty_print).c_str());
  }
  engine.stop();
  return 0;
}

static JobRequest read_cli_request(const Options& opts, bool pass_stdin) {
  JobRequest request;
  request.language = opts.language;
  request.code = fs::read(opts.code_path);
  if (!opts.stdin_path.empty()) {
    request.stdin_data = fs::read(opts.stdin_path);
  } else if (pass_stdin && !isatty(STDIN_FILENO)) {
    request.stdin_data = fs::read(stdin);
  }
  return request;
}

static int run_single(const Options& opts) {
  Engine engine(opts.config);
  start_engine(engine);
  JobResult result = engine.execute(read_cli_request(opts, false));
  printf("%s", to_response(result).serialize(opts.pretty_print).c_str());
  engine.stop();
  return 0;
}

static int run_direct_mode(const Options& opts) {
  Engine engine(opts.config);
  start_engine(engine);
  JobResult result = engine.execute(read_cli_request(opts, true));
  engine.stop();

  switch (result.status) {
    case COMPLETED:
      fwrite(result.stdout_data.data(), 1, result.stdout_data.length(), stdout);
      fflush(stdout);
      term::print(stderr, term::fg::RED, result.stderr_data);
      return result.has_exit_code ? result.exit_code : 1;
    case COMPILE_ERROR:
      term::print(stderr, term::fg::YELLOW, result.message);
      return 1;
    default:
      term::print(stderr, term::fg::RED, result.message);
      return 1;
  }
}

int main(int argc, char const *argv[]) {
  init_debug_level_from_env();
  if (argc == 1) print_usage();

  Options opts = parse_cli_options(argc, argv);
  check_options(opts);

  switch (opts.action) {
    case ACTION_CHECK:
      do_check(opts.config);
      break;
    case ACTION_COMPILER_VERSIONS:
      print_compiler_versions(opts, true /* only_present */);
      break;
    case ACTION_ALL_COMPILER_VERSIONS:
      print_compiler_versions(opts, false /* only_present */);
      break;
    case ACTION_LANGUAGES:
      print_languages(opts);
      break;
    case ACTION_REQUEST:
      return run_request_mode(opts);
    case ACTION_DIRECT:
      return run_direct_mode(opts);
    case ACTION_RUN:
      return run_single(opts);
  }
  return 0;
}
