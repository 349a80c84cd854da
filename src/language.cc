#include "language.hpp"
#include "fs.hpp"
#include "util.hpp"

using std::map;
using std::string;
using std::vector;

namespace runbox {

static vector<string> make_list(const string& arg1) {
  return vector<string>(1, arg1);
}

static vector<string> make_list(const string& arg1, const string& arg2) {
  vector<string> result;
  result.push_back(arg1);
  result.push_back(arg2);
  return result;
}

Language parse_language(const string& name) {
  string lang = string_tolower(name);
  if (lang == "cpp") return LANG_CPP;
  if (lang == "java") return LANG_JAVA;
  if (lang == "python") return LANG_PYTHON;
  if (lang == "node") return LANG_NODE;
  return LANG_UNKNOWN;
}

Language language_from_path(const string& path) {
  string ext = string_tolower(fs::extname(path));
  if (ext == ".cpp" || ext == ".cc" || ext == ".cxx") return LANG_CPP;
  if (ext == ".java") return LANG_JAVA;
  if (ext == ".py") return LANG_PYTHON;
  if (ext == ".js") return LANG_NODE;
  return LANG_UNKNOWN;
}

const char *language_name(Language language) {
  switch (language) {
    case LANG_CPP: return "cpp";
    case LANG_JAVA: return "java";
    case LANG_PYTHON: return "python";
    case LANG_NODE: return "node";
    case LANG_UNKNOWN: break;
  }
  return "unknown";
}

vector<Language> supported_languages() {
  vector<Language> result;
  result.push_back(LANG_CPP);
  result.push_back(LANG_JAVA);
  result.push_back(LANG_PYTHON);
  result.push_back(LANG_NODE);
  return result;
}

LanguageSpec get_language_spec(Language language, const Toolchains& toolchains) {
  LanguageSpec spec;
  spec.language = language;
  spec.name = language_name(language);

  switch (language) {
    case LANG_CPP:
      spec.src_name = "main.cpp";
      spec.exe_name = "main";
      spec.compile_cmd.push_back(toolchains.cxx);
      spec.compile_cmd.push_back("$dir/$src");
      spec.compile_cmd.push_back("-O2");
      spec.compile_cmd.push_back("-std=c++17");
      spec.compile_cmd.push_back("-o");
      spec.compile_cmd.push_back("$dir/$exe");
      spec.run_cmd = make_list("$dir/$exe");
      spec.version_cmd = make_list(toolchains.cxx, "--version");
      break;
    case LANG_JAVA:
      // the public class must be named Main
      spec.src_name = "Main.java";
      spec.exe_name = "Main";
      spec.compile_cmd = make_list(toolchains.javac, "$dir/$src");
      spec.run_cmd = make_list(toolchains.java, "-cp");
      spec.run_cmd.push_back("$dir");
      spec.run_cmd.push_back("$exe");
      // java prints its version to stderr
      spec.version_cmd = make_list(toolchains.java, "-version");
      break;
    case LANG_PYTHON:
      spec.src_name = "main.py";
      spec.run_cmd = make_list(toolchains.python, "$dir/$src");
      spec.version_cmd = make_list(toolchains.python, "--version");
      break;
    case LANG_NODE:
      spec.src_name = "main.js";
      spec.run_cmd = make_list(toolchains.node, "$dir/$src");
      spec.version_cmd = make_list(toolchains.node, "--version");
      break;
    case LANG_UNKNOWN:
      break;
  }
  return spec;
}

map<string, string> get_mappings(const string& src_name, const string& exe_name, const string& dest) {
  map<string, string> mappings;
  mappings["$src"] = src_name;  // basename
  mappings["$exe"] = exe_name;  // basename
  mappings["$dir"] = dest;      // unsandboxed, workdir full path

  return mappings;
}

}
