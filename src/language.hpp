#pragma once

#include <map>
#include <string>
#include <vector>
#include "config.hpp"

namespace runbox {

enum Language {
  LANG_UNKNOWN = 0,
  LANG_CPP,
  LANG_JAVA,
  LANG_PYTHON,
  LANG_NODE
};

// Commands may use these placeholders:
//   $dir  workspace full path
//   $src  source file name
//   $exe  compiled binary name
struct LanguageSpec {
  Language language;
  std::string name;
  std::string src_name;
  std::string exe_name;
  std::vector<std::string> compile_cmd;  // empty: nothing to compile
  std::vector<std::string> run_cmd;
  std::vector<std::string> version_cmd;
};

// "cpp", "Java", ... case insensitive. LANG_UNKNOWN if not supported
Language parse_language(const std::string& name);

// by file extension, ex. "a.cc" => LANG_CPP
Language language_from_path(const std::string& path);

const char *language_name(Language language);

std::vector<Language> supported_languages();

LanguageSpec get_language_spec(Language language, const Toolchains& toolchains);

std::map<std::string, std::string> get_mappings(const std::string& src_name, const std::string& exe_name, const std::string& dest);

}
