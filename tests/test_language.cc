#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "config.hpp"
#include "language.hpp"
#include "util.hpp"

using std::string;
using std::vector;
using namespace runbox;

TEST(Language, ParseIsCaseInsensitive) {
  EXPECT_EQ(LANG_CPP, parse_language("cpp"));
  EXPECT_EQ(LANG_CPP, parse_language("CPP"));
  EXPECT_EQ(LANG_JAVA, parse_language("Java"));
  EXPECT_EQ(LANG_PYTHON, parse_language("python"));
  EXPECT_EQ(LANG_NODE, parse_language("NODE"));
}

TEST(Language, ParseRejectsOthers) {
  EXPECT_EQ(LANG_UNKNOWN, parse_language(""));
  EXPECT_EQ(LANG_UNKNOWN, parse_language("ruby"));
  EXPECT_EQ(LANG_UNKNOWN, parse_language("c++"));
  EXPECT_EQ(LANG_UNKNOWN, parse_language(" cpp"));
}

TEST(Language, FromPath) {
  EXPECT_EQ(LANG_CPP, language_from_path("a.cpp"));
  EXPECT_EQ(LANG_CPP, language_from_path("/x/y/a.CC"));
  EXPECT_EQ(LANG_JAVA, language_from_path("Main.java"));
  EXPECT_EQ(LANG_PYTHON, language_from_path("a.py"));
  EXPECT_EQ(LANG_NODE, language_from_path("a.js"));
  EXPECT_EQ(LANG_UNKNOWN, language_from_path("a.rb"));
  EXPECT_EQ(LANG_UNKNOWN, language_from_path("Makefile"));
  EXPECT_EQ(LANG_UNKNOWN, language_from_path("dir.py/file"));
}

TEST(Language, NamesRoundTrip) {
  vector<Language> languages = supported_languages();
  ASSERT_EQ(4u, languages.size());
  for (size_t i = 0; i < languages.size(); ++i) {
    EXPECT_EQ(languages[i], parse_language(language_name(languages[i])));
  }
}

static vector<string> expand(const vector<string>& cmd, const LanguageSpec& spec) {
  return escape_list(cmd, get_mappings(spec.src_name, spec.exe_name, "/ws/abc"));
}

TEST(LanguageSpec, Cpp) {
  Config config = default_config();
  LanguageSpec spec = get_language_spec(LANG_CPP, config.toolchains);
  EXPECT_EQ("main.cpp", spec.src_name);
  EXPECT_EQ("g++ /ws/abc/main.cpp -O2 -std=c++17 -o /ws/abc/main", shell_escape(expand(spec.compile_cmd, spec)));
  EXPECT_EQ("/ws/abc/main", shell_escape(expand(spec.run_cmd, spec)));
}

TEST(LanguageSpec, Java) {
  Config config = default_config();
  LanguageSpec spec = get_language_spec(LANG_JAVA, config.toolchains);
  EXPECT_EQ("Main.java", spec.src_name);
  EXPECT_EQ("javac /ws/abc/Main.java", shell_escape(expand(spec.compile_cmd, spec)));
  EXPECT_EQ("java -cp /ws/abc Main", shell_escape(expand(spec.run_cmd, spec)));
}

TEST(LanguageSpec, Interpreted) {
  Config config = default_config();
  LanguageSpec python = get_language_spec(LANG_PYTHON, config.toolchains);
  EXPECT_EQ("main.py", python.src_name);
  EXPECT_TRUE(python.compile_cmd.empty());
  EXPECT_EQ("python3 /ws/abc/main.py", shell_escape(expand(python.run_cmd, python)));

  LanguageSpec node = get_language_spec(LANG_NODE, config.toolchains);
  EXPECT_EQ("main.js", node.src_name);
  EXPECT_TRUE(node.compile_cmd.empty());
  EXPECT_EQ("node /ws/abc/main.js", shell_escape(expand(node.run_cmd, node)));
}

TEST(LanguageSpec, ToolchainsAreConfigurable) {
  Config config = default_config();
  ASSERT_TRUE(config.toolchains.set("cxx", "clang++"));
  ASSERT_TRUE(config.toolchains.set("python", "/opt/py/bin/python3.12"));
  EXPECT_FALSE(config.toolchains.set("ruby", "ruby"));

  LanguageSpec cpp = get_language_spec(LANG_CPP, config.toolchains);
  EXPECT_EQ("clang++", cpp.compile_cmd[0]);
  EXPECT_EQ("clang++", cpp.version_cmd[0]);
  LanguageSpec python = get_language_spec(LANG_PYTHON, config.toolchains);
  EXPECT_EQ("/opt/py/bin/python3.12", python.run_cmd[0]);
}
