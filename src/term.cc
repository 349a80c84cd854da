#include "term.hpp"
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <tinyformat.h>

using std::string;

namespace runbox {

string term::escape(int attr, int fg, int bg) {
  string codes = tfm::format("%d", attr);
  if (fg >= 0) codes += tfm::format(";%d", fg);
  if (bg >= 0) codes += tfm::format(";%d", bg);
  return "\x1b[" + codes + "m";
}

bool term::colored(FILE *fp) {
  if (!isatty(fileno(fp))) return false;
  const char *name = getenv("TERM");
  return !name || strcmp(name, "dumb") != 0;
}

static void put(FILE *fp, const string& s) {
  fwrite(s.data(), 1, s.length(), fp);
}

void term::set(int attr, int fg, int bg, FILE *fp) {
  if (colored(fp)) put(fp, escape(attr, fg, bg));
}

void term::set(int attr, int fg, FILE *fp) {
  if (colored(fp)) put(fp, escape(attr, fg));
}

void term::set(int attr, FILE *fp) {
  if (colored(fp)) put(fp, escape(attr));
}

void term::print(FILE *fp, int fg, const string& content) {
  if (content.empty()) return;

  set(attr::RESET, fg, fp);
  // may contain NUL bytes
  put(fp, content);
  if (content[content.length() - 1] != '\n') put(fp, "\n");
  set(attr::RESET, fp);
}

}
