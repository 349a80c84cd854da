#pragma once

#include <cstdio>
#include <string>

namespace runbox {
namespace term {
  namespace attr {
    const int RESET      = 0;
    const int BOLD       = 1;
  }

  namespace fg {
    const int  RED       = 31;
    const int  GREEN     = 32;
    const int  YELLOW    = 33;
    const int  WHITE     = 37;
  }

  namespace bg {
    const int  RED       = 41;
    const int  GREEN     = 42;
    const int  YELLOW    = 43;
  }

  // SGR sequence, a negative color is left out
  std::string escape(int attr, int fg = -1, int bg = -1);

  // a terminal that is not "dumb"
  bool colored(FILE *fp);

  // no-op unless colored(fp)
  void set(int attr, int fg, int bg, FILE *fp = stdout);
  void set(int attr, int fg, FILE *fp = stdout);
  void set(int attr = attr::RESET, FILE *fp = stdout);

  // program output in one color, newline terminated. nothing for empty content
  void print(FILE *fp, int fg, const std::string& content);
}
}
