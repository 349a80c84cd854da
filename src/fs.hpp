#pragma once

#include <cstdio>
#include <list>
#include <string>
#include <unistd.h>

extern "C" {
#include "fs.h"
}

namespace runbox {
namespace fs {
  // proxy to fs.h
  std::string read(const std::string& path);
  std::string read(FILE *fp);                 // until EOF, NUL bytes kept
  int nwrite(const std::string& path, const std::string& content);
  bool exists(const std::string& path);

  // additional helper methods
  std::string join(const std::string& dirname, const std::string& basename);
  std::string join(const std::string&, const std::string&, const std::string&);
  std::string basename(const std::string& path);
  std::string extname(const std::string& path);
  bool is_dir(const std::string& path);
  int mkdir_p(const std::string& dir, const mode_t mode = 0755);
  int rm_rf(const std::string& path);
  bool is_absolute(const std::string& path);
  bool is_accessible(const std::string& path, int mode = R_OK, const std::string& work_dir = "");
  bool is_writable_dir(const std::string& path);
  bool touch(const std::string& path);
  std::list<std::string> scandir(const std::string& path);

  extern const char PATH_SEPARATOR;
}
}
