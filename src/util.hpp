#pragma once

#include <list>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

namespace runbox {
  std::string string_tolower(const std::string& str);
  std::vector<std::string> string_split(const std::string& str, const std::string& delim);
  void string_replacei(std::string& str, const std::string& from, const std::string& to);

  // replace every key of mappings found in each item, ex. "$dir" => "/tmp/x"
  std::vector<std::string> escape_list(const std::vector<std::string>& items, const std::map<std::string, std::string>& mappings);

  std::string shell_escape(const std::string& str);
  std::string shell_escape(const std::vector<std::string>& items);

  // search PATH. returns "" if not found
  std::string which(const std::string& name, int access = R_OK | X_OK);

  // find something like a.b.c from a long string
  std::string scan_version_string(const std::string& content);

  // accept "65536", "64k", "0.5mb", "1G" ...
  long long parse_bytes(const std::string& str);

  // hex string read from /dev/urandom, falls back to rand()
  std::string get_random_hash(int len = 32);
}
