#include "util.hpp"
#include "fs.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>

using std::map;
using std::string;
using std::vector;

namespace runbox {

string string_tolower(const string& str) {
  string result = str;
  for (size_t i = 0; i < result.length(); ++i) result[i] = tolower((unsigned char)result[i]);
  return result;
}

vector<string> string_split(const string& str, const string& delim) {
  vector<string> result;
  if (delim.empty()) {
    result.push_back(str);
  } else {
    size_t pos = 0, start = 0;
    for (int running = 1; running;) {
      pos = str.find(delim, start);
      size_t len;
      if (pos == string::npos) {
        len = string::npos;
        running = 0;
      } else {
        len = pos - start;
      }
      result.push_back(str.substr(start, len));
      start = pos + delim.length();
    }
  }
  return result;
}

void string_replacei(string& str, const string& from, const string& to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = str.find(from, pos)) != string::npos) {
    str.replace(pos, from.length(), to);
    pos += to.length();
  }
}

vector<string> escape_list(const vector<string>& items, const map<string, string>& mappings) {
  vector<string> result;
  for (__typeof(items.begin()) it = items.begin(); it != items.end(); ++it) {
    string item = *it;
    for (__typeof(mappings.begin()) mit = mappings.begin(); mit != mappings.end(); ++mit) {
      string_replacei(item, mit->first, mit->second);
    }
    result.push_back(item);
  }
  return result;
}

string shell_escape(const string& str) {
  bool should_escape = str.empty();
  static const char safe_chars[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=./$:";
  for (size_t i = 0; i < str.length(); ++i) {
    if (strchr(safe_chars, str[i]) == NULL) {
      should_escape = true;
      break;
    }
  }

  if (!should_escape) return str;

  string result = "'";
  for (size_t i = 0; i < str.length(); ++i) {
    char c = str[i];
    if (c == '\'') {
      result += "'\"'\"'";
    } else {
      result += c;
    }
  }
  return result + "'";
}

string shell_escape(const vector<string>& items) {
  string result = "";
  for (__typeof(items.begin()) it = items.begin(); it != items.end(); ++it) {
    if (!result.empty()) result += " ";
    result += shell_escape(*it);
  }
  return result;
}

string which(const string& name, int access) {
  string result;
  if (name.empty()) return result;
  if (name.find(fs::PATH_SEPARATOR) != string::npos) {
    return fs::is_accessible(name, access) && !fs::is_dir(name) ? name : result;
  }
  char * path_env = getenv("PATH");
  if (path_env) {
    vector<string> dirs = string_split(path_env, ":");
    for (int i = 0; i < (int)dirs.size(); ++i) {
       string path = fs::join(dirs[i], name);
       if (fs::is_accessible(path, access) && !fs::is_dir(path)) {
         result = path;
         break;
       }
    }
  }
  return result;
}

string scan_version_string(const string& content) {
  string result;
  bool current_word_is_version = false;
  // a trailing space flushes a version at the very end of content
  string padded = content + " ";
  for (size_t i = 0; i < padded.length(); ++i) {
    char c = padded[i];
    if (c >= '0' && c <= '9') {
      result += c;
      current_word_is_version = true;
    } else if (c == '.') {
      if (current_word_is_version) result += c;
    } else {
      if (current_word_is_version) {
        // exiting version, do check
        // remove tailing dot
        if (result.length() > 0 && result[result.length() - 1] == '.') result = result.substr(0, result.length() - 1);
        if (strchr(result.c_str(), '.') != NULL && result.length() >= 2) return result;
        // no '.', not a version string
        result = "";
      }
      current_word_is_version = false;
    }
  }
  return "";
}

long long parse_bytes(const string& str) {
  long long result = 1;
  // accept str which ends with 'k', 'kb', 'm', 'M', etc.
  int pos = str.length() - 1;
  if (pos > 0 && (str[pos] == 'b' || str[pos] == 'B')) --pos;
  if (pos > 0) {
    switch (str[pos]) {
      case 'g': case 'G':
        result *= 1024;
      case 'm': case 'M':
        result *= 1024;
      case 'k': case 'K':
        result *= 1024;
    }
  }
  if (result == 1) {
    // read as long long
    result = 0;
    sscanf(str.c_str(), "%lld", &result);
  } else {
    // read as double so that the user can use things like 0.5mb
    double v = 0;
    sscanf(str.c_str(), "%lf", &v);
    result *= v;
  }
  return result;
}

string get_random_hash(int len) {
  static const char chars[] = "0123456789abcdef";
  static const int MIN_LEN = 4;
  if (len < MIN_LEN) len = MIN_LEN;

  string result;
  result.reserve(len);

  int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd >= 0) {
    unsigned char buf[64];
    while ((int)result.length() < len) {
      ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n <= 0) break;
      for (ssize_t i = 0; i < n && (int)result.length() < len; ++i) result += chars[buf[i] & 15];
    }
    close(fd);
  }

  if ((int)result.length() < len) {
    // rand() is not thread safe
    static std::mutex rand_mutex;
    std::lock_guard<std::mutex> lock(rand_mutex);
    while ((int)result.length() < len) result += chars[rand() % (sizeof(chars) - 1)];
  }
  return result;
}

}
