#include "fs.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <list>
#include <string>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

using std::string;

namespace runbox {

const char fs::PATH_SEPARATOR = '/';

string fs::read (FILE *fp) {
  string result;
  char buf[16384];
  for (;;) {
    size_t bytes = fread(buf, 1, sizeof(buf), fp);
    if (bytes == 0) break;
    result.append(buf, bytes);
  }
  return result;
}

string fs::read (const string& path) {
  // fs_read stops at the first NUL byte, read by length instead
  FILE *fp = fs_open(path.c_str(), "rb");
  if (!fp) return "";
  string result = fs::read(fp);
  fs_close(fp);
  return result;
}

int fs::nwrite (const string& path, const string& content) {
  // source code may contain NUL bytes, write by length
  return fs_nwrite(path.c_str(), content.data(), (int)content.length());
}

bool fs::exists (const string& path) {
  // fs_exists returns 0 if the file actually exists
  return fs_exists(path.c_str()) == 0;
}


string fs::join(const string& dirname, const string& basename) {
  size_t dirname_len = dirname.length();
  size_t basename_len = basename.length();
  int offset = 0;

  if (dirname_len == 0) return basename;
  else if (dirname[dirname_len - 1] == PATH_SEPARATOR) offset++;
  if (basename_len == 0) return dirname;
  else if (basename[0] == PATH_SEPARATOR) offset++;

  switch (offset) {
    case 0:
      return dirname + PATH_SEPARATOR + basename;
    case 2:
      return dirname + basename.substr(1);
    case 1: default:
      return dirname + basename;
  }
}

string fs::join(const string& path1, const string& path2, const string& path3) {
  return fs::join(fs::join(path1, path2), path3);
}

string fs::basename(const string& path) {
  size_t pos = path.find_last_of(PATH_SEPARATOR);
  if (pos == string::npos) {
    return path;
  } else {
    return path.substr(pos + 1);
  }
}

string fs::extname(const string& path) {
  string name = fs::basename(path);
  size_t pos = name.find_last_of('.');
  if (pos == string::npos) {
    return "";
  } else {
    return name.substr(pos);
  }
}

bool fs::is_dir(const string& path) {
  struct stat buf;
  if (stat(path.c_str(), &buf) == -1) return 0;
  return S_ISDIR(buf.st_mode) ? 1 : 0;
}

int fs::mkdir_p(const string& dir, const mode_t mode) {
  // do nothing if directory exists
  if (is_dir(dir)) return 0;

  // make each dirs
  const char * head = dir.c_str();
  int nmkdir = 0;
  for (const char * p = head; *p; ++p) {
    if (*p == '/' && p > head) {
      int e = ::mkdir(dir.substr(0, p - head).c_str(), mode);
      if (e == 0) ++nmkdir;
    }
  }
  int e = ::mkdir(dir.c_str(), mode);

  if (e < 0 && !(errno == EEXIST && is_dir(dir))) return -1;
  return nmkdir;
}

int fs::rm_rf(const string& path) {
  // try to remove single file, symlink or an empty dir
  if (unlink(path.c_str()) == 0) return 0;
  if (errno == ENOENT) return 0;
  if (::rmdir(path.c_str()) == 0) return 0;

  // user programs may leave directories without write or search bits
  struct stat buf;
  if (lstat(path.c_str(), &buf) == 0 && S_ISDIR(buf.st_mode)) chmod(path.c_str(), 0700);

  // try to list path contents
  struct dirent **namelist = 0;
  int nlist = ::scandir(path.c_str(), &namelist, 0, alphasort);

  int failed = 0;
  for (int i = 0; i < nlist; ++i) {
    const char * name = namelist[i]->d_name;
    // skip . and ..
    if (strcmp(name, ".") != 0 && strcmp(name, "..") != 0) {
      if (fs::rm_rf(path + "/" + name) != 0) ++failed;
    }
    free(namelist[i]);
  }

  if (namelist) free(namelist);

  // try remove empty dir again
  if (::rmdir(path.c_str()) == 0) return 0;

  // otherwise something must went wrong
  return -1 - failed;
}

bool fs::is_absolute(const string& path) {
  return path.length() > 0 && path.data()[0] == PATH_SEPARATOR;
}

bool fs::is_accessible(const string& path, int mode, const string& work_dir) {
  int dirfd = AT_FDCWD;
  bool result = false;
  if (!work_dir.empty() && !is_absolute(path)) {
    dirfd = open(work_dir.c_str(), O_RDONLY);
    if (dirfd == -1) goto cleanup;
  }
  result = (faccessat(dirfd, path.c_str(), mode, 0) == 0);

cleanup:
  if (dirfd != -1 && dirfd != AT_FDCWD) close(dirfd);
  return result;
}

bool fs::is_writable_dir(const string& path) {
  return is_dir(path) && is_accessible(path, R_OK | W_OK | X_OK);
}

bool fs::touch(const string& path) {
  FILE *fp = fopen(path.c_str(), "a");
  if (!fp) return false;
  fclose(fp);
  return true;
}

std::list<string> fs::scandir(const string& path) {
  std::list<string> result;

  struct dirent **namelist = 0;
  int nlist = ::scandir(path.c_str(), &namelist, 0, alphasort);
  for (int i = 0; i < nlist; ++i) {
    const char * name = namelist[i]->d_name;
    // skip . and ..
    if (strcmp(name, ".") != 0 && strcmp(name, "..") != 0) {
      result.push_back(name);
    }
    free(namelist[i]);
  }
  if (namelist) free(namelist);

  return result;
}

}
