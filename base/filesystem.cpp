// File Description
// Author: Philip Salvaggio

#include "filesystem.h"

#include <sys/stat.h>
#include <wordexp.h>

namespace zab {

bool is_dir(const std::string& path) {
  struct stat buf;
  if (stat(path.c_str(), &buf) != 0) return false;
  return S_ISDIR(buf.st_mode);
}

bool file_exists(const std::string& path) {
  struct stat buffer;
  return stat(path.c_str(), &buffer) == 0;
}

std::string AppendSlash(const std::string& input) {
  if (input.empty() || input.back() != '/') {
    return input + '/';
  }
  return input;
}

std::string ResolvePath(const std::string& path) {
  wordexp_t exp_result;
  if (wordexp(path.c_str(), &exp_result, 0) != 0) return path;

  std::string new_path = path;
  if (exp_result.we_wordc > 0) new_path = exp_result.we_wordv[0];
  wordfree(&exp_result);

  if (is_dir(new_path)) {
    new_path = AppendSlash(new_path);
  }

  return new_path;
}

std::string JoinPath(const std::string& dir, const std::string& file) {
  if (dir.empty()) return file;
  return AppendSlash(dir) + file;
}

}
