// File Description
// Author: Philip Salvaggio

#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include <string>

namespace zab {

bool is_dir(const std::string& path);

bool file_exists(const std::string& path);

std::string AppendSlash(const std::string& input);

// Expand ~ and environment variables in a path. Directories get a trailing
// slash.
std::string ResolvePath(const std::string& path);

// Join a directory and a file name. An empty directory leaves the file name
// untouched.
std::string JoinPath(const std::string& dir, const std::string& file);

}

#endif  // FILESYSTEM_H
