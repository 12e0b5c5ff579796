#ifndef CLUSTERSUB_FILE_UTILS_H
#define CLUSTERSUB_FILE_UTILS_H

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

/**
   Create the directory "/some/path/to", including missing parents. A
   directory which already exists, also one created by another process while
   we were at it, is not an error.
*/
void make_path(const fs::path &path);

/** The directory which will contain "/some/path/to/file.txt" */
fs::path parent_directory(const std::string &file);

std::string read_file(const fs::path &path);

#endif
