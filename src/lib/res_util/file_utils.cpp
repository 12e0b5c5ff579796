#include <fstream>
#include <sstream>
#include <system_error>

#include <clustersub/except.hpp>
#include <clustersub/res_util/file_utils.hpp>

void make_path(const fs::path &path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (!ec)
        return;

    // Lost a race against a sibling process creating the same directory.
    if (fs::is_directory(path))
        return;

    throw fs::filesystem_error("Unable to create directory", path, ec);
}

fs::path parent_directory(const std::string &file) {
    auto path = fs::absolute(fs::path(file)).lexically_normal();
    // "out/dir/" names the directory "out/dir", whose parent is "out"
    if (!path.has_filename() && path.has_relative_path())
        path = path.parent_path();
    return path.parent_path();
}

std::string read_file(const fs::path &path) {
    std::ifstream stream(path);
    if (!stream)
        throw exc::runtime_error("Unable to open file: {}", path.string());

    std::stringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}
