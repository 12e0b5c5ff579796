#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include <catch2/catch.hpp>
#include <clustersub/except.hpp>

#include "tmpdir.hpp"

namespace fs = std::filesystem;

namespace {
/**
 * Keep [a-z0-9_-] of the test name, downcased, spaces replaced by '_'.
 */
std::string clean_name(const std::string &name) {
    std::string out;
    for (char c : name) {
        if (('a' <= c && c <= 'z') || ('0' <= c && c <= '9') || c == '-' ||
            c == '_')
            out.push_back(c);
        else if ('A' <= c && c <= 'Z')
            out.push_back(c + 'a' - 'A');
        else if (c == ' ')
            out.push_back('_');
    }
    return out.empty() ? "test" : out;
}

std::string get_username() {
    auto uid = getuid();
    auto pw = getpwuid(uid);
    return pw ? std::string{pw->pw_name} : std::to_string(uid);
}

fs::path make_test_dir() {
    auto base = fs::temp_directory_path() /
                ("clustersub-tests-" + get_username());
    fs::create_directories(base);

    auto name = clean_name(Catch::getResultCapture().getCurrentTestName());
    std::string templ = (base / (name + "-XXXXXX")).string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr)
        throw exc::runtime_error("Could not make tmpdir from {}", templ);
    return fs::path(buffer.data());
}
} // namespace

TmpDir::TmpDir() : m_prev_cwd(fs::current_path()), m_path(make_test_dir()) {
    UNSCOPED_INFO("Using temporary directory " << m_path.string() << "\n");
    fs::current_path(m_path);
}

TmpDir::~TmpDir() { fs::current_path(m_prev_cwd); }

std::string TmpDir::get_current_tmpdir() const { return m_path.string(); }

fs::path TmpDir::write_file(const std::string &name,
                            const std::string &content) const {
    auto path = m_path / name;
    fs::create_directories(path.parent_path());
    std::ofstream stream(path);
    if (!stream)
        throw exc::runtime_error("Could not open {}", path.string());
    stream << content;
    return path;
}

fs::path TmpDir::write_script(const std::string &name,
                              const std::string &content) const {
    auto path = write_file(name, content);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

TEST_CASE("Create a single tmpdir", "[tmpdir]") {
    auto before = fs::current_path();
    {
        WITH_TMPDIR;
        REQUIRE(fs::current_path() != before);
        REQUIRE(fs::is_empty(fs::current_path()));
    }
    REQUIRE(fs::current_path() == before);
}

TEST_CASE("Nested tmpdirs are distinct", "[tmpdir]") {
    TmpDir outer;
    fs::path outer_path = fs::current_path();
    {
        TmpDir inner;
        REQUIRE(fs::current_path() != outer_path);
    }
    REQUIRE(fs::current_path() == outer_path);
}
