#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/spawn.hpp>
#include <clustersub/logging.hpp>

extern char **environ;

static auto logger = clustersub::get_logger("job_queue.spawn");

#define SHELL_PATH "/bin/sh"

static bool is_executable(const char *path) {
    if (access(path, F_OK) == 0) {
        struct stat stat_buffer;
        if (stat(path, &stat_buffer) != 0)
            throw exc::runtime_error("Unable to get file properties of {}",
                                     path);
        if (S_ISREG(stat_buffer.st_mode)) {
            return (stat_buffer.st_mode & S_IXUSR);
        } else
            return false; // It is not a file.
    } else                // Entry does not exist - return false.
        return false;
}

static std::shared_ptr<posix_spawn_file_actions_t>
create_fileactions(posix_spawn_file_actions_t *file_actions) {
    int status = posix_spawn_file_actions_init(file_actions);
    if (status != 0)
        throw exc::runtime_error("Unable to set up file redirection due to {}",
                                 strerror(status));
    return {file_actions, posix_spawn_file_actions_destroy};
}

static void add_close(std::shared_ptr<posix_spawn_file_actions_t> fa, int p) {
    int status = posix_spawn_file_actions_addclose(fa.get(), p);
    if (status != 0)
        throw exc::runtime_error(
            "Unable to add posix_spawn close file_action {}", strerror(status));
}

static void add_dup2(std::shared_ptr<posix_spawn_file_actions_t> fa, int p1,
                     int p2) {
    int status = posix_spawn_file_actions_adddup2(fa.get(), p1, p2);
    if (status != 0)
        throw exc::runtime_error("Unable to add dup2 file_action {}",
                                 strerror(status));
}

/** Closes both ends of a pipe on scope exit */
class Pipe {
public:
    int fd[2] = {-1, -1};

    Pipe() {
        if (pipe(fd) != 0)
            throw exc::runtime_error("Error while creating pipe: {}",
                                     strerror(errno));
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    void close_read() {
        if (fd[0] >= 0)
            close(fd[0]);
        fd[0] = -1;
    }
    void close_write() {
        if (fd[1] >= 0)
            close(fd[1]);
        fd[1] = -1;
    }
};

spawn_result spawn_blocking(std::vector<std::string> argv) {
    std::unique_ptr<char *[]> argvptr(new char *[argv.size() + 1]);
    for (std::size_t i = 0; i < argv.size(); i++) {
        argvptr[i] = argv[i].data();
    }
    argvptr[argv.size()] = nullptr;
    return spawn_blocking(argvptr.get());
}

/**
  Will spawn a new process and wait for its completion. Both stdout and
  stderr of the child are written to the same pipe, so the returned output
  has them interleaved as the child wrote them. The raw waitpid() status is
  returned; observe that exit status 127 typically means 'File not found' -
  i.e. the executable could not be found.

  There is no timeout, a child which never exits blocks the caller forever.
*/
spawn_result spawn_blocking(char *const argv[]) {
    posix_spawn_file_actions_t _file_actions{};
    auto file_actions = create_fileactions(&_file_actions);

    Pipe output;
    add_close(file_actions, output.fd[0]);
    add_dup2(file_actions, output.fd[1], 1);
    add_dup2(file_actions, output.fd[1], 2);
    add_close(file_actions, output.fd[1]);

    pid_t pid = 0;
    int status;
    if (is_executable(argv[0])) {
        status = posix_spawn(&pid, argv[0], file_actions.get(), nullptr, argv,
                             environ);
    } else {
        // look for executable in path
        status = posix_spawnp(&pid, argv[0], file_actions.get(), nullptr,
                              argv, environ);
    }

    if (status != 0)
        throw exc::runtime_error("Could not call {} due to {}", argv[0],
                                 strerror(status));
    output.close_write();

    std::string buffer(1024, ' ');
    std::string out;
    while (true) {
        ssize_t bytes_read = read(output.fd[0], &buffer[0], buffer.size());
        if (bytes_read > 0)
            out.append(buffer, 0, bytes_read);
        else if (bytes_read == 0)
            break;
        else if (errno != EINTR)
            throw exc::runtime_error("Error while reading output of {}: {}",
                                     argv[0], strerror(errno));
    }

    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0) {
        if (errno != EINTR)
            throw exc::runtime_error("waitpid failed for {}: {}", argv[0],
                                     strerror(errno));
    }

    if (WIFEXITED(wait_status))
        logger->debug("{} exited with status={}", argv[0],
                      WEXITSTATUS(wait_status));
    else if (WIFSIGNALED(wait_status))
        logger->debug("{} killed by signal {}", argv[0],
                      WTERMSIG(wait_status));

    return {wait_status, out};
}

spawn_result spawn_shell_blocking(const std::string &command) {
    return spawn_blocking(std::vector<std::string>{SHELL_PATH, "-c", command});
}
