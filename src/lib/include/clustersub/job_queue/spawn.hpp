#pragma once
#include <string>
#include <sys/wait.h>
#include <vector>

struct spawn_result {
    /** The raw status from waitpid() */
    int status;
    /** stdout and stderr of the child, in the order they were written */
    std::string output;

    bool exited_ok() const { return WIFEXITED(status) && WEXITSTATUS(status) == 0; }
};

spawn_result spawn_blocking(std::vector<std::string> argv);
spawn_result spawn_blocking(char *const argv[]);
spawn_result spawn_shell_blocking(const std::string &command);
