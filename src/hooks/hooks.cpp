#include "unbox/hooks.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace unbox {

Result<int> run_post_unpack_hook(const std::string& command, const std::string& cwd) {
    if (command.empty()) {
        return Result<int>::ok(0);
    }

    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::string script = command;

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(shell.c_str()));
    argv.push_back(const_cast<char*>(flag.c_str()));
    argv.push_back(const_cast<char*>(script.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        return Result<int>::err(
            Error(ErrorCode::HOOK_FAILED, "fork failed: " + std::string(strerror(errno)))
                .withContext("post-unpack"));
    }

    if (pid == 0) {
        // Child
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execv(shell.c_str(), argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Result<int>::err(
                Error(ErrorCode::HOOK_FAILED, "waitpid failed: " + std::string(strerror(errno)))
                    .withContext("post-unpack"));
        }
    }

    int exit_code;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    } else {
        return Result<int>::err(
            Error(ErrorCode::HOOK_FAILED, "'" + command + "' terminated abnormally")
                .withContext("post-unpack"));
    }

    if (exit_code != 0) {
        return Result<int>::err(
            Error(ErrorCode::HOOK_FAILED,
                  "'" + command + "' exited with code " + std::to_string(exit_code))
                .withContext("post-unpack"));
    }

    return Result<int>::ok(exit_code);
}

} // namespace unbox
