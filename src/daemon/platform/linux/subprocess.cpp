#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <fcntl.h>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

std::expected<ProcessExit, std::string> run_process(const std::vector<std::string>& argv,
                                                   const std::string& stdin_text) {
    if (argv.empty()) return std::unexpected(std::string("empty command line"));

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // The daemon blocks SIGINT/SIGTERM for its signalfd; children must not inherit that.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        ::dup2(pipefd[0], STDIN_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[0]);
    size_t total_written = 0;
    while (total_written < stdin_text.size()) {
        ssize_t n = ::write(pipefd[1], stdin_text.data() + total_written,
                            stdin_text.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(pipefd[1]);
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(std::string("write() failed: ") + std::strerror(err));
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(pipefd[1]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return ProcessExit{.code = WEXITSTATUS(status)};
}
