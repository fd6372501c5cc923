#include "process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cronrepo {

bool ProcessResult::succeeded() const {
    return started && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input) {
    ProcessResult result;
    if (argv.empty()) return result;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return result;
    }

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return result;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        execvp(args[0], args.data());
        _exit(127);
    }

    result.started = true;
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    // A reader that exits early must not kill us with SIGPIPE
    struct sigaction ignore{}, previous{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &previous);

    size_t written = 0;
    while (written < input.size()) {
        ssize_t n = write(in_pipe[1], input.data() + written, input.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        written += static_cast<size_t>(n);
    }
    close(in_pipe[1]);
    sigaction(SIGPIPE, &previous, nullptr);

    std::array<char, 4096> buffer;
    struct pollfd fds[2];
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    int open_fds = 2;
    while (open_fds > 0) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(buffer.data(),
                                                          static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    while (waitpid(pid, &result.status, 0) < 0 && errno == EINTR) {
    }
    return result;
}

} // namespace cronrepo
