#include "include/shell_pipe.hpp"
#include "include/interrupts.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace speedwatch {

static int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);
    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        throw std::system_error(errno, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        if (::dup2(pipe_fds[1], STDOUT_FILENO) == -1) ::_exit(errno);
        if (::dup2(pipe_fds[1], STDERR_FILENO) == -1) ::_exit(errno);

        ::execvp(c_args[0], c_args.data());

        const char* msg = "Failed to execute binary\n";
        [[maybe_unused]] auto val = ::write(STDOUT_FILENO, msg, std::strlen(msg));
        ::_exit(127);
    }

    ::close(pipe_fds[1]);
    read_fd_.reset(pipe_fds[0]);
    pid_ = pid;
}

ShellPipe::~ShellPipe() {
    read_fd_.reset();

    if (pid_ == -1) return;

    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        return;
    }

    ::kill(pid_, SIGTERM);

    bool reaped = false;
    int pfd = pidfd_open(pid_, 0);
    if (pfd >= 0) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pfd;
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, 1000);
        ::close(pfd);

        if (ret > 0) {
            ::waitpid(pid_, &status, 0);
            reaped = true;
        }
    }

    if (!reaped) {
        for (int i = 0; i < 5; ++i) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (!reaped) {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, nullptr, 0);
        }
    }
}

std::expected<std::string, std::string> ShellPipe::read_all(std::chrono::milliseconds timeout,
                                                            std::size_t max_output) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    std::string output;
    std::array<char, 4096> buffer;

    while (true) {
        if (g_interrupted) {
            return std::unexpected("Interrupted");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            return std::unexpected(std::format("Timed out after {}s",
                                               std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
        }

        struct pollfd pfd{};
        pfd.fd = read_fd_.get();
        pfd.events = POLLIN;
        // Short slices so an interrupt is noticed promptly.
        int ret = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 200)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::format("poll failed: {}", std::system_category().message(errno)));
        }
        if (ret == 0) continue;

        auto n = read_fd_.read_some(buffer);
        if (!n) {
            return std::unexpected(n.error());
        }
        if (*n == 0) break;

        if (output.size() + *n > max_output) {
            output += "\n[Output truncated (too large)]";
            break;
        }
        output.append(buffer.data(), *n);
    }

    return output;
}

int ShellPipe::wait() {
    if (pid_ == -1) return exit_status_;

    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid failed");
        }
    }
    pid_ = -1;
    exit_status_ = decode_status(status);
    return exit_status_;
}

}  // namespace speedwatch
