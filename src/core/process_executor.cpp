#include "core/process_executor.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <errno.h>
#include <cstring>
#include <future>
#include <iostream>
#include <system_error>

namespace fatpack {

namespace {

// How long the reader waits for more data once the child has exited
constexpr int POLL_INTERVAL_MS = 50;

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);  // execvp requires null terminator
    return argv;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += lines[i];
    }
    return joined;
}

} // namespace

bool ProcessExecutor::is_executable(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }

    if (!S_ISREG(st.st_mode)) {
        return false;
    }

    return access(path.c_str(), X_OK) == 0;
}

ProcessExecutor::ExecResult ProcessExecutor::run(
    const std::string& command_path,
    const std::vector<std::string>& args,
    bool capture_output
) {
    if (command_path.empty()) {
        throw std::runtime_error("Cannot execute empty command");
    }

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(command_path);
    argv.insert(argv.end(), args.begin(), args.end());

    return capture_output ? run_captured(argv) : run_inherited(argv);
}

int ProcessExecutor::wait_for_exit(int pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(
                std::string("Failed to wait for process: ") + strerror(errno)
            );
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        // Process was killed by signal
        return 128 + WTERMSIG(status);
    }
    return -1;
}

ProcessExecutor::ExecResult ProcessExecutor::run_inherited(
    const std::vector<std::string>& args
) {
    auto start_time = std::chrono::steady_clock::now();

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(errno)
        );
    }

    if (pid == 0) {
        std::vector<char*> argv = make_argv(args);
        execvp(argv[0], argv.data());

        std::cerr << "Failed to execute " << args[0] << ": "
                  << strerror(errno) << std::endl;
        _exit(EXEC_FAILED_EXIT_CODE);
    }

    int exit_code = wait_for_exit(pid);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return ExecResult{exit_code, COMPLETED_SENTINEL, duration};
}

ProcessExecutor::ExecResult ProcessExecutor::run_captured(
    const std::vector<std::string>& args
) {
    auto start_time = std::chrono::steady_clock::now();

    // One pipe shared by stdout and stderr so lines keep their relative order
    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw std::runtime_error(
            std::string("Failed to create output pipe: ") + strerror(errno)
        );
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(errno)
        );
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);

        std::vector<char*> argv = make_argv(args);
        execvp(argv[0], argv.data());

        std::cerr << "Failed to execute " << args[0] << ": "
                  << strerror(errno) << std::endl;
        _exit(EXEC_FAILED_EXIT_CODE);  // Use _exit to avoid flushing parent's buffers
    }

    // Child is the only writer
    close(out_pipe[1]);

    std::atomic<bool> child_exited{false};
    std::future<std::vector<std::string>> reader;
    try {
        LineCallback cb = line_cb_;
        int fd = out_pipe[0];
        reader = std::async(std::launch::async, [fd, &child_exited, cb] {
            return read_lines(fd, child_exited, cb);
        });
    } catch (const std::system_error& e) {
        close(out_pipe[0]);
        wait_for_exit(pid);
        throw std::runtime_error(
            std::string("Failed to start output reader: ") + e.what()
        );
    }

    int exit_code = 0;
    try {
        exit_code = wait_for_exit(pid);
    } catch (...) {
        child_exited = true;
        reader.wait();
        close(out_pipe[0]);
        throw;
    }
    child_exited = true;

    std::vector<std::string> lines = reader.get();
    close(out_pipe[0]);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return ExecResult{exit_code, join_lines(lines), duration};
}

std::vector<std::string> ProcessExecutor::read_lines(
    int fd,
    const std::atomic<bool>& child_exited,
    const LineCallback& cb
) {
    std::vector<std::string> lines;
    std::string pending;
    char buffer[4096];

    auto emit = [&](std::string line) {
        if (cb) cb(line);
        lines.push_back(std::move(line));
    };

    while (true) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);

        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (ready == 0) {
            // Idle pipe after exit: the write end is held by someone else
            if (child_exited.load()) break;
            continue;
        }

        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) {
            break;  // EOF
        }

        pending.append(buffer, static_cast<size_t>(n));

        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            emit(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }

    if (!pending.empty()) {
        emit(std::move(pending));
    }

    return lines;
}

} // namespace fatpack
