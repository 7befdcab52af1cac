#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <atomic>
#include <stdexcept>

namespace fatpack {

/**
 * ProcessExecutor - Runs external tools (xcodebuild) to completion
 *
 * Responsibilities:
 * - Spawn the command with the given arguments and wait for it to exit
 * - Optionally capture combined stdout/stderr while the process runs
 * - Report the exit status as the only success criterion
 *
 * Output capture runs on a dedicated reader thread so that tools producing
 * large amounts of output never block on a full pipe. Lines are handed back
 * to the caller through a future once the process has exited.
 *
 * Platform Support: POSIX (fork/exec)
 */
class ProcessExecutor {
public:
    /**
     * Result of running an external command
     */
    struct ExecResult {
        int exit_code = 0;                      // Process exit code (0 = success)
        std::string output;                     // Captured lines joined with '\n'
        std::chrono::milliseconds duration{0};  // Wall time until exit

        bool success() const { return exit_code == 0; }
    };

    // Called from the reader thread for every captured line
    using LineCallback = std::function<void(const std::string&)>;

    // Output recorded when capture is disabled
    static constexpr const char* COMPLETED_SENTINEL = "The task completed";

    // Exit code reported when the command could not be executed
    static constexpr int EXEC_FAILED_EXIT_CODE = 127;

    ProcessExecutor() = default;

    /**
     * Stream captured lines to a callback (e.g. to echo them in verbose mode).
     * Only used when capture_output is true.
     */
    void set_line_callback(LineCallback cb) { line_cb_ = std::move(cb); }

    /**
     * Run a command and block until it terminates.
     *
     * @param command_path Path to the executable (argv[0])
     * @param args Arguments, not including the command itself
     * @param capture_output Capture combined stdout/stderr; otherwise the child
     *                       writes to the inherited console and the result
     *                       output is COMPLETED_SENTINEL
     * @return ExecResult with exit code and output
     * @throws std::runtime_error on pipe/fork/thread creation failure
     *         (not on non-zero exit)
     */
    ExecResult run(const std::string& command_path,
                   const std::vector<std::string>& args,
                   bool capture_output = false);

    /**
     * Check if a path names an executable regular file
     */
    static bool is_executable(const std::string& path);

private:
    LineCallback line_cb_;

    ExecResult run_inherited(const std::vector<std::string>& argv);
    ExecResult run_captured(const std::vector<std::string>& argv);

    /**
     * Read a pipe until EOF, splitting it into lines.
     *
     * Once child_exited is set, reading stops as soon as the pipe has been
     * idle for one poll interval. Data already written by the child is always
     * drained first; only a grandchild that keeps the write end open can
     * cause the reader to give up before EOF.
     */
    static std::vector<std::string> read_lines(int fd,
                                               const std::atomic<bool>& child_exited,
                                               const LineCallback& cb);

    // Block in waitpid and convert the status to an exit code
    static int wait_for_exit(int pid);
};

} // namespace fatpack
