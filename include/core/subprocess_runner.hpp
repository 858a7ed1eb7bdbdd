#pragma once

#include <string>
#include <vector>

/**
 * @brief Outcome of one external process run
 */
struct ExternalToolResult
{
    int exit_code;
    std::string std_out;
    std::string std_err;

    ExternalToolResult() : exit_code(-1) {}
    ExternalToolResult(int code, const std::string &out, const std::string &err)
        : exit_code(code), std_out(out), std_err(err) {}

    bool succeeded() const { return exit_code == 0; }
    std::string combinedOutput() const { return std_out + std_err; }
};

/**
 * @brief Runs external commands without interactive I/O
 *
 * A non-zero exit code is reported in the result, it is not an error here.
 */
class SubprocessRunner
{
public:
    virtual ~SubprocessRunner() = default;

    /**
     * @brief Run a command to completion and capture its output
     * @param argv Program followed by its arguments; argv[0] is looked up in PATH
     *             unless it contains a path separator
     * @return Exit code with captured stdout and stderr
     * @throws ExecutionError if the process cannot be started
     */
    virtual ExternalToolResult run(const std::vector<std::string> &argv) = 0;
};

/**
 * @brief SubprocessRunner backed by the operating system
 *
 * stdin is bound to the null device and stdout/stderr are captured through
 * pipes. On Windows the child gets no console window.
 */
class SystemSubprocessRunner : public SubprocessRunner
{
public:
    ExternalToolResult run(const std::vector<std::string> &argv) override;

    // Exit code reported when the child is killed by a signal is 128 + signal
    static constexpr int SIGNAL_EXIT_BASE = 128;
};
