#include "core/subprocess_runner.hpp"
#include "core/cleaning_errors.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <thread>
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace
{
    std::string commandLineForLog(const std::vector<std::string> &argv)
    {
        std::string line;
        for (const auto &arg : argv)
        {
            if (!line.empty())
                line += " ";
            line += arg;
        }
        return line;
    }

#ifdef _WIN32
    std::string quoteArgument(const std::string &arg)
    {
        if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
            return arg;

        std::string quoted = "\"";
        size_t backslashes = 0;
        for (char c : arg)
        {
            if (c == '\\')
            {
                ++backslashes;
            }
            else if (c == '"')
            {
                quoted.append(backslashes * 2 + 1, '\\');
                quoted += '"';
                backslashes = 0;
                continue;
            }
            else
            {
                backslashes = 0;
            }
            quoted += c;
        }
        quoted.append(backslashes, '\\');
        quoted += '"';
        return quoted;
    }

    std::string drainHandle(HANDLE handle)
    {
        std::string output;
        char buffer[4096];
        DWORD bytes_read = 0;
        while (ReadFile(handle, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0)
            output.append(buffer, bytes_read);
        return output;
    }

    struct HandleCloser
    {
        HANDLE handle = nullptr;
        explicit HandleCloser(HANDLE h) : handle(h) {}
        ~HandleCloser()
        {
            if (handle && handle != INVALID_HANDLE_VALUE)
                CloseHandle(handle);
        }
        HandleCloser(const HandleCloser &) = delete;
        HandleCloser &operator=(const HandleCloser &) = delete;
    };
#else
    // Owns a pipe pair; both ends are close-on-exec
    struct Pipe
    {
        int fds[2] = {-1, -1};

        bool open()
        {
            if (::pipe(fds) != 0)
                return false;
            for (int fd : fds)
                fcntl(fd, F_SETFD, FD_CLOEXEC);
            return true;
        }

        void closeRead()
        {
            if (fds[0] >= 0)
                ::close(fds[0]);
            fds[0] = -1;
        }

        void closeWrite()
        {
            if (fds[1] >= 0)
                ::close(fds[1]);
            fds[1] = -1;
        }

        ~Pipe()
        {
            closeRead();
            closeWrite();
        }
    };

    struct FileActions
    {
        posix_spawn_file_actions_t actions;
        FileActions() { posix_spawn_file_actions_init(&actions); }
        ~FileActions() { posix_spawn_file_actions_destroy(&actions); }
        FileActions(const FileActions &) = delete;
        FileActions &operator=(const FileActions &) = delete;
    };

    // Read both pipes until EOF without letting either one fill up
    void drainPipes(int out_fd, int err_fd, std::string &out, std::string &err)
    {
        char buffer[4096];
        struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
        std::string *targets[2] = {&out, &err};
        int open_count = 2;

        while (open_count > 0)
        {
            int ready = poll(fds, 2, -1);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                Logger::warn("poll failed while reading child output: " + std::string(std::strerror(errno)));
                break;
            }

            for (int i = 0; i < 2; ++i)
            {
                if (fds[i].fd < 0 || fds[i].revents == 0)
                    continue;

                ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0)
                {
                    targets[i]->append(buffer, static_cast<size_t>(n));
                }
                else if (n == 0 || errno != EINTR)
                {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }
#endif
}

#ifdef _WIN32

ExternalToolResult SystemSubprocessRunner::run(const std::vector<std::string> &argv)
{
    if (argv.empty())
        throw ExecutionError("No command given");

    Logger::debug("Running: " + commandLineForLog(argv));

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE out_read = nullptr, out_write = nullptr, err_read = nullptr, err_write = nullptr;
    if (!CreatePipe(&out_read, &out_write, &sa, 0) || !CreatePipe(&err_read, &err_write, &sa, 0))
        throw ExecutionError("Could not create pipes for " + argv[0]);

    HandleCloser out_read_guard(out_read), out_write_guard(out_write);
    HandleCloser err_read_guard(err_read), err_write_guard(err_write);
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    HANDLE null_input = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                                    OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    HandleCloser null_input_guard(null_input);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;
    si.hStdInput = null_input;
    si.hStdOutput = out_write;
    si.hStdError = err_write;

    std::string command_line;
    for (const auto &arg : argv)
    {
        if (!command_line.empty())
            command_line += ' ';
        command_line += quoteArgument(arg);
    }

    PROCESS_INFORMATION pi{};
    if (!CreateProcessA(nullptr, command_line.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                        nullptr, nullptr, &si, &pi))
    {
        DWORD code = GetLastError();
        throw ExecutionError("Could not start " + argv[0], "CreateProcess error " + std::to_string(code));
    }
    HandleCloser process_guard(pi.hProcess), thread_guard(pi.hThread);

    // Parent must not keep the write ends or the reads never see EOF
    CloseHandle(out_write);
    out_write_guard.handle = nullptr;
    CloseHandle(err_write);
    err_write_guard.handle = nullptr;

    std::string err_text;
    std::thread err_reader([&err_text, err_read]()
                           { err_text = drainHandle(err_read); });
    std::string out_text = drainHandle(out_read);
    err_reader.join();

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exit_code = 0;
    GetExitCodeProcess(pi.hProcess, &exit_code);

    return ExternalToolResult(static_cast<int>(exit_code), out_text, err_text);
}

#else

ExternalToolResult SystemSubprocessRunner::run(const std::vector<std::string> &argv)
{
    if (argv.empty())
        throw ExecutionError("No command given");

    Logger::debug("Running: " + commandLineForLog(argv));

    Pipe out_pipe, err_pipe;
    if (!out_pipe.open() || !err_pipe.open())
        throw ExecutionError("Could not create pipes for " + argv[0], std::strerror(errno));

    FileActions file_actions;
    posix_spawn_file_actions_addopen(&file_actions.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions.actions, out_pipe.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions.actions, err_pipe.fds[1], STDERR_FILENO);

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, args[0], &file_actions.actions, nullptr, args.data(), environ);
    if (rc != 0)
        throw ExecutionError("Could not start " + argv[0] + ": " + std::strerror(rc), std::strerror(rc));

    out_pipe.closeWrite();
    err_pipe.closeWrite();

    std::string out_text, err_text;
    drainPipes(out_pipe.fds[0], err_pipe.fds[0], out_text, err_text);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            throw ExecutionError("Lost track of child process for " + argv[0], std::strerror(errno));
    }

    int exit_code = -1;
    if (WIFEXITED(status))
        exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        exit_code = SIGNAL_EXIT_BASE + WTERMSIG(status);

    Logger::debug(argv[0] + " exited with code " + std::to_string(exit_code));
    return ExternalToolResult(exit_code, out_text, err_text);
}

#endif
