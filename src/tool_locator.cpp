#include "core/tool_locator.hpp"
#include "logging/logger.hpp"
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <climits>
#else
#include <climits>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

ToolLocator::ToolLocator(const CleanerConfig &config)
    : program_dir_(config.program_directory.empty() ? executableDirectory() : config.program_directory),
      tool_name_(config.video_tool_name),
      tool_subdir_(config.video_tool_subdirectory)
{
}

std::string ToolLocator::toolBinaryName() const
{
#ifdef _WIN32
    if (fs::path(tool_name_).extension().empty())
        return tool_name_ + ".exe";
#endif
    return tool_name_;
}

std::vector<std::string> ToolLocator::candidatePaths() const
{
    std::vector<std::string> candidates;
    const std::string binary = toolBinaryName();

    candidates.push_back((fs::path(program_dir_) / binary).string());
    if (!tool_subdir_.empty())
        candidates.push_back((fs::path(program_dir_) / tool_subdir_ / binary).string());

    return candidates;
}

std::string ToolLocator::locateVideoTool() const
{
    for (const auto &candidate : candidatePaths())
    {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec))
        {
            Logger::debug("Using bundled video tool: " + candidate);
            return candidate;
        }
    }

    Logger::debug("No bundled video tool in " + program_dir_ + ", relying on PATH for " + toolBinaryName());
    return toolBinaryName();
}

std::string ToolLocator::executableDirectory()
{
    std::error_code ec;
#ifdef _WIN32
    wchar_t buffer[MAX_PATH];
    DWORD length = GetModuleFileNameW(nullptr, buffer, MAX_PATH);
    if (length > 0 && length < MAX_PATH)
        return fs::path(std::wstring(buffer, length)).parent_path().string();
#elif defined(__APPLE__)
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0)
    {
        fs::path resolved = fs::weakly_canonical(fs::path(buffer), ec);
        if (!ec)
            return resolved.parent_path().string();
    }
#else
    char buffer[PATH_MAX];
    ssize_t length = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (length > 0)
    {
        buffer[length] = '\0';
        return fs::path(buffer).parent_path().string();
    }
#endif
    Logger::warn("Could not determine executable directory, using current directory");
    fs::path cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}
