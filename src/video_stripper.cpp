#include "core/video_stripper.hpp"
#include "core/cleaning_errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    std::string firstLine(const std::string &text)
    {
        size_t start = text.find_first_not_of("\r\n \t");
        if (start == std::string::npos)
            return "";
        size_t end = text.find_first_of("\r\n", start);
        return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }
}

VideoStripper::VideoStripper(const CleanerConfig &config, std::shared_ptr<SubprocessRunner> runner)
    : runner_(std::move(runner)),
      locator_(config),
      version_marker_(config.video_tool_version_marker),
      cleanup_partial_output_(config.cleanup_partial_output)
{
}

bool VideoStripper::isToolAvailable() const
{
    const std::string tool = locator_.locateVideoTool();
    try
    {
        ExternalToolResult probe = runner_->run({tool, "-version"});
        if (probe.combinedOutput().find(version_marker_) != std::string::npos)
            return true;

        Logger::warn("Version probe of " + tool + " did not report '" + version_marker_ +
                     "' (exit code " + std::to_string(probe.exit_code) + ")");
        return false;
    }
    catch (const ExecutionError &e)
    {
        Logger::warn("Video tool could not be started: " + std::string(e.what()));
        return false;
    }
}

void VideoStripper::ensureToolAvailable() const
{
    if (!isToolAvailable())
        throw ToolUnavailableError(unavailableMessage(), "Tried: " + locator_.locateVideoTool());
}

void VideoStripper::stripVideo(const std::string &input_path, const std::string &output_path) const
{
    ensureToolAvailable();

    const std::string tool = locator_.locateVideoTool();
    Logger::info("Copying video streams without metadata: " + input_path);

    ExternalToolResult result = runner_->run(buildArguments(tool, input_path, output_path));
    if (result.exit_code != 0)
    {
        Logger::error("Video tool exited with code " + std::to_string(result.exit_code) + ": " + result.std_err);

        std::error_code ec;
        if (cleanup_partial_output_ && fs::exists(output_path, ec))
        {
            if (fs::remove(output_path, ec))
                Logger::info("Removed partial output: " + output_path);
            else
                Logger::warn("Could not remove partial output " + output_path + ": " + ec.message());
        }

        std::string summary = firstLine(result.std_err);
        std::string message = "Video tool failed with exit code " + std::to_string(result.exit_code);
        if (!summary.empty())
            message += ": " + summary;
        throw ProcessingError(message, result.std_err);
    }

    std::error_code ec;
    if (!fs::exists(output_path, ec))
        throw ProcessingError("Video tool reported success but wrote no file: " + output_path, result.std_err);
}

std::vector<std::string> VideoStripper::buildArguments(const std::string &tool,
                                                       const std::string &input_path,
                                                       const std::string &output_path)
{
    return {
        tool,
        "-y",
        "-nostdin",
        "-hide_banner",
        "-loglevel", "error",
        "-i", input_path,
        "-map_metadata", "-1",
        "-map_chapters", "-1",
        "-c", "copy",
        output_path};
}

std::string VideoStripper::unavailableMessage() const
{
    const std::string binary = locator_.toolBinaryName();
    const auto candidates = locator_.candidatePaths();

    std::string message = "Video tool '" + binary + "' not found. Place it at ";
    for (size_t i = 0; i < candidates.size(); ++i)
    {
        if (i > 0)
            message += " or ";
        message += candidates[i];
    }
    message += ", or install it on the PATH.";
    return message;
}
