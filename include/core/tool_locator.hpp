#pragma once

#include <string>
#include <vector>
#include "core/cleaner_config.hpp"

/**
 * @brief Resolves the external video tool binary
 *
 * Lookup order:
 * 1. <program_dir>/<tool>
 * 2. <program_dir>/<subdir>/<tool>
 * 3. the bare tool name, resolved through PATH when it is run
 *
 * Only existence checks are made, nothing is executed.
 */
class ToolLocator
{
public:
    explicit ToolLocator(const CleanerConfig &config);

    /**
     * @brief Path of the bundled tool if present, otherwise the bare command name
     */
    std::string locateVideoTool() const;

    /**
     * @brief Bundled locations checked before falling back to PATH, in order
     */
    std::vector<std::string> candidatePaths() const;

    const std::string &programDirectory() const { return program_dir_; }

    /**
     * @brief Tool file name for the host platform ("ffmpeg" or "ffmpeg.exe")
     */
    std::string toolBinaryName() const;

    /**
     * @brief Directory containing the running executable
     * @return Absolute directory, or the current directory if it cannot be determined
     */
    static std::string executableDirectory();

private:
    std::string program_dir_;
    std::string tool_name_;
    std::string tool_subdir_;
};
