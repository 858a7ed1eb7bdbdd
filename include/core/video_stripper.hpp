#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/cleaner_config.hpp"
#include "core/subprocess_runner.hpp"
#include "core/tool_locator.hpp"

/**
 * @brief Removes container metadata from videos with the external video tool
 *
 * Streams are copied without re-encoding; global metadata and chapters are
 * dropped through the tool's metadata maps.
 */
class VideoStripper
{
public:
    VideoStripper(const CleanerConfig &config, std::shared_ptr<SubprocessRunner> runner);

    /**
     * @brief Probe the tool with "-version" and look for the version marker
     *
     * The exit code of the probe is not used; some builds return non-zero
     * for version queries.
     *
     * @return true if the tool started and printed the marker
     */
    bool isToolAvailable() const;

    /**
     * @throws ToolUnavailableError if isToolAvailable() is false
     */
    void ensureToolAvailable() const;

    /**
     * @brief Copy input to output with all metadata and chapters removed
     *
     * @throws ToolUnavailableError before anything is written if the tool does not answer the probe
     * @throws ExecutionError if the tool cannot be started
     * @throws ProcessingError if the tool exits with a non-zero code; the
     *         captured stderr is the diagnostic
     */
    void stripVideo(const std::string &input_path, const std::string &output_path) const;

    static std::vector<std::string> buildArguments(const std::string &tool,
                                                   const std::string &input_path,
                                                   const std::string &output_path);

    std::string toolCommand() const { return locator_.locateVideoTool(); }

private:
    std::shared_ptr<SubprocessRunner> runner_;
    ToolLocator locator_;
    std::string version_marker_;
    bool cleanup_partial_output_;

    std::string unavailableMessage() const;
};
