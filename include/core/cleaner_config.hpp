#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @brief Configuration of the metadata cleaning pipeline
 *
 * Passed by value into every component that needs it at construction time.
 * Empty output_directory means "next to the source file"; empty
 * program_directory means "directory of the running executable".
 */
struct CleanerConfig
{
    std::string log_level = "INFO";
    std::string output_directory;
    std::string output_prefix = "[CLEANED]";
    std::string placeholder_name = "arquivo";
    std::string program_directory;

    std::string video_tool_name = "ffmpeg";
    std::string video_tool_subdirectory = "ffmpeg";
    std::string video_tool_version_marker = "ffmpeg version";

    // Delete a partially written destination when the video tool fails
    bool cleanup_partial_output = false;

    std::vector<std::string> image_extensions = {"jpg", "jpeg", "png", "webp", "bmp", "tiff"};
    std::vector<std::string> video_extensions = {"mp4", "mov", "m4v", "mkv", "avi", "webm"};
};

/**
 * @brief Loads and saves CleanerConfig as YAML
 */
class CleanerConfigManager
{
public:
    /**
     * @brief Load configuration from a YAML file
     *
     * A missing file yields the defaults. A malformed file is logged and
     * also yields the defaults. Missing or invalid keys keep their default.
     *
     * @param file_path Path to the YAML file
     * @return The loaded configuration
     */
    static CleanerConfig loadConfig(const std::string &file_path);

    /**
     * @brief Save configuration to a YAML file
     * @param config Configuration to save
     * @param file_path Destination path
     * @return true if the file was written
     */
    static bool saveConfig(const CleanerConfig &config, const std::string &file_path);

    static CleanerConfig fromYaml(const YAML::Node &node);
    static YAML::Node toYaml(const CleanerConfig &config);

    /**
     * @brief Check a configuration for values the pipeline cannot work with
     * @param config Configuration to check
     * @param problems Receives one message per invalid value
     * @return true if the configuration is usable as is
     */
    static bool validateConfig(const CleanerConfig &config, std::vector<std::string> &problems);

private:
    static std::vector<std::string> enabledExtensions(const YAML::Node &category, const std::vector<std::string> &fallback);
};
