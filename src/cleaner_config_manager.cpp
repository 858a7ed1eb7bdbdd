#include "core/cleaner_config.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace
{
    std::string readString(const YAML::Node &node, const std::string &key, const std::string &def)
    {
        try
        {
            if (node && node[key] && node[key].IsScalar())
                return node[key].as<std::string>();
        }
        catch (const std::exception &e)
        {
            Logger::warn("Ignoring config key '" + key + "': " + e.what());
        }
        return def;
    }

    bool readBool(const YAML::Node &node, const std::string &key, bool def)
    {
        try
        {
            if (node && node[key] && node[key].IsScalar())
                return node[key].as<bool>();
        }
        catch (const std::exception &e)
        {
            Logger::warn("Ignoring config key '" + key + "': " + e.what());
        }
        return def;
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

CleanerConfig CleanerConfigManager::loadConfig(const std::string &file_path)
{
    if (!std::filesystem::exists(file_path))
    {
        Logger::info("Configuration file not found, using defaults: " + file_path);
        return CleanerConfig{};
    }

    try
    {
        YAML::Node node = YAML::LoadFile(file_path);
        CleanerConfig config = fromYaml(node);
        Logger::info("Configuration loaded from: " + file_path);
        return config;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error loading config " + file_path + ": " + e.what() + ", using defaults");
        return CleanerConfig{};
    }
}

bool CleanerConfigManager::saveConfig(const CleanerConfig &config, const std::string &file_path)
{
    try
    {
        std::ofstream file(file_path);
        if (!file.is_open())
        {
            Logger::error("Could not open config file for writing: " + file_path);
            return false;
        }
        file << toYaml(config) << "\n";
        Logger::info("Configuration saved to: " + file_path);
        return file.good();
    }
    catch (const std::exception &e)
    {
        Logger::error("Error saving config: " + std::string(e.what()));
        return false;
    }
}

CleanerConfig CleanerConfigManager::fromYaml(const YAML::Node &node)
{
    const CleanerConfig defaults;
    CleanerConfig config;

    config.log_level = readString(node, "log_level", defaults.log_level);
    config.output_directory = readString(node, "output_directory", defaults.output_directory);
    config.output_prefix = readString(node, "output_prefix", defaults.output_prefix);
    config.placeholder_name = readString(node, "placeholder_name", defaults.placeholder_name);
    config.program_directory = readString(node, "program_directory", defaults.program_directory);
    config.cleanup_partial_output = readBool(node, "cleanup_partial_output", defaults.cleanup_partial_output);

    if (node && node["video_tool"])
    {
        const YAML::Node &tool = node["video_tool"];
        config.video_tool_name = readString(tool, "name", defaults.video_tool_name);
        config.video_tool_subdirectory = readString(tool, "subdirectory", defaults.video_tool_subdirectory);
        config.video_tool_version_marker = readString(tool, "version_marker", defaults.video_tool_version_marker);
    }

    if (node && node["categories"])
    {
        config.image_extensions = enabledExtensions(node["categories"]["images"], defaults.image_extensions);
        config.video_extensions = enabledExtensions(node["categories"]["video"], defaults.video_extensions);
    }

    std::vector<std::string> problems;
    if (!validateConfig(config, problems))
    {
        for (const auto &problem : problems)
            Logger::warn("Invalid configuration value, using default: " + problem);

        if (config.output_prefix.empty() ||
            config.output_prefix.find_first_of("/\\") != std::string::npos)
            config.output_prefix = defaults.output_prefix;
        if (!FilenameSanitizer::isSafeBase(config.placeholder_name))
            config.placeholder_name = defaults.placeholder_name;
        if (config.video_tool_name.empty())
            config.video_tool_name = defaults.video_tool_name;
        if (config.video_tool_version_marker.empty())
            config.video_tool_version_marker = defaults.video_tool_version_marker;
        if (!Logger::isValidLevel(config.log_level))
            config.log_level = defaults.log_level;
    }

    return config;
}

YAML::Node CleanerConfigManager::toYaml(const CleanerConfig &config)
{
    YAML::Node node;
    node["log_level"] = config.log_level;
    node["output_directory"] = config.output_directory;
    node["output_prefix"] = config.output_prefix;
    node["placeholder_name"] = config.placeholder_name;
    node["program_directory"] = config.program_directory;
    node["cleanup_partial_output"] = config.cleanup_partial_output;

    node["video_tool"]["name"] = config.video_tool_name;
    node["video_tool"]["subdirectory"] = config.video_tool_subdirectory;
    node["video_tool"]["version_marker"] = config.video_tool_version_marker;

    for (const auto &ext : config.image_extensions)
        node["categories"]["images"][ext] = true;
    for (const auto &ext : config.video_extensions)
        node["categories"]["video"][ext] = true;

    return node;
}

bool CleanerConfigManager::validateConfig(const CleanerConfig &config, std::vector<std::string> &problems)
{
    if (config.output_prefix.empty())
        problems.push_back("output_prefix must not be empty");
    else if (config.output_prefix.find_first_of("/\\") != std::string::npos)
        problems.push_back("output_prefix must not contain a path separator: " + config.output_prefix);

    if (!FilenameSanitizer::isSafeBase(config.placeholder_name))
        problems.push_back("placeholder_name is not a safe file name: " + config.placeholder_name);

    if (config.video_tool_name.empty())
        problems.push_back("video_tool.name must not be empty");

    if (config.video_tool_version_marker.empty())
        problems.push_back("video_tool.version_marker must not be empty");

    if (!Logger::isValidLevel(config.log_level))
        problems.push_back("log_level is not a known level: " + config.log_level);

    return problems.empty();
}

std::vector<std::string> CleanerConfigManager::enabledExtensions(const YAML::Node &category,
                                                                const std::vector<std::string> &fallback)
{
    if (!category || !category.IsMap())
        return fallback;

    std::vector<std::string> extensions;
    try
    {
        for (const auto &file_type : category)
        {
            if (file_type.second.as<bool>())
                extensions.push_back(toLower(file_type.first.as<std::string>()));
        }
    }
    catch (const std::exception &e)
    {
        Logger::warn("Error reading extension category: " + std::string(e.what()));
        return fallback;
    }
    return extensions;
}
