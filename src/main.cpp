#include "core/cleaner_config.hpp"
#include "core/cleaning_orchestrator.hpp"
#include "core/filename_sanitizer.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "MetaClean - remove metadata from images and videos" << std::endl;
        std::cout << "Usage: " << program << " [options] <media-file>" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>     Load configuration from a YAML file" << std::endl;
        std::cout << "  --log-level <level>     TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --json                  Print the result as JSON" << std::endl;
        std::cout << "  --version-check         Report whether the video tool is available" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
    }

    nlohmann::json outcomeToJson(const CleaningOutcome &outcome)
    {
        nlohmann::json result;
        result["success"] = outcome.success;
        result["input"] = outcome.input_path;
        result["media_kind"] = MediaKinds::toString(outcome.media_kind);
        result["state"] = CleaningStates::toString(outcome.final_state);
        if (outcome.success)
        {
            result["output"] = outcome.output_path;
        }
        else
        {
            result["error"] = outcome.error_message;
            result["error_kind"] = CleaningErrors::getKindName(outcome.error_kind);
            if (!outcome.diagnostic.empty())
                result["diagnostic"] = outcome.diagnostic;
        }
        return result;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string log_level;
    std::string input_path;
    bool json_output = false;
    bool version_check = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            log_level = argv[++i];
        }
        else if (arg == "--json")
        {
            json_output = true;
        }
        else if (arg == "--version-check")
        {
            version_check = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
        else if (input_path.empty())
        {
            input_path = arg;
        }
        else
        {
            std::cerr << "Only one media file can be cleaned at a time" << std::endl;
            return 2;
        }
    }

    CleanerConfig config = config_path.empty() ? CleanerConfig{} : CleanerConfigManager::loadConfig(config_path);
    Logger::init(log_level.empty() ? config.log_level : log_level);

    CleaningOrchestrator orchestrator(config);

    if (version_check)
    {
        bool available = orchestrator.isVideoToolAvailable();
        if (json_output)
        {
            nlohmann::json result;
            result["video_tool_available"] = available;
            std::cout << result.dump(2) << std::endl;
        }
        else
        {
            std::cout << (available ? "Video tool available" : "Video tool not found") << std::endl;
        }
        if (input_path.empty())
            return available ? 0 : 1;
    }

    if (input_path.empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    DetectionResult detection = orchestrator.inspect(input_path);
    if (detection.isSupported() && !json_output)
    {
        std::cout << FilenameSanitizer::displayName(input_path) << ": detected type "
                  << MediaKinds::toString(detection.kind) << ", cleaning..." << std::endl;
    }

    CleaningOutcome outcome = orchestrator.cleanAsync(input_path).get();

    if (json_output)
    {
        std::cout << outcomeToJson(outcome).dump(2) << std::endl;
    }
    else if (outcome.success)
    {
        std::cout << "Metadata removed, saved to:" << std::endl
                  << outcome.output_path << std::endl;
    }
    else
    {
        std::cerr << "Error: " << outcome.error_message << std::endl;
    }

    return outcome.success ? 0 : 1;
}
