#pragma once

#include <string>
#include "core/cleaning_errors.hpp"
#include "core/media_kind.hpp"

/**
 * @brief States of a single cleaning request
 *
 * IDLE -> DETECTING -> VALIDATED | REJECTED -> SANITIZING -> STRIPPING -> DONE | FAILED
 */
enum class CleaningState
{
    IDLE,
    DETECTING,
    VALIDATED,
    REJECTED,
    SANITIZING,
    STRIPPING,
    DONE,
    FAILED
};

class CleaningStates
{
public:
    static std::string toString(CleaningState state)
    {
        switch (state)
        {
        case CleaningState::IDLE:
            return "IDLE";
        case CleaningState::DETECTING:
            return "DETECTING";
        case CleaningState::VALIDATED:
            return "VALIDATED";
        case CleaningState::REJECTED:
            return "REJECTED";
        case CleaningState::SANITIZING:
            return "SANITIZING";
        case CleaningState::STRIPPING:
            return "STRIPPING";
        case CleaningState::DONE:
            return "DONE";
        case CleaningState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
        }
    }
};

/**
 * @brief Where one cleaning request writes its result
 */
struct OutputDescriptor
{
    std::string source_path;
    std::string destination_path;
    MediaKind kind;

    OutputDescriptor() : kind(MediaKind::UNSUPPORTED) {}
    OutputDescriptor(const std::string &src, const std::string &dst, MediaKind k)
        : source_path(src), destination_path(dst), kind(k) {}
};

/**
 * @brief Result of a cleaning request as reported to the caller
 *
 * On success output_path is the absolute path of the cleaned file. On
 * failure error_message is a short text for the user and diagnostic holds
 * details such as the video tool's stderr.
 */
struct CleaningOutcome
{
    bool success;
    std::string input_path;
    std::string output_path;
    std::string error_message;
    std::string diagnostic;
    CleaningErrorKind error_kind;
    CleaningState final_state;
    MediaKind media_kind;

    CleaningOutcome()
        : success(false), error_kind(CleaningErrorKind::NONE),
          final_state(CleaningState::IDLE), media_kind(MediaKind::UNSUPPORTED) {}

    static CleaningOutcome succeeded(const std::string &input, const std::string &output, MediaKind kind)
    {
        CleaningOutcome outcome;
        outcome.success = true;
        outcome.input_path = input;
        outcome.output_path = output;
        outcome.final_state = CleaningState::DONE;
        outcome.media_kind = kind;
        return outcome;
    }

    static CleaningOutcome failed(const std::string &input, CleaningErrorKind kind, const std::string &message,
                                  const std::string &diagnostic = "", CleaningState state = CleaningState::FAILED)
    {
        CleaningOutcome outcome;
        outcome.input_path = input;
        outcome.error_kind = kind;
        outcome.error_message = message;
        outcome.diagnostic = diagnostic;
        outcome.final_state = state;
        return outcome;
    }
};
