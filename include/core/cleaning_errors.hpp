#pragma once

#include <stdexcept>
#include <string>

enum class CleaningErrorKind
{
    NONE,
    UNSUPPORTED_MEDIA,
    TOOL_UNAVAILABLE,
    EXECUTION,
    PROCESSING,
    IO,
    BUSY,
    INTERNAL
};

/**
 * @brief Base class for every failure of a cleaning request
 *
 * what() is a short message fit for the end user. Longer diagnostic text,
 * such as the captured stderr of the video tool, is kept in diagnostic().
 */
class CleaningError : public std::runtime_error
{
public:
    CleaningError(CleaningErrorKind kind, const std::string &message, const std::string &diagnostic = "")
        : std::runtime_error(message), kind_(kind), diagnostic_(diagnostic) {}

    CleaningErrorKind kind() const { return kind_; }
    const std::string &diagnostic() const { return diagnostic_; }

private:
    CleaningErrorKind kind_;
    std::string diagnostic_;
};

class UnsupportedMediaError : public CleaningError
{
public:
    explicit UnsupportedMediaError(const std::string &message)
        : CleaningError(CleaningErrorKind::UNSUPPORTED_MEDIA, message) {}
};

class ToolUnavailableError : public CleaningError
{
public:
    explicit ToolUnavailableError(const std::string &message, const std::string &diagnostic = "")
        : CleaningError(CleaningErrorKind::TOOL_UNAVAILABLE, message, diagnostic) {}
};

// The external process could not be started at all
class ExecutionError : public CleaningError
{
public:
    explicit ExecutionError(const std::string &message, const std::string &diagnostic = "")
        : CleaningError(CleaningErrorKind::EXECUTION, message, diagnostic) {}
};

class ProcessingError : public CleaningError
{
public:
    explicit ProcessingError(const std::string &message, const std::string &diagnostic = "")
        : CleaningError(CleaningErrorKind::PROCESSING, message, diagnostic) {}
};

class IOError : public CleaningError
{
public:
    explicit IOError(const std::string &message, const std::string &diagnostic = "")
        : CleaningError(CleaningErrorKind::IO, message, diagnostic) {}
};

class CleaningErrors
{
public:
    static std::string getKindName(CleaningErrorKind kind)
    {
        switch (kind)
        {
        case CleaningErrorKind::NONE:
            return "NONE";
        case CleaningErrorKind::UNSUPPORTED_MEDIA:
            return "UNSUPPORTED_MEDIA";
        case CleaningErrorKind::TOOL_UNAVAILABLE:
            return "TOOL_UNAVAILABLE";
        case CleaningErrorKind::EXECUTION:
            return "EXECUTION";
        case CleaningErrorKind::PROCESSING:
            return "PROCESSING";
        case CleaningErrorKind::IO:
            return "IO";
        case CleaningErrorKind::BUSY:
            return "BUSY";
        case CleaningErrorKind::INTERNAL:
            return "INTERNAL";
        default:
            return "UNKNOWN";
        }
    }
};
