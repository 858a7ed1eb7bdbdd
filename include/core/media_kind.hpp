#pragma once

#include <string>

/**
 * @brief Classification of a candidate input file
 */
enum class MediaKind
{
    IMAGE,
    VIDEO,
    UNSUPPORTED
};

/**
 * @brief Result of media type detection for one input path
 *
 * The extension is lower-cased and has no leading dot ("jpg", "mp4").
 * It is empty when the path has no extension.
 */
struct DetectionResult
{
    MediaKind kind;
    std::string extension;

    DetectionResult() : kind(MediaKind::UNSUPPORTED) {}
    DetectionResult(MediaKind k, const std::string &ext)
        : kind(k), extension(ext) {}

    bool isSupported() const { return kind != MediaKind::UNSUPPORTED; }
};

class MediaKinds
{
public:
    /**
     * @brief Get the media kind name as shown to the user
     * @param kind The media kind
     * @return "IMAGE", "VIDEO" or "UNSUPPORTED"
     */
    static std::string toString(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::IMAGE:
            return "IMAGE";
        case MediaKind::VIDEO:
            return "VIDEO";
        case MediaKind::UNSUPPORTED:
            return "UNSUPPORTED";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Classify a MIME type string by its top-level category
     * @param mime_type MIME type such as "image/png"
     * @return IMAGE for image/*, VIDEO for video/*, UNSUPPORTED otherwise
     */
    static MediaKind fromMimeType(const std::string &mime_type)
    {
        if (mime_type.rfind("image/", 0) == 0)
            return MediaKind::IMAGE;
        if (mime_type.rfind("video/", 0) == 0)
            return MediaKind::VIDEO;
        return MediaKind::UNSUPPORTED;
    }
};
