#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cleaner_config.hpp"
#include "core/media_kind.hpp"

typedef struct magic_set *magic_t;

/**
 * @brief Content based file type sniffing
 *
 * Implementations return std::nullopt when the content has no recognizable
 * signature or cannot be read. They do not throw.
 */
class SignatureSniffer
{
public:
    virtual ~SignatureSniffer() = default;
    virtual std::optional<std::string> sniffMimeType(const std::string &file_path) = 0;
};

/**
 * @brief libmagic backed sniffer
 *
 * Only a bounded prefix of the file is read. Generic answers such as
 * "application/octet-stream" or "text/plain" count as no signature.
 */
class LibMagicSniffer : public SignatureSniffer
{
public:
    static constexpr size_t SNIFF_BYTES = 64 * 1024;

    LibMagicSniffer();
    ~LibMagicSniffer() override;

    LibMagicSniffer(const LibMagicSniffer &) = delete;
    LibMagicSniffer &operator=(const LibMagicSniffer &) = delete;

    std::optional<std::string> sniffMimeType(const std::string &file_path) override;

    static bool isGenericMimeType(const std::string &mime_type);

private:
    magic_t cookie_;
    std::mutex mutex_;
};

/**
 * @brief Classifies a path as image, video or unsupported
 *
 * Content sniffing wins when it yields a type. Otherwise the configured
 * extension allow-lists decide.
 */
class MediaTypeDetector
{
public:
    explicit MediaTypeDetector(const CleanerConfig &config,
                               std::shared_ptr<SignatureSniffer> sniffer = std::make_shared<LibMagicSniffer>());

    DetectionResult detect(const std::string &file_path) const;

    std::optional<DetectionResult> classifyByContent(const std::string &file_path) const;
    DetectionResult classifyByExtension(const std::string &file_path) const;

    bool isImageExtension(const std::string &extension) const;
    bool isVideoExtension(const std::string &extension) const;

    /**
     * @brief Lower-cased extension without the dot, empty if there is none
     */
    static std::string getFileExtension(const std::string &file_path);

private:
    std::vector<std::string> image_extensions_;
    std::vector<std::string> video_extensions_;
    std::shared_ptr<SignatureSniffer> sniffer_;
};
