#include "core/media_type_detector.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <magic.h>

namespace fs = std::filesystem;

LibMagicSniffer::LibMagicSniffer()
    : cookie_(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR))
{
    if (!cookie_)
    {
        Logger::warn("libmagic could not be initialized, content sniffing disabled");
        return;
    }

    if (magic_load(cookie_, nullptr) != 0)
    {
        Logger::warn("libmagic database could not be loaded: " + std::string(magic_error(cookie_)));
        magic_close(cookie_);
        cookie_ = nullptr;
    }
}

LibMagicSniffer::~LibMagicSniffer()
{
    if (cookie_)
        magic_close(cookie_);
}

std::optional<std::string> LibMagicSniffer::sniffMimeType(const std::string &file_path)
{
    if (!cookie_)
        return std::nullopt;

    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec))
        return std::nullopt;

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;

    // Read only a bounded prefix
    std::vector<char> prefix(SNIFF_BYTES);
    file.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
    size_t bytes_read = static_cast<size_t>(file.gcount());
    if (bytes_read == 0)
        return std::nullopt;

    // magic_t is not thread safe
    std::lock_guard<std::mutex> lock(mutex_);
    const char *mime = magic_buffer(cookie_, prefix.data(), bytes_read);
    if (!mime)
    {
        Logger::debug("libmagic failed on " + file_path + ": " + std::string(magic_error(cookie_)));
        return std::nullopt;
    }

    std::string mime_type(mime);
    if (mime_type.find('/') == std::string::npos || isGenericMimeType(mime_type))
        return std::nullopt;
    return mime_type;
}

bool LibMagicSniffer::isGenericMimeType(const std::string &mime_type)
{
    static const std::vector<std::string> generic = {
        "application/octet-stream",
        "application/x-empty",
        "inode/x-empty",
        "text/plain"};
    return std::find(generic.begin(), generic.end(), mime_type) != generic.end();
}

MediaTypeDetector::MediaTypeDetector(const CleanerConfig &config, std::shared_ptr<SignatureSniffer> sniffer)
    : image_extensions_(config.image_extensions),
      video_extensions_(config.video_extensions),
      sniffer_(std::move(sniffer))
{
}

DetectionResult MediaTypeDetector::detect(const std::string &file_path) const
{
    // Content signature first, extension allow-list as fallback
    auto by_content = classifyByContent(file_path);
    DetectionResult result = by_content ? *by_content : classifyByExtension(file_path);

    Logger::debug("Detected " + MediaKinds::toString(result.kind) + " (" +
                  (by_content ? "content" : "extension") + ") for " + file_path);
    return result;
}

std::optional<DetectionResult> MediaTypeDetector::classifyByContent(const std::string &file_path) const
{
    if (!sniffer_)
        return std::nullopt;

    auto mime_type = sniffer_->sniffMimeType(file_path);
    if (!mime_type || mime_type->empty())
        return std::nullopt;

    std::string lowered = *mime_type;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    return DetectionResult(MediaKinds::fromMimeType(lowered), getFileExtension(file_path));
}

DetectionResult MediaTypeDetector::classifyByExtension(const std::string &file_path) const
{
    std::string ext = getFileExtension(file_path);
    if (isImageExtension(ext))
        return DetectionResult(MediaKind::IMAGE, ext);
    if (isVideoExtension(ext))
        return DetectionResult(MediaKind::VIDEO, ext);
    return DetectionResult(MediaKind::UNSUPPORTED, ext);
}

bool MediaTypeDetector::isImageExtension(const std::string &extension) const
{
    return !extension.empty() &&
           std::find(image_extensions_.begin(), image_extensions_.end(), extension) != image_extensions_.end();
}

bool MediaTypeDetector::isVideoExtension(const std::string &extension) const
{
    return !extension.empty() &&
           std::find(video_extensions_.begin(), video_extensions_.end(), extension) != video_extensions_.end();
}

std::string MediaTypeDetector::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}
