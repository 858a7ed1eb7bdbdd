#include "core/image_stripper.hpp"
#include "core/cleaning_errors.hpp"
#include "core/media_type_detector.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

void ImageStripper::stripImage(const std::string &input_path, const std::string &output_path)
{
    Logger::info("Re-encoding image without metadata: " + input_path);

    cv::Mat image;
    try
    {
        image = cv::imread(input_path, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        throw ProcessingError("Could not decode image: " + input_path, e.what());
    }
    if (image.empty())
        throw ProcessingError("Could not decode image: " + input_path);

    // Target format decides what the pixels may keep
    const std::string extension = MediaTypeDetector::getFileExtension(output_path);

    try
    {
        cv::Mat pixels = normalizeForFormat(image, extension);
        std::vector<int> params;
        if (extension == "jpg" || extension == "jpeg")
            params = {cv::IMWRITE_JPEG_QUALITY, 95};

        // Encoders write pixel data only, no metadata blocks
        if (cv::haveImageWriter(output_path))
        {
            if (!cv::imwrite(output_path, pixels, params))
                throw ProcessingError("Could not write image: " + output_path);
        }
        else
        {
            Logger::warn("No encoder for '." + extension + "', writing PNG data to " + output_path);
            std::vector<uchar> encoded;
            if (!cv::imencode(".png", normalizeForFormat(image, "png"), encoded))
                throw ProcessingError("Could not encode image: " + input_path);

            std::ofstream file(output_path, std::ios::binary);
            file.write(reinterpret_cast<const char *>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
            if (!file.good())
                throw ProcessingError("Could not write image: " + output_path);
        }
    }
    catch (const cv::Exception &e)
    {
        throw ProcessingError("Could not write image: " + output_path, e.what());
    }

    Logger::debug("Image written: " + std::to_string(image.cols) + "x" + std::to_string(image.rows) +
                  ", " + std::to_string(image.channels()) + " channel(s)");
}

cv::Mat ImageStripper::normalizeForFormat(const cv::Mat &image, const std::string &extension)
{
    cv::Mat result = image;

    // Drop alpha for formats without it
    if (result.channels() == 4 && !supportsAlpha(extension))
    {
        cv::Mat without_alpha;
        cv::cvtColor(result, without_alpha, cv::COLOR_BGRA2BGR);
        result = without_alpha;
    }

    // Scale deep images down to 8 bits
    if (result.depth() != CV_8U && !supportsHighBitDepth(extension))
    {
        double scale = 1.0;
        if (result.depth() == CV_16U)
            scale = 1.0 / 257.0;
        else if (result.depth() == CV_32F || result.depth() == CV_64F)
            scale = 255.0;

        cv::Mat eight_bit;
        result.convertTo(eight_bit, CV_MAKETYPE(CV_8U, result.channels()), scale);
        result = eight_bit;
    }

    return result;
}

bool ImageStripper::supportsAlpha(const std::string &extension)
{
    return extension == "png" || extension == "webp" || extension == "tiff" || extension == "tif";
}

bool ImageStripper::supportsHighBitDepth(const std::string &extension)
{
    return extension == "png" || extension == "tiff" || extension == "tif";
}
