#pragma once

#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Removes image metadata by decoding and re-encoding the pixels
 *
 * Only pixel data reaches the encoder, so EXIF, XMP, IPTC and ICC blocks of
 * the source are not carried over. EXIF orientation is not applied; the
 * stored pixel layout and dimensions are kept as they are.
 */
class ImageStripper
{
public:
    /**
     * @brief Re-encode input into output without metadata
     *
     * The encoder is chosen from the output extension. If OpenCV has no
     * writer for that extension the pixels are written as PNG under the
     * given output name.
     *
     * @throws ProcessingError if the input cannot be decoded or the output cannot be written
     */
    static void stripImage(const std::string &input_path, const std::string &output_path);

    /**
     * @brief Convert pixels to a layout the destination format can store
     *
     * Drops the alpha channel for formats without alpha (JPEG, BMP) and
     * reduces the bit depth to 8 bits for formats limited to it.
     *
     * @param image Decoded image
     * @param extension Lower-cased destination extension without dot
     * @return Image ready to be encoded
     */
    static cv::Mat normalizeForFormat(const cv::Mat &image, const std::string &extension);

    static bool supportsAlpha(const std::string &extension);
    static bool supportsHighBitDepth(const std::string &extension);
};
