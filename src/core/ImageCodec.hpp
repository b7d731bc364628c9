#pragma once

#include "Common.h"
#include <cstdint>
#include <functional>

namespace LazyWebp
{
    /**
     * @brief Metadata of a decodable source image.
     */
    struct ImageMetadata {
        std::string colorSpace;   // "srgb", "rgb", "display-p3", "b-w", "rgb16", "grey16"
        int width = 0;
        int height = 0;
        int channels = 0;
    };

    /**
     * @brief Settings handed to the encoder for one file.
     */
    struct EncodeOptions {
        int quality = DEFAULT_QUALITY;
        bool autoRotate = true;
        std::string targetColorSpace;   // empty: keep the source interpretation
        int effort = WEBP_EFFORT;
        int alphaQuality = WEBP_ALPHA_QUALITY;
        bool lossless = false;
    };

    // Picks the encoder settings once the source has been inspected
    using EncodeOptionsResolver = std::function<EncodeOptions(const ImageMetadata&)>;

    /**
     * @brief Decode/encode service used by the converter.
     *
     * Implementations must be safe to call from several threads at once.
     * Failures are reported by throwing (ConversionError with ErrorKind::Codec
     * or a library exception).
     */
    class ImageCodec {
    public:
        virtual ~ImageCodec() = default;

        virtual ImageMetadata probe(const fs::path& inputPath) = 0;

        virtual std::vector<std::uint8_t> encode(const fs::path& inputPath, const EncodeOptions& options) = 0;

        /**
         * @brief probe() followed by encode() with the options chosen for the
         * probed metadata. Codecs that can inspect and encode from a single
         * decode override this.
         */
        virtual std::vector<std::uint8_t> encodeWith(const fs::path& inputPath,
                                                     const EncodeOptionsResolver& resolve) {
            return encode(inputPath, resolve(probe(inputPath)));
        }
    };

    /**
     * @brief WebP encoder backed by OpenCV's imgcodecs module.
     *
     * encodeWith() decodes each source once. JPEG sources are read with their
     * EXIF orientation applied; other formats are read unchanged so their
     * alpha channel survives.
     */
    class OpenCvWebpCodec : public ImageCodec {
    public:
        ImageMetadata probe(const fs::path& inputPath) override;

        std::vector<std::uint8_t> encode(const fs::path& inputPath, const EncodeOptions& options) override;

        std::vector<std::uint8_t> encodeWith(const fs::path& inputPath,
                                             const EncodeOptionsResolver& resolve) override;
    };

} // namespace LazyWebp
