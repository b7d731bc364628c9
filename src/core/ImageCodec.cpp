#include "ImageCodec.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

namespace LazyWebp
{
    namespace {

    bool isJpeg(const fs::path& p) {
        std::string ext = to_lower(p.extension().string());
        return ext == ".jpg" || ext == ".jpeg";
    }

    std::string colorSpaceOf(const cv::Mat& img) {
        const bool wide = img.depth() != CV_8U;
        if (img.channels() <= 2) {
            return wide ? "grey16" : "b-w";
        }
        return wide ? "rgb16" : "srgb";
    }

    cv::Mat decode(const fs::path& inputPath, int flags) {
        cv::Mat img = cv::imread(inputPath.string(), flags);
        if (img.empty()) {
            throw ConversionError(ErrorKind::Codec,
                "Input file contains unsupported image format: " + inputPath.filename().string());
        }
        return img;
    }

    // The WebP writer accepts 8-bit BGR or BGRA only
    cv::Mat toEncodable(const cv::Mat& src) {
        cv::Mat img = src;
        if (img.depth() != CV_8U) {
            cv::Mat scaled;
            double scale = img.depth() == CV_16U ? 1.0 / 257.0
                         : (img.depth() == CV_32F || img.depth() == CV_64F) ? 255.0 : 1.0;
            img.convertTo(scaled, CV_8U, scale);
            img = scaled;
        }

        switch (img.channels()) {
            case 1: {
                cv::Mat bgr;
                cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
                return bgr;
            }
            case 2: {
                // Grey + alpha
                std::vector<cv::Mat> planes;
                cv::split(img, planes);
                cv::Mat bgra;
                cv::merge(std::vector<cv::Mat>{planes[0], planes[0], planes[0], planes[1]}, bgra);
                return bgra;
            }
            default:
                return img;
        }
    }

    cv::Mat load(const fs::path& inputPath, bool autoRotate) {
        if (isJpeg(inputPath)) {
            // JPEG has no alpha; any flag other than IMREAD_UNCHANGED honours the EXIF orientation
            int flags = cv::IMREAD_ANYCOLOR | cv::IMREAD_ANYDEPTH;
            if (!autoRotate) flags |= cv::IMREAD_IGNORE_ORIENTATION;
            return decode(inputPath, flags);
        }
        return decode(inputPath, cv::IMREAD_UNCHANGED);
    }

    ImageMetadata metadataOf(const cv::Mat& img) {
        ImageMetadata meta;
        meta.colorSpace = colorSpaceOf(img);
        meta.width = img.cols;
        meta.height = img.rows;
        meta.channels = img.channels();
        return meta;
    }

    std::vector<std::uint8_t> encodeMat(const cv::Mat& src, const fs::path& inputPath, const EncodeOptions& options) {
        cv::Mat img = src;
        if (!options.targetColorSpace.empty() || img.depth() != CV_8U || img.channels() < 3) {
            // OpenCV carries no ICC profile, so sRGB normalisation reduces to
            // an 8-bit BGR(A) buffer interpreted as sRGB
            img = toEncodable(img);
        }

        std::vector<int> params = {
            cv::IMWRITE_WEBP_QUALITY, options.lossless ? 101 : options.quality
        };

        std::vector<std::uint8_t> buffer;
        if (!cv::imencode(".webp", img, buffer, params)) {
            throw ConversionError(ErrorKind::Codec,
                "WebP encoder rejected " + inputPath.filename().string());
        }
        return buffer;
    }

    } // namespace

    ImageMetadata OpenCvWebpCodec::probe(const fs::path& inputPath) {
        return metadataOf(decode(inputPath, cv::IMREAD_UNCHANGED));
    }

    std::vector<std::uint8_t> OpenCvWebpCodec::encode(const fs::path& inputPath, const EncodeOptions& options) {
        return encodeMat(load(inputPath, options.autoRotate), inputPath, options);
    }

    std::vector<std::uint8_t> OpenCvWebpCodec::encodeWith(const fs::path& inputPath,
                                                          const EncodeOptionsResolver& resolve) {
        cv::Mat img = load(inputPath, true);
        const EncodeOptions options = resolve(metadataOf(img));
        if (!options.autoRotate && isJpeg(inputPath)) {
            img = load(inputPath, false);
        }
        return encodeMat(img, inputPath, options);
    }

} // namespace LazyWebp
