#include "core/media_transcoder.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

PixelSize OpenCvImageTranscoder::reencode(const std::string &input, const std::string &output, int max_dimension,
                                          double quality)
{
    cv::Mat image = cv::imread(input, cv::IMREAD_COLOR);
    if (image.empty())
    {
        throw std::runtime_error("OpenCV could not decode image: " + input);
    }

    int longest = std::max(image.cols, image.rows);
    if (max_dimension > 0 && longest > max_dimension)
    {
        double scale = static_cast<double>(max_dimension) / static_cast<double>(longest);
        cv::Mat resized;
        cv::resize(image, resized,
                   cv::Size(std::max(1, static_cast<int>(image.cols * scale)), std::max(1, static_cast<int>(image.rows * scale))),
                   0, 0, cv::INTER_AREA);
        image = resized;
    }

    int jpeg_quality = std::clamp(static_cast<int>(quality * 100.0 + 0.5), 1, 100);
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality};
    if (!cv::imwrite(output, image, params))
    {
        throw std::runtime_error("OpenCV could not write JPEG: " + output);
    }

    Logger::debug("Re-encoded " + input + " to " + std::to_string(image.cols) + "x" + std::to_string(image.rows) +
                  " at quality " + std::to_string(jpeg_quality));
    return PixelSize{image.cols, image.rows};
}

std::optional<PixelSize> OpenCvImageTranscoder::dimensions(const std::string &path)
{
    try
    {
        cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (image.empty())
        {
            return std::nullopt;
        }
        return PixelSize{image.cols, image.rows};
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("OpenCV failed to read " + path + ": " + std::string(e.what()));
        return std::nullopt;
    }
}
