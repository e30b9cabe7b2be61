// File: tests/support/synthetic_images.hpp

#ifndef TESTS_SUPPORT_SYNTHETIC_IMAGES_HPP
#define TESTS_SUPPORT_SYNTHETIC_IMAGES_HPP

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "types/pixel_buffer.hpp"

namespace tests::support {

    // Horizontal gray ramp, 0 on the left to 255 on the right, as 3-channel BGR.
    inline cv::Mat ramp(const int width = 256, const int height = 256) {
        cv::Mat row(1, width, CV_8UC1);
        for (int x = 0; x < width; ++x) {
            row.at<uchar>(0, x) = cv::saturate_cast<uchar>(x * 255.0 / std::max(1, width - 1));
        }
        cv::Mat gray;
        cv::repeat(row, height, 1, gray);
        cv::Mat bgr;
        cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
        return bgr;
    }

    inline cv::Mat uniform(const int width, const int height, const cv::Scalar &color) {
        return {height, width, CV_8UC3, color};
    }

    // Dark background with a bright centered square covering a quarter of each side.
    inline cv::Mat squareOnDark(const int width = 256, const int height = 256) {
        cv::Mat image = uniform(width, height, cv::Scalar::all(20));
        cv::rectangle(image, cv::Rect(width * 3 / 8, height * 3 / 8, width / 4, height / 4), cv::Scalar::all(230),
                      cv::FILLED);
        return image;
    }

    // Adds zero-mean gaussian noise independently per sample, saturating at [0, 255].
    inline cv::Mat withNoise(const cv::Mat &image, const double sigma, const std::uint64_t seed) {
        cv::Mat samples;
        image.convertTo(samples, CV_32F);
        cv::Mat noise(samples.size(), samples.type());
        cv::RNG rng(seed);
        rng.fill(noise, cv::RNG::NORMAL, 0.0, sigma);
        samples += noise;
        cv::Mat noisy;
        samples.convertTo(noisy, CV_8U);
        return noisy;
    }

    inline cv::Mat resized(const cv::Mat &image, const int width, const int height) {
        cv::Mat result;
        cv::resize(image, result, cv::Size(width, height), 0.0, 0.0, cv::INTER_AREA);
        return result;
    }

    inline types::PixelBuffer buffer(const cv::Mat &image) { return types::PixelBuffer::fromMat(image); }

    // Fresh directory under the system temp directory, removed with everything in it on destruction.
    class TemporaryDirectory {
    public:
        TemporaryDirectory() {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("image_similarity_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }

        ~TemporaryDirectory() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TemporaryDirectory(const TemporaryDirectory &) = delete;
        TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

        std::filesystem::path writeImage(const std::string &name, const cv::Mat &image) const {
            const auto file = path_ / name;
            std::filesystem::create_directories(file.parent_path());
            cv::imwrite(file.string(), image);
            return file;
        }

        std::filesystem::path writeText(const std::string &name, const std::string &content) const {
            const auto file = path_ / name;
            std::filesystem::create_directories(file.parent_path());
            std::ofstream(file) << content;
            return file;
        }

    private:
        std::filesystem::path path_;
    };

} // namespace tests::support

#endif // TESTS_SUPPORT_SYNTHETIC_IMAGES_HPP
