#ifndef PHOTOAR_TESTS_SYNTHETIC_SCENE_H_
#define PHOTOAR_TESTS_SYNTHETIC_SCENE_H_

#include "ar_core.h"
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/calib3d.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace photoar {
namespace test_support {

/**
 * @brief Busy grayscale "photo" with plenty of ORB corners, deterministic per seed
 */
inline cv::Mat makeTexturedImage(uint64_t seed, cv::Size size = cv::Size(320, 240)) {
    cv::RNG rng(seed);
    cv::Mat image(size, CV_8UC1, cv::Scalar(255));

    for (int i = 0; i < 80; ++i) {
        const cv::Point p1(rng.uniform(0, size.width), rng.uniform(0, size.height));
        const cv::Point p2(p1.x + rng.uniform(8, 50), p1.y + rng.uniform(8, 50));
        const cv::Scalar color(rng.uniform(0, 256));
        if (i % 3 == 0) {
            cv::circle(image, p1, rng.uniform(4, 25), color, cv::FILLED);
        } else {
            cv::rectangle(image, p1, p2, color, cv::FILLED);
        }
    }
    for (int i = 0; i < 20; ++i) {
        cv::line(image,
                 cv::Point(rng.uniform(0, size.width), rng.uniform(0, size.height)),
                 cv::Point(rng.uniform(0, size.width), rng.uniform(0, size.height)),
                 cv::Scalar(rng.uniform(0, 256)), rng.uniform(1, 4));
    }
    return image;
}

struct ScenePose {
    cv::Vec3d rvec{-CV_PI / 2 + 0.2, 0.1, 0.0}; // print facing the camera, slightly tilted
    cv::Vec3d tvec{0.01, -0.005, 0.4};           // meters, OpenCV camera frame
};

inline cv::Mat cameraMatrix(const CameraIntrinsics& intrinsics) {
    return (cv::Mat_<double>(3, 3) <<
        intrinsics.fx, 0, intrinsics.cx,
        0, intrinsics.fy, intrinsics.cy,
        0, 0, 1);
}

/**
 * @brief Corners of a print of the given physical size, projected into the frame (TL, TR, BR, BL)
 */
inline std::vector<cv::Point2f> projectPrint(const Size2& physical_size, const ScenePose& pose,
                                             const CameraIntrinsics& intrinsics) {
    const float hw = physical_size.width * 0.5f;
    const float hh = physical_size.height * 0.5f;
    const std::vector<cv::Point3f> object = {
        {-hw, 0.0f, -hh}, {hw, 0.0f, -hh}, {hw, 0.0f, hh}, {-hw, 0.0f, hh}
    };

    std::vector<cv::Point2f> projected;
    cv::projectPoints(object, pose.rvec, pose.tvec, cameraMatrix(intrinsics), cv::noArray(), projected);
    return projected;
}

/**
 * @brief A print placed somewhere in front of the camera
 */
struct PlacedPrint {
    cv::Mat print;
    Size2 physical_size;
    ScenePose pose;
};

/**
 * @brief BGR camera frame showing the prints over a flat background
 */
inline cv::Mat renderPrints(const std::vector<PlacedPrint>& prints, cv::Size frame_size = cv::Size(640, 480)) {
    const CameraIntrinsics intrinsics = CameraIntrinsics::approximate(frame_size.width, frame_size.height);
    cv::Mat gray(frame_size, CV_8UC1, cv::Scalar(90));

    for (const auto& placed : prints) {
        const std::vector<cv::Point2f> dst = projectPrint(placed.physical_size, placed.pose, intrinsics);
        const float w = static_cast<float>(placed.print.cols);
        const float h = static_cast<float>(placed.print.rows);
        const std::vector<cv::Point2f> src = { {0.0f, 0.0f}, {w, 0.0f}, {w, h}, {0.0f, h} };

        cv::warpPerspective(placed.print, gray, cv::getPerspectiveTransform(src, dst), frame_size,
                            cv::INTER_LINEAR, cv::BORDER_TRANSPARENT);
    }

    cv::Mat frame;
    cv::cvtColor(gray, frame, cv::COLOR_GRAY2BGR);
    return frame;
}

inline cv::Mat renderPrint(const cv::Mat& print, const Size2& physical_size, const ScenePose& pose,
                           cv::Size frame_size = cv::Size(640, 480)) {
    return renderPrints({ {print, physical_size, pose} }, frame_size);
}

inline cv::Mat emptyFrame(cv::Size frame_size = cv::Size(640, 480)) {
    return cv::Mat(frame_size, CV_8UC3, cv::Scalar(90, 90, 90));
}

struct ManifestEntry {
    std::string name;
    std::string file;
    float physical_width = 0.0f;
    float physical_height = 0.0f; // 0 = omit
};

/**
 * @brief Write `<root>/<group>/manifest.yml`
 */
inline void writeManifest(const std::filesystem::path& group_dir, const std::vector<ManifestEntry>& entries) {
    std::filesystem::create_directories(group_dir);

    cv::FileStorage fs((group_dir / "manifest.yml").string(), cv::FileStorage::WRITE);
    fs << "images" << "[";
    for (const auto& entry : entries) {
        fs << "{" << "name" << entry.name << "file" << entry.file << "physical_width" << entry.physical_width;
        if (entry.physical_height > 0.0f) {
            fs << "physical_height" << entry.physical_height;
        }
        fs << "}";
    }
    fs << "]";
    fs.release();
}

/**
 * @brief Fresh scratch directory under the test temp dir
 */
inline std::filesystem::path scratchDirectory(const std::string& name) {
    const std::filesystem::path dir = std::filesystem::path(::testing::TempDir()) / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace test_support
} // namespace photoar

#endif // PHOTOAR_TESTS_SYNTHETIC_SCENE_H_
