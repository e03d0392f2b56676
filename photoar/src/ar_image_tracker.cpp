#include "ar_image_tracker.h"
#include "ar_error.h"
#include <opencv2/imgproc.hpp>
#include <opencv2/calib3d.hpp>
#include <algorithm>

namespace photoar {

ImageTracker::ImageTracker() : ImageTracker(Config{}) {}

ImageTracker::ImageTracker(const Config& config) : config_(config) {
    detector_ = config_.features.createDetector();
    matcher_ = cv::BFMatcher::create(cv::NORM_HAMMING, false);
}

std::vector<ImageDetection> ImageTracker::detect(const cv::Mat& frame, const ReferenceImageLibrary& library) const {
    PHOTOAR_PROFILE("ImageTracker::detect");

    if (frame.empty()) {
        throw TrackingException("Empty frame", "ImageTracker::detect");
    }

    std::vector<ImageDetection> detections;
    if (library.empty()) {
        return detections;
    }

    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else if (frame.channels() == 4) {
        cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = frame;
    }

    std::vector<cv::KeyPoint> keypoints;
    cv::Mat descriptors;
    detector_->detectAndCompute(gray, cv::noArray(), keypoints, descriptors);

    if (descriptors.empty() || static_cast<int>(keypoints.size()) < config_.min_matches) {
        PHOTOAR_TRACE("ImageTracker", "Too few frame features: " + std::to_string(keypoints.size()));
        return detections;
    }

    const CameraIntrinsics intrinsics = intrinsics_.isValid()
        ? intrinsics_
        : CameraIntrinsics::approximate(gray.cols, gray.rows);

    for (const auto& reference : library) {
        ImageDetection detection;
        if (matchReference(*reference, keypoints, descriptors, gray.size(), intrinsics, detection)) {
            detections.push_back(std::move(detection));
        }
    }

    std::sort(detections.begin(), detections.end(),
              [](const ImageDetection& a, const ImageDetection& b) { return a.inliers > b.inliers; });
    return detections;
}

bool ImageTracker::matchReference(const ReferenceImage& reference,
                                  const std::vector<cv::KeyPoint>& frame_keypoints,
                                  const cv::Mat& frame_descriptors,
                                  const cv::Size& frame_size,
                                  const CameraIntrinsics& intrinsics,
                                  ImageDetection& detection) const {
    if (reference.descriptors.empty()) {
        return false;
    }

    std::vector<std::vector<cv::DMatch>> knn;
    matcher_->knnMatch(reference.descriptors, frame_descriptors, knn, 2);

    std::vector<cv::Point2f> src, dst;
    for (const auto& pair : knn) {
        if (pair.size() < 2) {
            continue;
        }
        if (pair[0].distance < config_.ratio_threshold * pair[1].distance) {
            src.push_back(reference.keypoints[pair[0].queryIdx].pt);
            dst.push_back(frame_keypoints[pair[0].trainIdx].pt);
        }
    }

    if (static_cast<int>(src.size()) < config_.min_matches) {
        return false;
    }

    cv::Mat inlier_mask;
    cv::Mat homography = cv::findHomography(src, dst, cv::RANSAC, config_.ransac_threshold, inlier_mask);
    if (homography.empty()) {
        return false;
    }

    const int inliers = cv::countNonZero(inlier_mask);
    if (inliers < config_.min_inliers) {
        PHOTOAR_TRACE("ImageTracker", reference.name + ": " + std::to_string(inliers) + " inliers, rejected");
        return false;
    }

    std::vector<cv::Point2f> corners;
    cv::perspectiveTransform(reference.corners(), corners, homography);
    if (!plausibleQuad(corners, frame_size)) {
        PHOTOAR_TRACE("ImageTracker", reference.name + ": implausible quad, rejected");
        return false;
    }

    const cv::Mat camera_matrix = (cv::Mat_<double>(3, 3) <<
        intrinsics.fx, 0, intrinsics.cx,
        0, intrinsics.fy, intrinsics.cy,
        0, 0, 1);
    const cv::Mat dist_coeffs = (cv::Mat_<double>(4, 1) <<
        intrinsics.k1, intrinsics.k2, intrinsics.p1, intrinsics.p2);

    cv::Mat rvec, tvec;
    if (!cv::solvePnP(reference.physicalCorners(), corners, camera_matrix, dist_coeffs,
                      rvec, tvec, false, cv::SOLVEPNP_IPPE)) {
        return false;
    }

    detection.name = reference.name;
    detection.physical_size = reference.physical_size;
    detection.corners = corners;
    detection.transform = toCameraTransform(rvec, tvec);
    detection.inliers = inliers;
    detection.confidence = static_cast<float>(inliers) / static_cast<float>(src.size());
    return true;
}

bool ImageTracker::plausibleQuad(const std::vector<cv::Point2f>& corners, const cv::Size& frame_size) const {
    if (corners.size() != 4 || !cv::isContourConvex(corners)) {
        return false;
    }

    const double area = cv::contourArea(corners);
    const double frame_area = static_cast<double>(frame_size.width) * frame_size.height;
    return area >= config_.min_area_fraction * frame_area;
}

Mat4 ImageTracker::toCameraTransform(const cv::Mat& rvec, const cv::Mat& tvec) {
    cv::Mat rotation;
    cv::Rodrigues(rvec, rotation);

    cv::Mat rotation_d, tvec_d;
    rotation.convertTo(rotation_d, CV_64F);
    tvec.convertTo(tvec_d, CV_64F);

    // Flip y and z to go from the OpenCV camera to the OpenGL camera
    float r[9];
    for (int row = 0; row < 3; ++row) {
        const float sign = row == 0 ? 1.0f : -1.0f;
        for (int col = 0; col < 3; ++col) {
            r[row * 3 + col] = sign * static_cast<float>(rotation_d.at<double>(row, col));
        }
    }
    const Vec3 t(static_cast<float>(tvec_d.at<double>(0)),
                 -static_cast<float>(tvec_d.at<double>(1)),
                 -static_cast<float>(tvec_d.at<double>(2)));

    return Mat4::rigid(r, t);
}

} // namespace photoar
