#ifndef AR_IMAGE_TRACKER_H_
#define AR_IMAGE_TRACKER_H_

#include "ar_core.h"
#include "ar_reference_image.h"
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <string>
#include <vector>

namespace photoar {

/**
 * @brief One reference image found in a frame
 */
struct ImageDetection {
    std::string name;
    Size2 physical_size;
    std::vector<cv::Point2f> corners; // frame pixels, TL, TR, BR, BL
    Mat4 transform;                   // anchor -> OpenGL camera space
    int inliers = 0;
    float confidence = 0.0f;
};

/**
 * @brief Feature-based detector for planar reference images
 *
 * ORB features are matched against every reference image with a ratio test;
 * a RANSAC homography locates the print and solvePnP recovers its pose from
 * the physical corner positions.
 */
class ImageTracker {
public:
    struct Config {
        FeatureConfig features;
        float ratio_threshold = 0.75f;   // Lowe's ratio test
        int min_matches = 15;
        int min_inliers = 12;
        double ransac_threshold = 4.0;   // pixels
        double min_area_fraction = 0.001; // of the frame area
    };

    ImageTracker();
    explicit ImageTracker(const Config& config);

    /**
     * @brief Use calibrated intrinsics; without them a pinhole guess is derived per frame
     */
    void setIntrinsics(const CameraIntrinsics& intrinsics) { intrinsics_ = intrinsics; }
    const CameraIntrinsics& getIntrinsics() const { return intrinsics_; }

    /**
     * @brief Find reference images in a frame, best first
     * @param frame BGR or grayscale image
     * @throws TrackingException if the frame is empty
     */
    std::vector<ImageDetection> detect(const cv::Mat& frame, const ReferenceImageLibrary& library) const;

    const Config& getConfig() const { return config_; }

    /**
     * @brief Convert an OpenCV object pose (x right, y down, z forward) to an OpenGL camera transform
     */
    static Mat4 toCameraTransform(const cv::Mat& rvec, const cv::Mat& tvec);

private:
    bool matchReference(const ReferenceImage& reference,
                        const std::vector<cv::KeyPoint>& frame_keypoints,
                        const cv::Mat& frame_descriptors,
                        const cv::Size& frame_size,
                        const CameraIntrinsics& intrinsics,
                        ImageDetection& detection) const;

    bool plausibleQuad(const std::vector<cv::Point2f>& corners, const cv::Size& frame_size) const;

    Config config_;
    CameraIntrinsics intrinsics_;
    cv::Ptr<cv::ORB> detector_;
    cv::Ptr<cv::DescriptorMatcher> matcher_;
};

} // namespace photoar

#endif // AR_IMAGE_TRACKER_H_
