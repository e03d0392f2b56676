#ifndef AR_REFERENCE_IMAGE_H_
#define AR_REFERENCE_IMAGE_H_

#include "ar_core.h"
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <memory>
#include <string>
#include <vector>

namespace photoar {

/**
 * @brief ORB settings shared by reference images and live frames
 */
struct FeatureConfig {
    int max_features = 1000;
    float scale_factor = 1.2f;
    int pyramid_levels = 8;
    int fast_threshold = 20;
    int max_reference_dimension = 640; // larger references are downscaled before extraction

    cv::Ptr<cv::ORB> createDetector() const;
};

/**
 * @brief A known printed image registered for tracking
 */
struct ReferenceImage {
    std::string name;
    Size2 physical_size;               // meters
    cv::Mat image;                     // grayscale, as used for extraction
    std::vector<cv::KeyPoint> keypoints;
    cv::Mat descriptors;

    /**
     * @brief Image corners in pixels: top-left, top-right, bottom-right, bottom-left
     */
    std::vector<cv::Point2f> corners() const;

    /**
     * @brief Corners on the physical print in anchor space (meters, image in the X/Z plane)
     */
    std::vector<cv::Point3f> physicalCorners() const;
};

/**
 * @brief Named group of reference images, loaded from an asset directory
 *
 * A group is a directory holding `manifest.yml`:
 *
 *   images:
 *     - { name: "photo", file: "photo.jpg", physical_width: 0.15, physical_height: 0.10 }
 *
 * `physical_height` may be omitted; it is derived from the image aspect.
 */
class ReferenceImageLibrary {
public:
    using ImageList = std::vector<std::shared_ptr<const ReferenceImage>>;

    ReferenceImageLibrary() = default;

    /**
     * @brief Load every image of `<asset_root>/<group>/manifest.yml`
     * @throws ARError (ASSET) when the group or manifest is missing or yields no image
     */
    static ReferenceImageLibrary loadGroup(const std::string& asset_root, const std::string& group,
                                           const FeatureConfig& features = FeatureConfig{});

    /**
     * @brief Extract features for one image
     * @param physical_size Print size in meters; a zero height is derived from the aspect
     * @throws ARError (ASSET) for empty images, bad sizes or featureless images
     */
    static ReferenceImage createReferenceImage(const std::string& name, const cv::Mat& image,
                                               const Size2& physical_size,
                                               const FeatureConfig& features = FeatureConfig{});

    /**
     * @throws ARError (ASSET) if an image with the same name is already present
     */
    void add(ReferenceImage image);

    const ReferenceImage* find(const std::string& name) const;

    size_t size() const { return images_.size(); }
    bool empty() const { return images_.empty(); }
    const std::string& groupName() const { return group_; }

    ImageList::const_iterator begin() const { return images_.begin(); }
    ImageList::const_iterator end() const { return images_.end(); }

    void logSummary() const;

private:
    std::string group_;
    ImageList images_;
};

} // namespace photoar

#endif // AR_REFERENCE_IMAGE_H_
