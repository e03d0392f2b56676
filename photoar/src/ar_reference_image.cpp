#include "ar_reference_image.h"
#include "ar_error.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <cstdio>

namespace photoar {

namespace fs = std::filesystem;

cv::Ptr<cv::ORB> FeatureConfig::createDetector() const {
    return cv::ORB::create(max_features, scale_factor, pyramid_levels,
                           31, 0, 2, cv::ORB::HARRIS_SCORE, 31, fast_threshold);
}

std::vector<cv::Point2f> ReferenceImage::corners() const {
    const float w = static_cast<float>(image.cols);
    const float h = static_cast<float>(image.rows);
    return { {0.0f, 0.0f}, {w, 0.0f}, {w, h}, {0.0f, h} };
}

std::vector<cv::Point3f> ReferenceImage::physicalCorners() const {
    const float hw = physical_size.width * 0.5f;
    const float hh = physical_size.height * 0.5f;
    return { {-hw, 0.0f, -hh}, {hw, 0.0f, -hh}, {hw, 0.0f, hh}, {-hw, 0.0f, hh} };
}

ReferenceImage ReferenceImageLibrary::createReferenceImage(const std::string& name, const cv::Mat& image,
                                                           const Size2& physical_size,
                                                           const FeatureConfig& features) {
    if (image.empty()) {
        PHOTOAR_THROW_ASSET_ERROR("Reference image is empty", name, "Check the image file");
    }
    if (physical_size.width <= 0.0f || physical_size.height < 0.0f) {
        PHOTOAR_THROW_ASSET_ERROR("Reference image needs a positive physical width", name,
                                  "Set physical_width in meters in the manifest");
    }

    ReferenceImage ref;
    ref.name = name;

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image.clone();
    }

    const int longest = std::max(gray.cols, gray.rows);
    if (features.max_reference_dimension > 0 && longest > features.max_reference_dimension) {
        const double scale = static_cast<double>(features.max_reference_dimension) / longest;
        cv::resize(gray, ref.image, cv::Size(), scale, scale, cv::INTER_AREA);
    } else {
        ref.image = gray;
    }

    ref.physical_size = physical_size;
    if (ref.physical_size.height <= 0.0f) {
        ref.physical_size.height = physical_size.width * static_cast<float>(gray.rows) / gray.cols;
    }

    auto detector = features.createDetector();
    detector->detectAndCompute(ref.image, cv::noArray(), ref.keypoints, ref.descriptors);

    if (ref.keypoints.size() < 10) {
        PHOTOAR_THROW_ASSET_ERROR("Reference image has too few features (" +
                                  std::to_string(ref.keypoints.size()) + ")", name,
                                  "Use a photo with more texture and contrast");
    }

    return ref;
}

ReferenceImageLibrary ReferenceImageLibrary::loadGroup(const std::string& asset_root, const std::string& group,
                                                       const FeatureConfig& features) {
    const fs::path group_dir = fs::path(asset_root) / group;
    const fs::path manifest_path = group_dir / "manifest.yml";

    std::error_code ec;
    const bool is_group = fs::is_directory(group_dir, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        PHOTOAR_THROW_ASSET_ERROR("Cannot access reference image group '" + group + "': " + ec.message(),
                                  group_dir.string(), "Check the asset directory permissions");
    }
    if (!is_group) {
        PHOTOAR_THROW_ASSET_ERROR("No reference image group named '" + group + "'", group_dir.string(),
                                  "Create the group directory with a manifest.yml");
    }

    cv::FileStorage manifest;
    try {
        manifest.open(manifest_path.string(), cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        PHOTOAR_THROW_ASSET_ERROR(std::string("Cannot parse manifest: ") + e.what(), manifest_path.string(),
                                  "Check the manifest YAML syntax");
    }
    if (!manifest.isOpened()) {
        PHOTOAR_THROW_ASSET_ERROR("Missing reference image manifest", manifest_path.string(),
                                  "Add a manifest.yml listing the images");
    }

    ReferenceImageLibrary library;
    library.group_ = group;

    const cv::FileNode images = manifest["images"];
    if (images.type() != cv::FileNode::SEQ) {
        PHOTOAR_THROW_ASSET_ERROR("Manifest has no 'images' list", manifest_path.string(),
                                  "Add an 'images' sequence");
    }

    for (const auto& node : images) {
        std::string name, file;
        float physical_width = 0.0f, physical_height = 0.0f;
        node["name"] >> name;
        node["file"] >> file;
        if (!node["physical_width"].empty()) node["physical_width"] >> physical_width;
        if (!node["physical_height"].empty()) node["physical_height"] >> physical_height;

        if (name.empty() || file.empty()) {
            PHOTOAR_WARN("ReferenceImages", "Skipping manifest entry without name or file");
            continue;
        }

        const fs::path image_path = group_dir / file;
        cv::Mat image = cv::imread(image_path.string(), cv::IMREAD_GRAYSCALE);
        if (image.empty()) {
            PHOTOAR_WARN("ReferenceImages", "Cannot read reference image " + image_path.string());
            continue;
        }

        try {
            library.add(createReferenceImage(name, image, Size2(physical_width, physical_height), features));
        } catch (const ARError& e) {
            PHOTOAR_WARN("ReferenceImages", e.getFormattedMessage());
        }
    }

    if (library.empty()) {
        PHOTOAR_THROW_ASSET_ERROR("No usable reference images in group '" + group + "'",
                                  manifest_path.string(), "Check the image files and sizes");
    }

    return library;
}

void ReferenceImageLibrary::add(ReferenceImage image) {
    if (find(image.name)) {
        PHOTOAR_THROW_ASSET_ERROR("Duplicate reference image name", image.name,
                                  "Reference image names must be unique within a group");
    }
    images_.push_back(std::make_shared<const ReferenceImage>(std::move(image)));
}

const ReferenceImage* ReferenceImageLibrary::find(const std::string& name) const {
    auto it = std::find_if(images_.begin(), images_.end(),
                           [&name](const auto& image) { return image->name == name; });
    return it != images_.end() ? it->get() : nullptr;
}

void ReferenceImageLibrary::logSummary() const {
    PHOTOAR_INFO("ReferenceImages", "Loaded " + std::to_string(images_.size()) + " reference images");
    for (const auto& image : images_) {
        char size_text[64];
        std::snprintf(size_text, sizeof(size_text), "%.3fm x %.3fm",
                      image->physical_size.width, image->physical_size.height);
        PHOTOAR_INFO("ReferenceImages", "Reference image name: " + image->name);
        PHOTOAR_INFO("ReferenceImages", std::string("Physical size: ") + size_text);
    }
}

} // namespace photoar
