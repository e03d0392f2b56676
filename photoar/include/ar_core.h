#ifndef AR_CORE_H_
#define AR_CORE_H_

#include "ar_la.h"
#include "ar_error.h"
#include <vector>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <string>
#include <cstdint>
#include <algorithm>

namespace photoar {

/**
 * @brief Exception types for the capture, tracking and media subsystems
 */
class CameraException : public ARError {
public:
    explicit CameraException(const std::string& msg, const std::string& context = "")
        : ARError(Category::CAMERA, Severity::ERROR, "Camera Error: " + msg, context) {}
};

class TrackingException : public ARError {
public:
    explicit TrackingException(const std::string& msg, const std::string& context = "")
        : ARError(Category::TRACKING, Severity::ERROR, "Tracking Error: " + msg, context) {}
};

class MediaException : public ARError {
public:
    explicit MediaException(const std::string& msg, const std::string& context = "")
        : ARError(Category::MEDIA, Severity::ERROR, "Media Error: " + msg, context) {}
};

/**
 * @brief Camera intrinsic parameters with validation
 */
struct CameraIntrinsics {
    float fx, fy, cx, cy;
    float k1 = 0.0f, k2 = 0.0f, p1 = 0.0f, p2 = 0.0f; // Distortion coefficients

    constexpr CameraIntrinsics() : fx(0), fy(0), cx(0), cy(0) {}
    constexpr CameraIntrinsics(float fx_, float fy_, float cx_, float cy_)
        : fx(fx_), fy(fy_), cx(cx_), cy(cy_) {}

    bool isValid() const {
        return fx > EPSILON && fy > EPSILON && cx >= 0 && cy >= 0;
    }

    /**
     * @brief Pinhole guess used until a calibration file is loaded
     */
    static CameraIntrinsics approximate(int width, int height) {
        const float f = 0.9f * static_cast<float>(std::max(width, height));
        return CameraIntrinsics(f, f, width * 0.5f, height * 0.5f);
    }

    /**
     * @brief OpenGL projection matching these intrinsics, principal point included
     * @throws CameraException if the intrinsics are invalid
     */
    Mat4 getProjectionMatrix(float width, float height, float near_plane, float far_plane) const {
        if (!isValid()) {
            throw CameraException("Invalid camera intrinsics");
        }

        Mat4 r{};
        r.m.fill(0.0f);
        r(0, 0) = 2.0f * fx / width;
        r(1, 1) = 2.0f * fy / height;
        r(0, 2) = 1.0f - 2.0f * cx / width;
        r(1, 2) = 2.0f * cy / height - 1.0f;
        r(2, 2) = -(far_plane + near_plane) / (far_plane - near_plane);
        r(2, 3) = -2.0f * far_plane * near_plane / (far_plane - near_plane);
        r(3, 2) = -1.0f;
        return r;
    }
};

/**
 * @brief RAII wrapper for image data with metadata
 */
class Frame {
public:
    enum class Format { GRAYSCALE, RGB, BGR, RGBA, BGRA };
    using Clock = std::chrono::steady_clock;

    Frame() = default;
    Frame(int width, int height, Format format, std::vector<uint8_t> data,
          Clock::time_point timestamp = Clock::now())
        : width_(width), height_(height), format_(format), data_(std::move(data))
        , timestamp_(timestamp) {
        validate();
    }

    // Move-only semantics for performance
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;
    Frame(Frame&&) = default;
    Frame& operator=(Frame&&) = default;

    int width() const { return width_; }
    int height() const { return height_; }
    Format format() const { return format_; }
    const uint8_t* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }
    Clock::time_point timestamp() const { return timestamp_; }

    size_t channels() const {
        switch (format_) {
            case Format::GRAYSCALE: return 1;
            case Format::RGB:
            case Format::BGR: return 3;
            case Format::RGBA:
            case Format::BGRA: return 4;
        }
        return 0;
    }

    bool empty() const { return data_.empty(); }

private:
    void validate() const {
        const size_t expected_size = static_cast<size_t>(width_) * height_ * channels();
        if (data_.size() != expected_size) {
            throw std::invalid_argument("Frame data size mismatch");
        }
    }

    int width_ = 0, height_ = 0;
    Format format_ = Format::GRAYSCALE;
    std::vector<uint8_t> data_;
    Clock::time_point timestamp_;
};

using AnchorId = uint64_t;

/**
 * @brief A tracked pose in camera space
 *
 * The transform maps anchor-local coordinates into the OpenGL camera frame
 * (x right, y up, looking down -z).
 */
class Anchor {
public:
    explicit Anchor(AnchorId id, const Mat4& transform = Mat4::identity())
        : id_(id), transform_(transform) {}
    virtual ~Anchor() = default;

    AnchorId id() const { return id_; }
    const Mat4& transform() const { return transform_; }
    void setTransform(const Mat4& transform) { transform_ = transform; }

private:
    AnchorId id_;
    Mat4 transform_;
};

/**
 * @brief Anchor for a detected reference image
 *
 * The image lies in the anchor's X/Z plane centered on the origin: +X points
 * to the image's right edge, +Z to its bottom edge, +Y out of the print.
 */
class ImageAnchor : public Anchor {
public:
    ImageAnchor(AnchorId id, std::string name, const Size2& physical_size,
                const Mat4& transform = Mat4::identity())
        : Anchor(id, transform), name_(std::move(name)), physical_size_(physical_size) {}

    const std::string& referenceImageName() const { return name_; }
    const Size2& physicalSize() const { return physical_size_; }

    bool isTracked() const { return tracked_; }
    void setTracked(bool tracked) { tracked_ = tracked; }

    // Image corners in frame pixels: top-left, top-right, bottom-right, bottom-left
    const std::vector<Vec3>& imageCorners() const { return corners_; }
    void setImageCorners(std::vector<Vec3> corners) { corners_ = std::move(corners); }

private:
    std::string name_;
    Size2 physical_size_;
    bool tracked_ = true;
    std::vector<Vec3> corners_;
};

} // namespace photoar

#endif // AR_CORE_H_
