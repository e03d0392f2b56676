#ifndef AR_VIDEO_ORIENTATION_H_
#define AR_VIDEO_ORIENTATION_H_

#include "ar_la.h"
#include <opencv2/core.hpp>
#include <string>

namespace photoar {

/**
 * @brief Preferred transform stored with a video track
 *
 * Affine map from stored pixels to display pixels (y down):
 *   x' = a*x + c*y + tx
 *   y' = b*x + d*y + ty
 */
struct VideoTransform {
    float a = 1.0f, b = 0.0f, c = 0.0f, d = 1.0f;
    float tx = 0.0f, ty = 0.0f;

    static VideoTransform identity() { return VideoTransform{}; }

    /**
     * @brief Transform for a clockwise container rotation tag
     *
     * Values are normalized mod 360 and snapped to the nearest quarter turn.
     * When the natural size is known the translation keeps the rotated
     * frame in positive coordinates.
     */
    static VideoTransform fromRotationDegrees(int degrees, const Size2& natural_size = Size2());

    /**
     * @brief Clockwise quarter turn encoded by this transform, 0 if it is not one
     */
    int rotationDegrees() const;

    bool isIdentity() const;
};

/**
 * @brief True when the transform turns the stored frame by 90 or 270 degrees
 */
bool isPortrait(const VideoTransform& transform);

struct OrientationCorrection {
    Size2 natural_size;
    Size2 render_size;
    int rotation_degrees = 0; // clockwise turn applied to decoded frames
    bool is_portrait = false;
};

/**
 * @brief Derive the upright render size and compensating rotation
 * @throws MediaException if the natural size is empty
 */
OrientationCorrection correctOrientation(const Size2& natural_size, const VideoTransform& transform);

/**
 * @brief Rotate a decoded frame so it displays upright
 */
cv::Mat applyCorrection(const cv::Mat& frame, const OrientationCorrection& correction);

enum class PlaneFit {
    STRETCH,     // plane = image, whole frame stretched over it
    ASPECT_FILL, // plane = image, frame center-cropped to the image aspect
    ASPECT_FIT   // plane shrunk to the frame aspect, centered on the image
};

/**
 * @brief Parse "stretch", "fill" or "fit"
 * @throws ARError (CONFIG) for anything else
 */
PlaneFit parsePlaneFit(const std::string& name);
const char* planeFitName(PlaneFit fit);

/**
 * @brief Largest centered region of the content with the target aspect, in normalized UV
 */
Rect2 centeredCrop(const Size2& content_size, float target_aspect);

/**
 * @brief Largest size with the content aspect that fits inside the bounds
 */
Size2 fittedPlaneSize(const Size2& bounds, float content_aspect);

struct VideoLayout {
    Size2 plane_size;
    Rect2 uv_rect;
};

/**
 * @brief Plane size and texture window for a video shown on a detected image
 * @throws MediaException if either size is empty
 */
VideoLayout computeVideoLayout(const Size2& image_physical_size, const Size2& render_size, PlaneFit fit);

} // namespace photoar

#endif // AR_VIDEO_ORIENTATION_H_
