#include "ar_video_orientation.h"
#include "ar_core.h"
#include <opencv2/core.hpp>
#include <cmath>

namespace photoar {

namespace {

int normalizeQuarterTurn(int degrees) {
    int normalized = degrees % 360;
    if (normalized < 0) {
        normalized += 360;
    }
    const int quarter = static_cast<int>(std::lround(normalized / 90.0)) % 4;
    return quarter * 90;
}

bool nearly(float value, float target) {
    return std::abs(value - target) < 1e-3f;
}

} // namespace

VideoTransform VideoTransform::fromRotationDegrees(int degrees, const Size2& natural_size) {
    VideoTransform t;
    switch (normalizeQuarterTurn(degrees)) {
        case 90:
            t.a = 0.0f;  t.b = 1.0f;  t.c = -1.0f; t.d = 0.0f;
            t.tx = natural_size.height; t.ty = 0.0f;
            break;
        case 180:
            t.a = -1.0f; t.b = 0.0f;  t.c = 0.0f;  t.d = -1.0f;
            t.tx = natural_size.width; t.ty = natural_size.height;
            break;
        case 270:
            t.a = 0.0f;  t.b = -1.0f; t.c = 1.0f;  t.d = 0.0f;
            t.tx = 0.0f; t.ty = natural_size.width;
            break;
        default:
            break;
    }
    return t;
}

int VideoTransform::rotationDegrees() const {
    if (nearly(a, 1.0f) && nearly(b, 0.0f) && nearly(c, 0.0f) && nearly(d, 1.0f)) return 0;
    if (nearly(a, 0.0f) && nearly(b, 1.0f) && nearly(c, -1.0f) && nearly(d, 0.0f)) return 90;
    if (nearly(a, -1.0f) && nearly(b, 0.0f) && nearly(c, 0.0f) && nearly(d, -1.0f)) return 180;
    if (nearly(a, 0.0f) && nearly(b, -1.0f) && nearly(c, 1.0f) && nearly(d, 0.0f)) return 270;
    return 0;
}

bool VideoTransform::isIdentity() const {
    return nearly(a, 1.0f) && nearly(b, 0.0f) && nearly(c, 0.0f) && nearly(d, 1.0f) &&
           nearly(tx, 0.0f) && nearly(ty, 0.0f);
}

bool isPortrait(const VideoTransform& transform) {
    const int degrees = transform.rotationDegrees();
    return degrees == 90 || degrees == 270;
}

OrientationCorrection correctOrientation(const Size2& natural_size, const VideoTransform& transform) {
    if (natural_size.isEmpty()) {
        throw MediaException("Video has no natural size", "correctOrientation");
    }

    OrientationCorrection correction;
    correction.natural_size = natural_size;
    correction.rotation_degrees = transform.rotationDegrees();
    correction.is_portrait = isPortrait(transform);
    correction.render_size = correction.is_portrait ? natural_size.swapped() : natural_size;
    return correction;
}

cv::Mat applyCorrection(const cv::Mat& frame, const OrientationCorrection& correction) {
    if (frame.empty()) {
        return frame;
    }

    cv::Mat upright;
    switch (correction.rotation_degrees) {
        case 90:
            cv::rotate(frame, upright, cv::ROTATE_90_CLOCKWISE);
            return upright;
        case 180:
            cv::rotate(frame, upright, cv::ROTATE_180);
            return upright;
        case 270:
            cv::rotate(frame, upright, cv::ROTATE_90_COUNTERCLOCKWISE);
            return upright;
        default:
            return frame;
    }
}

PlaneFit parsePlaneFit(const std::string& name) {
    if (name == "stretch") return PlaneFit::STRETCH;
    if (name == "fill") return PlaneFit::ASPECT_FILL;
    if (name == "fit") return PlaneFit::ASPECT_FIT;

    PHOTOAR_THROW_CONFIG_ERROR("Unknown plane fit: " + name, "overlay.plane_fit",
                               "Use stretch, fill or fit");
}

const char* planeFitName(PlaneFit fit) {
    switch (fit) {
        case PlaneFit::STRETCH:     return "stretch";
        case PlaneFit::ASPECT_FILL: return "fill";
        case PlaneFit::ASPECT_FIT:  return "fit";
    }
    return "unknown";
}

Rect2 centeredCrop(const Size2& content_size, float target_aspect) {
    const float content_aspect = content_size.aspect();
    if (content_aspect <= EPSILON || target_aspect <= EPSILON) {
        return Rect2::unit();
    }

    if (content_aspect > target_aspect) {
        // Wider than the target: trim left and right
        const float w = target_aspect / content_aspect;
        return Rect2((1.0f - w) * 0.5f, 0.0f, w, 1.0f);
    }

    const float h = content_aspect / target_aspect;
    return Rect2(0.0f, (1.0f - h) * 0.5f, 1.0f, h);
}

Size2 fittedPlaneSize(const Size2& bounds, float content_aspect) {
    if (bounds.isEmpty() || content_aspect <= EPSILON) {
        return bounds;
    }

    if (content_aspect > bounds.aspect()) {
        return Size2(bounds.width, bounds.width / content_aspect);
    }
    return Size2(bounds.height * content_aspect, bounds.height);
}

VideoLayout computeVideoLayout(const Size2& image_physical_size, const Size2& render_size, PlaneFit fit) {
    if (image_physical_size.isEmpty()) {
        throw MediaException("Reference image has no physical size", "computeVideoLayout");
    }
    if (render_size.isEmpty()) {
        throw MediaException("Video has no render size", "computeVideoLayout");
    }

    VideoLayout layout;
    switch (fit) {
        case PlaneFit::STRETCH:
            layout.plane_size = image_physical_size;
            layout.uv_rect = Rect2::unit();
            break;
        case PlaneFit::ASPECT_FILL:
            layout.plane_size = image_physical_size;
            layout.uv_rect = centeredCrop(render_size, image_physical_size.aspect());
            break;
        case PlaneFit::ASPECT_FIT:
            layout.plane_size = fittedPlaneSize(image_physical_size, render_size.aspect());
            layout.uv_rect = Rect2::unit();
            break;
    }
    return layout;
}

} // namespace photoar
