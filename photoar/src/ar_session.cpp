#include "ar_session.h"
#include "ar_camera.h"
#include "ar_error.h"
#include <unordered_set>

namespace photoar {

void ARSession::setIntrinsics(const CameraIntrinsics& intrinsics) {
    intrinsics_ = intrinsics;
    if (tracker_) {
        tracker_->setIntrinsics(intrinsics_);
    }
}

void ARSession::run(const SessionConfiguration& configuration, RunOptions options) {
    if (!configuration.detection_images || configuration.detection_images->empty()) {
        reportError(ARError(ARError::Category::TRACKING, ARError::Severity::ERROR,
                            "Session configuration has no detection images", "ARSession::run",
                            "Load a reference image group before running the session"));
        return;
    }
    if (configuration.maximum_number_of_tracked_images == 0) {
        reportError(ARError(ARError::Category::CONFIG, ARError::Severity::ERROR,
                            "maximum_number_of_tracked_images must be at least 1", "ARSession::run"));
        return;
    }

    configuration_ = configuration;
    tracker_ = std::make_unique<ImageTracker>(configuration_.tracker);
    tracker_->setIntrinsics(intrinsics_);

    if (options & RUN_REMOVE_EXISTING_ANCHORS) {
        removeAllAnchors();
    } else {
        // Anchors for images that are no longer tracked go away regardless
        std::vector<std::shared_ptr<Anchor>> stale;
        for (auto it = anchors_.begin(); it != anchors_.end();) {
            if (!configuration_.detection_images->find(it->first)) {
                stale.push_back(it->second.anchor);
                it = anchors_.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& anchor : stale) {
            if (delegate_) delegate_->didRemoveAnchor(*this, anchor);
        }
    }

    if (options & RUN_RESET_TRACKING) {
        for (auto& entry : anchors_) {
            entry.second.frames_missing = 0;
        }
        frames_processed_ = 0;
    }

    interrupted_ = false;
    last_frame_time_ = Clock::now();
    state_ = State::RUNNING;

    PHOTOAR_INFO("Session", "AR session started with " +
                 std::to_string(configuration_.detection_images->size()) + " detection images, max tracked " +
                 std::to_string(configuration_.maximum_number_of_tracked_images));
}

void ARSession::pause() {
    if (state_ != State::RUNNING) {
        return;
    }
    state_ = State::PAUSED;
    PHOTOAR_INFO("Session", "AR session paused");
}

void ARSession::processFrame(const Frame& frame) {
    if (frame.empty()) {
        PHOTOAR_WARN("Session", "Received empty frame");
        return;
    }

    // Header only; processImage does not keep the pixels
    processImage(matFromFrame(frame), frame.timestamp());
}

void ARSession::processImage(const cv::Mat& image, Clock::time_point timestamp) {
    if (state_ != State::RUNNING) {
        return;
    }

    last_frame_time_ = timestamp;
    if (interrupted_) {
        interrupted_ = false;
        PHOTOAR_INFO("Session", "Frames resumed");
        if (delegate_) delegate_->sessionInterruptionEnded(*this);
    }

    try {
        auto detections = tracker_->detect(image, *configuration_.detection_images);
        updateAnchors(detections);
    } catch (const ARError& e) {
        reportError(e);
    } catch (const cv::Exception& e) {
        reportError(ARError(ARError::Category::TRACKING, ARError::Severity::ERROR,
                            std::string("OpenCV failure: ") + e.what(), "ARSession::processImage"));
    }

    ++frames_processed_;
}

void ARSession::checkInterruption(Clock::time_point now) {
    if (state_ != State::RUNNING || interrupted_) {
        return;
    }

    if (now - last_frame_time_ > configuration_.interruption_timeout) {
        interrupted_ = true;
        PHOTOAR_WARN("Session", "No camera frames, session interrupted");
        if (delegate_) delegate_->sessionWasInterrupted(*this);
    }
}

std::vector<std::shared_ptr<Anchor>> ARSession::getAnchors() const {
    std::vector<std::shared_ptr<Anchor>> result;
    result.reserve(anchors_.size());
    for (const auto& entry : anchors_) {
        result.push_back(entry.second.anchor);
    }
    return result;
}

void ARSession::removeAllAnchors() {
    auto removed = std::move(anchors_);
    anchors_.clear();

    for (auto& entry : removed) {
        if (delegate_) delegate_->didRemoveAnchor(*this, entry.second.anchor);
    }
}

void ARSession::updateAnchors(const std::vector<ImageDetection>& detections) {
    std::vector<std::shared_ptr<Anchor>> added, updated, removed;
    std::unordered_set<std::string> seen;

    for (const auto& detection : detections) {
        if (!seen.insert(detection.name).second) {
            continue;
        }

        std::vector<Vec3> corners;
        corners.reserve(detection.corners.size());
        for (const auto& p : detection.corners) {
            corners.emplace_back(p.x, p.y, 0.0f);
        }

        auto it = anchors_.find(detection.name);
        if (it != anchors_.end()) {
            auto& tracked = it->second;
            tracked.frames_missing = 0;
            tracked.anchor->setTransform(detection.transform);
            tracked.anchor->setImageCorners(std::move(corners));
            tracked.anchor->setTracked(true);
            updated.push_back(tracked.anchor);
            continue;
        }

        if (anchors_.size() >= configuration_.maximum_number_of_tracked_images) {
            PHOTOAR_DEBUG("Session", "Ignoring " + detection.name + ", already tracking the maximum number of images");
            continue;
        }

        auto anchor = std::make_shared<ImageAnchor>(next_anchor_id_++, detection.name,
                                                    detection.physical_size, detection.transform);
        anchor->setImageCorners(std::move(corners));
        anchors_.emplace(detection.name, TrackedAnchor{anchor, 0});
        added.push_back(anchor);

        PHOTOAR_INFO("Session", "Detected image: " + detection.name + " (" +
                     std::to_string(detection.inliers) + " inliers)");
    }

    for (auto it = anchors_.begin(); it != anchors_.end();) {
        if (seen.count(it->first)) {
            ++it;
            continue;
        }

        auto& tracked = it->second;
        tracked.anchor->setTracked(false);
        if (++tracked.frames_missing >= configuration_.anchor_lost_frames) {
            PHOTOAR_INFO("Session", "Lost image: " + it->first);
            removed.push_back(tracked.anchor);
            it = anchors_.erase(it);
        } else {
            ++it;
        }
    }

    if (!delegate_) {
        return;
    }
    for (const auto& anchor : removed) delegate_->didRemoveAnchor(*this, anchor);
    for (const auto& anchor : added) delegate_->didAddAnchor(*this, anchor);
    for (const auto& anchor : updated) delegate_->didUpdateAnchor(*this, anchor);
}

void ARSession::reportError(const ARError& error) {
    PHOTOAR_ERROR("Session", error.getFormattedMessage());
    if (delegate_) {
        delegate_->didFailWithError(*this, error);
    }
}

} // namespace photoar
