#ifndef AR_SESSION_H_
#define AR_SESSION_H_

#include "ar_core.h"
#include "ar_error.h"
#include "ar_image_tracker.h"
#include "ar_reference_image.h"
#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <unordered_map>
#include <vector>

namespace photoar {

class ARSession;

/**
 * @brief Receives anchor and session events, on the thread that feeds frames
 */
class SessionDelegate {
public:
    virtual ~SessionDelegate() = default;

    virtual void didAddAnchor(ARSession& session, const std::shared_ptr<Anchor>& anchor) {}
    virtual void didUpdateAnchor(ARSession& session, const std::shared_ptr<Anchor>& anchor) {}
    virtual void didRemoveAnchor(ARSession& session, const std::shared_ptr<Anchor>& anchor) {}

    virtual void didFailWithError(ARSession& session, const ARError& error) {}
    virtual void sessionWasInterrupted(ARSession& session) {}
    virtual void sessionInterruptionEnded(ARSession& session) {}
};

/**
 * @brief What the session should track
 */
struct SessionConfiguration {
    std::shared_ptr<const ReferenceImageLibrary> detection_images;
    size_t maximum_number_of_tracked_images = 1;
    int anchor_lost_frames = 15;
    std::chrono::milliseconds interruption_timeout{1000};
    ImageTracker::Config tracker;
};

enum RunOption : unsigned {
    RUN_DEFAULT = 0,
    RUN_RESET_TRACKING = 1u << 0,
    RUN_REMOVE_EXISTING_ANCHORS = 1u << 1
};
using RunOptions = unsigned;

/**
 * @brief Image tracking session
 *
 * Frames are pushed in by the owner (normally the main loop); every delegate
 * callback runs synchronously inside processFrame(), run(), pause() or
 * checkInterruption().
 */
class ARSession {
public:
    using Clock = std::chrono::steady_clock;

    enum class State { NOT_STARTED, RUNNING, PAUSED };

    ARSession() = default;
    ~ARSession() = default;

    ARSession(const ARSession&) = delete;
    ARSession& operator=(const ARSession&) = delete;

    /**
     * @brief Set the delegate; the session does not own it
     */
    void setDelegate(SessionDelegate* delegate) { delegate_ = delegate; }
    SessionDelegate* getDelegate() const { return delegate_; }

    void setIntrinsics(const CameraIntrinsics& intrinsics);

    /**
     * @brief Start or reconfigure tracking
     *
     * A configuration without detection images is reported through
     * didFailWithError and leaves the session state unchanged.
     */
    void run(const SessionConfiguration& configuration, RunOptions options = RUN_DEFAULT);

    void pause();

    /**
     * @brief Detect and track reference images in one camera frame
     */
    void processFrame(const Frame& frame);
    void processImage(const cv::Mat& image, Clock::time_point timestamp = Clock::now());

    /**
     * @brief Report an interruption when frames stopped arriving
     */
    void checkInterruption(Clock::time_point now = Clock::now());

    State getState() const { return state_; }
    bool isRunning() const { return state_ == State::RUNNING; }
    bool isInterrupted() const { return interrupted_; }

    std::vector<std::shared_ptr<Anchor>> getAnchors() const;
    const SessionConfiguration& getConfiguration() const { return configuration_; }
    size_t getFramesProcessed() const { return frames_processed_; }

private:
    struct TrackedAnchor {
        std::shared_ptr<ImageAnchor> anchor;
        int frames_missing = 0;
    };

    void removeAllAnchors();
    void updateAnchors(const std::vector<ImageDetection>& detections);
    void reportError(const ARError& error);

    SessionDelegate* delegate_ = nullptr;
    SessionConfiguration configuration_;
    std::unique_ptr<ImageTracker> tracker_;
    CameraIntrinsics intrinsics_;

    State state_ = State::NOT_STARTED;
    bool interrupted_ = false;
    Clock::time_point last_frame_time_;

    std::unordered_map<std::string, TrackedAnchor> anchors_; // keyed by reference image name
    AnchorId next_anchor_id_ = 1;
    size_t frames_processed_ = 0;
};

} // namespace photoar

#endif // AR_SESSION_H_
