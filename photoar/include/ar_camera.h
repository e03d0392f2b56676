#ifndef AR_CAMERA_H_
#define AR_CAMERA_H_

#include "ar_core.h"
#include "ar_la.h"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <vector>
#include <memory>
#include <optional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <queue>
#include <chrono>

namespace photoar {

/**
 * @brief Copy a BGR, BGRA or grayscale OpenCV image into a Frame
 */
Frame frameFromMat(const cv::Mat& image, Frame::Clock::time_point timestamp = Frame::Clock::now());

/**
 * @brief Non-owning OpenCV view of a Frame's pixels
 */
cv::Mat matFromFrame(const Frame& frame);

/**
 * @brief Camera capture with an optional background capture thread
 */
class ARCamera {
public:
    struct Config {
        int camera_index = 0;
        std::string source;         // video file or stream URL; overrides camera_index when set
        int desired_width = 1280;
        int desired_height = 720;
        double desired_fps = 30.0;
        bool enable_async_capture = true;
        size_t frame_queue_size = 3;
        std::string calibration_file; // OpenCV FileStorage with camera_matrix / distortion_coefficients
    };

    ARCamera();
    explicit ARCamera(const Config& config);
    ~ARCamera();

    ARCamera(const ARCamera&) = delete;
    ARCamera& operator=(const ARCamera&) = delete;

    /**
     * @brief Open the capture device and set up intrinsics
     * @throws CameraException if the device cannot be opened
     */
    void initialize();

    bool isInitialized() const { return capture_.isOpened(); }

    void start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * @brief Next frame, waiting up to timeout_ms in async mode
     * @return std::nullopt when no frame is available
     */
    std::optional<Frame> getFrame(int timeout_ms = 100);

    const CameraIntrinsics& getIntrinsics() const { return intrinsics_; }

    /**
     * @brief Load camera calibration from file
     * @param filename Path to calibration file (OpenCV format)
     * @return true if successful
     */
    bool loadCalibration(const std::string& filename);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

    Mat4 getProjectionMatrix(float near_plane = 0.01f, float far_plane = 100.0f) const;

    /**
     * @brief Frame rate the source delivers at; file sources are replayed at this rate
     */
    double getSourceFps() const { return source_fps_; }

    size_t getFramesCaptured() const { return frames_captured_; }
    size_t getFramesDropped() const { return frames_dropped_; }

private:
    void captureLoop();
    bool isFileSource() const { return !config_.source.empty(); }
    void enqueueFrame(Frame frame);
    bool initializeCapture();
    void destroyCapture();

    Config config_;
    CameraIntrinsics intrinsics_;
    int width_ = 0, height_ = 0;
    double source_fps_ = 0.0;

    cv::VideoCapture capture_;

    std::atomic<bool> running_{false};
    std::atomic<bool> should_stop_{false};
    std::thread capture_thread_;

    mutable std::mutex frame_queue_mutex_;
    std::condition_variable frame_available_;
    std::queue<Frame> frame_queue_;

    std::atomic<size_t> frames_captured_{0};
    std::atomic<size_t> frames_dropped_{0};
};

} // namespace photoar

#endif // AR_CAMERA_H_
