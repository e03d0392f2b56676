#ifndef AR_VIDEO_PLAYER_H_
#define AR_VIDEO_PLAYER_H_

#include "ar_core.h"
#include "ar_video_orientation.h"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace photoar {

/**
 * @brief Playable video surface bound to a video material
 */
class VideoSource {
public:
    enum class Status { UNKNOWN, READY_TO_PLAY, FAILED };

    using EndCallback = std::function<void(VideoSource&)>;
    using StatusCallback = std::function<void(VideoSource&, Status)>;

    virtual ~VideoSource() = default;

    /**
     * @brief Open the media; status becomes READY_TO_PLAY or FAILED
     */
    virtual void load() = 0;
    virtual Status status() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void seekToZero() = 0;
    virtual bool isPlaying() const = 0;

    /**
     * @brief Advance playback time by dt seconds
     */
    virtual void update(double dt) = 0;

    /**
     * @brief Latest decoded frame, upright (BGR); empty until the first frame
     */
    virtual const cv::Mat& currentFrame() const = 0;

    /**
     * @brief Increments every time currentFrame() changes
     */
    virtual uint64_t frameSerial() const = 0;

    virtual const OrientationCorrection& orientation() const = 0;

    Size2 renderSize() const { return orientation().render_size; }

    void setEndCallback(EndCallback callback) { end_callback_ = std::move(callback); }
    void setStatusCallback(StatusCallback callback) { status_callback_ = std::move(callback); }

protected:
    void notifyEnd() {
        if (end_callback_) end_callback_(*this);
    }
    void notifyStatus(Status status) {
        if (status_callback_) status_callback_(*this, status);
    }

private:
    EndCallback end_callback_;
    StatusCallback status_callback_;
};

const char* videoStatusName(VideoSource::Status status);

/**
 * @brief File-backed player built on cv::VideoCapture
 *
 * Container rotation metadata is read but not applied by the backend;
 * decoded frames are rotated through correctOrientation() instead so the
 * render size is known before the first frame.
 */
class VideoPlayer : public VideoSource {
public:
    explicit VideoPlayer(std::string path);
    ~VideoPlayer() override;

    VideoPlayer(const VideoPlayer&) = delete;
    VideoPlayer& operator=(const VideoPlayer&) = delete;

    void load() override;
    Status status() const override { return status_; }

    void play() override;
    void pause() override;
    void seekToZero() override;
    bool isPlaying() const override { return playing_; }

    void update(double dt) override;

    const cv::Mat& currentFrame() const override { return frame_; }
    uint64_t frameSerial() const override { return frame_serial_; }
    const OrientationCorrection& orientation() const override { return orientation_; }

    const std::string& path() const { return path_; }
    double fps() const { return fps_; }
    double position() const { return position_; }

private:
    bool decodeNext();
    void setStatus(Status status);

    std::string path_;
    cv::VideoCapture capture_;
    Status status_ = Status::UNKNOWN;
    OrientationCorrection orientation_;

    double fps_ = 30.0;
    double position_ = 0.0;       // seconds of media time played
    double next_frame_time_ = 0.0;
    bool playing_ = false;
    bool at_end_ = false;

    cv::Mat frame_;
    uint64_t frame_serial_ = 0;
};

/**
 * @brief Resolves named resources inside the asset directory
 */
class AssetBundle {
public:
    explicit AssetBundle(std::string root,
                         std::vector<std::string> video_extensions = {"mov", "mp4", "m4v"});

    /**
     * @brief Path of `<root>/<name>.<extension>` if that file exists
     */
    std::optional<std::string> urlForResource(const std::string& name, const std::string& extension) const;

    /**
     * @brief First existing video named `name`, trying the extensions in order
     */
    std::optional<std::string> findVideo(const std::string& name) const;

    const std::string& root() const { return root_; }
    const std::vector<std::string>& videoExtensions() const { return video_extensions_; }

private:
    std::string root_;
    std::vector<std::string> video_extensions_;
};

} // namespace photoar

#endif // AR_VIDEO_PLAYER_H_
