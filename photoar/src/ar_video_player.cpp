#include "ar_video_player.h"
#include "ar_error.h"
#include <filesystem>
#include <cmath>

namespace photoar {

namespace fs = std::filesystem;

const char* videoStatusName(VideoSource::Status status) {
    switch (status) {
        case VideoSource::Status::UNKNOWN: return "unknown";
        case VideoSource::Status::READY_TO_PLAY: return "readyToPlay";
        case VideoSource::Status::FAILED: return "failed";
    }
    return "invalid";
}

VideoPlayer::VideoPlayer(std::string path) : path_(std::move(path)) {}

VideoPlayer::~VideoPlayer() {
    if (capture_.isOpened()) {
        capture_.release();
    }
}

void VideoPlayer::load() {
    PHOTOAR_PROFILE("VideoPlayer::load");

    try {
        if (!capture_.open(path_)) {
            PHOTOAR_ERROR("Video", "Cannot open " + path_);
            setStatus(Status::FAILED);
            return;
        }

        // Rotation is applied here, not by the backend
        capture_.set(cv::CAP_PROP_ORIENTATION_AUTO, 0);
        int rotation = static_cast<int>(capture_.get(cv::CAP_PROP_ORIENTATION_META));
        if (rotation < 0) {
            rotation = 0;
        }

        cv::Mat first;
        if (!capture_.read(first) || first.empty()) {
            PHOTOAR_ERROR("Video", "Cannot decode " + path_);
            capture_.release();
            setStatus(Status::FAILED);
            return;
        }

        const Size2 natural(static_cast<float>(first.cols), static_cast<float>(first.rows));
        orientation_ = correctOrientation(natural, VideoTransform::fromRotationDegrees(rotation, natural));

        fps_ = capture_.get(cv::CAP_PROP_FPS);
        if (!(fps_ > 0.0) || !std::isfinite(fps_)) {
            fps_ = 30.0;
        }

        frame_ = applyCorrection(first, orientation_);
        ++frame_serial_;
        position_ = 0.0;
        next_frame_time_ = 1.0 / fps_;
        at_end_ = false;

        PHOTOAR_DEBUG("Video", path_ + ": " + std::to_string(first.cols) + "x" + std::to_string(first.rows) +
                      " @ " + std::to_string(fps_) + " fps, rotation " + std::to_string(orientation_.rotation_degrees));

        setStatus(Status::READY_TO_PLAY);

    } catch (const cv::Exception& e) {
        PHOTOAR_ERROR("Video", "OpenCV error loading " + path_ + ": " + e.what());
        setStatus(Status::FAILED);
    } catch (const MediaException& e) {
        PHOTOAR_ERROR("Video", e.getFormattedMessage());
        setStatus(Status::FAILED);
    }
}

void VideoPlayer::setStatus(Status status) {
    if (status_ == status) {
        return;
    }
    status_ = status;
    notifyStatus(status);
}

void VideoPlayer::play() {
    if (status_ != Status::READY_TO_PLAY) {
        PHOTOAR_WARN("Video", "play() ignored, player is " + std::string(videoStatusName(status_)));
        return;
    }
    if (at_end_) {
        return;
    }
    playing_ = true;
}

void VideoPlayer::pause() {
    playing_ = false;
}

void VideoPlayer::seekToZero() {
    if (status_ != Status::READY_TO_PLAY) {
        return;
    }

    bool rewound = false;
    try {
        rewound = capture_.set(cv::CAP_PROP_POS_FRAMES, 0);
        if (!rewound) {
            // Some backends cannot seek; reopening is always possible
            capture_.release();
            rewound = capture_.open(path_);
            if (rewound) {
                capture_.set(cv::CAP_PROP_ORIENTATION_AUTO, 0);
            }
        }
    } catch (const cv::Exception& e) {
        PHOTOAR_ERROR("Video", "Seek failed on " + path_ + ": " + e.what());
        rewound = false;
    }

    if (!rewound) {
        playing_ = false;
        setStatus(Status::FAILED);
        return;
    }

    position_ = 0.0;
    next_frame_time_ = 0.0;
    at_end_ = false;
    decodeNext();
    next_frame_time_ = 1.0 / fps_;
}

void VideoPlayer::update(double dt) {
    if (!playing_ || status_ != Status::READY_TO_PLAY || dt <= 0.0) {
        return;
    }

    position_ += dt;

    // Skip straight to the newest due frame when the caller fell behind
    const double frame_duration = 1.0 / fps_;
    int due = 0;
    while (next_frame_time_ <= position_) {
        ++due;
        next_frame_time_ += frame_duration;
    }
    if (due == 0) {
        return;
    }

    for (int i = 0; i < due - 1; ++i) {
        if (!capture_.grab()) {
            break;
        }
    }

    if (!decodeNext()) {
        playing_ = false;
        at_end_ = true;
        PHOTOAR_DEBUG("Video", "Reached end of " + path_);
        notifyEnd();
    }
}

bool VideoPlayer::decodeNext() {
    cv::Mat raw;
    try {
        if (!capture_.read(raw) || raw.empty()) {
            return false;
        }
    } catch (const cv::Exception& e) {
        PHOTOAR_ERROR("Video", "Decode failed on " + path_ + ": " + e.what());
        return false;
    }

    frame_ = applyCorrection(raw, orientation_);
    ++frame_serial_;
    return true;
}

AssetBundle::AssetBundle(std::string root, std::vector<std::string> video_extensions)
    : root_(std::move(root)), video_extensions_(std::move(video_extensions)) {}

std::optional<std::string> AssetBundle::urlForResource(const std::string& name, const std::string& extension) const {
    if (name.empty()) {
        return std::nullopt;
    }

    fs::path path = fs::path(root_) / name;
    if (!extension.empty()) {
        path += "." + extension;
    }

    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return path.string();
    }
    return std::nullopt;
}

std::optional<std::string> AssetBundle::findVideo(const std::string& name) const {
    for (const auto& extension : video_extensions_) {
        if (auto url = urlForResource(name, extension)) {
            return url;
        }
    }
    return std::nullopt;
}

} // namespace photoar
