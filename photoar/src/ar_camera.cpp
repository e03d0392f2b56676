#include "ar_camera.h"
#include "ar_error.h"
#include <opencv2/imgproc.hpp>
#include <opencv2/calib3d.hpp>

namespace photoar {

Frame frameFromMat(const cv::Mat& image, Frame::Clock::time_point timestamp) {
    if (image.empty()) {
        return Frame{};
    }

    cv::Mat contiguous = image.isContinuous() ? image : image.clone();
    Frame::Format format = Frame::Format::BGR;
    switch (contiguous.channels()) {
        case 1: format = Frame::Format::GRAYSCALE; break;
        case 3: format = Frame::Format::BGR; break;
        case 4: format = Frame::Format::BGRA; break;
        default:
            throw CameraException("Unsupported channel count: " + std::to_string(contiguous.channels()));
    }

    std::vector<uint8_t> data(contiguous.data, contiguous.data + contiguous.total() * contiguous.elemSize());
    return Frame(contiguous.cols, contiguous.rows, format, std::move(data), timestamp);
}

cv::Mat matFromFrame(const Frame& frame) {
    if (frame.empty()) {
        return cv::Mat();
    }

    int type = CV_8UC3;
    switch (frame.format()) {
        case Frame::Format::GRAYSCALE: type = CV_8UC1; break;
        case Frame::Format::RGB:
        case Frame::Format::BGR: type = CV_8UC3; break;
        case Frame::Format::RGBA:
        case Frame::Format::BGRA: type = CV_8UC4; break;
    }
    return cv::Mat(frame.height(), frame.width(), type, const_cast<uint8_t*>(frame.data()));
}

ARCamera::ARCamera() : ARCamera(Config{}) {}

ARCamera::ARCamera(const Config& config) : config_(config) {
    PHOTOAR_DEBUG("Camera", "Creating ARCamera");
}

ARCamera::~ARCamera() {
    stop();
    destroyCapture();
}

void ARCamera::initialize() {
    if (!initializeCapture()) {
        const std::string device = config_.source.empty()
            ? "camera " + std::to_string(config_.camera_index)
            : config_.source;
        throw CameraException("Failed to open " + device, "ARCamera::initialize");
    }

    width_ = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH));
    height_ = static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (width_ <= 0 || height_ <= 0) {
        width_ = config_.desired_width;
        height_ = config_.desired_height;
    }

    source_fps_ = capture_.get(cv::CAP_PROP_FPS);
    if (!(source_fps_ > 0.0)) {
        source_fps_ = config_.desired_fps > 0.0 ? config_.desired_fps : 30.0;
    }

    intrinsics_ = CameraIntrinsics::approximate(width_, height_);

    if (!config_.calibration_file.empty()) {
        if (loadCalibration(config_.calibration_file)) {
            PHOTOAR_INFO("Camera", "Loaded calibration from " + config_.calibration_file);
        } else {
            PHOTOAR_WARN("Camera", "Cannot load calibration " + config_.calibration_file +
                         ", using approximate intrinsics");
        }
    }

    PHOTOAR_INFO("Camera", "Camera opened at " + std::to_string(width_) + "x" + std::to_string(height_) +
                 " @ " + std::to_string(source_fps_) + " fps");
}

bool ARCamera::initializeCapture() {
    try {
        if (config_.source.empty()) {
            capture_.open(config_.camera_index);
        } else {
            capture_.open(config_.source);
        }
        if (!capture_.isOpened()) {
            return false;
        }

        if (config_.source.empty()) {
            capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.desired_width);
            capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.desired_height);
            capture_.set(cv::CAP_PROP_FPS, config_.desired_fps);
        }

        return true;

    } catch (const cv::Exception& e) {
        PHOTOAR_ERROR("Camera", std::string("OpenCV error opening capture: ") + e.what());
        return false;
    }
}

void ARCamera::destroyCapture() {
    if (capture_.isOpened()) {
        capture_.release();
    }
}

void ARCamera::start() {
    if (running_ || !capture_.isOpened()) {
        return;
    }

    should_stop_ = false;
    running_ = true;

    if (config_.enable_async_capture) {
        capture_thread_ = std::thread(&ARCamera::captureLoop, this);
    }
}

void ARCamera::stop() {
    if (!running_) {
        return;
    }

    should_stop_ = true;
    running_ = false;

    if (capture_thread_.joinable()) {
        frame_available_.notify_all();
        capture_thread_.join();
    }
}

void ARCamera::captureLoop() {
    cv::Mat cv_frame;

    // Devices block in read() at the sensor rate; recordings have to be paced here
    const auto frame_interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / source_fps_));
    auto next_frame_due = std::chrono::steady_clock::now();

    while (!should_stop_) {
        try {
            if (isFileSource()) {
                std::this_thread::sleep_until(next_frame_due);
            }

            if (!capture_.read(cv_frame) || cv_frame.empty()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            enqueueFrame(frameFromMat(cv_frame));
            frames_captured_++;

            if (isFileSource()) {
                next_frame_due += frame_interval;
                const auto now = std::chrono::steady_clock::now();
                // Do not burst to catch up after a stall
                if (next_frame_due < now) {
                    next_frame_due = now;
                }
            }

        } catch (const std::exception& e) {
            PHOTOAR_ERROR("Camera", std::string("Capture failed: ") + e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
}

void ARCamera::enqueueFrame(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(frame_queue_mutex_);
        if (frame_queue_.size() >= config_.frame_queue_size) {
            frame_queue_.pop();
            frames_dropped_++;
        }
        frame_queue_.emplace(std::move(frame));
    }
    frame_available_.notify_one();
}

std::optional<Frame> ARCamera::getFrame(int timeout_ms) {
    if (!running_) {
        return std::nullopt;
    }

    if (!config_.enable_async_capture) {
        cv::Mat cv_frame;
        if (!capture_.read(cv_frame) || cv_frame.empty()) {
            return std::nullopt;
        }
        frames_captured_++;
        return frameFromMat(cv_frame);
    }

    std::unique_lock<std::mutex> lock(frame_queue_mutex_);

    if (frame_available_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this] { return !frame_queue_.empty(); })) {
        Frame frame = std::move(frame_queue_.front());
        frame_queue_.pop();
        return frame;
    }

    return std::nullopt;
}

bool ARCamera::loadCalibration(const std::string& filename) {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            return false;
        }

        cv::Mat camera_matrix, dist_coeffs;
        fs["camera_matrix"] >> camera_matrix;
        fs["distortion_coefficients"] >> dist_coeffs;

        if (camera_matrix.rows != 3 || camera_matrix.cols != 3) {
            return false;
        }
        camera_matrix.convertTo(camera_matrix, CV_64F);

        CameraIntrinsics loaded;
        loaded.fx = static_cast<float>(camera_matrix.at<double>(0, 0));
        loaded.fy = static_cast<float>(camera_matrix.at<double>(1, 1));
        loaded.cx = static_cast<float>(camera_matrix.at<double>(0, 2));
        loaded.cy = static_cast<float>(camera_matrix.at<double>(1, 2));

        if (dist_coeffs.total() >= 4) {
            dist_coeffs.convertTo(dist_coeffs, CV_64F);
            const double* d = dist_coeffs.ptr<double>();
            loaded.k1 = static_cast<float>(d[0]);
            loaded.k2 = static_cast<float>(d[1]);
            loaded.p1 = static_cast<float>(d[2]);
            loaded.p2 = static_cast<float>(d[3]);
        }

        if (!loaded.isValid()) {
            return false;
        }
        intrinsics_ = loaded;
        return true;

    } catch (const cv::Exception& e) {
        PHOTOAR_ERROR("Camera", std::string("Calibration parse error: ") + e.what());
        return false;
    }
}

Mat4 ARCamera::getProjectionMatrix(float near_plane, float far_plane) const {
    return intrinsics_.getProjectionMatrix(
        static_cast<float>(width_),
        static_cast<float>(height_),
        near_plane, far_plane);
}

} // namespace photoar
