#include "ar_config.h"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace photoar {

namespace {

void readInt(const cv::FileNode& node, const char* key, int& value) {
    const cv::FileNode child = node[key];
    if (child.isNone()) {
        return;
    }
    if (!child.isInt() && !child.isReal()) {
        PHOTOAR_THROW_CONFIG_ERROR(std::string("'") + key + "' must be a number", "AppConfig::loadFromFile", "");
    }
    value = static_cast<int>(child.real());
}

template<typename T>
void readReal(const cv::FileNode& node, const char* key, T& value) {
    const cv::FileNode child = node[key];
    if (child.isNone()) {
        return;
    }
    if (!child.isInt() && !child.isReal()) {
        PHOTOAR_THROW_CONFIG_ERROR(std::string("'") + key + "' must be a number", "AppConfig::loadFromFile", "");
    }
    value = static_cast<T>(child.real());
}

void readString(const cv::FileNode& node, const char* key, std::string& value) {
    const cv::FileNode child = node[key];
    if (child.isNone()) {
        return;
    }
    if (!child.isString()) {
        PHOTOAR_THROW_CONFIG_ERROR(std::string("'") + key + "' must be a string", "AppConfig::loadFromFile", "");
    }
    value = child.string();
}

// FileStorage keeps YAML booleans as strings
void readBool(const cv::FileNode& node, const char* key, bool& value) {
    const cv::FileNode child = node[key];
    if (child.isNone()) {
        return;
    }
    if (child.isInt()) {
        value = static_cast<int>(child) != 0;
        return;
    }

    std::string text = child.isString() ? child.string() : "";
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "yes" || text == "on") {
        value = true;
    } else if (text == "false" || text == "no" || text == "off") {
        value = false;
    } else {
        PHOTOAR_THROW_CONFIG_ERROR(std::string("'") + key + "' must be true or false", "AppConfig::loadFromFile", "");
    }
}

void readStringList(const cv::FileNode& node, const char* key, std::vector<std::string>& values) {
    const cv::FileNode child = node[key];
    if (child.isNone()) {
        return;
    }
    if (!child.isSeq()) {
        PHOTOAR_THROW_CONFIG_ERROR(std::string("'") + key + "' must be a list", "AppConfig::loadFromFile", "");
    }

    std::vector<std::string> parsed;
    for (const auto& item : child) {
        if (!item.isString()) {
            PHOTOAR_THROW_CONFIG_ERROR(std::string("'") + key + "' entries must be strings",
                                       "AppConfig::loadFromFile", "");
        }
        parsed.push_back(item.string());
    }
    values = std::move(parsed);
}

} // namespace

AppConfig AppConfig::loadFromFile(const std::string& path) {
    AppConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        PHOTOAR_WARN("Config", "Config file " + path + " not found, using defaults");
        return config;
    }

    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            PHOTOAR_THROW_CONFIG_ERROR("Cannot open config file " + path, "AppConfig::loadFromFile",
                                       "Check the file is readable YAML");
        }
    } catch (const cv::Exception& e) {
        PHOTOAR_THROW_CONFIG_ERROR("Cannot parse config file " + path + ": " + e.what(),
                                   "AppConfig::loadFromFile", "Check the YAML syntax");
    }

    const cv::FileNode window = fs["window"];
    if (!window.isNone()) {
        readInt(window, "width", config.window.width);
        readInt(window, "height", config.window.height);
        readString(window, "title", config.window.title);
        readBool(window, "fullscreen", config.window.fullscreen);
        readBool(window, "vsync", config.window.vsync);
    }

    const cv::FileNode camera = fs["camera"];
    if (!camera.isNone()) {
        readInt(camera, "index", config.camera.camera_index);
        readString(camera, "source", config.camera.source);
        readInt(camera, "width", config.camera.desired_width);
        readInt(camera, "height", config.camera.desired_height);
        readReal(camera, "fps", config.camera.desired_fps);
        readString(camera, "calibration_file", config.camera.calibration_file);
        readBool(camera, "async", config.camera.enable_async_capture);
    }

    const cv::FileNode assets = fs["assets"];
    if (!assets.isNone()) {
        readString(assets, "root", config.assets.root);
        readString(assets, "reference_group", config.scanner.reference_group);
        readStringList(assets, "video_extensions", config.assets.video_extensions);
    }

    const cv::FileNode tracking = fs["tracking"];
    if (!tracking.isNone()) {
        auto& session = config.scanner.session;
        int max_tracked = static_cast<int>(session.maximum_number_of_tracked_images);
        readInt(tracking, "max_tracked_images", max_tracked);
        if (max_tracked < 1) {
            PHOTOAR_THROW_CONFIG_ERROR("max_tracked_images must be at least 1", "AppConfig::loadFromFile", "");
        }
        session.maximum_number_of_tracked_images = static_cast<size_t>(max_tracked);

        readInt(tracking, "max_features", config.scanner.features.max_features);
        session.tracker.features = config.scanner.features;
        readReal(tracking, "ratio_threshold", session.tracker.ratio_threshold);
        readInt(tracking, "min_inliers", session.tracker.min_inliers);
        readInt(tracking, "anchor_lost_frames", session.anchor_lost_frames);

        int timeout_ms = static_cast<int>(session.interruption_timeout.count());
        readInt(tracking, "interruption_timeout_ms", timeout_ms);
        session.interruption_timeout = std::chrono::milliseconds(timeout_ms);
    }

    const cv::FileNode overlay = fs["overlay"];
    if (!overlay.isNone()) {
        std::string fit = planeFitName(config.scanner.plane_fit);
        readString(overlay, "plane_fit", fit);
        config.scanner.plane_fit = parsePlaneFit(fit);
        readReal(overlay, "lift_m", config.scanner.plane_lift);
        readBool(overlay, "double_sided", config.scanner.double_sided);
    }

    const cv::FileNode logging = fs["logging"];
    if (!logging.isNone()) {
        std::string level = LogSystem::levelName(config.logging.level);
        readString(logging, "level", level);
        config.logging.level = LogSystem::parseLevel(level);
        readString(logging, "file", config.logging.file);
    }

    config.validate();
    PHOTOAR_INFO("Config", "Loaded configuration from " + path);
    return config;
}

void AppConfig::validate() const {
    if (window.width <= 0 || window.height <= 0) {
        PHOTOAR_THROW_CONFIG_ERROR("Window size must be positive", "AppConfig::validate", "");
    }
    if (camera.desired_width <= 0 || camera.desired_height <= 0) {
        PHOTOAR_THROW_CONFIG_ERROR("Camera size must be positive", "AppConfig::validate", "");
    }
    if (camera.desired_fps <= 0.0) {
        PHOTOAR_THROW_CONFIG_ERROR("Camera fps must be positive", "AppConfig::validate", "");
    }
    if (assets.video_extensions.empty()) {
        PHOTOAR_THROW_CONFIG_ERROR("At least one video extension is required", "AppConfig::validate",
                                   "Add e.g. 'mov' to assets.video_extensions");
    }
    if (scanner.reference_group.empty()) {
        PHOTOAR_THROW_CONFIG_ERROR("Reference group name is empty", "AppConfig::validate", "");
    }

    const auto& session = scanner.session;
    if (session.maximum_number_of_tracked_images < 1) {
        PHOTOAR_THROW_CONFIG_ERROR("max_tracked_images must be at least 1", "AppConfig::validate", "");
    }
    if (scanner.features.max_features <= 0) {
        PHOTOAR_THROW_CONFIG_ERROR("max_features must be positive", "AppConfig::validate", "");
    }
    if (session.tracker.ratio_threshold <= 0.0f || session.tracker.ratio_threshold >= 1.0f) {
        PHOTOAR_THROW_CONFIG_ERROR("ratio_threshold must be in (0, 1)", "AppConfig::validate", "");
    }
    if (session.tracker.min_inliers < 4) {
        PHOTOAR_THROW_CONFIG_ERROR("min_inliers must be at least 4", "AppConfig::validate",
                                   "A homography needs four correspondences");
    }
    if (session.anchor_lost_frames <= 0) {
        PHOTOAR_THROW_CONFIG_ERROR("anchor_lost_frames must be positive", "AppConfig::validate", "");
    }
    if (session.interruption_timeout.count() <= 0) {
        PHOTOAR_THROW_CONFIG_ERROR("interruption_timeout_ms must be positive", "AppConfig::validate", "");
    }
    if (scanner.plane_lift < 0.0f) {
        PHOTOAR_THROW_CONFIG_ERROR("lift_m must not be negative", "AppConfig::validate", "");
    }
}

void AppConfig::applyLogging() const {
    auto& log = LogSystem::getInstance();
    log.setLevel(logging.level);
    if (!logging.file.empty()) {
        log.setFileOutput(logging.file);
    }
}

} // namespace photoar
