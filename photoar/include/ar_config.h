#ifndef AR_CONFIG_H_
#define AR_CONFIG_H_

#include "ar_camera.h"
#include "ar_error.h"
#include "ar_photo_scanner.h"
#include <string>
#include <vector>

namespace photoar {

/**
 * @brief Application settings, read from a YAML file through cv::FileStorage
 *
 *   window:   { width, height, title, fullscreen, vsync }
 *   camera:   { index, source, width, height, fps, calibration_file, async }
 *   assets:   { root, reference_group, video_extensions: [mov, mp4] }
 *   tracking: { max_tracked_images, max_features, ratio_threshold, min_inliers,
 *               anchor_lost_frames, interruption_timeout_ms }
 *   overlay:  { plane_fit: stretch|fill|fit, lift_m, double_sided }
 *   logging:  { level, file }
 *
 * Every key is optional.
 */
struct AppConfig {
    struct Window {
        int width = 1280;
        int height = 720;
        std::string title = "PhotoAR";
        bool fullscreen = false;
        bool vsync = true;
    };

    struct Assets {
        std::string root = "assets";
        std::vector<std::string> video_extensions = {"mov", "mp4", "m4v"};
    };

    struct Logging {
        LogSystem::Level level = LogSystem::Level::INFO;
        std::string file;
    };

    Window window;
    ARCamera::Config camera;
    Assets assets;
    PhotoScanner::Config scanner;
    Logging logging;

    static AppConfig defaultConfig() { return AppConfig{}; }

    /**
     * @brief Read settings, keeping defaults for absent keys
     * @throws ARError (CONFIG) if the file cannot be parsed or holds invalid values
     */
    static AppConfig loadFromFile(const std::string& path);

    /**
     * @throws ARError (CONFIG) describing the first invalid value
     */
    void validate() const;

    /**
     * @brief Set the log level and file output
     */
    void applyLogging() const;
};

} // namespace photoar

#endif // AR_CONFIG_H_
