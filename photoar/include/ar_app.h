#ifndef AR_APP_H_
#define AR_APP_H_

#include "ar_camera.h"
#include "ar_config.h"
#include "ar_photo_scanner.h"
#include "ar_renderer.h"
#include "ar_scene.h"
#include "ar_session.h"
#include <chrono>
#include <memory>

namespace photoar {

/**
 * @brief Window, camera and main loop around the photo scanner
 */
class ARApp {
public:
    explicit ARApp(const AppConfig& config = AppConfig::defaultConfig());
    ~ARApp();

    ARApp(const ARApp&) = delete;
    ARApp& operator=(const ARApp&) = delete;

    /**
     * @brief Create the window and GL context, open the camera, load the scanner
     * @throws ARError if the window or GL context cannot be created
     */
    void initialize();

    /**
     * @brief Run until the window is closed or Escape is pressed
     */
    void run();

    void shutdown();

    ARSession& getSession() { return session_; }
    Scene& getScene() { return scene_; }
    ARCamera& getCamera() { return camera_; }

private:
    void initializeWindow();
    void initializeOpenGL();
    void mainLoop();
    void handleEvents();
    void render();

    AppConfig config_;
    ARCamera camera_;
    ARSession session_;
    Scene scene_;
    std::unique_ptr<PhotoScanner> scanner_;
    std::unique_ptr<Renderer> renderer_;

    bool camera_available_ = false;
    Frame current_frame_;

    void* window_ = nullptr; // GLFWwindow*
    bool glfw_initialized_ = false;

    std::chrono::steady_clock::time_point last_frame_time_;
    float delta_time_ = 0.0f;
    size_t frames_rendered_ = 0;
};

} // namespace photoar

#endif // AR_APP_H_
