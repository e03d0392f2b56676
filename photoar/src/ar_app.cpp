#include "ar_app.h"
#include "ar_error.h"
#include <GL/glew.h>
#include <GLFW/glfw3.h>

namespace photoar {

ARApp::ARApp(const AppConfig& config) : config_(config), camera_(config.camera) {
    PHOTOAR_INFO("App", "Creating ARApp");
}

ARApp::~ARApp() {
    shutdown();
}

void ARApp::initialize() {
    PHOTOAR_PROFILE_FUNCTION();

    try {
        initializeWindow();
        initializeOpenGL();

        renderer_ = std::make_unique<Renderer>();
        renderer_->initialize();
    } catch (const std::exception& e) {
        PHOTOAR_ERROR("App", std::string("Failed to initialize ARApp: ") + e.what());
        throw;
    }

    try {
        camera_.initialize();
        session_.setIntrinsics(camera_.getIntrinsics());
        camera_available_ = true;
    } catch (const CameraException& e) {
        PHOTOAR_ERROR("App", e.getFormattedMessage());
        camera_available_ = false;
    }

    AssetBundle assets(config_.assets.root, config_.assets.video_extensions);
    scanner_ = std::make_unique<PhotoScanner>(config_.scanner, std::move(assets), session_, scene_);
    scanner_->viewDidLoad(camera_available_);

    PHOTOAR_INFO("App", "ARApp initialized successfully");
}

void ARApp::initializeWindow() {
    if (!glfwInit()) {
        PHOTOAR_THROW_RENDER_ERROR("Failed to initialize GLFW", "ARApp::initializeWindow",
                                   "Check that a display is available");
    }
    glfw_initialized_ = true;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    GLFWwindow* window = glfwCreateWindow(config_.window.width, config_.window.height,
                                          config_.window.title.c_str(),
                                          config_.window.fullscreen ? glfwGetPrimaryMonitor() : nullptr,
                                          nullptr);
    if (!window) {
        PHOTOAR_THROW_RENDER_ERROR("Failed to create GLFW window", "ARApp::initializeWindow",
                                   "An OpenGL 3.3 core context is required");
    }

    window_ = window;
    glfwMakeContextCurrent(window);
    glfwSwapInterval(config_.window.vsync ? 1 : 0);

    glfwSetWindowUserPointer(window, this);
    glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
        if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
            glfwSetWindowShouldClose(w, GLFW_TRUE);
        }
    });
}

void ARApp::initializeOpenGL() {
    glewExperimental = GL_TRUE;
    if (glewInit() != GLEW_OK) {
        PHOTOAR_THROW_RENDER_ERROR("Failed to initialize GLEW", "ARApp::initializeOpenGL", "");
    }
    // glewInit can leave a spurious GL_INVALID_ENUM on core profiles
    while (glGetError() != GL_NO_ERROR) {}

    PHOTOAR_INFO("App", std::string("OpenGL Version: ") + reinterpret_cast<const char*>(glGetString(GL_VERSION)));
    PHOTOAR_INFO("App", std::string("GLSL Version: ") + reinterpret_cast<const char*>(glGetString(GL_SHADING_LANGUAGE_VERSION)));
}

void ARApp::run() {
    if (!window_) {
        PHOTOAR_ERROR("App", "Application not initialized");
        return;
    }

    if (camera_available_) {
        camera_.start();
    }
    last_frame_time_ = std::chrono::steady_clock::now();

    PHOTOAR_INFO("App", "Starting main loop");

    while (!glfwWindowShouldClose(static_cast<GLFWwindow*>(window_))) {
        mainLoop();
    }

    scanner_->viewWillDisappear();
    camera_.stop();
    PHOTOAR_INFO("App", "Main loop ended after " + std::to_string(frames_rendered_) + " frames");
}

void ARApp::mainLoop() {
    PHOTOAR_PROFILE("ARApp::mainLoop");

    const auto current_time = std::chrono::steady_clock::now();
    delta_time_ = std::chrono::duration<float>(current_time - last_frame_time_).count();
    last_frame_time_ = current_time;

    handleEvents();

    if (camera_available_) {
        if (auto frame = camera_.getFrame(5)) {
            current_frame_ = std::move(*frame);
            session_.processFrame(current_frame_);
            renderer_->setBackground(matFromFrame(current_frame_));
        } else {
            session_.checkInterruption(current_time);
        }
    }

    scanner_->update(delta_time_);

    render();
    glfwSwapBuffers(static_cast<GLFWwindow*>(window_));
    ++frames_rendered_;
}

void ARApp::handleEvents() {
    glfwPollEvents();
}

void ARApp::render() {
    PHOTOAR_PROFILE("ARApp::render");

    int width = 0, height = 0;
    glfwGetFramebufferSize(static_cast<GLFWwindow*>(window_), &width, &height);
    if (width <= 0 || height <= 0) {
        return; // minimized
    }

    const Mat4 projection = camera_available_
        ? camera_.getProjectionMatrix(0.01f, 100.0f)
        : Mat4::perspectiveRH(60.0f * DEG_TO_RAD, static_cast<float>(width) / height, 0.01f, 100.0f);

    try {
        renderer_->render(scene_, projection, width, height);
    } catch (const ARError& e) {
        PHOTOAR_ERROR("App", e.getFormattedMessage());
    }
}

void ARApp::shutdown() {
    scanner_.reset();
    camera_.stop();

    if (window_) {
        // GL objects must go while the context is alive
        renderer_.reset();
        glfwDestroyWindow(static_cast<GLFWwindow*>(window_));
        window_ = nullptr;
    }
    if (glfw_initialized_) {
        glfwTerminate();
        glfw_initialized_ = false;
        PHOTOAR_INFO("App", "ARApp shutdown complete");
    }
}

} // namespace photoar
