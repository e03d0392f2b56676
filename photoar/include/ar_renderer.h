#ifndef AR_RENDERER_H_
#define AR_RENDERER_H_

#include "ar_la.h"
#include "ar_resource.h"
#include "ar_scene.h"
#include <opencv2/core.hpp>
#include <memory>
#include <unordered_map>

namespace photoar {

/**
 * @brief Draws the camera image and every video plane of a scene
 *
 * Requires a current GL 3.3 core context for its whole lifetime.
 */
class Renderer {
public:
    struct Config {
        Vec3 clear_color = Vec3(0.0f, 0.0f, 0.0f);
        bool draw_background = true;
    };

    struct RenderStats {
        size_t planes_rendered = 0;
        size_t textures_uploaded = 0;
        float render_time_ms = 0.0f;
    };

    Renderer();
    explicit Renderer(const Config& config);
    ~Renderer() = default;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    /**
     * @brief Compile shaders and create the quad
     * @throws ARError (RENDERING, OPENGL)
     */
    void initialize();
    bool isInitialized() const { return initialized_; }

    /**
     * @brief Camera image drawn behind the scene
     */
    void setBackground(const cv::Mat& frame);

    /**
     * @param projection Camera projection matching the background image
     */
    void render(const Scene& scene, const Mat4& projection, int viewport_width, int viewport_height);

    RenderStats getLastFrameStats() const { return last_frame_stats_; }

private:
    struct VideoTexture {
        std::weak_ptr<VideoSource> source;
        std::unique_ptr<GLTexture> texture;
        uint64_t serial = 0;
        size_t last_used_frame = 0;
    };

    void renderBackground();
    void renderPlane(const SceneNode& node, const Mat4& world, const Mat4& projection);
    GLTexture* textureFor(const std::shared_ptr<VideoSource>& source);
    void releaseUnusedTextures();

    Config config_;
    ShaderProgram background_shader_;
    ShaderProgram plane_shader_;
    Mesh quad_;
    std::unique_ptr<GLTexture> background_texture_;
    bool background_dirty_ = false;
    cv::Mat background_frame_;

    std::unordered_map<const VideoSource*, VideoTexture> video_textures_;

    RenderStats last_frame_stats_;
    size_t frame_counter_ = 0;
    bool initialized_ = false;
};

} // namespace photoar

#endif // AR_RENDERER_H_
