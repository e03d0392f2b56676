#include "ar_renderer.h"
#include "ar_error.h"
#include "ar_video_player.h"
#include <glm/glm.hpp>
#include <chrono>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace photoar {

namespace {

const char* kBackgroundVertexShader = R"(
#version 330 core
layout(location = 0) in vec3 a_position;
layout(location = 1) in vec2 a_uv;
out vec2 v_uv;
void main() {
    v_uv = a_uv;
    gl_Position = vec4(a_position.xy * 2.0, 0.0, 1.0);
}
)";

const char* kBackgroundFragmentShader = R"(
#version 330 core
in vec2 v_uv;
out vec4 frag_color;
uniform sampler2D u_texture;
void main() {
    frag_color = vec4(texture(u_texture, v_uv).rgb, 1.0);
}
)";

const char* kPlaneVertexShader = R"(
#version 330 core
layout(location = 0) in vec3 a_position;
layout(location = 1) in vec2 a_uv;
uniform mat4 u_mvp;
uniform vec4 u_uv_rect;
out vec2 v_uv;
void main() {
    v_uv = u_uv_rect.xy + a_uv * u_uv_rect.zw;
    gl_Position = u_mvp * vec4(a_position, 1.0);
}
)";

const char* kPlaneFragmentShader = R"(
#version 330 core
in vec2 v_uv;
out vec4 frag_color;
uniform sampler2D u_texture;
uniform int u_has_texture;
void main() {
    if (u_has_texture == 0) {
        frag_color = vec4(0.0, 0.0, 0.0, 1.0);
        return;
    }
    frag_color = vec4(texture(u_texture, v_uv).rgb, 1.0);
}
)";

// Drop textures of sources that were not drawn for this many frames
constexpr size_t kTextureIdleFrames = 120;

} // namespace

Renderer::Renderer() : Renderer(Config{}) {}

Renderer::Renderer(const Config& config) : config_(config) {}

void Renderer::initialize() {
    PHOTOAR_PROFILE_FUNCTION();

    if (initialized_) {
        return;
    }

    background_shader_.loadFromSource(kBackgroundVertexShader, kBackgroundFragmentShader);
    plane_shader_.loadFromSource(kPlaneVertexShader, kPlaneFragmentShader);
    quad_ = Mesh::createQuad();
    background_texture_ = std::make_unique<GLTexture>();

    PHOTOAR_GL_CHECK(glClearColor(config_.clear_color.x, config_.clear_color.y, config_.clear_color.z, 1.0f));

    initialized_ = true;
    PHOTOAR_INFO("Renderer", "Renderer initialized");
}

void Renderer::setBackground(const cv::Mat& frame) {
    if (frame.empty()) {
        return;
    }
    background_frame_ = frame;
    background_dirty_ = true;
}

void Renderer::render(const Scene& scene, const Mat4& projection, int viewport_width, int viewport_height) {
    PHOTOAR_PROFILE("Renderer::render");

    if (!initialized_) {
        PHOTOAR_THROW_RENDER_ERROR("Renderer used before initialize()", "Renderer::render", "");
    }

    const auto start = std::chrono::steady_clock::now();
    last_frame_stats_ = RenderStats{};
    ++frame_counter_;

    glViewport(0, 0, viewport_width, viewport_height);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    if (config_.draw_background) {
        renderBackground();
    }

    glEnable(GL_DEPTH_TEST);
    glDepthFunc(GL_LESS);
    glFrontFace(GL_CCW);
    glCullFace(GL_BACK);

    scene.rootNode()->enumerateHierarchy([&](const SceneNode& node, const Mat4& world) {
        if (node.geometry() && node.material()) {
            renderPlane(node, world, projection);
        }
    });

    glDisable(GL_CULL_FACE);
    glDisable(GL_DEPTH_TEST);
    gl::checkError("Renderer::render");

    releaseUnusedTextures();

    last_frame_stats_.render_time_ms = std::chrono::duration<float, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

void Renderer::renderBackground() {
    if (background_dirty_) {
        background_texture_->upload(background_frame_);
        background_dirty_ = false;
        ++last_frame_stats_.textures_uploaded;
    }
    if (!background_texture_->hasImage()) {
        return;
    }

    glDisable(GL_DEPTH_TEST);
    glDepthMask(GL_FALSE);

    background_shader_.use();
    background_shader_.setUniform("u_texture", 0);
    background_texture_->bind(0);
    quad_.render();
    background_texture_->unbind();

    glDepthMask(GL_TRUE);
}

void Renderer::renderPlane(const SceneNode& node, const Mat4& world, const Mat4& projection) {
    const PlaneGeometry& geometry = *node.geometry();
    const VideoMaterial& material = *node.material();

    const glm::mat4 proj = glm::make_mat4(projection.data());
    glm::mat4 model = glm::make_mat4(world.data());
    model = glm::scale(model, glm::vec3(geometry.width, geometry.height, 1.0f));
    const glm::mat4 mvp = proj * model;

    GLTexture* texture = material.source ? textureFor(material.source) : nullptr;

    // Quad front face looks along the plane's +Z
    if (material.double_sided) {
        glDisable(GL_CULL_FACE);
    } else {
        glEnable(GL_CULL_FACE);
    }

    plane_shader_.use();
    plane_shader_.setUniform("u_mvp", glm::value_ptr(mvp));
    plane_shader_.setUniform("u_uv_rect", material.uv_rect);
    plane_shader_.setUniform("u_texture", 0);
    plane_shader_.setUniform("u_has_texture", texture ? 1 : 0);

    if (texture) {
        texture->bind(0);
    }
    quad_.render();
    if (texture) {
        texture->unbind();
    }

    ++last_frame_stats_.planes_rendered;
}

GLTexture* Renderer::textureFor(const std::shared_ptr<VideoSource>& source) {
    auto& entry = video_textures_[source.get()];
    if (entry.source.lock() != source) {
        // New source, or an old address reused by a different player
        entry = VideoTexture{};
        entry.source = source;
        entry.texture = std::make_unique<GLTexture>();
    }
    entry.last_used_frame = frame_counter_;

    const cv::Mat& frame = source->currentFrame();
    if (!frame.empty() && source->frameSerial() != entry.serial) {
        entry.texture->upload(frame);
        entry.serial = source->frameSerial();
        ++last_frame_stats_.textures_uploaded;
    }

    return entry.texture->hasImage() ? entry.texture.get() : nullptr;
}

void Renderer::releaseUnusedTextures() {
    for (auto it = video_textures_.begin(); it != video_textures_.end();) {
        const bool expired = it->second.source.expired();
        const bool idle = frame_counter_ - it->second.last_used_frame > kTextureIdleFrames;
        if (expired || idle) {
            it = video_textures_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace photoar
