#ifndef AR_RESOURCE_H_
#define AR_RESOURCE_H_

#include "ar_la.h"
#include <GL/glew.h>
#include <opencv2/core.hpp>
#include <memory>
#include <vector>
#include <unordered_map>
#include <string>

namespace photoar {

namespace gl {

/**
 * @brief Check for OpenGL errors and throw if found
 * @throws ARError (OPENGL)
 */
void checkError(const std::string& operation = "");

std::string getErrorString(GLenum error);

} // namespace gl

#define PHOTOAR_GL_CHECK(operation) \
    do { \
        operation; \
        photoar::gl::checkError(#operation); \
    } while (0)

/**
 * @brief RAII wrapper for OpenGL resources
 */
template<typename T, void(*Deleter)(T)>
class GLResource {
public:
    explicit GLResource(T resource = T{}) : resource_(resource) {}

    ~GLResource() {
        if (resource_ != T{}) {
            Deleter(resource_);
        }
    }

    GLResource(const GLResource&) = delete;
    GLResource& operator=(const GLResource&) = delete;

    GLResource(GLResource&& other) noexcept : resource_(other.release()) {}

    GLResource& operator=(GLResource&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    T get() const { return resource_; }
    T release() {
        T tmp = resource_;
        resource_ = T{};
        return tmp;
    }

    void reset(T resource = T{}) {
        if (resource_ != T{}) {
            Deleter(resource_);
        }
        resource_ = resource;
    }

    explicit operator bool() const { return resource_ != T{}; }

private:
    T resource_;
};

namespace detail {
    inline void deleteBuffer(GLuint buffer) { if (buffer) glDeleteBuffers(1, &buffer); }
    inline void deleteTexture(GLuint texture) { if (texture) glDeleteTextures(1, &texture); }
    inline void deleteProgram(GLuint program) { if (program) glDeleteProgram(program); }
    inline void deleteVertexArray(GLuint vao) { if (vao) glDeleteVertexArrays(1, &vao); }
}

using GLBuffer = GLResource<GLuint, detail::deleteBuffer>;
using GLTextureHandle = GLResource<GLuint, detail::deleteTexture>;
using GLProgram = GLResource<GLuint, detail::deleteProgram>;
using GLVertexArray = GLResource<GLuint, detail::deleteVertexArray>;

/**
 * @brief Shader program built from inline GLSL
 */
class ShaderProgram {
public:
    ShaderProgram() = default;
    ~ShaderProgram() = default;

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;
    ShaderProgram(ShaderProgram&&) = default;
    ShaderProgram& operator=(ShaderProgram&&) = default;

    /**
     * @brief Compile and link
     * @throws ARError (RENDERING) with the driver's info log on failure
     */
    void loadFromSource(const std::string& vertex_source, const std::string& fragment_source);

    void use() const;

    GLuint getId() const { return program_.get(); }
    bool isValid() const { return program_.get() != 0; }

    void setUniform(const std::string& name, float value) const;
    void setUniform(const std::string& name, int value) const;
    void setUniform(const std::string& name, const Vec3& value) const;
    void setUniform(const std::string& name, const Mat4& value) const;
    void setUniform(const std::string& name, const Rect2& value) const; // as vec4(x, y, w, h)
    void setUniform(const std::string& name, const float* mat4_column_major) const;

    GLint getUniformLocation(const std::string& name) const;

private:
    GLuint compileShader(GLenum type, const std::string& source) const;

    GLProgram program_;
    mutable std::unordered_map<std::string, GLint> uniform_cache_;
};

/**
 * @brief Indexed triangle mesh with position and texture coordinates
 */
class Mesh {
public:
    struct Vertex {
        Vec3 position;
        float u, v;

        Vertex() = default;
        Vertex(const Vec3& pos, float tex_u, float tex_v) : position(pos), u(tex_u), v(tex_v) {}
    };

    Mesh() = default;
    ~Mesh() = default;

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;
    Mesh(Mesh&&) = default;
    Mesh& operator=(Mesh&&) = default;

    void create(const std::vector<Vertex>& vertices, const std::vector<unsigned int>& indices);
    void render() const;

    bool isValid() const { return vao_.get() != 0 && index_count_ > 0; }
    size_t getVertexCount() const { return vertex_count_; }
    size_t getIndexCount() const { return index_count_; }

    /**
     * @brief Unit quad in the X/Y plane, centered, v = 0 at the top edge
     */
    static Mesh createQuad();

private:
    GLVertexArray vao_;
    GLBuffer vbo_;
    GLBuffer ebo_;

    size_t vertex_count_ = 0;
    size_t index_count_ = 0;
};

/**
 * @brief 2D texture fed from OpenCV images
 */
class GLTexture {
public:
    GLTexture();
    ~GLTexture() = default;

    GLTexture(const GLTexture&) = delete;
    GLTexture& operator=(const GLTexture&) = delete;
    GLTexture(GLTexture&&) = default;
    GLTexture& operator=(GLTexture&&) = default;

    /**
     * @brief Upload a BGR, BGRA or grayscale 8-bit image, reallocating on size change
     */
    void upload(const cv::Mat& image);

    void bind(unsigned int unit = 0) const;
    void unbind() const;

    GLuint getId() const { return texture_.get(); }
    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    bool hasImage() const { return width_ > 0 && height_ > 0; }

private:
    GLTextureHandle texture_;
    int width_ = 0, height_ = 0;
    GLenum format_ = GL_BGR;
};

} // namespace photoar

#endif // AR_RESOURCE_H_
