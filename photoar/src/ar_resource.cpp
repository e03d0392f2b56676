#include "ar_resource.h"
#include "ar_error.h"
#include <opencv2/imgproc.hpp>
#include <cstddef>

namespace photoar {

// OpenGL error checking
namespace gl {

void checkError(const std::string& operation) {
    GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        std::string msg = "OpenGL error: " + getErrorString(error);
        if (!operation.empty()) {
            msg += " (during: " + operation + ")";
        }
        // Drain anything queued behind the first error
        while (glGetError() != GL_NO_ERROR) {}
        throw ARError(ARError::Category::OPENGL, ARError::Severity::ERROR,
                      msg, operation, "Check OpenGL state and parameters");
    }
}

std::string getErrorString(GLenum error) {
    switch (error) {
        case GL_NO_ERROR: return "GL_NO_ERROR";
        case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
        default: return "Unknown OpenGL error";
    }
}

} // namespace gl

// ═══════════════════════════════════════════════════════════════════════════
// ShaderProgram
// ═══════════════════════════════════════════════════════════════════════════

void ShaderProgram::loadFromSource(const std::string& vertex_source, const std::string& fragment_source) {
    GLuint program_id = glCreateProgram();
    if (program_id == 0) {
        PHOTOAR_THROW_RENDER_ERROR("Failed to create shader program", "ShaderProgram::loadFromSource",
                                   "Make sure a GL context is current");
    }
    GLProgram program(program_id);

    GLuint vertex_shader = compileShader(GL_VERTEX_SHADER, vertex_source);
    GLuint fragment_shader = 0;
    try {
        fragment_shader = compileShader(GL_FRAGMENT_SHADER, fragment_source);
    } catch (const ARError&) {
        glDeleteShader(vertex_shader);
        throw;
    }

    glAttachShader(program_id, vertex_shader);
    glAttachShader(program_id, fragment_shader);
    glLinkProgram(program_id);

    // Linked programs keep their own copy
    glDeleteShader(vertex_shader);
    glDeleteShader(fragment_shader);

    GLint success = GL_FALSE;
    glGetProgramiv(program_id, GL_LINK_STATUS, &success);
    if (!success) {
        GLchar info_log[1024];
        glGetProgramInfoLog(program_id, sizeof(info_log), nullptr, info_log);
        PHOTOAR_THROW_RENDER_ERROR(std::string("Program linking failed: ") + info_log,
                                   "ShaderProgram::loadFromSource", "");
    }

    program_ = std::move(program);
    uniform_cache_.clear();
}

GLuint ShaderProgram::compileShader(GLenum type, const std::string& source) const {
    GLuint shader = glCreateShader(type);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint success = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        GLchar info_log[1024];
        glGetShaderInfoLog(shader, sizeof(info_log), nullptr, info_log);
        glDeleteShader(shader);
        PHOTOAR_THROW_RENDER_ERROR(std::string(type == GL_VERTEX_SHADER ? "Vertex" : "Fragment") +
                                   " shader compilation failed: " + info_log,
                                   "ShaderProgram::compileShader", "");
    }
    return shader;
}

void ShaderProgram::use() const {
    if (!isValid()) {
        PHOTOAR_ERROR("Shader", "Attempting to use invalid shader program");
        return;
    }
    glUseProgram(program_.get());
}

GLint ShaderProgram::getUniformLocation(const std::string& name) const {
    auto it = uniform_cache_.find(name);
    if (it != uniform_cache_.end()) {
        return it->second;
    }

    GLint location = glGetUniformLocation(program_.get(), name.c_str());
    uniform_cache_[name] = location;

    if (location == -1) {
        PHOTOAR_WARN("Shader", "Uniform not found: " + name);
    }

    return location;
}

void ShaderProgram::setUniform(const std::string& name, float value) const {
    GLint location = getUniformLocation(name);
    if (location >= 0) {
        glUniform1f(location, value);
    }
}

void ShaderProgram::setUniform(const std::string& name, int value) const {
    GLint location = getUniformLocation(name);
    if (location >= 0) {
        glUniform1i(location, value);
    }
}

void ShaderProgram::setUniform(const std::string& name, const Vec3& value) const {
    GLint location = getUniformLocation(name);
    if (location >= 0) {
        glUniform3f(location, value.x, value.y, value.z);
    }
}

void ShaderProgram::setUniform(const std::string& name, const Mat4& value) const {
    setUniform(name, value.data());
}

void ShaderProgram::setUniform(const std::string& name, const Rect2& value) const {
    GLint location = getUniformLocation(name);
    if (location >= 0) {
        glUniform4f(location, value.x, value.y, value.width, value.height);
    }
}

void ShaderProgram::setUniform(const std::string& name, const float* mat4_column_major) const {
    GLint location = getUniformLocation(name);
    if (location >= 0) {
        glUniformMatrix4fv(location, 1, GL_FALSE, mat4_column_major);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Mesh
// ═══════════════════════════════════════════════════════════════════════════

void Mesh::create(const std::vector<Vertex>& vertices, const std::vector<unsigned int>& indices) {
    GLuint vao, vbo, ebo;
    PHOTOAR_GL_CHECK(glGenVertexArrays(1, &vao));
    vao_ = GLVertexArray(vao);
    PHOTOAR_GL_CHECK(glGenBuffers(1, &vbo));
    vbo_ = GLBuffer(vbo);
    PHOTOAR_GL_CHECK(glGenBuffers(1, &ebo));
    ebo_ = GLBuffer(ebo);

    glBindVertexArray(vao);

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, vertices.size() * sizeof(Vertex), vertices.data(), GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, indices.size() * sizeof(unsigned int), indices.data(), GL_STATIC_DRAW);

    // Position attribute
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                          reinterpret_cast<void*>(offsetof(Vertex, position)));

    // Texture coordinate attribute
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(Vertex),
                          reinterpret_cast<void*>(offsetof(Vertex, u)));

    glBindVertexArray(0);
    gl::checkError("Mesh::create");

    vertex_count_ = vertices.size();
    index_count_ = indices.size();
}

void Mesh::render() const {
    if (!isValid()) {
        return;
    }
    glBindVertexArray(vao_.get());
    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(index_count_), GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}

Mesh Mesh::createQuad() {
    const std::vector<Vertex> vertices = {
        Vertex(Vec3(-0.5f,  0.5f, 0.0f), 0.0f, 0.0f),
        Vertex(Vec3( 0.5f,  0.5f, 0.0f), 1.0f, 0.0f),
        Vertex(Vec3( 0.5f, -0.5f, 0.0f), 1.0f, 1.0f),
        Vertex(Vec3(-0.5f, -0.5f, 0.0f), 0.0f, 1.0f),
    };
    const std::vector<unsigned int> indices = {0, 3, 2, 0, 2, 1};

    Mesh mesh;
    mesh.create(vertices, indices);
    return mesh;
}

// ═══════════════════════════════════════════════════════════════════════════
// GLTexture
// ═══════════════════════════════════════════════════════════════════════════

GLTexture::GLTexture() {
    GLuint id = 0;
    PHOTOAR_GL_CHECK(glGenTextures(1, &id));
    texture_ = GLTextureHandle(id);

    PHOTOAR_GL_CHECK(glBindTexture(GL_TEXTURE_2D, id));
    PHOTOAR_GL_CHECK(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR));
    PHOTOAR_GL_CHECK(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR));
    PHOTOAR_GL_CHECK(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE));
    PHOTOAR_GL_CHECK(glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE));
    glBindTexture(GL_TEXTURE_2D, 0);
}

void GLTexture::upload(const cv::Mat& image) {
    if (image.empty()) {
        return;
    }
    if (image.depth() != CV_8U) {
        PHOTOAR_THROW_RENDER_ERROR("Only 8-bit images can be uploaded", "GLTexture::upload", "");
    }

    GLenum format = GL_BGR;
    switch (image.channels()) {
        case 1: format = GL_RED; break;
        case 3: format = GL_BGR; break;
        case 4: format = GL_BGRA; break;
        default:
            PHOTOAR_THROW_RENDER_ERROR("Unsupported channel count " + std::to_string(image.channels()),
                                       "GLTexture::upload", "");
    }

    const cv::Mat pixels = image.isContinuous() ? image : image.clone();

    PHOTOAR_GL_CHECK(glBindTexture(GL_TEXTURE_2D, texture_.get()));
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    if (pixels.cols != width_ || pixels.rows != height_ || format != format_) {
        width_ = pixels.cols;
        height_ = pixels.rows;
        format_ = format;
        const GLint internal_format = format == GL_RED ? GL_R8 : GL_RGBA8;
        PHOTOAR_GL_CHECK(glTexImage2D(GL_TEXTURE_2D, 0, internal_format, width_, height_, 0,
                                      format_, GL_UNSIGNED_BYTE, pixels.data));
        if (format == GL_RED) {
            const GLint swizzle[] = {GL_RED, GL_RED, GL_RED, GL_ONE};
            glTexParameteriv(GL_TEXTURE_2D, GL_TEXTURE_SWIZZLE_RGBA, swizzle);
        }
    } else {
        PHOTOAR_GL_CHECK(glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width_, height_,
                                         format_, GL_UNSIGNED_BYTE, pixels.data));
    }

    glBindTexture(GL_TEXTURE_2D, 0);
}

void GLTexture::bind(unsigned int unit) const {
    PHOTOAR_GL_CHECK(glActiveTexture(GL_TEXTURE0 + unit));
    PHOTOAR_GL_CHECK(glBindTexture(GL_TEXTURE_2D, texture_.get()));
}

void GLTexture::unbind() const {
    glBindTexture(GL_TEXTURE_2D, 0);
}

} // namespace photoar
