#ifndef AR_LA_H_
#define AR_LA_H_

#include <array>
#include <cmath>
#include <cstring>
#include <limits>
#include <cassert>

namespace photoar {
    inline constexpr float PI = 3.14159265358979323846f;
    inline constexpr float PI_2 = PI * 0.5f;
    inline constexpr float EPSILON = std::numeric_limits<float>::epsilon() * 10.0f;
    inline constexpr float DEG_TO_RAD = PI / 180.0f;
    inline constexpr float RAD_TO_DEG = 180.0f / PI;
}

namespace photoar {

/**
 * @brief 2D size in arbitrary units (pixels or meters)
 */
struct Size2 {
    float width, height;

    constexpr Size2() : width(0), height(0) {}
    constexpr Size2(float w, float h) : width(w), height(h) {}

    constexpr bool isEmpty() const { return width <= 0.0f || height <= 0.0f; }
    float aspect() const { return isEmpty() ? 0.0f : width / height; }
    constexpr Size2 swapped() const { return {height, width}; }

    bool operator==(const Size2& o) const {
        return std::abs(width - o.width) < EPSILON && std::abs(height - o.height) < EPSILON;
    }
    bool operator!=(const Size2& o) const { return !(*this == o); }
};

/**
 * @brief Axis-aligned rectangle, used for normalized texture coordinates
 */
struct Rect2 {
    float x = 0.0f, y = 0.0f, width = 1.0f, height = 1.0f;

    constexpr Rect2() = default;
    constexpr Rect2(float x_, float y_, float w, float h) : x(x_), y(y_), width(w), height(h) {}

    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    static constexpr Rect2 unit() { return {0.0f, 0.0f, 1.0f, 1.0f}; }
};

struct Vec3 {
    float x, y, z;

    constexpr Vec3() : x(0), y(0), z(0) {}
    constexpr Vec3(float X, float Y, float Z) : x(X), y(Y), z(Z) {}

    constexpr Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    constexpr Vec3 operator-() const { return {-x, -y, -z}; }
    constexpr Vec3 operator*(float s) const { return {x*s, y*s, z*s}; }

    constexpr Vec3& operator+=(const Vec3& o) { x += o.x; y += o.y; z += o.z; return *this; }

    bool operator==(const Vec3& o) const {
        return std::abs(x - o.x) < EPSILON &&
               std::abs(y - o.y) < EPSILON &&
               std::abs(z - o.z) < EPSILON;
    }
    bool operator!=(const Vec3& o) const { return !(*this == o); }

    constexpr float dot(const Vec3& o) const { return x*o.x + y*o.y + z*o.z; }
    constexpr Vec3 cross(const Vec3& o) const {
        return { y*o.z - z*o.y, z*o.x - x*o.z, x*o.y - y*o.x };
    }

    constexpr float lengthSquared() const { return dot(*this); }
    float length() const { return std::sqrt(lengthSquared()); }

    Vec3 normalized() const {
        const float len = length();
        if (len < EPSILON) {
            return *this;
        }
        return *this * (1.0f / len);
    }

    static constexpr Vec3 zero() { return {0, 0, 0}; }
    static constexpr Vec3 one() { return {1, 1, 1}; }
    static constexpr Vec3 up() { return {0, 1, 0}; }
};

constexpr Vec3 operator*(float s, const Vec3& v) { return v * s; }

/**
 * @brief Column-major 4x4 matrix (OpenGL layout)
 */
struct alignas(16) Mat4 {
    std::array<float, 16> m;

    constexpr Mat4( float m00, float m01, float m02, float m03,
                   float m10, float m11, float m12, float m13,
                   float m20, float m21, float m22, float m23,
                   float m30, float m31, float m32, float m33 )
        : m{ m00,m01,m02,m03,
            m10,m11,m12,m13,
            m20,m21,m22,m23,
            m30,m31,m32,m33 } {}

    explicit Mat4(const float* arr) { std::memcpy(m.data(), arr, 16*sizeof(float)); }

    constexpr Mat4() : m{1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,0,1} {}

    constexpr const float* data() const { return m.data(); }
    float* data() { return m.data(); }

    constexpr float& operator()(size_t row, size_t col) { return m[col*4 + row]; }
    constexpr const float& operator()(size_t row, size_t col) const { return m[col*4 + row]; }

    Mat4 operator*(const Mat4& b) const {
        Mat4 result{};
        result.m.fill(0);

        for (int i = 0; i < 4; ++i) {
            for (int k = 0; k < 4; ++k) {
                const float a_ik = m[k*4 + i];
                for (int j = 0; j < 4; ++j) {
                    result.m[j*4 + i] += a_ik * b.m[j*4 + k];
                }
            }
        }
        return result;
    }

    bool operator==(const Mat4& other) const {
        for (size_t i = 0; i < 16; ++i) {
            if (std::abs(m[i] - other.m[i]) > EPSILON) return false;
        }
        return true;
    }
    bool operator!=(const Mat4& other) const { return !(*this == other); }

    static constexpr Mat4 identity() { return Mat4(); }

    static constexpr Mat4 translation(const Vec3& t) {
        Mat4 r = identity();
        r.m[12] = t.x; r.m[13] = t.y; r.m[14] = t.z;
        return r;
    }

    static constexpr Mat4 scale(const Vec3& s) {
        Mat4 r{};
        r.m = {s.x,0,0,0, 0,s.y,0,0, 0,0,s.z,0, 0,0,0,1};
        return r;
    }

    static Mat4 rotationX(float angle) {
        const float c = std::cos(angle), s = std::sin(angle);
        return Mat4{1,0,0,0, 0,c,s,0, 0,-s,c,0, 0,0,0,1};
    }

    static Mat4 rotationY(float angle) {
        const float c = std::cos(angle), s = std::sin(angle);
        return Mat4{c,0,-s,0, 0,1,0,0, s,0,c,0, 0,0,0,1};
    }

    static Mat4 rotationZ(float angle) {
        const float c = std::cos(angle), s = std::sin(angle);
        return Mat4{c,s,0,0, -s,c,0,0, 0,0,1,0, 0,0,0,1};
    }

    // Node convention: roll about Z, then yaw about Y, then pitch about X
    static Mat4 rotationEuler(const Vec3& euler) {
        return rotationX(euler.x) * rotationY(euler.y) * rotationZ(euler.z);
    }

    /**
     * @brief Build a rigid transform from a row-major 3x3 rotation and a translation
     */
    static Mat4 rigid(const float* rotation_row_major, const Vec3& t) {
        Mat4 r = identity();
        for (size_t row = 0; row < 3; ++row) {
            for (size_t col = 0; col < 3; ++col) {
                r(row, col) = rotation_row_major[row * 3 + col];
            }
        }
        r(0, 3) = t.x; r(1, 3) = t.y; r(2, 3) = t.z;
        return r;
    }

    /**
     * @brief Inverse of a rotation+translation matrix (no scale, no skew)
     */
    Mat4 inverseRigid() const {
        Mat4 r = identity();
        for (size_t row = 0; row < 3; ++row) {
            for (size_t col = 0; col < 3; ++col) {
                r(row, col) = (*this)(col, row);
            }
        }
        const Vec3 t = getTranslation();
        for (size_t row = 0; row < 3; ++row) {
            r(row, 3) = -(r(row, 0) * t.x + r(row, 1) * t.y + r(row, 2) * t.z);
        }
        return r;
    }

    // Right-handed perspective projection (OpenGL convention)
    static Mat4 perspectiveRH(float fovy, float aspect, float zNear, float zFar) {
        assert(aspect > EPSILON && "Invalid aspect ratio");
        assert(zFar > zNear && "Invalid depth range");

        const float f = 1.0f / std::tan(fovy * 0.5f);
        const float depth_range = zNear - zFar;

        Mat4 r{};
        r.m = {f/aspect, 0, 0, 0,
               0, f, 0, 0,
               0, 0, (zFar+zNear)/depth_range, -1,
               0, 0, (2*zFar*zNear)/depth_range, 0};
        return r;
    }

    constexpr Vec3 transformPoint(const Vec3& v) const {
        const float x = m[0]*v.x + m[4]*v.y + m[8]*v.z  + m[12];
        const float y = m[1]*v.x + m[5]*v.y + m[9]*v.z  + m[13];
        const float z = m[2]*v.x + m[6]*v.y + m[10]*v.z + m[14];
        const float w = m[3]*v.x + m[7]*v.y + m[11]*v.z + m[15];

        if (w > EPSILON || w < -EPSILON) {
            if (w - 1.0f > EPSILON || 1.0f - w > EPSILON) {
                return {x/w, y/w, z/w};
            }
        }
        return {x, y, z};
    }

    constexpr Vec3 transformVector(const Vec3& v) const {
        return {m[0]*v.x + m[4]*v.y + m[8]*v.z,
                m[1]*v.x + m[5]*v.y + m[9]*v.z,
                m[2]*v.x + m[6]*v.y + m[10]*v.z};
    }

    constexpr Vec3 getTranslation() const {
        return {m[12], m[13], m[14]};
    }

    Vec3 getScale() const {
        const Vec3 x_axis{m[0], m[1], m[2]};
        const Vec3 y_axis{m[4], m[5], m[6]};
        const Vec3 z_axis{m[8], m[9], m[10]};
        return {x_axis.length(), y_axis.length(), z_axis.length()};
    }
};

} // namespace photoar

#endif // AR_LA_H_
