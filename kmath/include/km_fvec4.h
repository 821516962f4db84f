#ifndef KM_FVEC4_H_
#define KM_FVEC4_H_

#include "km_lanes.h"
#include <cmath>
#include <cstddef>

namespace kmath {

/**
 * @brief 4D vector with single precision, packed in one 128-bit register
 */
struct Fvec4 {
    f32x4 inner;

    Fvec4() : inner(_mm_setzero_ps()) {}
    Fvec4(float X, float Y, float Z, float W) : inner(_mm_set_ps(W, Z, Y, X)) {}
    explicit Fvec4(f32x4 v) : inner(v) {}

    static Fvec4 splat(float s) { return Fvec4(_mm_set1_ps(s)); }
    static Fvec4 zero() { return Fvec4(); }
    static Fvec4 point(float X, float Y, float Z) { return Fvec4(X, Y, Z, 1.0f); }
    static Fvec4 direction(float X, float Y, float Z) { return Fvec4(X, Y, Z, 0.0f); }

    static Fvec4 load(const float* ptr) { return Fvec4(_mm_loadu_ps(ptr)); }
    void store(float* ptr) const { _mm_storeu_ps(ptr, inner); }

    float x() const { return data()[0]; }
    float y() const { return data()[1]; }
    float z() const { return data()[2]; }
    float w() const { return data()[3]; }

    float* data() { return reinterpret_cast<float*>(&inner); }
    const float* data() const { return reinterpret_cast<const float*>(&inner); }

    float& operator[](size_t index) { return data()[index]; }
    const float& operator[](size_t index) const { return data()[index]; }

    Fvec4 operator+(const Fvec4& o) const { return Fvec4(_mm_add_ps(inner, o.inner)); }
    Fvec4 operator-(const Fvec4& o) const { return Fvec4(_mm_sub_ps(inner, o.inner)); }
    Fvec4 operator*(const Fvec4& o) const { return Fvec4(_mm_mul_ps(inner, o.inner)); }
    Fvec4 operator/(const Fvec4& o) const { return Fvec4(_mm_div_ps(inner, o.inner)); }

    Fvec4 operator+(float s) const { return Fvec4(_mm_add_ps(inner, _mm_set1_ps(s))); }
    Fvec4 operator-(float s) const { return Fvec4(_mm_sub_ps(inner, _mm_set1_ps(s))); }
    Fvec4 operator*(float s) const { return Fvec4(_mm_mul_ps(inner, _mm_set1_ps(s))); }
    Fvec4 operator/(float s) const { return Fvec4(_mm_div_ps(inner, _mm_set1_ps(s))); }

    Fvec4 operator-() const { return Fvec4(_mm_xor_ps(inner, _mm_set1_ps(-0.0f))); }

    Fvec4& operator+=(const Fvec4& o) { inner = _mm_add_ps(inner, o.inner); return *this; }
    Fvec4& operator-=(const Fvec4& o) { inner = _mm_sub_ps(inner, o.inner); return *this; }
    Fvec4& operator*=(const Fvec4& o) { inner = _mm_mul_ps(inner, o.inner); return *this; }
    Fvec4& operator/=(const Fvec4& o) { inner = _mm_div_ps(inner, o.inner); return *this; }

    Fvec4& operator+=(float s) { inner = _mm_add_ps(inner, _mm_set1_ps(s)); return *this; }
    Fvec4& operator-=(float s) { inner = _mm_sub_ps(inner, _mm_set1_ps(s)); return *this; }
    Fvec4& operator*=(float s) { inner = _mm_mul_ps(inner, _mm_set1_ps(s)); return *this; }
    Fvec4& operator/=(float s) { inner = _mm_div_ps(inner, _mm_set1_ps(s)); return *this; }

    bool operator==(const Fvec4& o) const { return lanes::all_equal_f32x4(inner, o.inner); }
    bool operator!=(const Fvec4& o) const { return !(*this == o); }

    float dot(const Fvec4& o) const { return lanes::hsum_f32x4(_mm_mul_ps(inner, o.inner)); }

    Fvec4 cross(const Fvec4& o) const {
        constexpr int yzx = _MM_SHUFFLE(3, 0, 2, 1);
        const f32x4 left = _mm_mul_ps(inner, _mm_shuffle_ps(o.inner, o.inner, yzx));
        const f32x4 right = _mm_mul_ps(o.inner, _mm_shuffle_ps(inner, inner, yzx));
        const f32x4 diff = _mm_sub_ps(left, right);
        return Fvec4(_mm_blend_ps(_mm_shuffle_ps(diff, diff, yzx), _mm_setzero_ps(), 0x8));
    }

    Fvec4 min(const Fvec4& o) const { return Fvec4(lanes::min_f32x4(inner, o.inner)); }
    Fvec4 max(const Fvec4& o) const { return Fvec4(lanes::max_f32x4(inner, o.inner)); }

    float minReduce() const { return lanes::hmin_f32x4(inner); }
    float maxReduce() const { return lanes::hmax_f32x4(inner); }

    Fvec4 floor() const { return Fvec4(_mm_floor_ps(inner)); }

    float lengthSquared() const { return dot(*this); }
    float length() const { return std::sqrt(lengthSquared()); }
    Fvec4 normalized() const { return *this / length(); }
};

inline Fvec4 operator+(float s, const Fvec4& v) { return Fvec4(_mm_add_ps(_mm_set1_ps(s), v.inner)); }
inline Fvec4 operator-(float s, const Fvec4& v) { return Fvec4(_mm_sub_ps(_mm_set1_ps(s), v.inner)); }
inline Fvec4 operator*(float s, const Fvec4& v) { return Fvec4(_mm_mul_ps(_mm_set1_ps(s), v.inner)); }
inline Fvec4 operator/(float s, const Fvec4& v) { return Fvec4(_mm_div_ps(_mm_set1_ps(s), v.inner)); }

inline float dot(const Fvec4& a, const Fvec4& b) { return a.dot(b); }
inline Fvec4 cross(const Fvec4& a, const Fvec4& b) { return a.cross(b); }
inline Fvec4 min(const Fvec4& a, const Fvec4& b) { return a.min(b); }
inline Fvec4 max(const Fvec4& a, const Fvec4& b) { return a.max(b); }
inline float min(const Fvec4& v) { return v.minReduce(); }
inline float max(const Fvec4& v) { return v.maxReduce(); }
inline Fvec4 floor(const Fvec4& v) { return v.floor(); }

inline bool approxEqual(const Fvec4& a, const Fvec4& b, float eps) {
    return lanes::hmax_f32x4(lanes::abs_f32x4(_mm_sub_ps(a.inner, b.inner))) <= eps;
}

static_assert(sizeof(Fvec4) == 16, "Fvec4 must fill exactly one 128-bit register");
static_assert(alignof(Fvec4) == 16, "Fvec4 must be 16-byte aligned");

} // namespace kmath

#endif // KM_FVEC4_H_
