#ifndef KM_FMAT4_H_
#define KM_FMAT4_H_

#include "km_fvec4.h"
#include <array>
#include <cmath>
#include <cstddef>

namespace kmath {

/**
 * @brief 4x4 matrix with single precision, stored as four Fvec4 columns
 *
 * Default construction gives the identity, not zero(), as for Dmat4.
 */
struct Fmat4 {
    std::array<Fvec4, 4> columns;

    Fmat4() : columns{Fvec4(1, 0, 0, 0), Fvec4(0, 1, 0, 0), Fvec4(0, 0, 1, 0), Fvec4(0, 0, 0, 1)} {}
    Fmat4(const Fvec4& c0, const Fvec4& c1, const Fvec4& c2, const Fvec4& c3)
        : columns{c0, c1, c2, c3} {}

    static Fmat4 fromColumns(const Fvec4& c0, const Fvec4& c1, const Fvec4& c2, const Fvec4& c3) {
        return Fmat4(c0, c1, c2, c3);
    }

    static Fmat4 fromRows(const std::array<float, 4>& r0, const std::array<float, 4>& r1,
                          const std::array<float, 4>& r2, const std::array<float, 4>& r3) {
        return Fmat4(Fvec4(r0[0], r1[0], r2[0], r3[0]),
                     Fvec4(r0[1], r1[1], r2[1], r3[1]),
                     Fvec4(r0[2], r1[2], r2[2], r3[2]),
                     Fvec4(r0[3], r1[3], r2[3], r3[3]));
    }

    static Fmat4 splat(float s) {
        const Fvec4 c = Fvec4::splat(s);
        return Fmat4(c, c, c, c);
    }

    static Fmat4 identity() { return Fmat4(); }
    static Fmat4 zero() { return splat(0.0f); }

    static Fmat4 load(const float* ptr) {
        return Fmat4(Fvec4::load(ptr), Fvec4::load(ptr + 4), Fvec4::load(ptr + 8), Fvec4::load(ptr + 12));
    }

    void store(float* ptr) const {
        columns[0].store(ptr);
        columns[1].store(ptr + 4);
        columns[2].store(ptr + 8);
        columns[3].store(ptr + 12);
    }

    static Fmat4 translation(const Fvec4& t) {
        return Fmat4(Fvec4(1, 0, 0, 0), Fvec4(0, 1, 0, 0), Fvec4(0, 0, 1, 0),
                     Fvec4(t.x(), t.y(), t.z(), 1.0f));
    }

    static Fmat4 scale(const Fvec4& s) {
        return Fmat4(Fvec4(s.x(), 0, 0, 0), Fvec4(0, s.y(), 0, 0), Fvec4(0, 0, s.z(), 0),
                     Fvec4(0, 0, 0, 1));
    }

    static Fmat4 rotationX(float angle) {
        const float c = std::cos(angle), s = std::sin(angle);
        return Fmat4(Fvec4(1, 0, 0, 0), Fvec4(0, c, s, 0), Fvec4(0, -s, c, 0), Fvec4(0, 0, 0, 1));
    }

    static Fmat4 rotationY(float angle) {
        const float c = std::cos(angle), s = std::sin(angle);
        return Fmat4(Fvec4(c, 0, -s, 0), Fvec4(0, 1, 0, 0), Fvec4(s, 0, c, 0), Fvec4(0, 0, 0, 1));
    }

    static Fmat4 rotationZ(float angle) {
        const float c = std::cos(angle), s = std::sin(angle);
        return Fmat4(Fvec4(c, s, 0, 0), Fvec4(-s, c, 0, 0), Fvec4(0, 0, 1, 0), Fvec4(0, 0, 0, 1));
    }

    Fvec4& operator[](size_t col) { return columns[col]; }
    const Fvec4& operator[](size_t col) const { return columns[col]; }

    float& operator()(size_t row, size_t col) { return columns[col][row]; }
    const float& operator()(size_t row, size_t col) const { return columns[col][row]; }

    Fmat4 operator+(const Fmat4& o) const {
        return Fmat4(columns[0] + o.columns[0], columns[1] + o.columns[1],
                     columns[2] + o.columns[2], columns[3] + o.columns[3]);
    }

    Fmat4 operator-(const Fmat4& o) const {
        return Fmat4(columns[0] - o.columns[0], columns[1] - o.columns[1],
                     columns[2] - o.columns[2], columns[3] - o.columns[3]);
    }

    Fmat4 operator-() const { return Fmat4(-columns[0], -columns[1], -columns[2], -columns[3]); }

    Fmat4& operator+=(const Fmat4& o) { return *this = *this + o; }
    Fmat4& operator-=(const Fmat4& o) { return *this = *this - o; }

    Fvec4 operator*(const Fvec4& v) const {
        f32x4 result = _mm_mul_ps(columns[0].inner, lanes::broadcast_f32x4<0>(v.inner));
        result = _mm_fmadd_ps(columns[1].inner, lanes::broadcast_f32x4<1>(v.inner), result);
        result = _mm_fmadd_ps(columns[2].inner, lanes::broadcast_f32x4<2>(v.inner), result);
        result = _mm_fmadd_ps(columns[3].inner, lanes::broadcast_f32x4<3>(v.inner), result);
        return Fvec4(result);
    }

    Fmat4 operator*(const Fmat4& o) const {
        return Fmat4(*this * o.columns[0], *this * o.columns[1],
                     *this * o.columns[2], *this * o.columns[3]);
    }

    Fmat4& operator*=(const Fmat4& o) { return *this = *this * o; }

    bool operator==(const Fmat4& o) const {
        return columns[0] == o.columns[0] && columns[1] == o.columns[1] &&
               columns[2] == o.columns[2] && columns[3] == o.columns[3];
    }

    bool operator!=(const Fmat4& o) const { return !(*this == o); }

    Fmat4 transpose() const {
        const f32x4 c0 = _mm_unpacklo_ps(columns[0].inner, columns[1].inner);
        const f32x4 c1 = _mm_unpackhi_ps(columns[0].inner, columns[1].inner);
        const f32x4 c2 = _mm_unpacklo_ps(columns[2].inner, columns[3].inner);
        const f32x4 c3 = _mm_unpackhi_ps(columns[2].inner, columns[3].inner);
        return Fmat4(Fvec4(_mm_movelh_ps(c0, c2)), Fvec4(_mm_movehl_ps(c2, c0)),
                     Fvec4(_mm_movelh_ps(c1, c3)), Fvec4(_mm_movehl_ps(c3, c1)));
    }

    /// Inverse of a rotation plus translation, see Dmat4::invertSE3()
    Fmat4 invertSE3() const {
        const f32x4 zero = _mm_setzero_ps();
        const f32x4 unit_w = _mm_set_ps(1.0f, 0.0f, 0.0f, 0.0f);

        const Fmat4 rotation_t = Fmat4(Fvec4(_mm_blend_ps(columns[0].inner, zero, 0x8)),
                                       Fvec4(_mm_blend_ps(columns[1].inner, zero, 0x8)),
                                       Fvec4(_mm_blend_ps(columns[2].inner, zero, 0x8)),
                                       Fvec4(unit_w)).transpose();
        const Fvec4 t(_mm_blend_ps(columns[3].inner, zero, 0x8));
        const Fvec4 moved = -(rotation_t * t);

        return Fmat4(rotation_t.columns[0], rotation_t.columns[1], rotation_t.columns[2],
                     Fvec4(_mm_blend_ps(moved.inner, unit_w, 0x8)));
    }

    Fvec4 transformPoint(const Fvec4& p) const {
        return *this * Fvec4(_mm_blend_ps(p.inner, _mm_set1_ps(1.0f), 0x8));
    }

    Fvec4 transformDirection(const Fvec4& d) const {
        return *this * Fvec4(_mm_blend_ps(d.inner, _mm_setzero_ps(), 0x8));
    }

    Fvec4 getTranslation() const { return Fvec4::direction(columns[3].x(), columns[3].y(), columns[3].z()); }
};

inline Fmat4 transpose(const Fmat4& m) { return m.transpose(); }
inline Fmat4 invertSE3(const Fmat4& m) { return m.invertSE3(); }

inline bool approxEqual(const Fmat4& a, const Fmat4& b, float eps) {
    return approxEqual(a.columns[0], b.columns[0], eps) && approxEqual(a.columns[1], b.columns[1], eps) &&
           approxEqual(a.columns[2], b.columns[2], eps) && approxEqual(a.columns[3], b.columns[3], eps);
}

static_assert(sizeof(Fmat4) == 64, "Fmat4 must be four packed Fvec4 columns");
static_assert(alignof(Fmat4) == 16, "Fmat4 must be 16-byte aligned");

} // namespace kmath

#endif // KM_FMAT4_H_
