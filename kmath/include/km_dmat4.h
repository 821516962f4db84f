#ifndef KM_DMAT4_H_
#define KM_DMAT4_H_

#include "km_dvec4.h"
#include <array>
#include <cmath>
#include <cstddef>

namespace kmath {

/**
 * @brief 4x4 matrix with double precision, stored as four Dvec4 columns
 *
 * Column-major: element (row r, col c) is columns[c][r]. A default
 * constructed matrix is the identity, not the zero matrix; ask for zero()
 * explicitly when an all-zero start is wanted.
 */
struct Dmat4 {
    std::array<Dvec4, 4> columns;

    Dmat4() : columns{Dvec4(1, 0, 0, 0), Dvec4(0, 1, 0, 0), Dvec4(0, 0, 1, 0), Dvec4(0, 0, 0, 1)} {}
    Dmat4(const Dvec4& c0, const Dvec4& c1, const Dvec4& c2, const Dvec4& c3)
        : columns{c0, c1, c2, c3} {}

    static Dmat4 fromColumns(const Dvec4& c0, const Dvec4& c1, const Dvec4& c2, const Dvec4& c3) {
        return Dmat4(c0, c1, c2, c3);
    }

    static Dmat4 fromRows(const std::array<double, 4>& r0, const std::array<double, 4>& r1,
                          const std::array<double, 4>& r2, const std::array<double, 4>& r3) {
        return Dmat4(Dvec4(r0[0], r1[0], r2[0], r3[0]),
                     Dvec4(r0[1], r1[1], r2[1], r3[1]),
                     Dvec4(r0[2], r1[2], r2[2], r3[2]),
                     Dvec4(r0[3], r1[3], r2[3], r3[3]));
    }

    static Dmat4 splat(double s) {
        const Dvec4 c = Dvec4::splat(s);
        return Dmat4(c, c, c, c);
    }

    static Dmat4 identity() { return Dmat4(); }
    static Dmat4 zero() { return splat(0.0); }

    /// Load 16 column-major doubles, no alignment requirement
    static Dmat4 load(const double* ptr) {
        return Dmat4(Dvec4::load(ptr), Dvec4::load(ptr + 4), Dvec4::load(ptr + 8), Dvec4::load(ptr + 12));
    }

    void store(double* ptr) const {
        columns[0].store(ptr);
        columns[1].store(ptr + 4);
        columns[2].store(ptr + 8);
        columns[3].store(ptr + 12);
    }

    static Dmat4 translation(const Dvec4& t) {
        return Dmat4(Dvec4(1, 0, 0, 0), Dvec4(0, 1, 0, 0), Dvec4(0, 0, 1, 0),
                     Dvec4(t.x(), t.y(), t.z(), 1.0));
    }

    static Dmat4 scale(const Dvec4& s) {
        return Dmat4(Dvec4(s.x(), 0, 0, 0), Dvec4(0, s.y(), 0, 0), Dvec4(0, 0, s.z(), 0),
                     Dvec4(0, 0, 0, 1));
    }

    static Dmat4 rotationX(double angle) {
        const double c = std::cos(angle), s = std::sin(angle);
        return Dmat4(Dvec4(1, 0, 0, 0), Dvec4(0, c, s, 0), Dvec4(0, -s, c, 0), Dvec4(0, 0, 0, 1));
    }

    static Dmat4 rotationY(double angle) {
        const double c = std::cos(angle), s = std::sin(angle);
        return Dmat4(Dvec4(c, 0, -s, 0), Dvec4(0, 1, 0, 0), Dvec4(s, 0, c, 0), Dvec4(0, 0, 0, 1));
    }

    static Dmat4 rotationZ(double angle) {
        const double c = std::cos(angle), s = std::sin(angle);
        return Dmat4(Dvec4(c, s, 0, 0), Dvec4(-s, c, 0, 0), Dvec4(0, 0, 1, 0), Dvec4(0, 0, 0, 1));
    }

    Dvec4& operator[](size_t col) { return columns[col]; }
    const Dvec4& operator[](size_t col) const { return columns[col]; }

    double& operator()(size_t row, size_t col) { return columns[col][row]; }
    const double& operator()(size_t row, size_t col) const { return columns[col][row]; }

    Dmat4 operator+(const Dmat4& o) const {
        return Dmat4(columns[0] + o.columns[0], columns[1] + o.columns[1],
                     columns[2] + o.columns[2], columns[3] + o.columns[3]);
    }

    Dmat4 operator-(const Dmat4& o) const {
        return Dmat4(columns[0] - o.columns[0], columns[1] - o.columns[1],
                     columns[2] - o.columns[2], columns[3] - o.columns[3]);
    }

    Dmat4 operator-() const { return Dmat4(-columns[0], -columns[1], -columns[2], -columns[3]); }

    Dmat4& operator+=(const Dmat4& o) { return *this = *this + o; }
    Dmat4& operator-=(const Dmat4& o) { return *this = *this - o; }

    /**
     * @brief Matrix-vector product as a combination of the columns
     *
     * result = c0*v.x + c1*v.y + c2*v.z + c3*v.w, each lane of v broadcast
     * across the register and accumulated with FMA.
     */
    Dvec4 operator*(const Dvec4& v) const {
        f64x4 result = _mm256_mul_pd(columns[0].inner, lanes::broadcast_f64x4<0>(v.inner));
        result = _mm256_fmadd_pd(columns[1].inner, lanes::broadcast_f64x4<1>(v.inner), result);
        result = _mm256_fmadd_pd(columns[2].inner, lanes::broadcast_f64x4<2>(v.inner), result);
        result = _mm256_fmadd_pd(columns[3].inner, lanes::broadcast_f64x4<3>(v.inner), result);
        return Dvec4(result);
    }

    // Column j of the product is this matrix applied to column j of o
    Dmat4 operator*(const Dmat4& o) const {
        return Dmat4(*this * o.columns[0], *this * o.columns[1],
                     *this * o.columns[2], *this * o.columns[3]);
    }

    Dmat4& operator*=(const Dmat4& o) { return *this = *this * o; }

    bool operator==(const Dmat4& o) const {
        return columns[0] == o.columns[0] && columns[1] == o.columns[1] &&
               columns[2] == o.columns[2] && columns[3] == o.columns[3];
    }

    bool operator!=(const Dmat4& o) const { return !(*this == o); }

    Dmat4 transpose() const {
        // [a0 b0 a2 b2], [a1 b1 a3 b3], [c0 d0 c2 d2], [c1 d1 c3 d3]
        const f64x4 c0 = _mm256_unpacklo_pd(columns[0].inner, columns[1].inner);
        const f64x4 c1 = _mm256_unpackhi_pd(columns[0].inner, columns[1].inner);
        const f64x4 c2 = _mm256_unpacklo_pd(columns[2].inner, columns[3].inner);
        const f64x4 c3 = _mm256_unpackhi_pd(columns[2].inner, columns[3].inner);
        return Dmat4(Dvec4(_mm256_permute2f128_pd(c0, c2, 0x20)),
                     Dvec4(_mm256_permute2f128_pd(c1, c3, 0x20)),
                     Dvec4(_mm256_permute2f128_pd(c0, c2, 0x31)),
                     Dvec4(_mm256_permute2f128_pd(c1, c3, 0x31)));
    }

    /**
     * @brief Inverse of a rigid transform [R | t; 0 0 0 1]
     *
     * Returns [R^T | -R^T t; 0 0 0 1]. The input must be a rotation plus a
     * translation; scaled or skewed matrices give a wrong result silently.
     * Use invertSE3Checked() from km_se3.h when the input is not trusted.
     */
    Dmat4 invertSE3() const {
        const f64x4 zero = _mm256_setzero_pd();
        const f64x4 unit_w = _mm256_set_pd(1.0, 0.0, 0.0, 0.0);

        const Dmat4 rotation_t = Dmat4(Dvec4(_mm256_blend_pd(columns[0].inner, zero, 0x8)),
                                       Dvec4(_mm256_blend_pd(columns[1].inner, zero, 0x8)),
                                       Dvec4(_mm256_blend_pd(columns[2].inner, zero, 0x8)),
                                       Dvec4(unit_w)).transpose();
        const Dvec4 t(_mm256_blend_pd(columns[3].inner, zero, 0x8));
        const Dvec4 moved = -(rotation_t * t);

        return Dmat4(rotation_t.columns[0], rotation_t.columns[1], rotation_t.columns[2],
                     Dvec4(_mm256_blend_pd(moved.inner, unit_w, 0x8)));
    }

    /// Apply to a point, the w lane is taken as 1
    Dvec4 transformPoint(const Dvec4& p) const {
        return *this * Dvec4(_mm256_blend_pd(p.inner, _mm256_set1_pd(1.0), 0x8));
    }

    /// Apply to a direction, translation is ignored
    Dvec4 transformDirection(const Dvec4& d) const {
        return *this * Dvec4(_mm256_blend_pd(d.inner, _mm256_setzero_pd(), 0x8));
    }

    Dvec4 getTranslation() const { return Dvec4::direction(columns[3].x(), columns[3].y(), columns[3].z()); }
};

inline Dmat4 transpose(const Dmat4& m) { return m.transpose(); }
inline Dmat4 invertSE3(const Dmat4& m) { return m.invertSE3(); }

inline bool approxEqual(const Dmat4& a, const Dmat4& b, double eps) {
    return approxEqual(a.columns[0], b.columns[0], eps) && approxEqual(a.columns[1], b.columns[1], eps) &&
           approxEqual(a.columns[2], b.columns[2], eps) && approxEqual(a.columns[3], b.columns[3], eps);
}

static_assert(sizeof(Dmat4) == 128, "Dmat4 must be four packed Dvec4 columns");
static_assert(alignof(Dmat4) == 32, "Dmat4 must be 32-byte aligned");

} // namespace kmath

#endif // KM_DMAT4_H_
