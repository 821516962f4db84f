#ifndef KM_DVEC4_H_
#define KM_DVEC4_H_

#include "km_lanes.h"
#include <cmath>
#include <cstddef>

namespace kmath {

/**
 * @brief 4D vector with double precision, packed in one 256-bit register
 *
 * Components are laid out as [x, y, z, w]. The w convention is up to the
 * caller: point() sets it to 1, direction() to 0.
 */
struct Dvec4 {
    f64x4 inner;

    Dvec4() : inner(_mm256_setzero_pd()) {}
    Dvec4(double X, double Y, double Z, double W) : inner(_mm256_set_pd(W, Z, Y, X)) {}
    explicit Dvec4(f64x4 v) : inner(v) {}

    static Dvec4 splat(double s) { return Dvec4(_mm256_set1_pd(s)); }
    static Dvec4 zero() { return Dvec4(); }
    static Dvec4 point(double X, double Y, double Z) { return Dvec4(X, Y, Z, 1.0); }
    static Dvec4 direction(double X, double Y, double Z) { return Dvec4(X, Y, Z, 0.0); }

    /// Load from four consecutive doubles, no alignment requirement
    static Dvec4 load(const double* ptr) { return Dvec4(_mm256_loadu_pd(ptr)); }
    void store(double* ptr) const { _mm256_storeu_pd(ptr, inner); }

    double x() const { return data()[0]; }
    double y() const { return data()[1]; }
    double z() const { return data()[2]; }
    double w() const { return data()[3]; }

    double* data() { return reinterpret_cast<double*>(&inner); }
    const double* data() const { return reinterpret_cast<const double*>(&inner); }

    double& operator[](size_t index) { return data()[index]; }
    const double& operator[](size_t index) const { return data()[index]; }

    Dvec4 operator+(const Dvec4& o) const { return Dvec4(_mm256_add_pd(inner, o.inner)); }
    Dvec4 operator-(const Dvec4& o) const { return Dvec4(_mm256_sub_pd(inner, o.inner)); }
    Dvec4 operator*(const Dvec4& o) const { return Dvec4(_mm256_mul_pd(inner, o.inner)); }
    Dvec4 operator/(const Dvec4& o) const { return Dvec4(_mm256_div_pd(inner, o.inner)); }

    Dvec4 operator+(double s) const { return Dvec4(_mm256_add_pd(inner, _mm256_set1_pd(s))); }
    Dvec4 operator-(double s) const { return Dvec4(_mm256_sub_pd(inner, _mm256_set1_pd(s))); }
    Dvec4 operator*(double s) const { return Dvec4(_mm256_mul_pd(inner, _mm256_set1_pd(s))); }
    Dvec4 operator/(double s) const { return Dvec4(_mm256_div_pd(inner, _mm256_set1_pd(s))); }

    Dvec4 operator-() const { return Dvec4(_mm256_xor_pd(inner, _mm256_set1_pd(-0.0))); }

    Dvec4& operator+=(const Dvec4& o) { inner = _mm256_add_pd(inner, o.inner); return *this; }
    Dvec4& operator-=(const Dvec4& o) { inner = _mm256_sub_pd(inner, o.inner); return *this; }
    Dvec4& operator*=(const Dvec4& o) { inner = _mm256_mul_pd(inner, o.inner); return *this; }
    Dvec4& operator/=(const Dvec4& o) { inner = _mm256_div_pd(inner, o.inner); return *this; }

    Dvec4& operator+=(double s) { inner = _mm256_add_pd(inner, _mm256_set1_pd(s)); return *this; }
    Dvec4& operator-=(double s) { inner = _mm256_sub_pd(inner, _mm256_set1_pd(s)); return *this; }
    Dvec4& operator*=(double s) { inner = _mm256_mul_pd(inner, _mm256_set1_pd(s)); return *this; }
    Dvec4& operator/=(double s) { inner = _mm256_div_pd(inner, _mm256_set1_pd(s)); return *this; }

    /// Exact IEEE comparison on all four lanes: -0 == 0, NaN != NaN
    bool operator==(const Dvec4& o) const { return lanes::all_equal_f64x4(inner, o.inner); }
    bool operator!=(const Dvec4& o) const { return !(*this == o); }

    /// Sum of the componentwise products over all four lanes
    double dot(const Dvec4& o) const { return lanes::hsum_f64x4(_mm256_mul_pd(inner, o.inner)); }

    /**
     * @brief 3D cross product of the leading three lanes
     *
     * Rotating both operands by (1, 2, 0) leaves the result rotated the same
     * way, so one permute per operand and one on the difference is enough.
     * The w lane of the result is always 0.
     */
    Dvec4 cross(const Dvec4& o) const {
        constexpr int yzx = _MM_SHUFFLE(3, 0, 2, 1);
        const f64x4 left = _mm256_mul_pd(inner, _mm256_permute4x64_pd(o.inner, yzx));
        const f64x4 right = _mm256_mul_pd(o.inner, _mm256_permute4x64_pd(inner, yzx));
        const f64x4 result = _mm256_permute4x64_pd(_mm256_sub_pd(left, right), yzx);
        return Dvec4(_mm256_blend_pd(result, _mm256_setzero_pd(), 0x8));
    }

    /// Componentwise minimum; a NaN in either operand lane yields NaN
    Dvec4 min(const Dvec4& o) const { return Dvec4(lanes::min_f64x4(inner, o.inner)); }
    Dvec4 max(const Dvec4& o) const { return Dvec4(lanes::max_f64x4(inner, o.inner)); }

    /// Smallest of the four components (NaN if any component is NaN)
    double minReduce() const { return lanes::hmin_f64x4(inner); }
    double maxReduce() const { return lanes::hmax_f64x4(inner); }

    Dvec4 floor() const { return Dvec4(_mm256_floor_pd(inner)); }

    double lengthSquared() const { return dot(*this); }
    double length() const { return std::sqrt(lengthSquared()); }

    /// Zero-length input gives NaN components, no check is made
    Dvec4 normalized() const { return *this / length(); }
};

inline Dvec4 operator+(double s, const Dvec4& v) { return Dvec4(_mm256_add_pd(_mm256_set1_pd(s), v.inner)); }
inline Dvec4 operator-(double s, const Dvec4& v) { return Dvec4(_mm256_sub_pd(_mm256_set1_pd(s), v.inner)); }
inline Dvec4 operator*(double s, const Dvec4& v) { return Dvec4(_mm256_mul_pd(_mm256_set1_pd(s), v.inner)); }
inline Dvec4 operator/(double s, const Dvec4& v) { return Dvec4(_mm256_div_pd(_mm256_set1_pd(s), v.inner)); }

inline double dot(const Dvec4& a, const Dvec4& b) { return a.dot(b); }
inline Dvec4 cross(const Dvec4& a, const Dvec4& b) { return a.cross(b); }
inline Dvec4 min(const Dvec4& a, const Dvec4& b) { return a.min(b); }
inline Dvec4 max(const Dvec4& a, const Dvec4& b) { return a.max(b); }
inline double min(const Dvec4& v) { return v.minReduce(); }
inline double max(const Dvec4& v) { return v.maxReduce(); }
inline Dvec4 floor(const Dvec4& v) { return v.floor(); }

/// True when every lane differs by at most eps
inline bool approxEqual(const Dvec4& a, const Dvec4& b, double eps) {
    return lanes::hmax_f64x4(lanes::abs_f64x4(_mm256_sub_pd(a.inner, b.inner))) <= eps;
}

static_assert(sizeof(Dvec4) == 32, "Dvec4 must fill exactly one 256-bit register");
static_assert(alignof(Dvec4) == 32, "Dvec4 must be 32-byte aligned");

} // namespace kmath

#endif // KM_DVEC4_H_
