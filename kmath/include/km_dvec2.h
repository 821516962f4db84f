#ifndef KM_DVEC2_H_
#define KM_DVEC2_H_

#include "km_lanes.h"
#include <cstddef>

namespace kmath {

/**
 * @brief 2D vector with double precision, packed in one 128-bit register
 *
 * Components are laid out as [x, y]. Only componentwise operations are
 * vectorized; geometry on 2D doubles goes through x()/y().
 */
struct Dvec2 {
    f64x2 inner;

    Dvec2() : inner(_mm_setzero_pd()) {}
    Dvec2(double X, double Y) : inner(_mm_set_pd(Y, X)) {}   // _mm_set_pd takes the high lane first
    explicit Dvec2(f64x2 v) : inner(v) {}

    static Dvec2 splat(double s) { return Dvec2(_mm_set1_pd(s)); }
    static Dvec2 zero() { return Dvec2(); }

    /// Load from two consecutive doubles, no alignment requirement
    static Dvec2 load(const double* ptr) { return Dvec2(_mm_loadu_pd(ptr)); }
    void store(double* ptr) const { _mm_storeu_pd(ptr, inner); }

    double x() const { return _mm_cvtsd_f64(inner); }
    double y() const { return _mm_cvtsd_f64(_mm_permute_pd(inner, 1)); }

    double* data() { return reinterpret_cast<double*>(&inner); }
    const double* data() const { return reinterpret_cast<const double*>(&inner); }

    double& operator[](size_t index) { return data()[index]; }
    const double& operator[](size_t index) const { return data()[index]; }

    Dvec2 operator+(const Dvec2& o) const { return Dvec2(_mm_add_pd(inner, o.inner)); }
    Dvec2 operator-(const Dvec2& o) const { return Dvec2(_mm_sub_pd(inner, o.inner)); }
    Dvec2 operator*(const Dvec2& o) const { return Dvec2(_mm_mul_pd(inner, o.inner)); }
    Dvec2 operator/(const Dvec2& o) const { return Dvec2(_mm_div_pd(inner, o.inner)); }

    Dvec2 operator+(double s) const { return Dvec2(_mm_add_pd(inner, _mm_set1_pd(s))); }
    Dvec2 operator-(double s) const { return Dvec2(_mm_sub_pd(inner, _mm_set1_pd(s))); }
    Dvec2 operator*(double s) const { return Dvec2(_mm_mul_pd(inner, _mm_set1_pd(s))); }
    Dvec2 operator/(double s) const { return Dvec2(_mm_div_pd(inner, _mm_set1_pd(s))); }

    /// Flips the sign bit, so -(+0) is -0
    Dvec2 operator-() const { return Dvec2(_mm_xor_pd(inner, _mm_set1_pd(-0.0))); }

    Dvec2& operator+=(const Dvec2& o) { inner = _mm_add_pd(inner, o.inner); return *this; }
    Dvec2& operator-=(const Dvec2& o) { inner = _mm_sub_pd(inner, o.inner); return *this; }
    Dvec2& operator*=(const Dvec2& o) { inner = _mm_mul_pd(inner, o.inner); return *this; }
    Dvec2& operator/=(const Dvec2& o) { inner = _mm_div_pd(inner, o.inner); return *this; }

    Dvec2& operator+=(double s) { inner = _mm_add_pd(inner, _mm_set1_pd(s)); return *this; }
    Dvec2& operator-=(double s) { inner = _mm_sub_pd(inner, _mm_set1_pd(s)); return *this; }
    Dvec2& operator*=(double s) { inner = _mm_mul_pd(inner, _mm_set1_pd(s)); return *this; }
    Dvec2& operator/=(double s) { inner = _mm_div_pd(inner, _mm_set1_pd(s)); return *this; }

    /// Exact IEEE comparison on both lanes: -0 == 0, NaN != NaN
    bool operator==(const Dvec2& o) const { return lanes::all_equal_f64x2(inner, o.inner); }
    bool operator!=(const Dvec2& o) const { return !(*this == o); }

    /// Componentwise minimum; a NaN in either operand lane yields NaN
    Dvec2 min(const Dvec2& o) const { return Dvec2(lanes::min_f64x2(inner, o.inner)); }
    Dvec2 max(const Dvec2& o) const { return Dvec2(lanes::max_f64x2(inner, o.inner)); }

    Dvec2 floor() const { return Dvec2(_mm_floor_pd(inner)); }
};

inline Dvec2 operator+(double s, const Dvec2& v) { return Dvec2(_mm_add_pd(_mm_set1_pd(s), v.inner)); }
inline Dvec2 operator-(double s, const Dvec2& v) { return Dvec2(_mm_sub_pd(_mm_set1_pd(s), v.inner)); }
inline Dvec2 operator*(double s, const Dvec2& v) { return Dvec2(_mm_mul_pd(_mm_set1_pd(s), v.inner)); }
inline Dvec2 operator/(double s, const Dvec2& v) { return Dvec2(_mm_div_pd(_mm_set1_pd(s), v.inner)); }

inline Dvec2 min(const Dvec2& a, const Dvec2& b) { return a.min(b); }
inline Dvec2 max(const Dvec2& a, const Dvec2& b) { return a.max(b); }
inline Dvec2 floor(const Dvec2& v) { return v.floor(); }

static_assert(sizeof(Dvec2) == 16, "Dvec2 must fill exactly one 128-bit register");
static_assert(alignof(Dvec2) == 16, "Dvec2 must be 16-byte aligned");

} // namespace kmath

#endif // KM_DVEC2_H_
