#ifndef KM_LANES_H_
#define KM_LANES_H_

/**
 * @file km_lanes.h
 * @brief Register layout and lane-level primitives shared by every kmath type
 *
 * Double precision types live in 128-bit (Dvec2) and 256-bit (Dvec4) registers,
 * single precision types in 128-bit registers (Fvec4). The width is fixed when
 * the library is compiled; nothing here dispatches at runtime.
 */

#if !defined(__AVX2__) || !defined(__FMA__)
#error "kmath requires x86_64 with AVX2 and FMA. Compile with -mavx2 -mfma (MSVC: /arch:AVX2)."
#endif

#include <immintrin.h>

namespace kmath {

using f64x2 = __m128d;
using f64x4 = __m256d;
using f32x4 = __m128;

namespace lanes {

// ============================================================================
// BROADCAST
// ============================================================================

/// Copy lane I of v into all four lanes
template<int I>
inline f64x4 broadcast_f64x4(f64x4 v) {
    static_assert(I >= 0 && I < 4, "lane index out of range");
    return _mm256_permute4x64_pd(v, _MM_SHUFFLE(I, I, I, I));
}

template<int I>
inline f32x4 broadcast_f32x4(f32x4 v) {
    static_assert(I >= 0 && I < 4, "lane index out of range");
    return _mm_shuffle_ps(v, v, _MM_SHUFFLE(I, I, I, I));
}

// ============================================================================
// MIN / MAX
//
// The hardware min/max return the second operand whenever either lane is NaN.
// Blending the first operand back in where it is NaN makes a NaN in either
// position reach the result.
// ============================================================================

inline f64x2 min_f64x2(f64x2 a, f64x2 b) {
    return _mm_blendv_pd(_mm_min_pd(a, b), a, _mm_cmpunord_pd(a, a));
}

inline f64x2 max_f64x2(f64x2 a, f64x2 b) {
    return _mm_blendv_pd(_mm_max_pd(a, b), a, _mm_cmpunord_pd(a, a));
}

inline f64x4 min_f64x4(f64x4 a, f64x4 b) {
    return _mm256_blendv_pd(_mm256_min_pd(a, b), a, _mm256_cmp_pd(a, a, _CMP_UNORD_Q));
}

inline f64x4 max_f64x4(f64x4 a, f64x4 b) {
    return _mm256_blendv_pd(_mm256_max_pd(a, b), a, _mm256_cmp_pd(a, a, _CMP_UNORD_Q));
}

inline f32x4 min_f32x4(f32x4 a, f32x4 b) {
    return _mm_blendv_ps(_mm_min_ps(a, b), a, _mm_cmpunord_ps(a, a));
}

inline f32x4 max_f32x4(f32x4 a, f32x4 b) {
    return _mm_blendv_ps(_mm_max_ps(a, b), a, _mm_cmpunord_ps(a, a));
}

// ============================================================================
// HORIZONTAL OPERATIONS
// ============================================================================

/// Horizontal sum of 4 doubles
inline double hsum_f64x4(f64x4 v) {
    const f64x2 low = _mm256_castpd256_pd128(v);
    const f64x2 high = _mm256_extractf128_pd(v, 1);
    const f64x2 sum = _mm_add_pd(low, high);
    return _mm_cvtsd_f64(_mm_add_sd(sum, _mm_permute_pd(sum, 1)));
}

/// Horizontal minimum of 4 doubles
inline double hmin_f64x4(f64x4 v) {
    const f64x2 low = _mm256_castpd256_pd128(v);
    const f64x2 high = _mm256_extractf128_pd(v, 1);
    const f64x2 min1 = min_f64x2(low, high);
    return _mm_cvtsd_f64(min_f64x2(min1, _mm_permute_pd(min1, 1)));
}

/// Horizontal maximum of 4 doubles
inline double hmax_f64x4(f64x4 v) {
    const f64x2 low = _mm256_castpd256_pd128(v);
    const f64x2 high = _mm256_extractf128_pd(v, 1);
    const f64x2 max1 = max_f64x2(low, high);
    return _mm_cvtsd_f64(max_f64x2(max1, _mm_permute_pd(max1, 1)));
}

/// Horizontal sum of 4 floats
inline float hsum_f32x4(f32x4 v) {
    const f32x4 sum = _mm_add_ps(v, _mm_movehl_ps(v, v));
    return _mm_cvtss_f32(_mm_add_ss(sum, _mm_shuffle_ps(sum, sum, _MM_SHUFFLE(1, 1, 1, 1))));
}

inline float hmin_f32x4(f32x4 v) {
    const f32x4 min1 = min_f32x4(v, _mm_movehl_ps(v, v));
    return _mm_cvtss_f32(min_f32x4(min1, _mm_shuffle_ps(min1, min1, _MM_SHUFFLE(1, 1, 1, 1))));
}

inline float hmax_f32x4(f32x4 v) {
    const f32x4 max1 = max_f32x4(v, _mm_movehl_ps(v, v));
    return _mm_cvtss_f32(max_f32x4(max1, _mm_shuffle_ps(max1, max1, _MM_SHUFFLE(1, 1, 1, 1))));
}

// ============================================================================
// COMPARISON
// ============================================================================

/// True when every lane compares equal (ordered, so NaN never matches)
inline bool all_equal_f64x2(f64x2 a, f64x2 b) {
    return _mm_movemask_pd(_mm_cmpeq_pd(a, b)) == 0x3;
}

inline bool all_equal_f64x4(f64x4 a, f64x4 b) {
    return _mm256_movemask_pd(_mm256_cmp_pd(a, b, _CMP_EQ_OQ)) == 0xF;
}

inline bool all_equal_f32x4(f32x4 a, f32x4 b) {
    return _mm_movemask_ps(_mm_cmpeq_ps(a, b)) == 0xF;
}

/// Componentwise absolute value (clears the sign bit)
inline f64x4 abs_f64x4(f64x4 v) {
    return _mm256_andnot_pd(_mm256_set1_pd(-0.0), v);
}

inline f32x4 abs_f32x4(f32x4 v) {
    return _mm_andnot_ps(_mm_set1_ps(-0.0f), v);
}

} // namespace lanes
} // namespace kmath

#endif // KM_LANES_H_
