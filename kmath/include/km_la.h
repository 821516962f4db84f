#ifndef KM_LA_H_
#define KM_LA_H_

#include "km_lanes.h"
#include "km_dvec2.h"
#include "km_dvec4.h"
#include "km_dmat4.h"
#include "km_fvec4.h"
#include "km_fmat4.h"

#include <limits>

/* ───────────────── Platform / visibility macros ───────────────── */

// Reached only on an Emscripten target built with -msimd128 -mavx2 -mfma;
// km_lanes.h rejects any build without AVX2 and FMA first.
#ifdef __EMSCRIPTEN__
#include <emscripten.h>
#define KM_API EMSCRIPTEN_KEEPALIVE           // exported to JS / other Wasm
#else
#define KM_API                                // no decoration on native
#endif

namespace kmath {
    inline constexpr double PI = 3.14159265358979323846;
    inline constexpr double PI_2 = PI * 0.5;
    inline constexpr double PI_4 = PI * 0.25;
    inline constexpr double DEG_TO_RAD = PI / 180.0;
    inline constexpr double RAD_TO_DEG = 180.0 / PI;

    // Comparison tolerances for results that went through a handful of roundings
    inline constexpr double EPSILON = std::numeric_limits<double>::epsilon() * 64.0;
    inline constexpr float EPSILON_F = std::numeric_limits<float>::epsilon() * 64.0f;
}

/* ────────────────── C ABI for Wasm and FFI callers ───────────────────
   Matrices are 16 column-major values, vectors 4 values. Pointers need
   no particular alignment. `out` may alias an input.                  */
extern "C" {

KM_API const double* km_dmat4_identity();
KM_API void km_dmat4_mul(const double* a, const double* b, double* out);
KM_API void km_dmat4_mul_vec(const double* m, const double* v, double* out);
KM_API void km_dmat4_transpose(const double* m, double* out);
KM_API void km_dmat4_invert_se3(const double* m, double* out);

KM_API void km_fmat4_mul(const float* a, const float* b, float* out);
KM_API void km_fmat4_mul_vec(const float* m, const float* v, float* out);
KM_API void km_fmat4_invert_se3(const float* m, float* out);

} // extern "C"

#endif // KM_LA_H_
