#include "km_la.h"

/* ────────────────── C ABI exports implementation ─────────────── */

using kmath::Dmat4;
using kmath::Dvec4;
using kmath::Fmat4;
using kmath::Fvec4;

extern "C" {

KM_API const double* km_dmat4_identity() {
    static const double I[16] = {1, 0, 0, 0,
                                 0, 1, 0, 0,
                                 0, 0, 1, 0,
                                 0, 0, 0, 1};
    return I;
}

KM_API void km_dmat4_mul(const double* a, const double* b, double* out) {
    (Dmat4::load(a) * Dmat4::load(b)).store(out);
}

KM_API void km_dmat4_mul_vec(const double* m, const double* v, double* out) {
    (Dmat4::load(m) * Dvec4::load(v)).store(out);
}

KM_API void km_dmat4_transpose(const double* m, double* out) {
    Dmat4::load(m).transpose().store(out);
}

KM_API void km_dmat4_invert_se3(const double* m, double* out) {
    Dmat4::load(m).invertSE3().store(out);
}

KM_API void km_fmat4_mul(const float* a, const float* b, float* out) {
    (Fmat4::load(a) * Fmat4::load(b)).store(out);
}

KM_API void km_fmat4_mul_vec(const float* m, const float* v, float* out) {
    (Fmat4::load(m) * Fvec4::load(v)).store(out);
}

KM_API void km_fmat4_invert_se3(const float* m, float* out) {
    Fmat4::load(m).invertSE3().store(out);
}

} // extern "C"
