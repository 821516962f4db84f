#include "km_se3.h"
#include "km_error.h"
#include <cmath>
#include <sstream>

namespace kmath {

namespace {

constexpr int W_LANE = 0x8;

// Rotation block with the w lanes cleared, completed with e3 as last column
Dmat4 rotationBlock(const Dmat4& m) {
    const f64x4 zero = _mm256_setzero_pd();
    return Dmat4(Dvec4(_mm256_blend_pd(m[0].inner, zero, W_LANE)),
                 Dvec4(_mm256_blend_pd(m[1].inner, zero, W_LANE)),
                 Dvec4(_mm256_blend_pd(m[2].inner, zero, W_LANE)),
                 Dvec4(0, 0, 0, 1));
}

Fmat4 rotationBlock(const Fmat4& m) {
    const f32x4 zero = _mm_setzero_ps();
    return Fmat4(Fvec4(_mm_blend_ps(m[0].inner, zero, W_LANE)),
                 Fvec4(_mm_blend_ps(m[1].inner, zero, W_LANE)),
                 Fvec4(_mm_blend_ps(m[2].inner, zero, W_LANE)),
                 Fvec4(0, 0, 0, 1));
}

double maxAbs(const Dmat4& m) {
    f64x4 acc = lanes::abs_f64x4(m[0].inner);
    acc = lanes::max_f64x4(acc, lanes::abs_f64x4(m[1].inner));
    acc = lanes::max_f64x4(acc, lanes::abs_f64x4(m[2].inner));
    acc = lanes::max_f64x4(acc, lanes::abs_f64x4(m[3].inner));
    return lanes::hmax_f64x4(acc);
}

float maxAbs(const Fmat4& m) {
    f32x4 acc = lanes::abs_f32x4(m[0].inner);
    acc = lanes::max_f32x4(acc, lanes::abs_f32x4(m[1].inner));
    acc = lanes::max_f32x4(acc, lanes::abs_f32x4(m[2].inner));
    acc = lanes::max_f32x4(acc, lanes::abs_f32x4(m[3].inner));
    return lanes::hmax_f32x4(acc);
}

// NaN compares false, so a NaN error never passes
bool within(double error, double tolerance) {
    return error <= tolerance;
}

bool passes(const Se3Report& report, const Se3Check::Config& config) {
    return within(report.orthonormality_error, config.orthonormality_tolerance) &&
           within(report.determinant_error, config.determinant_tolerance) &&
           within(report.bottom_row_error, config.bottom_row_tolerance);
}

} // namespace

std::string Se3Report::describe() const {
    std::ostringstream oss;
    oss << "orthonormality error " << orthonormality_error
        << ", determinant error " << determinant_error
        << ", bottom row error " << bottom_row_error;
    return oss.str();
}

Se3Check::Se3Check() : config_(Config::defaultConfig()) {}

Se3Check::Se3Check(const Config& config) : config_(config) {}

Se3Report Se3Check::check(const Dmat4& m) const {
    const Dmat4 r = rotationBlock(m);

    Se3Report report;
    report.orthonormality_error = maxAbs(r.transpose() * r - Dmat4::identity());
    report.determinant_error = std::abs(r[0].cross(r[1]).dot(r[2]) - 1.0);
    report.bottom_row_error = lanes::hmax_f64x4(
        lanes::abs_f64x4(_mm256_sub_pd(m.transpose()[3].inner, _mm256_set_pd(1.0, 0.0, 0.0, 0.0))));
    report.rigid = passes(report, config_);
    return report;
}

Se3Report Se3Check::check(const Fmat4& m) const {
    const Fmat4 r = rotationBlock(m);

    Se3Report report;
    report.orthonormality_error = maxAbs(r.transpose() * r - Fmat4::identity());
    report.determinant_error = std::abs(static_cast<double>(r[0].cross(r[1]).dot(r[2])) - 1.0);
    report.bottom_row_error = lanes::hmax_f32x4(
        lanes::abs_f32x4(_mm_sub_ps(m.transpose()[3].inner, _mm_set_ps(1.0f, 0.0f, 0.0f, 0.0f))));
    report.rigid = passes(report, config_);
    return report;
}

void Se3Check::reject(const Se3Report& report) const {
    if (config_.log_violations) {
        KMATH_WARN("SE3", "Rejected non-rigid transform: " + report.describe());
    }
    KMATH_THROW_PRECONDITION_ERROR("Matrix is not a rigid transform", report.describe(),
                                   "Re-orthonormalize the rotation block or remove scale and shear");
}

Dmat4 Se3Check::invert(const Dmat4& m) const {
    const Se3Report report = check(m);
    if (!report.isRigid()) {
        reject(report);
    }
    return m.invertSE3();
}

Fmat4 Se3Check::invert(const Fmat4& m) const {
    const Se3Report report = check(m);
    if (!report.isRigid()) {
        reject(report);
    }
    return m.invertSE3();
}

Se3Report checkSE3(const Dmat4& m, const Se3Check::Config& config) {
    return Se3Check(config).check(m);
}

Se3Report checkSE3(const Fmat4& m, const Se3Check::Config& config) {
    return Se3Check(config).check(m);
}

bool isSE3(const Dmat4& m, const Se3Check::Config& config) {
    return Se3Check(config).isRigid(m);
}

bool isSE3(const Fmat4& m, const Se3Check::Config& config) {
    return Se3Check(config).isRigid(m);
}

Dmat4 invertSE3Checked(const Dmat4& m, const Se3Check::Config& config) {
    return Se3Check(config).invert(m);
}

Fmat4 invertSE3Checked(const Fmat4& m, const Se3Check::Config& config) {
    return Se3Check(config).invert(m);
}

} // namespace kmath
