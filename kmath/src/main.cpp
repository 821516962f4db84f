#include "km_la.h"
#include "km_se3.h"
#include "km_error.h"
#include "km_config.h"
#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace {

// Rotation about a random axis composed with a random translation
kmath::Dmat4 randomRigid(std::mt19937& gen) {
    std::uniform_real_distribution<double> angle(-kmath::PI, kmath::PI);
    std::uniform_real_distribution<double> offset(-10.0, 10.0);

    const kmath::Dmat4 rotation = kmath::Dmat4::rotationZ(angle(gen)) *
                                  kmath::Dmat4::rotationY(angle(gen)) *
                                  kmath::Dmat4::rotationX(angle(gen));
    const kmath::Dvec4 t = kmath::Dvec4::direction(offset(gen), offset(gen), offset(gen));
    return kmath::Dmat4::translation(t) * rotation;
}

kmath::Fmat4 toFloat(const kmath::Dmat4& m) {
    double raw[16];
    float narrowed[16];
    m.store(raw);
    for (int i = 0; i < 16; ++i) {
        narrowed[i] = static_cast<float>(raw[i]);
    }
    return kmath::Fmat4::load(narrowed);
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace kmath;

    try {
        const DemoConfig config = parseDemoArgs(argc, argv);
        LogSystem::getInstance().setLevel(config.log_level);
        if (!config.log_file.empty()) {
            LogSystem::getInstance().setFileOutput(config.log_file);
        }

        KMATH_INFO("Main", "Running " + std::to_string(config.iterations) +
                           " rigid transform round trips, seed " + std::to_string(config.seed));

        std::mt19937 gen(config.seed);
        std::vector<Dmat4> transforms;
        transforms.reserve(config.iterations);
        {
            KMATH_PROFILE("generate");
            for (size_t i = 0; i < config.iterations; ++i) {
                transforms.push_back(randomRigid(gen));
            }
        }

        {
            KMATH_PROFILE("validate");
            const Se3Check checker;
            size_t rejected = 0;
            for (const Dmat4& m : transforms) {
                if (!checker.isRigid(m)) {
                    ++rejected;
                }
            }
            if (rejected > 0) {
                KMATH_WARN("Main", std::to_string(rejected) + " generated transforms failed the SE(3) check");
            }
        }

        std::vector<Dmat4> inverses;
        inverses.reserve(transforms.size());
        {
            KMATH_PROFILE("invertSE3");
            for (const Dmat4& m : transforms) {
                inverses.push_back(m.invertSE3());
            }
        }

        double worst = 0.0;
        {
            KMATH_PROFILE("compose");
            for (size_t i = 0; i < transforms.size(); ++i) {
                const Dmat4 residual = transforms[i] * inverses[i] - Dmat4::identity();
                for (int c = 0; c < 4; ++c) {
                    worst = std::max(worst, max(Dvec4(lanes::abs_f64x4(residual[c].inner))));
                }
            }
        }

        Dvec4 sink;
        {
            KMATH_PROFILE("transformPoint");
            const Dvec4 p = Dvec4::point(1.0, 2.0, 3.0);
            for (const Dmat4& m : transforms) {
                sink += m.transformPoint(p);
            }
        }

        float worst_f = 0.0f;
        {
            KMATH_PROFILE("float round trip");
            for (size_t i = 0; i < transforms.size(); ++i) {
                const Fmat4 m = toFloat(transforms[i]);
                const Fmat4 residual = m * m.invertSE3() - Fmat4::identity();
                for (int c = 0; c < 4; ++c) {
                    worst_f = std::max(worst_f, max(Fvec4(lanes::abs_f32x4(residual[c].inner))));
                }
            }
        }

        KMATH_INFO("Main", "Worst |M * inverse(M) - I| (double): " + std::to_string(worst));
        KMATH_INFO("Main", "Worst |M * inverse(M) - I| (float): " + std::to_string(worst_f));
        KMATH_DEBUG("Main", "Checksum: " + std::to_string(sink.dot(Dvec4::splat(1.0))));

        Profiler::getInstance().printSummary();

        if (worst > 1e-9) {
            KMATH_ERROR("Main", "Double precision round trip exceeded 1e-9");
            return 1;
        }
    } catch (const KMError& e) {
        KMATH_CRITICAL("Main", e.getFormattedMessage());
        return -1;
    } catch (const std::exception& e) {
        KMATH_CRITICAL("Main", std::string("Unhandled exception: ") + e.what());
        return -1;
    }

    return 0;
}
