#ifndef KM_SE3_H_
#define KM_SE3_H_

#include "km_dmat4.h"
#include "km_fmat4.h"
#include <string>

namespace kmath {

/**
 * @brief How far a matrix is from being a rigid transform
 *
 * orthonormality_error is max |R^T R - I| over the 3x3 rotation block,
 * determinant_error is |det R - 1| (a reflection scores 2), and
 * bottom_row_error is max |row3 - [0 0 0 1]|. NaN input makes every
 * error NaN, which never passes a check.
 */
struct Se3Report {
    double orthonormality_error = 0.0;
    double determinant_error = 0.0;
    double bottom_row_error = 0.0;
    bool rigid = false;

    bool isRigid() const { return rigid; }
    std::string describe() const;
};

/**
 * @brief Opt-in validation in front of invertSE3()
 *
 * Dmat4::invertSE3() trusts its input. Se3Check measures the input first and
 * throws KMError (PRECONDITION) instead of returning a meaningless inverse.
 */
class Se3Check {
public:
    struct Config {
        double orthonormality_tolerance = 1e-9;
        double determinant_tolerance = 1e-9;
        double bottom_row_tolerance = 0.0;
        bool log_violations = true;

        static Config defaultConfig() { return Config{}; }

        // Single precision accumulates about 1e-7 per operation
        static Config floatConfig() {
            Config config;
            config.orthonormality_tolerance = 1e-5;
            config.determinant_tolerance = 1e-5;
            return config;
        }
    };

    Se3Check();
    explicit Se3Check(const Config& config);

    Se3Report check(const Dmat4& m) const;
    Se3Report check(const Fmat4& m) const;

    bool isRigid(const Dmat4& m) const { return check(m).isRigid(); }
    bool isRigid(const Fmat4& m) const { return check(m).isRigid(); }

    /**
     * @brief invertSE3() after a successful check
     *
     * Logs a WARN entry under "SE3" (unless log_violations is off) and
     * throws KMError with Category::PRECONDITION when the check fails.
     */
    Dmat4 invert(const Dmat4& m) const;
    Fmat4 invert(const Fmat4& m) const;

    const Config& getConfig() const { return config_; }

private:
    void reject(const Se3Report& report) const;

    Config config_;
};

Se3Report checkSE3(const Dmat4& m, const Se3Check::Config& config = Se3Check::Config::defaultConfig());
Se3Report checkSE3(const Fmat4& m, const Se3Check::Config& config = Se3Check::Config::floatConfig());

bool isSE3(const Dmat4& m, const Se3Check::Config& config = Se3Check::Config::defaultConfig());
bool isSE3(const Fmat4& m, const Se3Check::Config& config = Se3Check::Config::floatConfig());

Dmat4 invertSE3Checked(const Dmat4& m, const Se3Check::Config& config = Se3Check::Config::defaultConfig());
Fmat4 invertSE3Checked(const Fmat4& m, const Se3Check::Config& config = Se3Check::Config::floatConfig());

} // namespace kmath

#endif // KM_SE3_H_
