#ifndef KM_CONFIG_H_
#define KM_CONFIG_H_

#include "km_error.h"
#include <cstddef>
#include <string>

namespace kmath {

/**
 * @brief Settings for the kmath_demo workload
 */
struct DemoConfig {
    size_t iterations = 100000;
    unsigned seed = 42;
    LogSystem::Level log_level = LogSystem::Level::INFO;
    std::string log_file;

    static DemoConfig defaultConfig() { return DemoConfig{}; }
};

/**
 * @brief Fill a DemoConfig from command-line arguments
 *
 * Accepts --iterations N (N >= 1), --seed S (0 to UINT_MAX), --log-file PATH,
 * --verbose and --quiet. Anything else, a missing value, a sign, trailing
 * characters or an out-of-range number throws KMError with Category::CONFIG.
 */
DemoConfig parseDemoArgs(int argc, const char* const* argv);

} // namespace kmath

#endif // KM_CONFIG_H_
