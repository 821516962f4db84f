#include "km_config.h"
#include <cctype>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace kmath {

namespace {

// Digits only: std::stoull would accept a sign and wrap "-1" to ULLONG_MAX
unsigned long long parseUnsigned(const std::string& flag, const char* value, unsigned long long max_value) {
    const std::string suggestion = "Pass an integer between 0 and " + std::to_string(max_value);
    if (value == nullptr) {
        KMATH_THROW_CONFIG_ERROR("Missing value for " + flag, flag, suggestion);
    }
    if (!std::isdigit(static_cast<unsigned char>(value[0]))) {
        KMATH_THROW_CONFIG_ERROR("Invalid value for " + flag, value, suggestion);
    }

    unsigned long long parsed = 0;
    size_t consumed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::out_of_range&) {
        KMATH_THROW_CONFIG_ERROR("Value out of range for " + flag, value, suggestion);
    } catch (const std::invalid_argument&) {
        KMATH_THROW_CONFIG_ERROR("Invalid value for " + flag, value, suggestion);
    }

    if (consumed != std::strlen(value)) {
        KMATH_THROW_CONFIG_ERROR("Trailing characters in " + flag, value, suggestion);
    }
    if (parsed > max_value) {
        KMATH_THROW_CONFIG_ERROR("Value out of range for " + flag, value, suggestion);
    }
    return parsed;
}

} // namespace

DemoConfig parseDemoArgs(int argc, const char* const* argv) {
    DemoConfig config = DemoConfig::defaultConfig();
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const char* next = i + 1 < argc ? argv[i + 1] : nullptr;
        if (arg == "--iterations") {
            const unsigned long long n = parseUnsigned(arg, next, std::numeric_limits<size_t>::max());
            if (n == 0) {
                KMATH_THROW_CONFIG_ERROR("--iterations must be at least 1", next, "Pass a positive integer");
            }
            config.iterations = static_cast<size_t>(n);
            ++i;
        } else if (arg == "--seed") {
            config.seed = static_cast<unsigned>(parseUnsigned(arg, next, std::numeric_limits<unsigned>::max()));
            ++i;
        } else if (arg == "--log-file") {
            if (next == nullptr) {
                KMATH_THROW_CONFIG_ERROR("Missing value for --log-file", arg, "Pass a file path");
            }
            config.log_file = next;
            ++i;
        } else if (arg == "--verbose") {
            config.log_level = LogSystem::Level::DEBUG;
        } else if (arg == "--quiet") {
            config.log_level = LogSystem::Level::WARN;
        } else {
            KMATH_THROW_CONFIG_ERROR("Unknown argument", arg,
                                     "Use --iterations N, --seed S, --log-file PATH, --verbose or --quiet");
        }
    }
    return config;
}

} // namespace kmath
