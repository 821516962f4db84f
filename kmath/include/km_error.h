#ifndef KM_ERROR_H_
#define KM_ERROR_H_

#include <stdexcept>
#include <string>
#include <sstream>
#include <chrono>
#include <functional>
#include <fstream>
#include <mutex>
#include <vector>
#include <memory>
#include <thread>
#include <unordered_map>

namespace kmath {

/**
 * @brief Error with category, context and a recovery suggestion
 *
 * Kernel arithmetic never throws. KMError is raised by the opt-in checks
 * (km_se3.h), the log file handler and the demo's argument parsing.
 */
class KMError : public std::runtime_error {
public:
    enum class Severity {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class Category {
        GENERAL,
        PRECONDITION,
        IO,
        CONFIG
    };

    KMError(Category category, Severity severity, const std::string& message,
            const std::string& context = "", const std::string& suggestion = "");

    Category getCategory() const { return category_; }
    Severity getSeverity() const { return severity_; }
    const std::string& getContext() const { return context_; }
    const std::string& getSuggestion() const { return suggestion_; }
    auto getTimestamp() const { return timestamp_; }

    std::string getFormattedMessage() const;

private:
    Category category_;
    Severity severity_;
    std::string context_;
    std::string suggestion_;
    std::chrono::steady_clock::time_point timestamp_;
};

const char* toString(KMError::Category category);

#define KMATH_THROW_PRECONDITION_ERROR(msg, context, suggestion) \
    throw kmath::KMError(kmath::KMError::Category::PRECONDITION, kmath::KMError::Severity::ERROR, msg, context, suggestion)

#define KMATH_THROW_IO_ERROR(msg, context, suggestion) \
    throw kmath::KMError(kmath::KMError::Category::IO, kmath::KMError::Severity::ERROR, msg, context, suggestion)

#define KMATH_THROW_CONFIG_ERROR(msg, context, suggestion) \
    throw kmath::KMError(kmath::KMError::Category::CONFIG, kmath::KMError::Severity::ERROR, msg, context, suggestion)

/**
 * @brief Process-wide logging with pluggable handlers and level filtering
 */
class LogSystem {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5
    };

    struct LogEntry {
        Level level;
        std::string message;
        std::string category;
        std::chrono::steady_clock::time_point timestamp;
        std::thread::id thread_id;
        std::string file;
        int line;
        std::string function;
    };

    using LogHandler = std::function<void(const LogEntry&)>;

    static LogSystem& getInstance();

    void setLevel(Level level) { min_level_ = level; }
    Level getLevel() const { return min_level_; }

    void addHandler(LogHandler handler);

    /**
     * @brief Remove every handler, the built-in console handler included
     */
    void clearHandlers();

    void log(Level level, const std::string& category, const std::string& message,
             const char* file = __builtin_FILE(), int line = __builtin_LINE(),
             const char* function = __builtin_FUNCTION());

    /**
     * @brief Most recent entries that passed the level filter, oldest first
     */
    std::vector<LogEntry> getRecentEntries(size_t count = 100) const;

    void clearRecentEntries();

    void setConsoleOutput(bool enabled);

    /**
     * @brief Append every entry to a file as well
     *
     * Throws KMError (IO) if the file cannot be opened.
     */
    void setFileOutput(const std::string& filename);

private:
    LogSystem();
    ~LogSystem() = default;

    std::vector<LogHandler> handlers_;
    Level min_level_ = Level::INFO;
    mutable std::mutex mutex_;
    std::vector<LogEntry> recent_entries_;
    size_t max_recent_entries_ = 1000;

    void consoleHandler(const LogEntry& entry);
    void fileHandler(const LogEntry& entry);

    bool console_enabled_ = true;
    std::unique_ptr<std::ofstream> log_file_;
};

const char* toString(LogSystem::Level level);

#define KMATH_LOG(level, category, message) \
    kmath::LogSystem::getInstance().log(level, category, message, __FILE__, __LINE__, __FUNCTION__)

#define KMATH_TRACE(category, message) KMATH_LOG(kmath::LogSystem::Level::TRACE, category, message)
#define KMATH_DEBUG(category, message) KMATH_LOG(kmath::LogSystem::Level::DEBUG, category, message)
#define KMATH_INFO(category, message) KMATH_LOG(kmath::LogSystem::Level::INFO, category, message)
#define KMATH_WARN(category, message) KMATH_LOG(kmath::LogSystem::Level::WARN, category, message)
#define KMATH_ERROR(category, message) KMATH_LOG(kmath::LogSystem::Level::ERROR, category, message)
#define KMATH_CRITICAL(category, message) KMATH_LOG(kmath::LogSystem::Level::CRITICAL, category, message)

/**
 * @brief Accumulates wall time per named scope
 */
class Profiler {
public:
    struct ProfileData {
        std::string name;
        std::chrono::nanoseconds total_time{0};
        std::chrono::nanoseconds min_time{std::chrono::nanoseconds::max()};
        std::chrono::nanoseconds max_time{0};
        size_t call_count = 0;

        double getAverageMs() const {
            return call_count > 0 ?
                std::chrono::duration<double, std::milli>(total_time).count() / call_count : 0.0;
        }

        double getTotalMs() const {
            return std::chrono::duration<double, std::milli>(total_time).count();
        }
    };

    class ScopedTimer {
    public:
        explicit ScopedTimer(const std::string& name);
        ~ScopedTimer();

    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_time_;
    };

    static Profiler& getInstance();

    void record(const std::string& name, std::chrono::nanoseconds duration);
    std::vector<ProfileData> getData() const;
    void clear();

    /**
     * @brief Log one INFO line per recorded scope
     */
    void printSummary() const;

private:
    Profiler() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProfileData> data_;
};

#define KMATH_PROFILE(name) kmath::Profiler::ScopedTimer kmath_profile_timer_(name)
#define KMATH_PROFILE_FUNCTION() KMATH_PROFILE(__FUNCTION__)

} // namespace kmath

#endif // KM_ERROR_H_
