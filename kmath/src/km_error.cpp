#include "km_error.h"
#include <algorithm>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace kmath {

KMError::KMError(Category category, Severity severity, const std::string& message,
                 const std::string& context, const std::string& suggestion)
    : std::runtime_error(message), category_(category), severity_(severity),
      context_(context), suggestion_(suggestion),
      timestamp_(std::chrono::steady_clock::now()) {
}

std::string KMError::getFormattedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(category_) << "] " << what();
    if (!context_.empty()) {
        oss << " (Context: " << context_ << ")";
    }
    if (!suggestion_.empty()) {
        oss << " (Suggestion: " << suggestion_ << ")";
    }
    return oss.str();
}

const char* toString(KMError::Category category) {
    switch (category) {
        case KMError::Category::GENERAL:      return "GENERAL";
        case KMError::Category::PRECONDITION: return "PRECONDITION";
        case KMError::Category::IO:           return "IO";
        case KMError::Category::CONFIG:       return "CONFIG";
    }
    return "UNKNOWN";
}

const char* toString(LogSystem::Level level) {
    switch (level) {
        case LogSystem::Level::TRACE:    return "TRACE";
        case LogSystem::Level::DEBUG:    return "DEBUG";
        case LogSystem::Level::INFO:     return "INFO";
        case LogSystem::Level::WARN:     return "WARN";
        case LogSystem::Level::ERROR:    return "ERROR";
        case LogSystem::Level::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

namespace {

void writeEntry(std::ostream& out, const LogSystem::LogEntry& entry) {
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    out << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S")
        << "] [" << toString(entry.level) << "] [" << entry.category << "] "
        << entry.message << std::endl;
}

} // namespace

// LogSystem implementation
LogSystem& LogSystem::getInstance() {
    static LogSystem instance;
    return instance;
}

LogSystem::LogSystem() {
    addHandler([this](const LogEntry& entry) { consoleHandler(entry); });
    addHandler([this](const LogEntry& entry) { fileHandler(entry); });
}

void LogSystem::addHandler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void LogSystem::clearHandlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

void LogSystem::log(Level level, const std::string& category, const std::string& message,
                    const char* file, int line, const char* function) {
    if (level < min_level_) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.category = category;
    entry.timestamp = std::chrono::steady_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";

    std::lock_guard<std::mutex> lock(mutex_);

    recent_entries_.push_back(entry);
    if (recent_entries_.size() > max_recent_entries_) {
        recent_entries_.erase(recent_entries_.begin());
    }

    for (const auto& handler : handlers_) {
        try {
            handler(entry);
        } catch (const std::exception& e) {
            // A failing handler must not recurse into log()
            std::cerr << "kmath: log handler failed: " << e.what() << std::endl;
        }
    }
}

std::vector<LogSystem::LogEntry> LogSystem::getRecentEntries(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count >= recent_entries_.size()) {
        return recent_entries_;
    }

    auto start_it = recent_entries_.end() - static_cast<std::ptrdiff_t>(count);
    return std::vector<LogEntry>(start_it, recent_entries_.end());
}

void LogSystem::clearRecentEntries() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_entries_.clear();
}

void LogSystem::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void LogSystem::setFileOutput(const std::string& filename) {
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        KMATH_THROW_IO_ERROR("Cannot open log file", filename,
                             "Check that the directory exists and is writable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_file_ = std::move(file);
}

// Handlers run with mutex_ held
void LogSystem::consoleHandler(const LogEntry& entry) {
    if (!console_enabled_) {
        return;
    }
    writeEntry(entry.level >= Level::WARN ? std::cerr : std::cout, entry);
}

void LogSystem::fileHandler(const LogEntry& entry) {
    if (!log_file_ || !log_file_->is_open()) {
        return;
    }
    writeEntry(*log_file_, entry);
}

// Profiler implementation
Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

Profiler::ScopedTimer::ScopedTimer(const std::string& name)
    : name_(name), start_time_(std::chrono::steady_clock::now()) {
}

Profiler::ScopedTimer::~ScopedTimer() {
    auto duration = std::chrono::steady_clock::now() - start_time_;
    Profiler::getInstance().record(name_, std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
}

void Profiler::record(const std::string& name, std::chrono::nanoseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& data = data_[name];

    data.name = name;
    data.total_time += duration;
    data.call_count++;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

std::vector<Profiler::ProfileData> Profiler::getData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProfileData> result;
    result.reserve(data_.size());

    for (const auto& pair : data_) {
        result.push_back(pair.second);
    }

    std::sort(result.begin(), result.end(),
              [](const ProfileData& a, const ProfileData& b) { return a.name < b.name; });
    return result;
}

void Profiler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void Profiler::printSummary() const {
    auto data = getData();
    if (data.empty()) {
        KMATH_INFO("Profiler", "No profiling data available");
        return;
    }

    KMATH_INFO("Profiler", "=== Performance Summary ===");
    for (const auto& entry : data) {
        std::stringstream ss;
        ss << entry.name << ": avg=" << std::fixed << std::setprecision(6)
           << entry.getAverageMs() << "ms, total=" << entry.getTotalMs()
           << "ms, calls=" << entry.call_count;
        KMATH_INFO("Profiler", ss.str());
    }
}

} // namespace kmath
