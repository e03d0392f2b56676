#include "ar_error.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace photoar {

// ARError implementation
ARError::ARError(Category category, Severity severity, const std::string& message,
                const std::string& context, const std::string& suggestion)
    : std::runtime_error(message), category_(category), severity_(severity),
      context_(context), suggestion_(suggestion),
      timestamp_(std::chrono::steady_clock::now()) {
}

std::string ARError::getFormattedMessage() const {
    std::ostringstream oss;
    oss << "[" << categoryName(category_) << "] " << what();
    if (!context_.empty()) {
        oss << " (Context: " << context_ << ")";
    }
    if (!suggestion_.empty()) {
        oss << " (Suggestion: " << suggestion_ << ")";
    }
    return oss.str();
}

const char* ARError::categoryName(Category category) {
    switch (category) {
        case Category::GENERAL:   return "general";
        case Category::CAMERA:    return "camera";
        case Category::TRACKING:  return "tracking";
        case Category::ASSET:     return "asset";
        case Category::MEDIA:     return "media";
        case Category::CONFIG:    return "config";
        case Category::RENDERING: return "rendering";
        case Category::OPENGL:    return "opengl";
    }
    return "unknown";
}

// LogSystem implementation
LogSystem& LogSystem::getInstance() {
    static LogSystem instance;
    return instance;
}

LogSystem::LogSystem() {
    resetHandlers();
}

LogSystem::Level LogSystem::parseLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::TRACE;
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "critical") return Level::CRITICAL;

    PHOTOAR_THROW_CONFIG_ERROR("Unknown log level: " + name, "logging.level",
                               "Use one of trace, debug, info, warn, error, critical");
}

const char* LogSystem::levelName(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

void LogSystem::addHandler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void LogSystem::clearHandlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    file_handler_installed_ = false;
}

void LogSystem::resetHandlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    handlers_.push_back([this](const LogEntry& entry) { consoleHandler(entry); });
    file_handler_installed_ = false;
    if (log_file_) {
        handlers_.push_back([this](const LogEntry& entry) { fileHandler(entry); });
        file_handler_installed_ = true;
    }
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
            // A failing handler must not take the others down with it
            std::cerr << "[LogSystem] handler failed: " << e.what() << std::endl;
        }
    }
}

std::vector<LogSystem::LogEntry> LogSystem::getRecentEntries(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count >= recent_entries_.size()) {
        return recent_entries_;
    }

    auto start_it = recent_entries_.end() - count;
    return std::vector<LogEntry>(start_it, recent_entries_.end());
}

void LogSystem::clearRecentEntries() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_entries_.clear();
}

void LogSystem::setConsoleOutput(bool enabled) {
    console_enabled_ = enabled;
}

void LogSystem::setFileOutput(const std::string& filename) {
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        PHOTOAR_THROW_CONFIG_ERROR("Cannot open log file: " + filename, "logging.file",
                                   "Check that the directory exists and is writable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    log_file_ = std::move(file);
    if (!file_handler_installed_) {
        handlers_.push_back([this](const LogEntry& entry) { fileHandler(entry); });
        file_handler_installed_ = true;
    }
}

std::string LogSystem::formatEntry(const LogEntry& entry) const {
    auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::ostringstream oss;
    oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S")
        << "] [" << levelName(entry.level) << "] [" << entry.category << "] "
        << entry.message;
    return oss.str();
}

void LogSystem::consoleHandler(const LogEntry& entry) {
    if (!console_enabled_) {
        return;
    }

    std::ostream& out = entry.level >= Level::ERROR ? std::cerr : std::cout;
    out << formatEntry(entry) << std::endl;
}

void LogSystem::fileHandler(const LogEntry& entry) {
    if (!log_file_ || !log_file_->is_open()) {
        return;
    }

    *log_file_ << formatEntry(entry) << std::endl;
    log_file_->flush();
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
    Profiler::getInstance().record(name_, duration);
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
              [](const ProfileData& a, const ProfileData& b) { return a.total_time > b.total_time; });
    return result;
}

void Profiler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void Profiler::printSummary() const {
    auto data = getData();
    if (data.empty()) {
        PHOTOAR_INFO("Profiler", "No profiling data available");
        return;
    }

    PHOTOAR_INFO("Profiler", "=== Performance Summary ===");
    for (const auto& entry : data) {
        std::stringstream ss;
        ss << entry.name << ": avg=" << std::fixed << std::setprecision(3)
           << entry.getAverageMs() << "ms, total=" << entry.getTotalMs()
           << "ms, calls=" << entry.call_count;
        PHOTOAR_INFO("Profiler", ss.str());
    }
}

} // namespace photoar
