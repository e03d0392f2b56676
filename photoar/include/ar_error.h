#ifndef AR_ERROR_H_
#define AR_ERROR_H_

#include <stdexcept>
#include <string>
#include <sstream>
#include <chrono>
#include <functional>
#include <mutex>
#include <vector>
#include <memory>
#include <thread>
#include <unordered_map>
#include <fstream>

namespace photoar {

/**
 * @brief Error with category, context and a recovery suggestion
 */
class ARError : public std::runtime_error {
public:
    enum class Severity {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class Category {
        GENERAL,
        CAMERA,
        TRACKING,
        ASSET,
        MEDIA,
        CONFIG,
        RENDERING,
        OPENGL
    };

    ARError(Category category, Severity severity, const std::string& message,
           const std::string& context = "", const std::string& suggestion = "");

    Category getCategory() const { return category_; }
    Severity getSeverity() const { return severity_; }
    const std::string& getContext() const { return context_; }
    const std::string& getSuggestion() const { return suggestion_; }
    auto getTimestamp() const { return timestamp_; }

    std::string getFormattedMessage() const;

    static const char* categoryName(Category category);

private:
    Category category_;
    Severity severity_;
    std::string context_;
    std::string suggestion_;
    std::chrono::steady_clock::time_point timestamp_;
};

#define PHOTOAR_THROW_CAMERA_ERROR(msg, context, suggestion) \
    throw photoar::ARError(photoar::ARError::Category::CAMERA, photoar::ARError::Severity::ERROR, msg, context, suggestion)

#define PHOTOAR_THROW_ASSET_ERROR(msg, context, suggestion) \
    throw photoar::ARError(photoar::ARError::Category::ASSET, photoar::ARError::Severity::ERROR, msg, context, suggestion)

#define PHOTOAR_THROW_MEDIA_ERROR(msg, context, suggestion) \
    throw photoar::ARError(photoar::ARError::Category::MEDIA, photoar::ARError::Severity::ERROR, msg, context, suggestion)

#define PHOTOAR_THROW_CONFIG_ERROR(msg, context, suggestion) \
    throw photoar::ARError(photoar::ARError::Category::CONFIG, photoar::ARError::Severity::ERROR, msg, context, suggestion)

#define PHOTOAR_THROW_RENDER_ERROR(msg, context, suggestion) \
    throw photoar::ARError(photoar::ARError::Category::RENDERING, photoar::ARError::Severity::ERROR, msg, context, suggestion)

/**
 * @brief Logging system with multiple outputs and filtering
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

    /**
     * @brief Parse a level name ("trace" .. "critical", case-insensitive)
     * @throws ARError (CONFIG) for unknown names
     */
    static Level parseLevel(const std::string& name);
    static const char* levelName(Level level);

    void addHandler(LogHandler handler);

    /**
     * @brief Remove all handlers, including the built-in console and file ones
     */
    void clearHandlers();

    /**
     * @brief Restore the built-in console handler after clearHandlers()
     */
    void resetHandlers();

    void log(Level level, const std::string& category, const std::string& message,
            const char* file = __builtin_FILE(), int line = __builtin_LINE(),
            const char* function = __builtin_FUNCTION());

    std::vector<LogEntry> getRecentEntries(size_t count = 100) const;
    void clearRecentEntries();

    void setConsoleOutput(bool enabled);

    /**
     * @brief Append every entry to a file as well
     * @throws ARError (CONFIG) if the file cannot be opened
     */
    void setFileOutput(const std::string& filename);

private:
    LogSystem();
    ~LogSystem() = default;

    std::string formatEntry(const LogEntry& entry) const;
    void consoleHandler(const LogEntry& entry);
    void fileHandler(const LogEntry& entry);

    std::vector<LogHandler> handlers_;
    Level min_level_ = Level::INFO;
    mutable std::mutex mutex_;
    std::vector<LogEntry> recent_entries_;
    size_t max_recent_entries_ = 1000;

    bool console_enabled_ = true;
    bool file_handler_installed_ = false;
    std::unique_ptr<std::ofstream> log_file_;
};

#define PHOTOAR_LOG(level, category, message) \
    photoar::LogSystem::getInstance().log(level, category, message, __FILE__, __LINE__, __FUNCTION__)

#define PHOTOAR_TRACE(category, message) PHOTOAR_LOG(photoar::LogSystem::Level::TRACE, category, message)
#define PHOTOAR_DEBUG(category, message) PHOTOAR_LOG(photoar::LogSystem::Level::DEBUG, category, message)
#define PHOTOAR_INFO(category, message) PHOTOAR_LOG(photoar::LogSystem::Level::INFO, category, message)
#define PHOTOAR_WARN(category, message) PHOTOAR_LOG(photoar::LogSystem::Level::WARN, category, message)
#define PHOTOAR_ERROR(category, message) PHOTOAR_LOG(photoar::LogSystem::Level::ERROR, category, message)
#define PHOTOAR_CRITICAL(category, message) PHOTOAR_LOG(photoar::LogSystem::Level::CRITICAL, category, message)

/**
 * @brief Per-name timing accumulator for frame processing hot spots
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
    void printSummary() const;

private:
    Profiler() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProfileData> data_;
};

#define PHOTOAR_PROFILE(name) photoar::Profiler::ScopedTimer photoar_profile_timer_(name)
#define PHOTOAR_PROFILE_FUNCTION() PHOTOAR_PROFILE(__FUNCTION__)

} // namespace photoar

#endif // AR_ERROR_H_
