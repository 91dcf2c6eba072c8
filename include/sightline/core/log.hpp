#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <source_location>
#include <format>

namespace sightline::core {

// Log severity levels
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Critical = 5
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    General = 0,
    Geometry = 1,
    Terrain = 2,
    Collision = 3,
    Vision = 4,
    Analysis = 5,
    Config = 6,
    Performance = 7
};

// Compile-time log level configuration
#ifdef NDEBUG
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Debug;
#else
    constexpr LogLevel COMPILE_TIME_LOG_LEVEL = LogLevel::Trace;
#endif

// Structured diagnostic hook, receives every entry that passes the level and category filters
using LogSink = std::function<void(LogLevel, LogCategory, std::string_view)>;

// RAII scoped timer for performance logging
class ScopedTimer {
public:
    ScopedTimer(std::string_view name, LogCategory category = LogCategory::Performance);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    LogCategory category_;
    std::chrono::steady_clock::time_point start_;
};

// Thread-safe leveled logger
class Logger {
public:
    static Logger& instance();

    // Open a log file. Console output is controlled separately.
    void initialize(const std::string& log_file_path = "sightline.log",
                    bool append = false,
                    LogLevel min_level = LogLevel::Info);

    // Flush and close the log file
    void shutdown();

    void set_min_level(LogLevel level) noexcept;
    LogLevel get_min_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    void set_console_output(bool enabled) noexcept { console_output_.store(enabled, std::memory_order_relaxed); }
    bool is_console_output_enabled() const noexcept { return console_output_.load(std::memory_order_relaxed); }

    void enable_category(LogCategory category, bool enabled = true) noexcept;
    bool is_category_enabled(LogCategory category) const noexcept;

    // Install or remove (pass nullptr) the diagnostic sink. The sink is called without
    // any logger lock held; messages it logs itself are not fed back to it.
    void set_sink(LogSink sink);

    // Cheap pre-check so callers can skip building expensive diagnostics
    bool should_log(LogLevel level, LogCategory category) const noexcept {
        return level >= COMPILE_TIME_LOG_LEVEL &&
               level >= min_level_.load(std::memory_order_relaxed) &&
               is_category_enabled(category);
    }

    template<LogLevel Level, LogCategory Category = LogCategory::General, typename... Args>
    void log_fmt(const std::source_location& location, std::format_string<Args...> fmt, Args&&... args) {
        if constexpr (Level < COMPILE_TIME_LOG_LEVEL) {
            return;
        }

        if (!should_log(Level, Category)) {
            return;
        }

        try {
            std::string formatted = std::format(fmt, std::forward<Args>(args)...);
            log_impl(Level, Category, formatted, location);
        } catch (const std::exception& e) {
            log_impl(LogLevel::Error, LogCategory::General,
                     std::format("Log formatting error: {}", e.what()), location);
        }
    }

    void flush();

    struct Stats {
        uint64_t total_logs = 0;
        uint64_t dropped_logs = 0;
        uint64_t file_writes = 0;
        uint64_t console_writes = 0;
    };
    Stats get_stats() const noexcept;

    // Public for ScopedTimer
    void log_impl(LogLevel level, LogCategory category, std::string_view message,
                  const std::source_location& location);

    static const char* level_to_string(LogLevel level) noexcept;
    static const char* category_to_string(LogCategory category) noexcept;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_to_file(std::string_view formatted_message);
    void write_to_console(LogLevel level, std::string_view formatted_message);

    std::string format_log_entry(LogLevel level, LogCategory category,
                                 std::string_view message,
                                 const std::source_location& location) const;

    static const char* level_to_color_code(LogLevel level) noexcept;

    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::atomic<uint32_t> enabled_categories_{0xFFFFFFFF};
    std::atomic<bool> console_output_{false};

    std::ofstream log_file_;
    std::string log_file_path_;
    std::mutex file_mutex_;

    std::shared_ptr<const LogSink> sink_;
    std::mutex sink_mutex_;

    mutable std::atomic<uint64_t> total_logs_{0};
    mutable std::atomic<uint64_t> dropped_logs_{0};
    mutable std::atomic<uint64_t> file_writes_{0};
    mutable std::atomic<uint64_t> console_writes_{0};

    std::atomic<bool> initialized_{false};
};

#define LOG_TRACE(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Trace, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Debug, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Info, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_WARNING(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Warning, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Error, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(category, ...) \
    ::sightline::core::Logger::instance().log_fmt<::sightline::core::LogLevel::Critical, ::sightline::core::LogCategory::category>(std::source_location::current(), __VA_ARGS__)

#define LOG_SCOPE_TIMER(name) \
    ::sightline::core::ScopedTimer SIGHTLINE_UNIQUE_NAME(timer_)(name)

#define LOG_SCOPE_TIMER_CAT(name, category) \
    ::sightline::core::ScopedTimer SIGHTLINE_UNIQUE_NAME(timer_)(name, ::sightline::core::LogCategory::category)

#define SIGHTLINE_CONCAT_IMPL(a, b) a##b
#define SIGHTLINE_CONCAT(a, b) SIGHTLINE_CONCAT_IMPL(a, b)
#define SIGHTLINE_UNIQUE_NAME(prefix) SIGHTLINE_CONCAT(prefix, __LINE__)

} // namespace sightline::core
