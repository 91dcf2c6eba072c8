#include <sightline/core/log.hpp>

#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <thread>
#include <ctime>

namespace sightline::core {

// ANSI color codes for console output
namespace {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* GRAY = "\033[90m";
    constexpr const char* CYAN = "\033[96m";
    constexpr const char* GREEN = "\033[92m";
    constexpr const char* YELLOW = "\033[93m";
    constexpr const char* RED = "\033[91m";
    constexpr const char* BOLD_RED = "\033[1;91m";

    std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm;
#ifdef _WIN32
        localtime_s(&tm, &time_t);
#else
        localtime_r(&time_t, &tm);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::string get_thread_id() {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        return oss.str();
    }
}

ScopedTimer::ScopedTimer(std::string_view name, LogCategory category)
    : name_(name)
    , category_(category)
    , start_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto& logger = Logger::instance();
    if (!logger.should_log(LogLevel::Debug, category_)) {
        return;
    }

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    logger.log_impl(LogLevel::Debug, category_,
                    std::format("{} took {:.3f}ms", name_, duration.count() / 1000.0),
                    std::source_location::current());
}

Logger::~Logger() {
    shutdown();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path, bool append, LogLevel min_level) {
    if (initialized_.exchange(true, std::memory_order_acquire)) {
        return;
    }

    log_file_path_ = log_file_path;
    min_level_.store(min_level, std::memory_order_relaxed);

    std::filesystem::path log_path(log_file_path);
    if (log_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    std::ios_base::openmode mode = std::ios::out;
    mode |= append ? std::ios::app : std::ios::trunc;

    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        log_file_.open(log_file_path, mode);
    }
    if (!log_file_.is_open()) {
        std::cerr << "Failed to open log file: " << log_file_path << std::endl;
        return;
    }

    log_impl(LogLevel::Info, LogCategory::General,
             std::format("Logger initialized - Log file: {}", log_file_path),
             std::source_location::current());
}

void Logger::shutdown() {
    if (!initialized_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    auto stats = get_stats();
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_ << std::format("Logger stats - Total: {} | Dropped: {} | File writes: {} | Console writes: {}",
                                 stats.total_logs, stats.dropped_logs, stats.file_writes, stats.console_writes)
                  << std::endl;
        log_file_.close();
    }
}

void Logger::set_min_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

void Logger::enable_category(LogCategory category, bool enabled) noexcept {
    uint32_t mask = 1u << static_cast<uint32_t>(category);
    if (enabled) {
        enabled_categories_.fetch_or(mask, std::memory_order_relaxed);
    } else {
        enabled_categories_.fetch_and(~mask, std::memory_order_relaxed);
    }
}

bool Logger::is_category_enabled(LogCategory category) const noexcept {
    uint32_t mask = 1u << static_cast<uint32_t>(category);
    return (enabled_categories_.load(std::memory_order_relaxed) & mask) != 0;
}

void Logger::set_sink(LogSink sink) {
    std::shared_ptr<const LogSink> installed;
    if (sink) {
        installed = std::make_shared<const LogSink>(std::move(sink));
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(installed);
}

void Logger::log_impl(LogLevel level, LogCategory category, std::string_view message,
                      const std::source_location& location) {
    total_logs_.fetch_add(1, std::memory_order_relaxed);

    // Set while this thread is inside the sink
    thread_local bool in_sink = false;
    if (!in_sink) {
        std::shared_ptr<const LogSink> sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = sink_;
        }
        if (sink) {
            struct Reset {
                bool& flag;
                ~Reset() { flag = false; }
            } reset{in_sink};
            in_sink = true;
            (*sink)(level, category, message);
        }
    }

    const bool to_file = initialized_.load(std::memory_order_acquire);
    const bool to_console = console_output_.load(std::memory_order_relaxed);
    if (!to_file && !to_console) {
        return;
    }

    std::string formatted = format_log_entry(level, category, message, location);

    if (to_file) {
        write_to_file(formatted);
    }
    if (to_console) {
        write_to_console(level, formatted);
    }
}

void Logger::write_to_file(std::string_view formatted_message) {
    std::lock_guard<std::mutex> lock(file_mutex_);

    if (log_file_.is_open()) {
        log_file_ << formatted_message << '\n';
        file_writes_.fetch_add(1, std::memory_order_relaxed);
    } else {
        dropped_logs_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Logger::write_to_console(LogLevel level, std::string_view formatted_message) {
    const char* color = level_to_color_code(level);

    if (level >= LogLevel::Error) {
        std::cerr << color << formatted_message << RESET << std::endl;
    } else {
        std::cout << color << formatted_message << RESET << std::endl;
    }

    console_writes_.fetch_add(1, std::memory_order_relaxed);
}

std::string Logger::format_log_entry(LogLevel level, LogCategory category,
                                     std::string_view message,
                                     const std::source_location& location) const {
    // Format: [TIMESTAMP] [LEVEL] [CATEGORY] [thread:THREAD_ID] message (file:line)
    std::ostringstream oss;

    oss << "[" << get_timestamp() << "] "
        << "[" << level_to_string(level) << "] "
        << "[" << category_to_string(category) << "] "
        << "[thread:" << get_thread_id() << "] "
        << message;

    if (level <= LogLevel::Debug) {
        std::filesystem::path file_path(location.file_name());
        oss << " (" << file_path.filename().string() << ":" << location.line() << ")";
    }

    return oss.str();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_.is_open()) {
        log_file_.flush();
    }
}

Logger::Stats Logger::get_stats() const noexcept {
    Stats stats;
    stats.total_logs = total_logs_.load(std::memory_order_relaxed);
    stats.dropped_logs = dropped_logs_.load(std::memory_order_relaxed);
    stats.file_writes = file_writes_.load(std::memory_order_relaxed);
    stats.console_writes = console_writes_.load(std::memory_order_relaxed);
    return stats;
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRIT";
        default: return "UNKNOWN";
    }
}

const char* Logger::category_to_string(LogCategory category) noexcept {
    switch (category) {
        case LogCategory::General: return "General";
        case LogCategory::Geometry: return "Geometry";
        case LogCategory::Terrain: return "Terrain";
        case LogCategory::Collision: return "Collision";
        case LogCategory::Vision: return "Vision";
        case LogCategory::Analysis: return "Analysis";
        case LogCategory::Config: return "Config";
        case LogCategory::Performance: return "Perf";
        default: return "Unknown";
    }
}

const char* Logger::level_to_color_code(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info: return GREEN;
        case LogLevel::Warning: return YELLOW;
        case LogLevel::Error: return RED;
        case LogLevel::Critical: return BOLD_RED;
        default: return RESET;
    }
}

} // namespace sightline::core
