#include "logger.hpp"

#include <cctype>
#include <algorithm>

namespace ml {

namespace {
    std::atomic<LogLevel> g_log_level{LogLevel::INFO};
}

LogLevel log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel parse_log_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRIT" || upper == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

Logger& core_logger() {
    static Logger logger("CORE");
    return logger;
}

Logger::Logger(std::string module_name,
        bool use_colors,
        bool use_timestamps)
    : module_name_(std::move(module_name))
    , use_colors_(use_colors)
    , use_timestamps_(use_timestamps) {}

void Logger::trace_enter(const std::string& function_name, const std::string& args) {
    if (args.empty()) {
        trace("--> {}", function_name);
    } else {
        trace("--> {}({})", function_name, args);
    }
}

void Logger::initialize(const std::string& level, const std::string& log_file) {
    set_log_level(parse_log_level(level));
    if (!log_file.empty()) {
        enable_file_logging(log_file);
    }
}

void Logger::shutdown() {
    disable_file_logging();
}

void Logger::enable_file_logging(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    log_file_.open(filename, std::ios::app);
    file_logging_enabled_ = log_file_.is_open();

    if (file_logging_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto now_time_t = std::chrono::system_clock::to_time_t(now);
        std::tm now_tm;
        localtime_r(&now_time_t, &now_tm);
        log_file_ << "\n\n=== Logging started at: "
                  << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S")
                  << " ===\n";
    }
}

void Logger::disable_file_logging() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    file_logging_enabled_ = false;
}

fmt::text_style Logger::get_fmt_style(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE:    return fmt::fg(fmt::color::gray);
        case LogLevel::DEBUG:    return fmt::fg(fmt::color::cyan);
        case LogLevel::INFO:     return fmt::fg(fmt::color::green);
        case LogLevel::WARNING:  return fmt::fg(fmt::color::yellow);
        case LogLevel::ERROR:    return fmt::fg(fmt::color::red);
        case LogLevel::CRITICAL: return fmt::fg(fmt::color::magenta) | fmt::emphasis::bold;
        default:                 return {};
    }
}

const char* Logger::level_to_str(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARN";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default:                 return "UNKNOWN";
    }
}

// Консоль: stderr, с цветами
void Logger::output_to_console(LogLevel level, const std::string& message) {
    if (use_colors_) {
        fmt::print(stderr, get_fmt_style(level), "{}\n", message);
    } else {
        fmt::print(stderr, "{}\n", message);
    }
}

// Файл: без цветов
void Logger::output_to_file(const std::string& message) {
    if (file_logging_enabled_ && log_file_.is_open()) {
        log_file_ << message << std::endl;
    }
}

std::mutex Logger::log_mutex_;
std::ofstream Logger::log_file_;
bool Logger::file_logging_enabled_ = false;

} // namespace ml
