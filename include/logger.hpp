#pragma once

#include <mutex>
#include <atomic>
#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <fstream>
#include <string_view>

#include "fmt/color.h"
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "fmt/chrono.h"

namespace ml {

/**
  * @brief Уровни детализации логов.
*/
enum class LogLevel {
    /// Дамп сообщений протокола, шаги циклов чтения.
    TRACE,

    /// Вход в команды, ответы бэкенда, выбор версии протокола.
    DEBUG,

    /// Подключение к бэкенду, начало и конец передачи файла.
    INFO,

    /// Некритичные аномалии: ошибка при закрытии сокета, исключение в подписчике.
    WARNING,

    /// Команда завершилась ошибкой, соединение продолжает работать.
    ERROR,

    /// Фатальная ошибка, приложение завершается.
    CRITICAL
};

// Глобальный порог логирования, общий для всех модулей
LogLevel log_level();
void set_log_level(LogLevel level);

// "trace", "DEBUG", "warn"... Неизвестное значение -> INFO
LogLevel parse_log_level(std::string_view name);

class Logger {
public:
    explicit Logger(std::string module_name,
                    bool use_colors = true,
                    bool use_timestamps = true);

    // Базовый метод логирования
    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
        if (level < log_level()) {
            return;
        }

        std::string message = format_message(level, fmt, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(log_mutex_);
        output_to_console(level, message);
        output_to_file(message);
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::WARNING, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::ERROR, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::CRITICAL, fmt, std::forward<Args>(args)...);
    }

    // Трассировка вызовов команд
    void trace_enter(const std::string& function_name, const std::string& args = "");

    // Настройка из конфигурации при старте приложения
    static void initialize(const std::string& level, const std::string& log_file);
    static void shutdown();

    static void enable_file_logging(const std::string& filename);
    static void disable_file_logging();

private:
    std::string module_name_;
    bool use_colors_;
    bool use_timestamps_;

    static std::mutex log_mutex_;
    static std::ofstream log_file_;
    static bool file_logging_enabled_;

    fmt::text_style get_fmt_style(LogLevel level) const;
    static const char* level_to_str(LogLevel level);

    template<typename... Args>
    std::string format_message(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
        std::string user_msg;
        try {
            user_msg = fmt::format(fmt, std::forward<Args>(args)...);
        } catch (const fmt::format_error& e) {
            user_msg = fmt::format("Format error: {} | Original args count: {}", e.what(), sizeof...(Args));
        }

        std::ostringstream oss;

        if (use_timestamps_) {
            auto now = std::chrono::system_clock::now();
            auto now_time_t = std::chrono::system_clock::to_time_t(now);
            auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::tm now_tm;
            localtime_r(&now_time_t, &now_tm);
            oss << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S")
                << '.' << std::setfill('0') << std::setw(3) << now_ms.count() << ' ';
        }

        oss << '[' << level_to_str(level) << "] ";
        oss << '[' << module_name_ << "] " << user_msg;

        return oss.str();
    }

    void output_to_console(LogLevel level, const std::string& message);
    void output_to_file(const std::string& message);
};

// Логгер модуля CORE, через него работают макросы LOG_*
Logger& core_logger();

} // namespace ml

// Логгер уровня файла: LOGGER("WIRE"); logger.trace(...)
#define LOGGER(module_name) \
    static ::ml::Logger logger(module_name)

#define LOG_DEBUG(...)    ::ml::core_logger().debug(__VA_ARGS__)
#define LOG_INFO(...)     ::ml::core_logger().info(__VA_ARGS__)
#define LOG_WARN(...)     ::ml::core_logger().warning(__VA_ARGS__)
#define LOG_CRITICAL(...) ::ml::core_logger().critical(__VA_ARGS__)

// Трассировка входа в команды
#define LOG_TRACE_ENTER_ARGS(...) \
    if (::ml::log_level() <= ::ml::LogLevel::TRACE) { \
        ::ml::core_logger().trace_enter(__FUNCTION__, fmt::format(__VA_ARGS__)); \
    }
