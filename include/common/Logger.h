#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace marketlens {

class Logger {
public:
    static Logger& getInstance();

    // Console output goes to stderr; stdout is reserved for the assessment JSON.
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) marketlens::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) marketlens::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) marketlens::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) marketlens::Logger::getInstance().error(__VA_ARGS__)

} // namespace marketlens
