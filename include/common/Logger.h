#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace stockcast {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // initialize() 전에는 아무것도 기록하지 않는다 (테스트/라이브러리 사용 시 조용함)
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        write(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        write(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        write(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        write(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    void setLevel(const std::string& level);

    // predictions.log: symbol,direction,confidence,price,model
    void logPrediction(const std::string& symbol, const std::string& direction,
                       double confidence, double price, const std::string& model_name);

private:
    Logger() = default;

    template<typename... Args>
    void write(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->log(level, fmt, std::forward<Args>(args)...);
        }
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> prediction_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) stockcast::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) stockcast::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) stockcast::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) stockcast::Logger::getInstance().error(__VA_ARGS__)

} // namespace stockcast
