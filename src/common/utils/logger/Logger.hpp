// src/common/utils/logger/Logger.hpp
#pragma once

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <memory>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifndef COMPILE_LOG_LEVEL
    #ifdef NDEBUG
        #define COMPILE_LOG_LEVEL 1  // Release: INFO 이상
    #else
        #define COMPILE_LOG_LEVEL 0  // Debug: 모든 로그
    #endif
#endif

namespace secret_env::utils {

enum class LogLevel : int {
    DEBUG = 0,  // 개발 디버깅
    INFO = 1,   // 주요 이벤트
    WARN = 2,   // 경고
    ERROR = 3,  // 오류
    FATAL = 4,  // 치명적 오류
    NONE = 5    // 로그 비활성화
};

/**
 * @brief 프로세스 전역 로거 (싱글톤)
 *
 * 모든 로그는 stderr 또는 파일로 출력
 * stdout은 CLI의 KEY=VALUE 출력 전용이므로 사용하지 않음
 * 시크릿 값은 절대 로그에 남기지 않음
 */
class Logger {
private:
    inline static std::unique_ptr<Logger> instance = nullptr;
    inline static std::mutex instance_mutex;

    LogLevel min_level = static_cast<LogLevel>(COMPILE_LOG_LEVEL > 1 ? COMPILE_LOG_LEVEL : 1);
    std::mutex log_mutex;
    std::ofstream file;
    bool console_enabled = true;
    bool file_enabled = false;

    Logger() = default;

    static const char* LogLevelToString(LogLevel level) {
        switch(level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKN ";
        }
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

public:
    static Logger& Instance() {
        std::lock_guard<std::mutex> lock(instance_mutex);
        if (!instance) {
            instance.reset(new Logger());
        }
        return *instance;
    }

    static LogLevel StringToLogLevel(const char* str) {
        if (!str) return LogLevel::INFO;

        std::string level_str(str);
        if (level_str == "DEBUG" || level_str == "debug" || level_str == "0") return LogLevel::DEBUG;
        if (level_str == "INFO"  || level_str == "info"  || level_str == "1") return LogLevel::INFO;
        if (level_str == "WARN"  || level_str == "warn"  || level_str == "2") return LogLevel::WARN;
        if (level_str == "ERROR" || level_str == "error" || level_str == "3") return LogLevel::ERROR;
        if (level_str == "FATAL" || level_str == "fatal" || level_str == "4") return LogLevel::FATAL;
        if (level_str == "NONE"  || level_str == "none"  || level_str == "5") return LogLevel::NONE;

        return LogLevel::INFO;
    }

    /**
     * @brief 로거 초기화
     *
     * @param log_file 로그 파일 경로 (nullptr이면 파일 출력 안 함)
     * @param enable_console stderr 출력 여부
     * @param level_override 레벨 문자열 (nullptr이면 RUNTIME_LOG_LEVEL, LOG_LEVEL 순으로 확인)
     */
    void Initialize(const char* log_file = nullptr, bool enable_console = true,
                    const char* level_override = nullptr) {
        std::lock_guard<std::mutex> lock(log_mutex);
        console_enabled = enable_console;

        if (log_file) {
            file.open(log_file, std::ios::app);
            file_enabled = file.is_open();
        }

        const char* runtime_level = level_override;
        if (!runtime_level) {
            runtime_level = std::getenv("RUNTIME_LOG_LEVEL");
        }
        if (!runtime_level) {
            runtime_level = std::getenv("LOG_LEVEL");
        }

        if (runtime_level) {
            LogLevel requested_level = StringToLogLevel(runtime_level);

            if (static_cast<int>(requested_level) < COMPILE_LOG_LEVEL) {
                std::cerr << "[Logger] Warning: RUNTIME_LOG_LEVEL("
                         << static_cast<int>(requested_level)
                         << ") < COMPILE_LOG_LEVEL(" << COMPILE_LOG_LEVEL
                         << "). Using COMPILE_LOG_LEVEL." << std::endl;
                min_level = static_cast<LogLevel>(COMPILE_LOG_LEVEL);
            } else {
                min_level = requested_level;
            }
        }
    }

    void SetLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(log_mutex);
        min_level = level;
    }

    LogLevel GetLevel() const { return min_level; }

    void Log(LogLevel level, const char* category, const char* message) {
        if (static_cast<int>(level) < static_cast<int>(min_level)) return;

        std::string log_line = GetTimestamp() + " [" + LogLevelToString(level) + "] " +
                               "[" + category + "] " + message + "\n";

        std::lock_guard<std::mutex> lock(log_mutex);

        if (console_enabled) {
            std::cerr << log_line;
        }

        if (file_enabled && file.is_open()) {
            file << log_line;
            if (level >= LogLevel::ERROR) {
                file.flush();
            }
        }
    }

    void Logf(LogLevel level, const char* category, const char* format, ...) {
        if (static_cast<int>(level) < static_cast<int>(min_level)) return;

        char buffer[4096];
        va_list args;
        va_start(args, format);
        std::vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        Log(level, category, buffer);
    }

    ~Logger() {
        if (file.is_open()) {
            file.close();
        }
    }
};

} // namespace secret_env::utils

// ========================================
// 컴파일 타임 로그 제거 매크로
// ========================================

#define LOG_IMPL(level, cat, msg) \
    secret_env::utils::Logger::Instance().Log(secret_env::utils::LogLevel::level, cat, msg)

#define LOG_IMPLF(level, cat, fmt, ...) \
    secret_env::utils::Logger::Instance().Logf(secret_env::utils::LogLevel::level, cat, fmt, ##__VA_ARGS__)

#if COMPILE_LOG_LEVEL <= 0
    #define LOG_DEBUG(cat, msg) LOG_IMPL(DEBUG, cat, msg)
    #define LOG_DEBUGF(cat, fmt, ...) LOG_IMPLF(DEBUG, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_DEBUG(cat, msg) ((void)0)
    #define LOG_DEBUGF(cat, fmt, ...) ((void)0)
#endif

#if COMPILE_LOG_LEVEL <= 1
    #define LOG_INFO(cat, msg) LOG_IMPL(INFO, cat, msg)
    #define LOG_INFOF(cat, fmt, ...) LOG_IMPLF(INFO, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_INFO(cat, msg) ((void)0)
    #define LOG_INFOF(cat, fmt, ...) ((void)0)
#endif

#if COMPILE_LOG_LEVEL <= 2
    #define LOG_WARN(cat, msg) LOG_IMPL(WARN, cat, msg)
    #define LOG_WARNF(cat, fmt, ...) LOG_IMPLF(WARN, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_WARN(cat, msg) ((void)0)
    #define LOG_WARNF(cat, fmt, ...) ((void)0)
#endif

#if COMPILE_LOG_LEVEL <= 3
    #define LOG_ERROR(cat, msg) LOG_IMPL(ERROR, cat, msg)
    #define LOG_ERRORF(cat, fmt, ...) LOG_IMPLF(ERROR, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_ERROR(cat, msg) ((void)0)
    #define LOG_ERRORF(cat, fmt, ...) ((void)0)
#endif

#if COMPILE_LOG_LEVEL <= 4
    #define LOG_FATAL(cat, msg) LOG_IMPL(FATAL, cat, msg)
    #define LOG_FATALF(cat, fmt, ...) LOG_IMPLF(FATAL, cat, fmt, ##__VA_ARGS__)
#else
    #define LOG_FATAL(cat, msg) ((void)0)
    #define LOG_FATALF(cat, fmt, ...) ((void)0)
#endif
