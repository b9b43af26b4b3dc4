#include "utils/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace seroherd {

    Logger& Logger::getInstance() {
        static Logger instance;
        return instance;
    }

    void Logger::setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::getLogLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void Logger::setOutputStream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        redirect_ = stream;
    }

    bool Logger::isEnabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(level) >= static_cast<int>(level_);
    }

    void Logger::debug(const std::string& source, const std::string& message) {
        log(LogLevel::DEBUG, source, message);
    }

    void Logger::info(const std::string& source, const std::string& message) {
        log(LogLevel::INFO, source, message);
    }

    void Logger::warning(const std::string& source, const std::string& message) {
        log(LogLevel::WARNING, source, message);
    }

    void Logger::error(const std::string& source, const std::string& message) {
        log(LogLevel::ERROR, source, message);
    }

    void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(level_)) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local_tm{};
#if defined(_WIN32)
        localtime_s(&local_tm, &now);
#else
        localtime_r(&now, &local_tm);
#endif
        std::ostringstream line;
        line << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
             << " [" << levelToString(level) << "] [" << source << "] " << message << '\n';

        std::ostream* out = redirect_;
        if (!out) {
            out = (level >= LogLevel::WARNING) ? &std::cerr : &std::cout;
        }
        (*out) << line.str();
        out->flush();
    }

    std::string Logger::levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR:   return "ERROR";
        }
        return "UNKNOWN";
    }

} // namespace seroherd
