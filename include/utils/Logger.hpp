#ifndef SEROHERD_LOGGER_HPP
#define SEROHERD_LOGGER_HPP

#include <mutex>
#include <ostream>
#include <string>

namespace seroherd {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    /**
     * @brief Process-wide, thread-safe logger.
     *
     * Lines have the form "YYYY-mm-dd HH:MM:SS [LEVEL] [source] message".
     * DEBUG and INFO go to the standard output stream, WARNING and ERROR to the
     * error stream, unless both are redirected with setOutputStream().
     */
    class Logger {
    public:
        static Logger& getInstance();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void setLogLevel(LogLevel level);
        LogLevel getLogLevel() const;

        /**
         * @brief Redirect every level to one stream (nullptr restores the defaults).
         * The stream must outlive its use by the logger.
         */
        void setOutputStream(std::ostream* stream);

        bool isEnabled(LogLevel level) const;

        void debug(const std::string& source, const std::string& message);
        void info(const std::string& source, const std::string& message);
        void warning(const std::string& source, const std::string& message);
        void error(const std::string& source, const std::string& message);

        void log(LogLevel level, const std::string& source, const std::string& message);

        static std::string levelToString(LogLevel level);

    private:
        Logger() = default;

        LogLevel level_ = LogLevel::INFO;
        std::ostream* redirect_ = nullptr;
        mutable std::mutex mutex_;
    };

} // namespace seroherd

#endif // SEROHERD_LOGGER_HPP
