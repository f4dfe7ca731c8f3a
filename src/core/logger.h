#pragma once

#include <memory>
#include <string>

// Include format library for format string support
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

#define TICKETMCP_TRACE(...) ::ticketmcp::core::Logger::instance().trace(__VA_ARGS__)
#define TICKETMCP_DEBUG(...) ::ticketmcp::core::Logger::instance().debug(__VA_ARGS__)
#define TICKETMCP_INFO(...) ::ticketmcp::core::Logger::instance().info(__VA_ARGS__)
#define TICKETMCP_WARN(...) ::ticketmcp::core::Logger::instance().warn(__VA_ARGS__)
#define TICKETMCP_ERROR(...) ::ticketmcp::core::Logger::instance().error(__VA_ARGS__)
#define TICKETMCP_CRITICAL(...) ::ticketmcp::core::Logger::instance().critical(__VA_ARGS__)

namespace ticketmcp {
    namespace core {

        /**
        * @brief Log levels for the logger, numerically aligned with spdlog::level
        */
        enum class LogLevel {
            TRACE = 0,
            DEBUG = 1,
            INFO = 2,
            WARN = 3,
            ERR = 4,
            CRITICAL = 5,
            OFF = 6
        };

        // global logger instance
        extern std::shared_ptr<spdlog::logger> g_logger;
        extern LogLevel g_current_level;

        /**
        * @brief Map a config string (trace, debug, info, warn, error, critical, off) to a LogLevel.
        * Unknown strings map to INFO.
        */
        LogLevel parse_log_level(const std::string &name);

        /**
        * @brief Process-wide facade over the spdlog logger
        */
        class Logger {
        public:
            static Logger &instance();

            std::shared_ptr<spdlog::logger> operator->();

            template<typename... Args>
            void trace(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void debug(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void info(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void warn(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void error(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::ERR, fmt, std::forward<Args>(args)...);
            }

            template<typename... Args>
            void critical(fmt::format_string<Args...> fmt, Args &&...args) {
                log(LogLevel::CRITICAL, fmt, std::forward<Args>(args)...);
            }

            // Overloads for plain messages without format arguments
            void trace(const char *msg);
            void debug(const char *msg);
            void info(const char *msg);
            void warn(const char *msg);
            void error(const char *msg);
            void critical(const char *msg);

            void set_level(LogLevel level);
            LogLevel get_level() const;

        private:
            Logger() = default;

            static bool enabled(LogLevel level) {
                return g_logger && static_cast<int>(level) >= static_cast<int>(g_current_level);
            }

            template<typename... Args>
            void log(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) {
                if (!enabled(level)) {
                    return;
                }

                try {
                    std::string formatted_msg = fmt::format(fmt, std::forward<Args>(args)...);
                    g_logger->log(static_cast<spdlog::level::level_enum>(static_cast<int>(level)), formatted_msg);
                } catch (const std::exception &e) {
                    // Fallback in case of formatting error
                    g_logger->error("Log formatting error: {}", e.what());
                }
            }
        };

        /**
        * @brief Initialize global spdlog in asynchronous mode
        * @param log_path Log file path, empty disables the rotating file sink
        * @param log_level Log level (trace, debug, info, warn, error, critical, off)
        * @param max_file_size Maximum size of each log file (bytes)
        * @param max_files Maximum number of log files
        * @param console_to_stderr Route console output to stderr (stdout carries protocol frames in stdio mode)
        */
        void initializeAsyncLogger(
                const std::string &log_path,
                const std::string &log_level = "info",
                size_t max_file_size = 1048576 * 5,// 5MB
                size_t max_files = 3,
                bool console_to_stderr = false);

        /**
        * @brief Flush and drop the global logger, used on shutdown
        */
        void shutdownLogger();

    }// namespace core
}// namespace ticketmcp
