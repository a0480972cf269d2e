/**
 * @file Logging.cpp
 *
 * This module contains the implementation of the diagnostic message
 * functions, on top of spdlog.
 *
 * © 2018 by Richard Walters
 */

#include "Logger.hpp"

#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

    /**
     * This function converts the given library log level into
     * the corresponding spdlog level.
     *
     * @param[in] level
     *     This is the level to convert.
     *
     * @return
     *     The spdlog level is returned.
     */
    spdlog::level::level_enum Convert(Rfc3986::LogLevel level) {
        switch (level) {
            case Rfc3986::LogLevel::Trace: return spdlog::level::trace;
            case Rfc3986::LogLevel::Debug: return spdlog::level::debug;
            case Rfc3986::LogLevel::Info: return spdlog::level::info;
            case Rfc3986::LogLevel::Warn: return spdlog::level::warn;
            case Rfc3986::LogLevel::Error: return spdlog::level::err;
            case Rfc3986::LogLevel::Off:
            default: return spdlog::level::off;
        }
    }

    /**
     * This holds the one logger shared by the whole library.
     */
    class Logger {
    public:
        void SetLevel(Rfc3986::LogLevel level) {
            logger_->set_level(Convert(level));
        }

        void Log(
            Rfc3986::LogLevel level,
            const std::string& message
        ) {
            logger_->log(Convert(level), message);
        }

        bool ShouldLog(Rfc3986::LogLevel level) const {
            return logger_->should_log(Convert(level));
        }

        static Logger& GetInstance() {
            static Logger instance;
            return instance;
        }

    private:
        Logger()
            : logger_(spdlog::stdout_color_mt("rfc3986"))
        {
            logger_->set_level(spdlog::level::warn);
        }

        std::shared_ptr< spdlog::logger > logger_;
    };

}

namespace Rfc3986 {

    void SetLoggingLevel(LogLevel level) {
        Logger::GetInstance().SetLevel(level);
    }

    void Log(
        LogLevel level,
        const std::string& message
    ) {
        Logger::GetInstance().Log(level, message);
    }

    bool IsLogging(LogLevel level) {
        return Logger::GetInstance().ShouldLog(level);
    }

}
