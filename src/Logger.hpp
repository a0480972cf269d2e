#ifndef RFC3986_LOGGER_HPP
#define RFC3986_LOGGER_HPP

/**
 * @file Logger.hpp
 *
 * This module declares the Rfc3986::Log function used inside
 * the library to publish diagnostic messages.
 *
 * © 2018 by Richard Walters
 */

#include <Rfc3986/Logging.hpp>
#include <string>

namespace Rfc3986 {

    /**
     * This function publishes a diagnostic message, if its level is
     * at or above the level set with SetLoggingLevel.
     *
     * @param[in] level
     *     This is the severity level of the message.
     *
     * @param[in] message
     *     This is the message to publish.
     */
    void Log(
        LogLevel level,
        const std::string& message
    );

    /**
     * This function returns an indication of whether or not messages
     * of the given level are currently published.
     *
     * @param[in] level
     *     This is the severity level to check.
     *
     * @return
     *     An indication of whether or not messages of the
     *     given level are published is returned.
     */
    bool IsLogging(LogLevel level);

}

#endif /* RFC3986_LOGGER_HPP */
