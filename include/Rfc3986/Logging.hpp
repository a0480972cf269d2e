#ifndef RFC3986_LOGGING_HPP
#define RFC3986_LOGGING_HPP

/**
 * @file Logging.hpp
 *
 * This module declares the functions which control the diagnostic
 * messages published by the library.
 *
 * © 2018 by Richard Walters
 */

namespace Rfc3986 {

    /**
     * These are the severity levels of diagnostic messages.
     */
    enum class LogLevel {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off,
    };

    /**
     * This function sets the minimum level of the diagnostic messages
     * which the library will publish.  The default is LogLevel::Warn.
     *
     * @param[in] level
     *     This is the minimum level of messages to publish.
     */
    void SetLoggingLevel(LogLevel level);

}

#endif /* RFC3986_LOGGING_HPP */
