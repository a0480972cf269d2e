/**
 * @file DecodeElement.cpp
 *
 * This module contains the implementation of the
 * Rfc3986::DecodeElement function.
 *
 * © 2018 by Richard Walters
 */

#include "DecodeElement.hpp"
#include "Logger.hpp"

#include <Rfc3986/PercentEncoding.hpp>

namespace Rfc3986 {

    std::string DecodeElement(const Substring& element) {
        const auto encoded = element.ToString();
        std::string decoded;
        if (!PercentDecode(encoded, decoded)) {
            Log(
                LogLevel::Warn,
                "malformed percent-encoding kept as-is: \"" + encoded + "\""
            );
            return encoded;
        }
        return decoded;
    }

}
