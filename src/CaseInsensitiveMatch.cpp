/**
 * @file CaseInsensitiveMatch.cpp
 *
 * This module contains the implementation of the
 * Rfc3986::IsCaseInsensitiveMatch function.
 *
 * © 2018 by Richard Walters
 */

#include "CaseInsensitiveMatch.hpp"

#include <ctype.h>

namespace Rfc3986 {

    size_t IsCaseInsensitiveMatch(
        const char* text,
        size_t length,
        const char* lowerCaseLiteral
    ) {
        size_t matched = 0;
        while (lowerCaseLiteral[matched] != '\0') {
            if (
                (matched >= length)
                || (tolower((unsigned char)text[matched]) != lowerCaseLiteral[matched])
            ) {
                return 0;
            }
            ++matched;
        }
        return matched;
    }

}
