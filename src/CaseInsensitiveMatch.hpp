#ifndef RFC3986_CASE_INSENSITIVE_MATCH_HPP
#define RFC3986_CASE_INSENSITIVE_MATCH_HPP

/**
 * @file CaseInsensitiveMatch.hpp
 *
 * This module declares the Rfc3986::IsCaseInsensitiveMatch function.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>

namespace Rfc3986 {

    /**
     * This function checks whether or not the given text begins
     * with the given lower-case literal, ignoring the case
     * of the letters in the text.
     *
     * @param[in] text
     *     This points to the text to check.
     *
     * @param[in] length
     *     This is the number of characters available in the text.
     *
     * @param[in] lowerCaseLiteral
     *     This is the null-terminated, all lower-case literal
     *     to look for.
     *
     * @return
     *     The number of characters of the text matched by the literal
     *     is returned.
     *
     * @retval 0
     *     This is returned if the text does not begin with the literal.
     */
    size_t IsCaseInsensitiveMatch(
        const char* text,
        size_t length,
        const char* lowerCaseLiteral
    );

}

#endif /* RFC3986_CASE_INSENSITIVE_MATCH_HPP */
