#ifndef RFC3986_PERCENT_ENCODING_HPP
#define RFC3986_PERCENT_ENCODING_HPP

/**
 * @file PercentEncoding.hpp
 *
 * This module declares the functions which apply and remove
 * the "percent-encoding" of RFC 3986 (https://tools.ietf.org/html/rfc3986).
 *
 * © 2018 by Richard Walters
 */

#include <string>

namespace Rfc3986 {

    /**
     * This function decodes the given percent-encoded text.
     *
     * Every "%" followed by two hex digits is replaced by the octet
     * those digits represent.  Hex digits of either case are accepted,
     * and all other characters are copied through unchanged.
     *
     * A "%" with fewer than two characters left after it in the
     * text is copied through unchanged, along with those characters.
     *
     * @param[in] encoded
     *     This is the text to decode.
     *
     * @param[out] decoded
     *     This is where to store the decoded text.
     *
     * @return
     *     An indication of whether or not the text was decoded
     *     successfully is returned.
     *
     * @retval false
     *     This is returned if a "%" is followed by two characters
     *     which are not both hex digits.
     */
    bool PercentDecode(
        const std::string& encoded,
        std::string& decoded
    );

    /**
     * This function percent-encodes the given text, appending
     * the result to the given output string.
     *
     * Characters in the "unreserved" set (ALPHA, DIGIT, "-", ".", "_",
     * and "~") are copied through; every other octet is written
     * as "%" followed by two upper-case hex digits.
     *
     * @param[in] text
     *     This is the text to encode.
     *
     * @param[in,out] out
     *     This is the string to which to append the encoded text.
     */
    void PercentEncode(
        const std::string& text,
        std::string& out
    );

    /**
     * This function percent-encodes the given text.
     *
     * @param[in] text
     *     This is the text to encode.
     *
     * @return
     *     The encoded text is returned.
     */
    std::string PercentEncode(const std::string& text);

}

#endif /* RFC3986_PERCENT_ENCODING_HPP */
