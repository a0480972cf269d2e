#ifndef RFC3986_CHARACTER_CLASSES_HPP
#define RFC3986_CHARACTER_CLASSES_HPP

/**
 * @file CharacterClasses.hpp
 *
 * This module declares the character classes of the grammar
 * in RFC 3986 (https://tools.ietf.org/html/rfc3986).
 *
 * The sets are built on first use, so they may be used safely
 * from the initializers of other static objects.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"

namespace Rfc3986 {

    /**
     * This returns the set containing just the alphabetic characters
     * from the ASCII character set ("ALPHA").
     */
    const CharacterSet& Alpha();

    /**
     * This returns the set containing just numbers ("DIGIT").
     */
    const CharacterSet& Digit();

    /**
     * This returns the set of characters allowed in a
     * hexadecimal digit ("HEXDIG").
     */
    const CharacterSet& Hexdig();

    /**
     * This returns the set corresponding to the "unreserved" syntax.
     */
    const CharacterSet& Unreserved();

    /**
     * This returns the set corresponding to the "sub-delims" syntax.
     */
    const CharacterSet& SubDelims();

    /**
     * This returns the set corresponding to the "gen-delims" syntax.
     */
    const CharacterSet& GenDelims();

    /**
     * This returns the set corresponding to the "reserved" syntax.
     */
    const CharacterSet& Reserved();

    /**
     * This returns the set corresponding to the characters after the
     * first one in the "scheme" syntax.
     */
    const CharacterSet& SchemeNotFirst();

    /**
     * This returns the set corresponding to the "pchar" syntax,
     * leaving out "pct-encoded".
     */
    const CharacterSet& PcharNotPctEncoded();

    /**
     * This returns the set corresponding to the "segment-nz-nc" syntax,
     * leaving out "pct-encoded".
     */
    const CharacterSet& SegmentNzNcNotPctEncoded();

    /**
     * This returns the set corresponding to the "query" and "fragment"
     * syntax, leaving out "pct-encoded".
     */
    const CharacterSet& QueryOrFragmentNotPctEncoded();

    /**
     * This returns the set corresponding to the "userinfo" syntax,
     * leaving out "pct-encoded".
     */
    const CharacterSet& UserInfoNotPctEncoded();

    /**
     * This returns the set corresponding to the "reg-name" syntax,
     * leaving out "pct-encoded".
     */
    const CharacterSet& RegNameNotPctEncoded();

    /**
     * This returns the set corresponding to the last part of
     * the "IPvFuture" syntax.
     */
    const CharacterSet& IpvFutureLastPart();

    /**
     * This function returns the value of the given hex digit,
     * which must be in the HEXDIG class.
     *
     * @param[in] c
     *     This is the digit to convert.
     *
     * @return
     *     The value of the digit is returned.
     */
    unsigned int HexDigitValue(char c);

}

#endif /* RFC3986_CHARACTER_CLASSES_HPP */
