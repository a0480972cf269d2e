/**
 * @file CharacterClasses.cpp
 *
 * This module contains the definitions of the character classes of the
 * grammar in RFC 3986 (https://tools.ietf.org/html/rfc3986).
 *
 * © 2018 by Richard Walters
 */

#include "CharacterClasses.hpp"

namespace Rfc3986 {

    const CharacterSet& Alpha() {
        static const CharacterSet alpha{
            CharacterSet('a', 'z'),
            CharacterSet('A', 'Z')
        };
        return alpha;
    }

    const CharacterSet& Digit() {
        static const CharacterSet digit('0', '9');
        return digit;
    }

    const CharacterSet& Hexdig() {
        static const CharacterSet hexdig{
            CharacterSet('0', '9'),
            CharacterSet('A', 'F'),
            CharacterSet('a', 'f')
        };
        return hexdig;
    }

    const CharacterSet& Unreserved() {
        static const CharacterSet unreserved{
            Alpha(),
            Digit(),
            CharacterSet("-._~")
        };
        return unreserved;
    }

    const CharacterSet& SubDelims() {
        static const CharacterSet subDelims("!$&'()*+,;=");
        return subDelims;
    }

    const CharacterSet& GenDelims() {
        static const CharacterSet genDelims(":/?#[]@");
        return genDelims;
    }

    const CharacterSet& Reserved() {
        static const CharacterSet reserved{
            GenDelims(),
            SubDelims()
        };
        return reserved;
    }

    const CharacterSet& SchemeNotFirst() {
        static const CharacterSet schemeNotFirst{
            Alpha(),
            Digit(),
            CharacterSet("+-.")
        };
        return schemeNotFirst;
    }

    const CharacterSet& PcharNotPctEncoded() {
        static const CharacterSet pchar{
            Unreserved(),
            SubDelims(),
            ':', '@'
        };
        return pchar;
    }

    const CharacterSet& SegmentNzNcNotPctEncoded() {
        static const CharacterSet segmentNzNc{
            Unreserved(),
            SubDelims(),
            '@'
        };
        return segmentNzNc;
    }

    const CharacterSet& QueryOrFragmentNotPctEncoded() {
        static const CharacterSet queryOrFragment{
            PcharNotPctEncoded(),
            '/', '?'
        };
        return queryOrFragment;
    }

    const CharacterSet& UserInfoNotPctEncoded() {
        static const CharacterSet userInfo{
            Unreserved(),
            SubDelims(),
            ':'
        };
        return userInfo;
    }

    const CharacterSet& RegNameNotPctEncoded() {
        static const CharacterSet regName{
            Unreserved(),
            SubDelims()
        };
        return regName;
    }

    const CharacterSet& IpvFutureLastPart() {
        static const CharacterSet ipvFutureLastPart{
            Unreserved(),
            SubDelims(),
            ':'
        };
        return ipvFutureLastPart;
    }

    unsigned int HexDigitValue(char c) {
        if (Digit().Contains(c)) {
            return (unsigned int)(c - '0');
        } else if (c >= 'a') {
            return (unsigned int)(c - 'a') + 10;
        } else {
            return (unsigned int)(c - 'A') + 10;
        }
    }

}
