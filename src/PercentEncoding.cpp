/**
 * @file PercentEncoding.cpp
 *
 * This module contains the implementation of the percent-encoding
 * functions.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterClasses.hpp"
#include "PercentEncodedCharacterDecoder.hpp"

#include <Rfc3986/PercentEncoding.hpp>

namespace {

    /**
     * These are the digits used when encoding octets, in upper case.
     */
    const char HEX_DIGITS[] = "0123456789ABCDEF";

}

namespace Rfc3986 {

    bool PercentDecode(
        const std::string& encoded,
        std::string& decoded
    ) {
        decoded.clear();
        decoded.reserve(encoded.length());
        PercentEncodedCharacterDecoder pecDecoder;
        size_t i = 0;
        while (i < encoded.length()) {
            const auto c = encoded[i++];
            if (c != '%') {
                decoded.push_back(c);
                continue;
            }
            if (encoded.length() - i < 2) {
                // Sequence cut short by the end of the text.
                decoded.push_back(c);
                decoded.append(encoded, i, std::string::npos);
                break;
            }
            pecDecoder.Reset();
            while (!pecDecoder.Done()) {
                if (!pecDecoder.NextEncodedCharacter(encoded[i++])) {
                    return false;
                }
            }
            decoded.push_back(pecDecoder.GetDecodedCharacter());
        }
        return true;
    }

    void PercentEncode(
        const std::string& text,
        std::string& out
    ) {
        for (const auto c: text) {
            if (Unreserved().Contains(c)) {
                out.push_back(c);
            } else {
                const auto octet = (unsigned char)c;
                out.push_back('%');
                out.push_back(HEX_DIGITS[octet >> 4]);
                out.push_back(HEX_DIGITS[octet & 0x0F]);
            }
        }
    }

    std::string PercentEncode(const std::string& text) {
        std::string out;
        PercentEncode(text, out);
        return out;
    }

}
