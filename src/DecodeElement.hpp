#ifndef RFC3986_DECODE_ELEMENT_HPP
#define RFC3986_DECODE_ELEMENT_HPP

/**
 * @file DecodeElement.hpp
 *
 * This module declares the Rfc3986::DecodeElement function.
 *
 * © 2018 by Richard Walters
 */

#include <Rfc3986/Substring.hpp>
#include <string>

namespace Rfc3986 {

    /**
     * This function percent-decodes the given element of a parsed URI,
     * for copying into a builder.
     *
     * What we are calling a "URI element" is any part of the URI
     * which is a sequence of characters that may be percent-encoded.
     * The grammar only lets well-formed encodings into a parsed element,
     * so decoding is expected to succeed.  If it doesn't, a warning
     * is logged and the element is returned unchanged.
     *
     * @param[in] element
     *     This is the element to decode.
     *
     * @return
     *     The decoded element is returned.
     */
    std::string DecodeElement(const Substring& element);

}

#endif /* RFC3986_DECODE_ELEMENT_HPP */
