#ifndef RFC3986_PERCENT_ENCODED_CHARACTER_DECODER_HPP
#define RFC3986_PERCENT_ENCODED_CHARACTER_DECODER_HPP

/**
 * @file PercentEncodedCharacterDecoder.hpp
 *
 * This module declares the Rfc3986::PercentEncodedCharacterDecoder class.
 *
 * © 2018 by Richard Walters
 */

#include <stddef.h>

namespace Rfc3986 {

    /**
     * This is fed the two hex digits of a "pct-encoded" triple,
     * one at a time, and yields the octet they encode.
     */
    class PercentEncodedCharacterDecoder {
        // Public methods
    public:
        PercentEncodedCharacterDecoder();

        /**
         * This method discards any digits taken so far, so that the
         * decoder can be used for the next triple.
         */
        void Reset();

        /**
         * This method feeds the decoder the next hex digit.
         *
         * @param[in] c
         *     This is the digit to feed the decoder.
         *
         * @return
         *     An indication of whether or not the digit was taken
         *     is returned.  It is not taken if it isn't a hex digit
         *     or if the decoder already has both digits.
         */
        bool NextEncodedCharacter(char c);

        /**
         * This method tells whether or not the decoder has
         * taken both digits.
         *
         * @return
         *     An indication of whether or not the octet
         *     is decoded is returned.
         */
        bool Done() const;

        char GetDecodedCharacter() const;

        // Private properties
    private:
        /**
         * This accumulates the value of the digits taken so far.
         */
        unsigned int decodedCharacter_;

        /**
         * This is the number of digits still to take.
         */
        size_t digitsLeft_;
    };

}

#endif /* RFC3986_PERCENT_ENCODED_CHARACTER_DECODER_HPP */
