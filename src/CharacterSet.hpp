#ifndef RFC3986_CHARACTER_SET_HPP
#define RFC3986_CHARACTER_SET_HPP

/**
 * @file CharacterSet.hpp
 *
 * This module declares the Rfc3986::CharacterSet class.
 *
 * © 2018 by Richard Walters
 */

#include <bitset>
#include <initializer_list>

namespace Rfc3986 {

    /**
     * This is a table of octet values, used to classify the
     * characters of the RFC 3986 grammar.
     */
    class CharacterSet {
        // Public methods
    public:
        /**
         * This constructs an empty set.
         */
        CharacterSet();

        /**
         * This constructs a set holding only the given character.
         *
         * @param[in] c
         *     This is the character to put in the set.
         */
        CharacterSet(char c);

        /**
         * This constructs a set holding the inclusive range of
         * characters between the two given characters, which may
         * be given in either order.
         *
         * @param[in] first
         *     This is one end of the range.
         *
         * @param[in] last
         *     This is the other end of the range.
         */
        CharacterSet(char first, char last);

        /**
         * This constructs a set holding every character of
         * the given null-terminated string.
         *
         * @param[in] characters
         *     These are the characters to put in the set.
         */
        explicit CharacterSet(const char* characters);

        /**
         * This constructs the union of the given sets.
         *
         * @param[in] characterSets
         *     These are the sets to combine.
         */
        CharacterSet(
            std::initializer_list< const CharacterSet > characterSets
        );

        /**
         * This method tells whether or not the given character
         * is in the set.
         *
         * @param[in] c
         *     This is the character to look up.
         *
         * @return
         *     An indication of whether or not the character
         *     is in the set is returned.
         */
        bool Contains(char c) const;

        // Private methods
    private:
        void Insert(char c);

        // Private properties
    private:
        /**
         * This holds one flag per octet value.
         */
        std::bitset< 256 > octets_;
    };

}

#endif /* RFC3986_CHARACTER_SET_HPP */
