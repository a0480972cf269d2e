/**
 * @file CharacterSet.cpp
 *
 * This module contains the implementation of the
 * Rfc3986::CharacterSet class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"

#include <utility>

namespace Rfc3986 {

    CharacterSet::CharacterSet() = default;

    CharacterSet::CharacterSet(char c) {
        Insert(c);
    }

    CharacterSet::CharacterSet(char first, char last) {
        if (first > last) {
            std::swap(first, last);
        }
        for (int c = first; c <= last; ++c) {
            Insert((char)c);
        }
    }

    CharacterSet::CharacterSet(const char* characters) {
        while (*characters != '\0') {
            Insert(*characters++);
        }
    }

    CharacterSet::CharacterSet(
        std::initializer_list< const CharacterSet > characterSets
    ) {
        for (const auto& characterSet: characterSets) {
            octets_ |= characterSet.octets_;
        }
    }

    bool CharacterSet::Contains(char c) const {
        return octets_.test((unsigned char)c);
    }

    void CharacterSet::Insert(char c) {
        (void)octets_.set((unsigned char)c);
    }

}
