/**
 * @file PercentEncodedCharacterDecoder.cpp
 *
 * This module contains the implementation of the
 * Rfc3986::PercentEncodedCharacterDecoder class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterClasses.hpp"
#include "PercentEncodedCharacterDecoder.hpp"

namespace Rfc3986 {

    PercentEncodedCharacterDecoder::PercentEncodedCharacterDecoder()
        : decodedCharacter_(0)
        , digitsLeft_(2)
    {
    }

    void PercentEncodedCharacterDecoder::Reset() {
        decodedCharacter_ = 0;
        digitsLeft_ = 2;
    }

    bool PercentEncodedCharacterDecoder::NextEncodedCharacter(char c) {
        if (
            (digitsLeft_ == 0)
            || !Hexdig().Contains(c)
        ) {
            return false;
        }
        decodedCharacter_ = (decodedCharacter_ << 4) + HexDigitValue(c);
        --digitsLeft_;
        return true;
    }

    bool PercentEncodedCharacterDecoder::Done() const {
        return (digitsLeft_ == 0);
    }

    char PercentEncodedCharacterDecoder::GetDecodedCharacter() const {
        return (char)decodedCharacter_;
    }

}
