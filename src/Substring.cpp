/**
 * @file Substring.cpp
 *
 * This module contains the implementation of the Rfc3986::Substring class.
 *
 * © 2018 by Richard Walters
 */

#include <Rfc3986/Substring.hpp>
#include <string.h>

namespace Rfc3986 {

    Substring::Substring()
        : begin_("")
        , length_(0)
    {
    }

    Substring::Substring(
        const char* begin,
        size_t length
    )
        : begin_(begin)
        , length_(length)
    {
    }

    const char* Substring::GetData() const {
        return begin_;
    }

    size_t Substring::GetLength() const {
        return length_;
    }

    bool Substring::IsEmpty() const {
        return (length_ == 0);
    }

    std::string Substring::ToString() const {
        return std::string(begin_, length_);
    }

    bool Substring::operator==(const Substring& other) const {
        return (
            (length_ == other.length_)
            && (memcmp(begin_, other.begin_, length_) == 0)
        );
    }

    bool Substring::operator!=(const Substring& other) const {
        return !(*this == other);
    }

    bool Substring::operator==(const std::string& other) const {
        return *this == Substring(other.data(), other.length());
    }

    bool Substring::operator!=(const std::string& other) const {
        return !(*this == other);
    }

    bool Substring::operator==(const char* other) const {
        return *this == Substring(other, strlen(other));
    }

    bool Substring::operator!=(const char* other) const {
        return !(*this == other);
    }

    bool operator==(const std::string& lhs, const Substring& rhs) {
        return (rhs == lhs);
    }

    bool operator!=(const std::string& lhs, const Substring& rhs) {
        return (rhs != lhs);
    }

    bool operator==(const char* lhs, const Substring& rhs) {
        return (rhs == lhs);
    }

    bool operator!=(const char* lhs, const Substring& rhs) {
        return (rhs != lhs);
    }

    std::ostream& operator<<(
        std::ostream& stream,
        const Substring& substring
    ) {
        return stream.write(substring.GetData(), (std::streamsize)substring.GetLength());
    }

}
