#ifndef RFC3986_SUBSTRING_HPP
#define RFC3986_SUBSTRING_HPP

/**
 * @file Substring.hpp
 *
 * This module declares the Rfc3986::Substring class.
 *
 * © 2018 by Richard Walters
 */

#include <ostream>
#include <stddef.h>
#include <string>

namespace Rfc3986 {

    /**
     * This class refers to a run of characters inside a string owned
     * by someone else.  It does not copy the characters, so the string
     * must outlive every Substring referring into it.
     */
    class Substring {
        // Public methods
    public:
        /**
         * This is the default constructor.  It refers to no characters.
         */
        Substring();

        /**
         * This constructs a substring referring to the given characters.
         *
         * @param[in] begin
         *     This points to the first character of the substring.
         *
         * @param[in] length
         *     This is the number of characters in the substring.
         */
        Substring(
            const char* begin,
            size_t length
        );

        /**
         * This method returns a pointer to the first character
         * of the substring.  The characters are not null-terminated.
         *
         * @return
         *     A pointer to the first character is returned.
         */
        const char* GetData() const;

        /**
         * This method returns the number of characters in the substring.
         *
         * @return
         *     The number of characters in the substring is returned.
         */
        size_t GetLength() const;

        /**
         * This method returns an indication of whether or not the
         * substring has no characters.
         *
         * @return
         *     An indication of whether or not the substring
         *     has no characters is returned.
         */
        bool IsEmpty() const;

        /**
         * This method returns a copy of the characters of the substring.
         *
         * @return
         *     A copy of the characters of the substring is returned.
         */
        std::string ToString() const;

        bool operator==(const Substring& other) const;
        bool operator!=(const Substring& other) const;
        bool operator==(const std::string& other) const;
        bool operator!=(const std::string& other) const;
        bool operator==(const char* other) const;
        bool operator!=(const char* other) const;

        // Private properties
    private:
        /**
         * This points to the first character of the substring.
         */
        const char* begin_;

        /**
         * This is the number of characters in the substring.
         */
        size_t length_;
    };

    bool operator==(const std::string& lhs, const Substring& rhs);
    bool operator!=(const std::string& lhs, const Substring& rhs);
    bool operator==(const char* lhs, const Substring& rhs);
    bool operator!=(const char* lhs, const Substring& rhs);

    /**
     * This is a support function for Rfc3986::Substring, so that
     * it can be written to streams, such as in test failure messages.
     *
     * @param[in,out] stream
     *     This is the stream to which to write the substring.
     *
     * @param[in] substring
     *     This is the substring to write.
     *
     * @return
     *     The given stream is returned.
     */
    std::ostream& operator<<(
        std::ostream& stream,
        const Substring& substring
    );

}

#endif /* RFC3986_SUBSTRING_HPP */
