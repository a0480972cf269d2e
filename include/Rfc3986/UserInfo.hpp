#ifndef RFC3986_USER_INFO_HPP
#define RFC3986_USER_INFO_HPP

/**
 * @file UserInfo.hpp
 *
 * This module declares the Rfc3986::UserInfo and
 * Rfc3986::UserInfoBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Substring.hpp"

#include <string>

namespace Rfc3986 {

    /**
     * This class holds an owned, mutable "userinfo" element of a URI,
     * as a user name and optional password, both not percent-encoded.
     */
    class UserInfoBuilder {
        // Public methods
    public:
        /**
         * This is the default constructor.  The user name is empty
         * and there is no password.
         */
        UserInfoBuilder();

        bool operator==(const UserInfoBuilder& other) const;
        bool operator!=(const UserInfoBuilder& other) const;

        std::string GetUsername() const;
        void SetUsername(const std::string& username);

        /**
         * This method returns an indication of whether or not the
         * userinfo includes a password.
         *
         * @return
         *     An indication of whether or not the
         *     userinfo includes a password is returned.
         */
        bool HasPassword() const;

        /**
         * This method returns the password, if there is one.
         *
         * @return
         *     The password is returned.
         *
         * @retval ""
         *     This is returned if there is no password.
         */
        std::string GetPassword() const;

        void SetPassword(const std::string& password);
        void ClearPassword();

        /**
         * This method constructs and returns the percent-encoded
         * string rendering of the userinfo.
         *
         * @return
         *     The string rendering of the userinfo is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        std::string username_;
        bool hasPassword_;
        std::string password_;
    };

    /**
     * This class represents the "userinfo" element of a parsed URI.
     *
     * The userinfo is split into a user name and optional password
     * when it has the form username [ ":" password ] with a non-empty
     * user name.  Otherwise it is kept unsplit, and only the raw text
     * is available.
     */
    class UserInfo {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        UserInfo();

        /**
         * This method returns the text matched for the userinfo.
         *
         * @return
         *     The text matched for the userinfo is returned.
         */
        Substring GetRaw() const;

        /**
         * This method returns an indication of whether or not
         * the userinfo was split into a user name and
         * optional password.
         *
         * @return
         *     An indication of whether or not the userinfo was split
         *     into a user name and optional password is returned.
         */
        bool IsSplit() const;

        /**
         * This method returns the user name, still percent-encoded.
         *
         * @note
         *     This is only valid if IsSplit returns true.
         */
        Substring GetUsername() const;

        bool HasPassword() const;

        /**
         * This method returns the password, still percent-encoded.
         *
         * @note
         *     This is only valid if HasPassword returns true.
         */
        Substring GetPassword() const;

        std::string ToString() const;

        /**
         * This method returns an owned, mutable, percent-decoded
         * copy of the userinfo.  An unsplit userinfo becomes
         * a user name with no password.
         *
         * @return
         *     An owned, mutable copy of the userinfo is returned.
         */
        UserInfoBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        Substring raw_;
        bool isSplit_;
        Substring username_;
        bool hasPassword_;
        Substring password_;
    };

}

#endif /* RFC3986_USER_INFO_HPP */
