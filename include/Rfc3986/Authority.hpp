#ifndef RFC3986_AUTHORITY_HPP
#define RFC3986_AUTHORITY_HPP

/**
 * @file Authority.hpp
 *
 * This module declares the Rfc3986::Authority and
 * Rfc3986::AuthorityBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "HostInfo.hpp"
#include "Substring.hpp"
#include "UserInfo.hpp"

#include <memory>
#include <stdint.h>
#include <string>

namespace Rfc3986 {

    /**
     * This class holds an owned, mutable "authority" element of a URI:
     * an optional userinfo, a host, and an optional port number.
     */
    class AuthorityBuilder {
        // Lifecycle management
    public:
        ~AuthorityBuilder() noexcept;
        AuthorityBuilder(const AuthorityBuilder& other);
        AuthorityBuilder(AuthorityBuilder&&) noexcept;
        AuthorityBuilder& operator=(const AuthorityBuilder& other);
        AuthorityBuilder& operator=(AuthorityBuilder&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  The authority has the
         * default host, and no userinfo or port.
         */
        AuthorityBuilder();

        bool operator==(const AuthorityBuilder& other) const;
        bool operator!=(const AuthorityBuilder& other) const;

        /**
         * This method returns an indication of whether or not the
         * authority includes a userinfo element.
         *
         * @return
         *     An indication of whether or not the
         *     authority includes a userinfo element is returned.
         */
        bool HasUserInfo() const;

        /**
         * This method returns the userinfo element of the authority.
         *
         * @note
         *     This is only meaningful if HasUserInfo returns true.
         */
        UserInfoBuilder GetUserInfo() const;

        void SetUserInfo(const UserInfoBuilder& userInfo);
        void ClearUserInfo();

        HostInfoBuilder GetHost() const;
        void SetHost(const HostInfoBuilder& host);

        /**
         * This method returns an indication of whether or not the
         * authority includes a port number.
         *
         * @return
         *     An indication of whether or not the
         *     authority includes a port number is returned.
         */
        bool HasPort() const;

        /**
         * This method returns the port number of the authority.
         *
         * @note
         *     The returned port number is only valid if the
         *     HasPort method returns true.
         */
        uint16_t GetPort() const;

        void SetPort(uint16_t port);
        void ClearPort();

        /**
         * This method constructs and returns the string
         * rendering of the authority, without the leading "//".
         *
         * @return
         *     The string rendering of the authority is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

    /**
     * This class represents the "authority" element of a parsed URI.
     */
    class Authority {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        Authority();

        /**
         * This method returns the text matched for the authority,
         * not including the leading "//".
         *
         * @return
         *     The text matched for the authority is returned.
         */
        Substring GetRaw() const;

        bool HasUserInfo() const;

        /**
         * This method returns the userinfo element of the authority.
         *
         * @note
         *     This is only meaningful if HasUserInfo returns true.
         */
        const UserInfo& GetUserInfo() const;

        const HostInfo& GetHost() const;

        bool HasPort() const;

        /**
         * This method returns the port number of the authority.
         *
         * @note
         *     The returned port number is only valid if the
         *     HasPort method returns true.
         */
        uint16_t GetPort() const;

        std::string ToString() const;

        /**
         * This method returns an owned, mutable, percent-decoded
         * copy of the authority.
         *
         * @return
         *     An owned, mutable copy of the authority is returned.
         */
        AuthorityBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        Substring raw_;
        bool hasUserInfo_;
        UserInfo userInfo_;
        HostInfo host_;
        bool hasPort_;
        uint16_t port_;
    };

}

#endif /* RFC3986_AUTHORITY_HPP */
