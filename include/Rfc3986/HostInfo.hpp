#ifndef RFC3986_HOST_INFO_HPP
#define RFC3986_HOST_INFO_HPP

/**
 * @file HostInfo.hpp
 *
 * This module declares the Rfc3986::HostInfo and
 * Rfc3986::HostInfoBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Substring.hpp"

#include <array>
#include <stdint.h>
#include <string>

namespace Rfc3986 {

    /**
     * These are the forms the "host" element of a URI can take.
     */
    enum class HostKind {
        /**
         * This is a registered name, such as a DNS host name.
         */
        RegistryName,

        /**
         * This is an IPv4 address in dotted-decimal form.
         */
        Ipv4Address,

        /**
         * This is an IPv6 address enclosed in square brackets.
         */
        Ipv6Address,

        /**
         * This is an "IPvFuture" address enclosed in square brackets.
         */
        IpvFuture,
    };

    /**
     * This holds the four octets of an IPv4 address, in network order.
     */
    typedef std::array< uint8_t, 4 > Ipv4Octets;

    /**
     * This holds the sixteen octets of an IPv6 address, in network order.
     */
    typedef std::array< uint8_t, 16 > Ipv6Octets;

    /**
     * This class holds an owned, mutable "host" element of a URI.
     */
    class HostInfoBuilder {
        // Public methods
    public:
        /**
         * This is the default constructor.  The host is the
         * registered name "localhost".
         */
        HostInfoBuilder();

        bool operator==(const HostInfoBuilder& other) const;
        bool operator!=(const HostInfoBuilder& other) const;

        HostKind GetKind() const;

        /**
         * This method returns the registered name (not percent-encoded)
         * or the IPvFuture address text, depending on the kind of host.
         *
         * @return
         *     The name of the host is returned.
         *
         * @retval ""
         *     This is returned for IPv4 and IPv6 hosts.
         */
        std::string GetName() const;

        /**
         * This method returns the IPv4 address of the host.
         *
         * @note
         *     This is only valid if GetKind returns HostKind::Ipv4Address.
         */
        Ipv4Octets GetIpv4Address() const;

        /**
         * This method returns the IPv6 address of the host.
         *
         * @note
         *     This is only valid if GetKind returns HostKind::Ipv6Address.
         */
        Ipv6Octets GetIpv6Address() const;

        void SetRegistryName(const std::string& name);
        void SetIpv4Address(const Ipv4Octets& address);
        void SetIpv6Address(const Ipv6Octets& address);

        /**
         * This method sets the host to an "IPvFuture" address, given
         * without its enclosing square brackets.
         *
         * @param[in] address
         *     This is the address to set, such as "v7.aB:c".
         *
         * @return
         *     An indication of whether or not the address matches the
         *     "IPvFuture" syntax is returned.  If it does not, the host
         *     is left unchanged.
         */
        bool SetIpvFuture(const std::string& address);

        /**
         * This method constructs and returns the string rendering
         * of the host.  Registered names are percent-encoded,
         * IPv4 addresses are rendered in dotted-decimal form, and
         * IPv6 addresses are rendered in the recommended form of
         * RFC 5952 (https://tools.ietf.org/html/rfc5952), in brackets.
         *
         * @return
         *     The string rendering of the host is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        HostKind kind_;
        std::string name_;
        Ipv4Octets ipv4Address_;
        Ipv6Octets ipv6Address_;
    };

    /**
     * This class represents the "host" element of a parsed URI.
     */
    class HostInfo {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        HostInfo();

        HostKind GetKind() const;

        /**
         * This method returns the text matched for the host.
         * For IPv6 and IPvFuture addresses, the enclosing square
         * brackets are not included.
         *
         * @return
         *     The text matched for the host is returned.
         */
        Substring GetRaw() const;

        /**
         * This method returns the IPv4 address of the host.
         *
         * @note
         *     This is only valid if GetKind returns HostKind::Ipv4Address.
         */
        Ipv4Octets GetIpv4Address() const;

        /**
         * This method returns the IPv6 address of the host.
         *
         * @note
         *     This is only valid if GetKind returns HostKind::Ipv6Address.
         */
        Ipv6Octets GetIpv6Address() const;

        std::string ToString() const;

        /**
         * This method returns an owned, mutable copy of the host.
         * Registered names are percent-decoded; IP addresses keep
         * their parsed values.
         *
         * @return
         *     An owned, mutable copy of the host is returned.
         */
        HostInfoBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        HostKind kind_;
        Substring raw_;
        Ipv4Octets ipv4Address_;
        Ipv6Octets ipv6Address_;
    };

}

#endif /* RFC3986_HOST_INFO_HPP */
