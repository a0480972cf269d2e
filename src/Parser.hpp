#ifndef RFC3986_PARSER_HPP
#define RFC3986_PARSER_HPP

/**
 * @file Parser.hpp
 *
 * This module declares the Rfc3986::Parser class.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterSet.hpp"

#include <Rfc3986/Authority.hpp>
#include <Rfc3986/Fragment.hpp>
#include <Rfc3986/HostInfo.hpp>
#include <Rfc3986/Path.hpp>
#include <Rfc3986/Query.hpp>
#include <Rfc3986/RelativeReference.hpp>
#include <Rfc3986/Scheme.hpp>
#include <Rfc3986/Substring.hpp>
#include <Rfc3986/Uri.hpp>
#include <Rfc3986/UriReference.hpp>
#include <Rfc3986/UserInfo.hpp>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace Rfc3986 {

    /**
     * This class matches the productions of the URI grammar of
     * RFC 3986 (https://tools.ietf.org/html/rfc3986) against a string,
     * filling in parsed entities which refer into that string.
     *
     * Where a production has alternatives, they are tried in a fixed
     * order, rewinding to the same position before each one, and the
     * first one that matches is taken.
     *
     * The methods for the top-level productions (URI, relative-ref,
     * URI-reference, and path) start from the beginning of the string
     * and only succeed if they consume the whole string.  The methods
     * for the other productions start from the current position and
     * advance it past whatever they match.
     */
    class Parser {
        // Lifecycle management
    public:
        ~Parser() noexcept = default;
        Parser(const Parser&) = delete;
        Parser(Parser&&) = delete;
        Parser& operator=(const Parser&) = delete;
        Parser& operator=(Parser&&) = delete;

        // Public methods
    public:
        /**
         * This constructs a parser for the given string.
         *
         * @param[in] text
         *     This points to the first character of the string to parse.
         *     It must remain valid for as long as any parsed entity
         *     filled in by the parser is used.
         *
         * @param[in] length
         *     This is the number of characters in the string to parse.
         */
        Parser(
            const char* text,
            size_t length
        );

        /**
         * This method matches the whole string against the "URI"
         * production.
         *
         * @param[out] uri
         *     This is where to store the parsed URI.
         *
         * @return
         *     An indication of whether or not the whole string
         *     matched is returned.
         */
        bool ParseUri(Uri& uri);

        /**
         * This method matches the whole string against the
         * "relative-ref" production.
         *
         * @param[out] relativeReference
         *     This is where to store the parsed relative reference.
         *
         * @return
         *     An indication of whether or not the whole string
         *     matched is returned.
         */
        bool ParseRelativeReference(RelativeReference& relativeReference);

        /**
         * This method matches the whole string against the
         * "URI-reference" production, trying "URI" before "relative-ref".
         *
         * @param[out] uriReference
         *     This is where to store the parsed URI reference.
         *
         * @return
         *     An indication of whether or not the whole string
         *     matched is returned.
         */
        bool ParseUriReference(UriReference& uriReference);

        /**
         * This method matches the whole string against the "path"
         * production, trying "path-absolute", "path-rootless",
         * "path-abempty", and "path-empty", in that order.
         *
         * @param[out] path
         *     This is where to store the parsed path.
         *
         * @return
         *     An indication of whether or not the whole string
         *     matched is returned.
         */
        bool ParsePath(Path& path);

        bool ParseScheme(Scheme& scheme);
        bool ParseAuthority(Authority& authority);

        /**
         * This method matches the "userinfo" production, which
         * may be empty, and then tries to split what it matched
         * into a username and optional password.
         *
         * @param[out] userInfo
         *     This is where to store the parsed userinfo.
         *
         * @return
         *     An indication of whether or not the production
         *     matched is returned.
         */
        bool ParseUserInfo(UserInfo& userInfo);

        /**
         * This method matches the "host" production, trying an IPv6
         * literal, an IPvFuture literal, an IPv4 address, and a
         * registered name, in that order.
         *
         * @param[out] host
         *     This is where to store the parsed host.
         *
         * @return
         *     An indication of whether or not the production
         *     matched is returned.
         */
        bool ParseHost(HostInfo& host);

        /**
         * This method matches one or more decimal digits
         * forming a port number no greater than 65535.
         *
         * @param[out] port
         *     This is where to store the port number.
         *
         * @return
         *     An indication of whether or not the production
         *     matched is returned.
         */
        bool ParsePort(uint16_t& port);

        bool ParseQuery(Query& query);
        bool ParseFragment(Fragment& fragment);

        /**
         * This method returns an indication of whether or not the
         * whole string has been consumed.
         *
         * @return
         *     An indication of whether or not the whole string
         *     has been consumed is returned.
         */
        bool AtEnd() const;

        size_t GetPosition() const;

        /**
         * This method returns a description of why the string
         * failed to match, naming the production that got the
         * furthest into the string before failing.
         *
         * @param[in] production
         *     This is the name of the top-level production attempted.
         *
         * @return
         *     A description of the failure is returned.
         */
        std::string GetDiagnostic(const char* production) const;

        // Private methods
    private:
        typedef bool (Parser::*PathProduction)(Path& path);
        typedef bool (Parser::*HostProduction)(HostInfo& host);

        /**
         * These are the ways the "IPv6address" production can end.
         */
        enum class Ipv6Tail {
            Ls32,
            H16,
            None,
        };

        /**
         * This describes one of the alternatives of the
         * "IPv6address" production.
         */
        struct Ipv6Shape {
            /**
             * This indicates whether or not the shape includes "::".
             */
            bool elided;

            /**
             * This is the maximum number of groups before the "::".
             */
            size_t maxPrefixGroups;

            /**
             * This is the number of "h16 ':'" groups following
             * the "::", or beginning the address if there is no "::".
             */
            size_t suffixGroups;

            /**
             * This is how the address ends.
             */
            Ipv6Tail tail;
        };

        bool ParseHierPart(
            bool& hasAuthority,
            Authority& authority,
            Path& path,
            PathProduction rootlessProduction
        );
        void ParseQueryAndFragment(
            bool& hasQuery,
            Query& query,
            bool& hasFragment,
            Fragment& fragment
        );
        bool ParseFirstPathAlternative(
            const PathProduction* alternatives,
            size_t numAlternatives,
            bool wholeString,
            Path& path
        );
        bool ParsePathAbEmpty(Path& path);
        bool ParsePathAbsolute(Path& path);
        bool ParsePathNoScheme(Path& path);
        bool ParsePathRootless(Path& path);
        bool ParsePathEmpty(Path& path);
        void ParseSegments(std::vector< Substring >& segments);
        bool ParseIpv6Literal(HostInfo& host);
        bool ParseIpvFutureLiteral(HostInfo& host);
        bool ParseIpv4Host(HostInfo& host);
        bool ParseRegName(HostInfo& host);
        bool ParseIpv6Address(Ipv6Octets& address);
        bool ParseIpv6Shape(
            const Ipv6Shape& shape,
            Ipv6Octets& address
        );
        void ParseIpv6Prefix(
            size_t maxGroups,
            std::vector< uint16_t >& groups
        );
        bool ParseLs32(std::vector< uint16_t >& groups);
        bool ParseH16(uint16_t& group);
        bool ParseIpv4Address(Ipv4Octets& address);
        bool ParseDecOctet(uint8_t& octet);
        void SplitUserInfo(UserInfo& userInfo);

        /**
         * This method consumes characters for as long as they are either
         * in the given set or begin a valid percent-encoded octet.
         *
         * @param[in] characterSet
         *     This is the set of characters which may appear literally.
         *
         * @return
         *     The number of characters consumed is returned.
         */
        size_t ConsumeRun(const CharacterSet& characterSet);

        bool Peek(char c) const;
        bool PeekInSet(const CharacterSet& characterSet) const;
        bool Accept(char c);
        bool AcceptInSet(const CharacterSet& characterSet);
        bool AcceptPctEncoded();

        /**
         * This method returns the text from the given
         * position up to the current position.
         */
        Substring Span(size_t start) const;

        /**
         * This method records that the given production failed to
         * match at the current position, if that is as far into the
         * string as any failure so far.
         *
         * @param[in] production
         *     This is the name of the production which failed.
         */
        void Fail(const char* production);

        // Private properties
    private:
        /**
         * This points to the first character of the string to parse.
         */
        const char* text_;

        /**
         * This is the number of characters in the string to parse.
         */
        size_t length_;

        /**
         * This is the offset of the next character to match.
         */
        size_t position_ = 0;

        /**
         * This is the offset of the furthest failure so far.
         */
        size_t furthestFailure_ = 0;

        /**
         * This is the name of the production which
         * failed furthest into the string.
         */
        const char* expected_ = nullptr;
    };

}

#endif /* RFC3986_PARSER_HPP */
