#ifndef RFC3986_URI_HPP
#define RFC3986_URI_HPP

/**
 * @file Uri.hpp
 *
 * This module declares the Rfc3986::Uri and
 * Rfc3986::UriBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Authority.hpp"
#include "Fragment.hpp"
#include "Path.hpp"
#include "Query.hpp"
#include "Scheme.hpp"
#include "Substring.hpp"

#include <memory>
#include <string>

namespace Rfc3986 {

    /**
     * This class holds an owned, mutable Uniform Resource Identifier
     * (URI), as defined in RFC 3986 (https://tools.ietf.org/html/rfc3986).
     */
    class UriBuilder {
        // Lifecycle management
    public:
        ~UriBuilder() noexcept;
        UriBuilder(const UriBuilder& other);
        UriBuilder(UriBuilder&&) noexcept;
        UriBuilder& operator=(const UriBuilder& other);
        UriBuilder& operator=(UriBuilder&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  The URI has the default
         * scheme, no authority, an empty path, and no query or fragment.
         */
        UriBuilder();

        bool operator==(const UriBuilder& other) const;
        bool operator!=(const UriBuilder& other) const;

        SchemeBuilder GetScheme() const;
        void SetScheme(const SchemeBuilder& scheme);

        /**
         * This method returns an indication of whether or not the
         * URI includes an authority.
         *
         * @return
         *     An indication of whether or not the
         *     URI includes an authority is returned.
         */
        bool HasAuthority() const;

        /**
         * This method returns the authority of the URI.
         *
         * @note
         *     This is only meaningful if HasAuthority returns true.
         */
        AuthorityBuilder GetAuthority() const;

        void SetAuthority(const AuthorityBuilder& authority);
        void ClearAuthority();

        PathBuilder GetPath() const;
        void SetPath(const PathBuilder& path);

        bool HasQuery() const;
        QueryBuilder GetQuery() const;
        void SetQuery(const QueryBuilder& query);
        void ClearQuery();

        bool HasFragment() const;
        FragmentBuilder GetFragment() const;
        void SetFragment(const FragmentBuilder& fragment);
        void ClearFragment();

        /**
         * This method constructs and returns the string
         * rendering of the URI, according to the rules in
         * RFC 3986 (https://tools.ietf.org/html/rfc3986).
         *
         * @return
         *     The string rendering of the URI is returned.
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
     * This class represents a parsed Uniform Resource Identifier (URI),
     * as defined in RFC 3986 (https://tools.ietf.org/html/rfc3986).
     *
     * The text of every element refers into the string which was parsed,
     * so that string must outlive the Uri and everything obtained from it
     * except its builder.
     */
    class Uri {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        Uri();

        /**
         * This method returns the whole text matched for the URI.
         *
         * @return
         *     The whole text matched for the URI is returned.
         */
        Substring GetRaw() const;

        const Scheme& GetScheme() const;
        bool HasAuthority() const;

        /**
         * This method returns the authority of the URI.
         *
         * @note
         *     This is only meaningful if HasAuthority returns true.
         */
        const Authority& GetAuthority() const;

        const Path& GetPath() const;
        bool HasQuery() const;
        const Query& GetQuery() const;
        bool HasFragment() const;
        const Fragment& GetFragment() const;

        /**
         * This method returns a copy of the whole text
         * matched for the URI.
         *
         * @return
         *     A copy of the whole text matched for the URI is returned.
         */
        std::string ToString() const;

        /**
         * This method returns an owned, mutable, percent-decoded
         * copy of the URI.
         *
         * @return
         *     An owned, mutable copy of the URI is returned.
         */
        UriBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        Substring raw_;
        Scheme scheme_;
        bool hasAuthority_;
        Authority authority_;
        Path path_;
        bool hasQuery_;
        Query query_;
        bool hasFragment_;
        Fragment fragment_;
    };

}

#endif /* RFC3986_URI_HPP */
