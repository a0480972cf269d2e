#ifndef RFC3986_RELATIVE_REFERENCE_HPP
#define RFC3986_RELATIVE_REFERENCE_HPP

/**
 * @file RelativeReference.hpp
 *
 * This module declares the Rfc3986::RelativeReference and
 * Rfc3986::RelativeReferenceBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Authority.hpp"
#include "Fragment.hpp"
#include "Path.hpp"
#include "Query.hpp"
#include "Substring.hpp"

#include <memory>
#include <string>

namespace Rfc3986 {

    /**
     * This class holds an owned, mutable relative reference: a URI
     * reference without a scheme ("relative-ref" in RFC 3986).
     */
    class RelativeReferenceBuilder {
        // Lifecycle management
    public:
        ~RelativeReferenceBuilder() noexcept;
        RelativeReferenceBuilder(const RelativeReferenceBuilder& other);
        RelativeReferenceBuilder(RelativeReferenceBuilder&&) noexcept;
        RelativeReferenceBuilder& operator=(const RelativeReferenceBuilder& other);
        RelativeReferenceBuilder& operator=(RelativeReferenceBuilder&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  The reference has no
         * authority, an empty path, and no query or fragment.
         */
        RelativeReferenceBuilder();

        bool operator==(const RelativeReferenceBuilder& other) const;
        bool operator!=(const RelativeReferenceBuilder& other) const;

        bool HasAuthority() const;
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
         * rendering of the relative reference.
         *
         * @return
         *     The string rendering of the relative reference is returned.
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
     * This class represents a parsed relative reference
     * ("relative-ref" in RFC 3986).
     *
     * The text of every element refers into the string which was parsed.
     */
    class RelativeReference {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        RelativeReference();

        Substring GetRaw() const;
        bool HasAuthority() const;
        const Authority& GetAuthority() const;
        const Path& GetPath() const;
        bool HasQuery() const;
        const Query& GetQuery() const;
        bool HasFragment() const;
        const Fragment& GetFragment() const;
        std::string ToString() const;

        /**
         * This method returns an owned, mutable, percent-decoded
         * copy of the relative reference.
         *
         * @return
         *     An owned, mutable copy of the relative reference is returned.
         */
        RelativeReferenceBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        Substring raw_;
        bool hasAuthority_;
        Authority authority_;
        Path path_;
        bool hasQuery_;
        Query query_;
        bool hasFragment_;
        Fragment fragment_;
    };

}

#endif /* RFC3986_RELATIVE_REFERENCE_HPP */
