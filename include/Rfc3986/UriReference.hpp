#ifndef RFC3986_URI_REFERENCE_HPP
#define RFC3986_URI_REFERENCE_HPP

/**
 * @file UriReference.hpp
 *
 * This module declares the Rfc3986::UriReference and
 * Rfc3986::UriReferenceBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "RelativeReference.hpp"
#include "Substring.hpp"
#include "Uri.hpp"

#include <string>

namespace Rfc3986 {

    /**
     * This class holds an owned, mutable URI reference, which is
     * either a URI or a relative reference ("URI-reference" in RFC 3986).
     */
    class UriReferenceBuilder {
        // Public methods
    public:
        /**
         * This is the default constructor.  The reference is
         * a default-constructed URI.
         */
        UriReferenceBuilder();

        /**
         * This constructs a reference holding the given URI.
         *
         * @param[in] uri
         *     This is the URI to hold.
         */
        explicit UriReferenceBuilder(const UriBuilder& uri);

        /**
         * This constructs a reference holding the given
         * relative reference.
         *
         * @param[in] relativeReference
         *     This is the relative reference to hold.
         */
        explicit UriReferenceBuilder(const RelativeReferenceBuilder& relativeReference);

        bool operator==(const UriReferenceBuilder& other) const;
        bool operator!=(const UriReferenceBuilder& other) const;

        /**
         * This method returns an indication of whether or not the
         * reference holds a relative reference rather than a URI.
         *
         * @return
         *     An indication of whether or not the reference
         *     holds a relative reference is returned.
         */
        bool IsRelativeReference() const;

        /**
         * This method returns the URI held by the reference.
         *
         * @note
         *     This is only meaningful if IsRelativeReference returns false.
         */
        UriBuilder GetUri() const;

        /**
         * This method returns the relative reference held
         * by the reference.
         *
         * @note
         *     This is only meaningful if IsRelativeReference returns true.
         */
        RelativeReferenceBuilder GetRelativeReference() const;

        void SetUri(const UriBuilder& uri);
        void SetRelativeReference(const RelativeReferenceBuilder& relativeReference);

        std::string GenerateString() const;

        // Private properties
    private:
        bool isRelativeReference_;
        UriBuilder uri_;
        RelativeReferenceBuilder relativeReference_;
    };

    /**
     * This class represents a parsed URI reference, which is either
     * a URI or a relative reference ("URI-reference" in RFC 3986).
     */
    class UriReference {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        UriReference();

        bool IsRelativeReference() const;

        /**
         * This method returns the URI held by the reference.
         *
         * @note
         *     This is only meaningful if IsRelativeReference returns false.
         */
        const Uri& GetUri() const;

        /**
         * This method returns the relative reference held
         * by the reference.
         *
         * @note
         *     This is only meaningful if IsRelativeReference returns true.
         */
        const RelativeReference& GetRelativeReference() const;

        /**
         * This method returns the whole text matched for the reference.
         *
         * @return
         *     The whole text matched for the reference is returned.
         */
        Substring GetRaw() const;

        std::string ToString() const;
        UriReferenceBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        bool isRelativeReference_;
        Uri uri_;
        RelativeReference relativeReference_;
    };

}

#endif /* RFC3986_URI_REFERENCE_HPP */
