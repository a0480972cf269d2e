#ifndef RFC3986_SCHEME_HPP
#define RFC3986_SCHEME_HPP

/**
 * @file Scheme.hpp
 *
 * This module declares the Rfc3986::Scheme and
 * Rfc3986::SchemeBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Substring.hpp"

#include <string>

namespace Rfc3986 {

    /**
     * These are the kinds of scheme the library tells apart.
     */
    enum class SchemeKind {
        /**
         * This is the "http" scheme, in any letter case.
         */
        Http,

        /**
         * This is the "https" scheme, in any letter case.
         */
        Https,

        /**
         * This is any other scheme, kept as opaque text.
         */
        Other,
    };

    /**
     * This class holds an owned, mutable "scheme" element of a URI.
     */
    class SchemeBuilder {
        // Public methods
    public:
        /**
         * This is the default constructor.  The scheme is
         * the opaque name "scheme".
         */
        SchemeBuilder();

        /**
         * This constructs a scheme builder with the given name.
         *
         * @param[in] name
         *     This is the name of the scheme.
         */
        explicit SchemeBuilder(const std::string& name);

        bool operator==(const SchemeBuilder& other) const;
        bool operator!=(const SchemeBuilder& other) const;

        /**
         * This method returns the kind of the scheme.
         *
         * @return
         *     The kind of the scheme is returned.
         */
        SchemeKind GetKind() const;

        /**
         * This method returns the name of the scheme: "http" or "https"
         * for those kinds, or the opaque name otherwise.
         *
         * @return
         *     The name of the scheme is returned.
         */
        std::string GetName() const;

        /**
         * This method sets the name of the scheme.  The names "http"
         * and "https" are recognized regardless of letter case.
         *
         * @param[in] name
         *     This is the name of the scheme.
         */
        void SetName(const std::string& name);

        /**
         * This method constructs and returns the string
         * rendering of the scheme.
         *
         * @return
         *     The string rendering of the scheme is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        /**
         * This is the kind of the scheme.
         */
        SchemeKind kind_;

        /**
         * This is the name of the scheme, when it's of the
         * SchemeKind::Other kind.
         */
        std::string name_;
    };

    /**
     * This class represents the "scheme" element of a parsed URI.
     */
    class Scheme {
        // Public methods
    public:
        /**
         * This is the default constructor.
         */
        Scheme();

        SchemeKind GetKind() const;

        /**
         * This method returns the name of the scheme: "http" or "https"
         * for those kinds, or the text of the scheme otherwise.
         *
         * @return
         *     The name of the scheme is returned.
         */
        std::string GetName() const;

        /**
         * This method returns the text matched for the scheme.
         *
         * @return
         *     The text matched for the scheme is returned.
         */
        Substring GetRaw() const;

        std::string ToString() const;

        /**
         * This method returns an owned, mutable copy of the scheme.
         *
         * @return
         *     An owned, mutable copy of the scheme is returned.
         */
        SchemeBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        /**
         * This is the kind of the scheme.
         */
        SchemeKind kind_;

        /**
         * This is the text matched for the scheme.
         */
        Substring raw_;
    };

}

#endif /* RFC3986_SCHEME_HPP */
