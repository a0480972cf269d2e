#ifndef RFC3986_FRAGMENT_HPP
#define RFC3986_FRAGMENT_HPP

/**
 * @file Fragment.hpp
 *
 * This module declares the Rfc3986::Fragment and
 * Rfc3986::FragmentBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Substring.hpp"

#include <string>

namespace Rfc3986 {

    /**
     * This class holds an owned, mutable "fragment" element of a URI.
     */
    class FragmentBuilder {
        // Public methods
    public:
        /**
         * This is the default constructor.  The fragment is empty.
         */
        FragmentBuilder();

        /**
         * This constructs a fragment with the given text.
         *
         * @param[in] text
         *     This is the text of the fragment, not percent-encoded.
         */
        explicit FragmentBuilder(const std::string& text);

        bool operator==(const FragmentBuilder& other) const;
        bool operator!=(const FragmentBuilder& other) const;

        std::string GetText() const;
        void SetText(const std::string& text);

        /**
         * This method constructs and returns the string rendering
         * of the fragment, percent-encoded, without the leading "#".
         *
         * @return
         *     The string rendering of the fragment is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        std::string text_;
    };

    /**
     * This class represents the "fragment" element of a parsed URI.
     */
    class Fragment {
        // Public methods
    public:
        /**
         * This method returns the text matched for the fragment,
         * not including the leading "#".
         *
         * @return
         *     The text matched for the fragment is returned.
         */
        Substring GetRaw() const;

        std::string ToString() const;
        FragmentBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        Substring raw_;
    };

}

#endif /* RFC3986_FRAGMENT_HPP */
