#ifndef RFC3986_PARSE_HPP
#define RFC3986_PARSE_HPP

/**
 * @file Parse.hpp
 *
 * This module declares the functions which parse URIs,
 * URI references, relative references, and paths.
 *
 * Parsed entities refer into the string given to the parse function,
 * so the string must outlive them.  For this reason, the functions
 * taking a std::string do not accept temporaries.
 *
 * © 2018 by Richard Walters
 */

#include "Path.hpp"
#include "RelativeReference.hpp"
#include "Uri.hpp"
#include "UriReference.hpp"

#include <string>

namespace Rfc3986 {

    /**
     * This holds the details of why a string failed to parse.
     */
    struct ParseError {
        /**
         * This describes the failure, naming the grammar production
         * that was expected where the string stopped matching.
         */
        std::string message;
    };

    /**
     * This function parses the given string as a URI
     * ("URI" in RFC 3986).
     *
     * @param[in] text
     *     This is the string to parse.  It must be null-terminated
     *     and must outlive the parsed URI.
     *
     * @param[out] uri
     *     This is where to store the parsed URI.
     *
     * @return
     *     An indication of whether or not the whole string
     *     was parsed successfully is returned.
     */
    bool ParseUri(
        const char* text,
        Uri& uri
    );

    /**
     * This function parses the given string as a URI
     * ("URI" in RFC 3986).
     *
     * @param[in] text
     *     This is the string to parse.  It must be null-terminated
     *     and must outlive the parsed URI.
     *
     * @param[out] uri
     *     This is where to store the parsed URI.
     *
     * @param[out] error
     *     This is where to store the details of any failure.
     *
     * @return
     *     An indication of whether or not the whole string
     *     was parsed successfully is returned.
     */
    bool ParseUri(
        const char* text,
        Uri& uri,
        ParseError& error
    );

    bool ParseUri(
        const std::string& text,
        Uri& uri
    );
    bool ParseUri(
        const std::string& text,
        Uri& uri,
        ParseError& error
    );
    bool ParseUri(
        std::string&& text,
        Uri& uri
    ) = delete;
    bool ParseUri(
        std::string&& text,
        Uri& uri,
        ParseError& error
    ) = delete;

    /**
     * This function parses the given string as a URI reference
     * ("URI-reference" in RFC 3986), which is either a URI or a
     * relative reference.  A string which is a valid URI is
     * always parsed as a URI.
     *
     * @param[in] text
     *     This is the string to parse.  It must be null-terminated
     *     and must outlive the parsed reference.
     *
     * @param[out] uriReference
     *     This is where to store the parsed reference.
     *
     * @return
     *     An indication of whether or not the whole string
     *     was parsed successfully is returned.
     */
    bool ParseUriReference(
        const char* text,
        UriReference& uriReference
    );

    bool ParseUriReference(
        const char* text,
        UriReference& uriReference,
        ParseError& error
    );
    bool ParseUriReference(
        const std::string& text,
        UriReference& uriReference
    );
    bool ParseUriReference(
        const std::string& text,
        UriReference& uriReference,
        ParseError& error
    );
    bool ParseUriReference(
        std::string&& text,
        UriReference& uriReference
    ) = delete;
    bool ParseUriReference(
        std::string&& text,
        UriReference& uriReference,
        ParseError& error
    ) = delete;

    /**
     * This function parses the given string as a relative reference
     * ("relative-ref" in RFC 3986).
     *
     * @param[in] text
     *     This is the string to parse.  It must be null-terminated
     *     and must outlive the parsed reference.
     *
     * @param[out] relativeReference
     *     This is where to store the parsed reference.
     *
     * @return
     *     An indication of whether or not the whole string
     *     was parsed successfully is returned.
     */
    bool ParseRelativeReference(
        const char* text,
        RelativeReference& relativeReference
    );

    bool ParseRelativeReference(
        const char* text,
        RelativeReference& relativeReference,
        ParseError& error
    );
    bool ParseRelativeReference(
        const std::string& text,
        RelativeReference& relativeReference
    );
    bool ParseRelativeReference(
        const std::string& text,
        RelativeReference& relativeReference,
        ParseError& error
    );
    bool ParseRelativeReference(
        std::string&& text,
        RelativeReference& relativeReference
    ) = delete;
    bool ParseRelativeReference(
        std::string&& text,
        RelativeReference& relativeReference,
        ParseError& error
    ) = delete;

    /**
     * This function parses the given string as a path
     * ("path" in RFC 3986).
     *
     * @param[in] text
     *     This is the string to parse.  It must be null-terminated
     *     and must outlive the parsed path.
     *
     * @param[out] path
     *     This is where to store the parsed path.
     *
     * @return
     *     An indication of whether or not the whole string
     *     was parsed successfully is returned.
     */
    bool ParsePath(
        const char* text,
        Path& path
    );

    bool ParsePath(
        const char* text,
        Path& path,
        ParseError& error
    );
    bool ParsePath(
        const std::string& text,
        Path& path
    );
    bool ParsePath(
        const std::string& text,
        Path& path,
        ParseError& error
    );
    bool ParsePath(
        std::string&& text,
        Path& path
    ) = delete;
    bool ParsePath(
        std::string&& text,
        Path& path,
        ParseError& error
    ) = delete;

}

#endif /* RFC3986_PARSE_HPP */
