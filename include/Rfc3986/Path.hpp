#ifndef RFC3986_PATH_HPP
#define RFC3986_PATH_HPP

/**
 * @file Path.hpp
 *
 * This module declares the Rfc3986::Path and
 * Rfc3986::PathBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Substring.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Rfc3986 {

    /**
     * These are the alternatives of the "path" syntax
     * of RFC 3986 (https://tools.ietf.org/html/rfc3986).
     */
    enum class PathKind {
        /**
         * The path has zero characters ("path-empty").
         */
        Empty,

        /**
         * The path follows an authority and begins with
         * an empty segment ("//"), as allowed by "path-abempty".
         */
        AbEmpty,

        /**
         * The path begins with "/" but not "//" ("path-absolute").
         */
        Absolute,

        /**
         * The path begins with a segment which has
         * no colon ("path-noscheme").
         */
        NoScheme,

        /**
         * The path begins with a segment ("path-rootless").
         */
        Rootless,
    };

    /**
     * These are the kinds of path a PathBuilder can hold.
     */
    enum class PathBuilderKind {
        /**
         * The path has no segments and renders as an empty string.
         */
        Empty,

        /**
         * The path renders with a leading "/".
         */
        Absolute,

        /**
         * The path renders without a leading "/".
         */
        Relative,
    };

    /**
     * This class holds an owned, mutable "path" element of a URI,
     * as a sequence of segments which are not percent-encoded.
     */
    class PathBuilder {
        // Lifecycle management
    public:
        ~PathBuilder() noexcept;
        PathBuilder(const PathBuilder& other);
        PathBuilder(PathBuilder&&) noexcept;
        PathBuilder& operator=(const PathBuilder& other);
        PathBuilder& operator=(PathBuilder&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  The path is empty.
         */
        PathBuilder();

        /**
         * This constructs a path of the given kind and segments.
         *
         * @param[in] kind
         *     This is the kind of path to construct.
         *
         * @param[in] segments
         *     These are the segments of the path.
         *     They are ignored for PathBuilderKind::Empty.
         */
        PathBuilder(
            PathBuilderKind kind,
            const std::vector< std::string >& segments
        );

        bool operator==(const PathBuilder& other) const;
        bool operator!=(const PathBuilder& other) const;

        PathBuilderKind GetKind() const;

        /**
         * This method returns the segments of the path.
         *
         * @return
         *     The segments of the path are returned.
         */
        std::vector< std::string > GetSegments() const;

        /**
         * This method replaces the segments of the path.
         * An empty path becomes absolute if given segments.
         *
         * @param[in] segments
         *     These are the new segments of the path.
         */
        void SetSegments(const std::vector< std::string >& segments);

        /**
         * This method returns the path of the parent of the resource
         * at this path.  The last segment is removed; a relative path
         * with no segments gains a ".." segment instead.
         *
         * @return
         *     The parent path is returned.
         */
        PathBuilder Parent() const;

        /**
         * This method returns the path of the given child of the
         * resource at this path, formed by appending a segment.
         * The child of an empty path is an empty path.
         *
         * @param[in] name
         *     This is the name of the child, as a single segment.
         *
         * @return
         *     The child path is returned.
         */
        PathBuilder Child(const std::string& name) const;

        /**
         * This method constructs and returns the string rendering
         * of the path, with every segment percent-encoded.
         *
         * @return
         *     The string rendering of the path is returned.
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
     * This class represents the "path" element of a parsed URI,
     * as the alternative of the "path" syntax that matched and
     * the segments between its "/" delimiters.
     *
     * A path beginning with "/" has one segment for each "/"
     * (so "/" alone has a single empty segment); other paths have
     * one more segment than they have "/" characters, except the
     * empty path, which has no segments.
     */
    class Path {
        // Public methods
    public:
        /**
         * This is the default constructor.  The path is empty.
         */
        Path();

        PathKind GetKind() const;

        /**
         * This method returns the text matched for the path.
         *
         * @return
         *     The text matched for the path is returned.
         */
        Substring GetRaw() const;

        /**
         * This method returns the segments of the path,
         * still percent-encoded.
         *
         * @return
         *     The segments of the path are returned.
         */
        const std::vector< Substring >& GetSegments() const;

        std::string ToString() const;

        /**
         * This method returns an owned, mutable, percent-decoded
         * copy of the path.
         *
         * @return
         *     An owned, mutable copy of the path is returned.
         */
        PathBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        PathKind kind_;
        Substring raw_;
        std::vector< Substring > segments_;
    };

}

#endif /* RFC3986_PATH_HPP */
