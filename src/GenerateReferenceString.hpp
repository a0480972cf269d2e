#ifndef RFC3986_GENERATE_REFERENCE_STRING_HPP
#define RFC3986_GENERATE_REFERENCE_STRING_HPP

/**
 * @file GenerateReferenceString.hpp
 *
 * This module declares the Rfc3986::GenerateReferenceString function.
 *
 * © 2018 by Richard Walters
 */

#include <Rfc3986/Authority.hpp>
#include <Rfc3986/Fragment.hpp>
#include <Rfc3986/Path.hpp>
#include <Rfc3986/Query.hpp>
#include <Rfc3986/Scheme.hpp>
#include <string>

namespace Rfc3986 {

    /**
     * This function renders the elements of a URI or relative reference
     * as a string.  Each optional element is given as a pointer which
     * is null if the element is absent.
     *
     * A "/" is inserted before a relative path that follows an
     * authority, so such a path reads back as absolute.  Without an
     * authority, a path whose first segment is empty would begin
     * with "/" or "//".  An absolute one is given a "/." prefix so that
     * it is not mistaken for an authority, as in section 5.3 of
     * RFC 3986 (https://tools.ietf.org/html/rfc3986).  A relative one
     * is given a "./" prefix so that it stays relative.
     *
     * @param[in] scheme
     *     This is the scheme of a URI, or null for a relative reference.
     *
     * @param[in] authority
     *     This is the authority, if any.
     *
     * @param[in] path
     *     This is the path.
     *
     * @param[in] query
     *     This is the query, if any.
     *
     * @param[in] fragment
     *     This is the fragment, if any.
     *
     * @return
     *     The rendered string is returned.
     */
    std::string GenerateReferenceString(
        const SchemeBuilder* scheme,
        const AuthorityBuilder* authority,
        const PathBuilder& path,
        const QueryBuilder* query,
        const FragmentBuilder* fragment
    );

}

#endif /* RFC3986_GENERATE_REFERENCE_STRING_HPP */
