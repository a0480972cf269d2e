/**
 * @file GenerateReferenceString.cpp
 *
 * This module contains the implementation of the
 * Rfc3986::GenerateReferenceString function.
 *
 * © 2018 by Richard Walters
 */

#include "GenerateReferenceString.hpp"

namespace Rfc3986 {

    std::string GenerateReferenceString(
        const SchemeBuilder* scheme,
        const AuthorityBuilder* authority,
        const PathBuilder& path,
        const QueryBuilder* query,
        const FragmentBuilder* fragment
    ) {
        std::string out;
        if (scheme != nullptr) {
            out += scheme->GenerateString();
            out.push_back(':');
        }
        const auto pathString = path.GenerateString();
        if (authority != nullptr) {
            out += "//";
            out += authority->GenerateString();
            if (
                (path.GetKind() == PathBuilderKind::Relative)
                && !pathString.empty()
            ) {
                out.push_back('/');
            }
        } else {
            // An empty first segment would otherwise render as "//",
            // which reads back as an authority, or as a leading "/",
            // which reads back as an absolute path.
            const auto segments = path.GetSegments();
            if (
                (segments.size() > 1)
                && segments[0].empty()
            ) {
                if (path.GetKind() == PathBuilderKind::Absolute) {
                    out += "/.";
                } else if (path.GetKind() == PathBuilderKind::Relative) {
                    out += "./";
                }
            }
        }
        out += pathString;
        if (query != nullptr) {
            out.push_back('?');
            out += query->GenerateString();
        }
        if (fragment != nullptr) {
            out.push_back('#');
            out += fragment->GenerateString();
        }
        return out;
    }

}
