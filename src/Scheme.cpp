/**
 * @file Scheme.cpp
 *
 * This module contains the implementation of the Rfc3986::Scheme and
 * Rfc3986::SchemeBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "CaseInsensitiveMatch.hpp"

#include <Rfc3986/Scheme.hpp>

namespace {

    /**
     * This function determines the kind of scheme the given name is.
     *
     * @param[in] name
     *     This is the name of the scheme.
     *
     * @return
     *     The kind of the scheme is returned.
     */
    Rfc3986::SchemeKind ClassifySchemeName(const std::string& name) {
        if (Rfc3986::IsCaseInsensitiveMatch(name.data(), name.length(), "https") == name.length()) {
            return Rfc3986::SchemeKind::Https;
        }
        if (Rfc3986::IsCaseInsensitiveMatch(name.data(), name.length(), "http") == name.length()) {
            return Rfc3986::SchemeKind::Http;
        }
        return Rfc3986::SchemeKind::Other;
    }

    /**
     * This function returns the canonical name of the given kind
     * of scheme, or the given opaque name for other schemes.
     */
    std::string NameOf(
        Rfc3986::SchemeKind kind,
        const std::string& otherName
    ) {
        switch (kind) {
            case Rfc3986::SchemeKind::Http: return "http";
            case Rfc3986::SchemeKind::Https: return "https";
            default: return otherName;
        }
    }

}

namespace Rfc3986 {

    SchemeBuilder::SchemeBuilder()
        : kind_(SchemeKind::Other)
        , name_("scheme")
    {
    }

    SchemeBuilder::SchemeBuilder(const std::string& name)
        : kind_(SchemeKind::Other)
    {
        SetName(name);
    }

    bool SchemeBuilder::operator==(const SchemeBuilder& other) const {
        return (
            (kind_ == other.kind_)
            && (name_ == other.name_)
        );
    }

    bool SchemeBuilder::operator!=(const SchemeBuilder& other) const {
        return !(*this == other);
    }

    SchemeKind SchemeBuilder::GetKind() const {
        return kind_;
    }

    std::string SchemeBuilder::GetName() const {
        return NameOf(kind_, name_);
    }

    void SchemeBuilder::SetName(const std::string& name) {
        kind_ = (name.empty() ? SchemeKind::Other : ClassifySchemeName(name));
        if (kind_ == SchemeKind::Other) {
            name_ = name;
        } else {
            name_.clear();
        }
    }

    std::string SchemeBuilder::GenerateString() const {
        return GetName();
    }

    Scheme::Scheme()
        : kind_(SchemeKind::Other)
    {
    }

    SchemeKind Scheme::GetKind() const {
        return kind_;
    }

    std::string Scheme::GetName() const {
        return NameOf(kind_, raw_.ToString());
    }

    Substring Scheme::GetRaw() const {
        return raw_;
    }

    std::string Scheme::ToString() const {
        return raw_.ToString();
    }

    SchemeBuilder Scheme::GetBuilder() const {
        return SchemeBuilder(GetName());
    }

}
