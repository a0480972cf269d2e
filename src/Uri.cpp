/**
 * @file Uri.cpp
 *
 * This module contains the implementation of the Rfc3986::Uri and
 * Rfc3986::UriBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "GenerateReferenceString.hpp"

#include <Rfc3986/Uri.hpp>

namespace Rfc3986 {

    /**
     * This contains the private properties of a UriBuilder instance.
     */
    struct UriBuilder::Impl {
        /**
         * This is the "scheme" element of the URI.
         */
        SchemeBuilder scheme;

        /**
         * This flag indicates whether or not the
         * URI includes an "authority" element.
         */
        bool hasAuthority = false;

        /**
         * This is the "authority" element of the URI.
         */
        AuthorityBuilder authority;

        /**
         * This is the "path" element of the URI.
         */
        PathBuilder path;

        /**
         * This flag indicates whether or not the
         * URI includes a "query" element.
         */
        bool hasQuery = false;

        /**
         * This is the "query" element of the URI.
         */
        QueryBuilder query;

        /**
         * This flag indicates whether or not the
         * URI includes a "fragment" element.
         */
        bool hasFragment = false;

        /**
         * This is the "fragment" element of the URI.
         */
        FragmentBuilder fragment;
    };

    UriBuilder::~UriBuilder() noexcept = default;
    UriBuilder::UriBuilder(const UriBuilder& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    UriBuilder::UriBuilder(UriBuilder&&) noexcept = default;
    UriBuilder& UriBuilder::operator=(const UriBuilder& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    UriBuilder& UriBuilder::operator=(UriBuilder&&) noexcept = default;

    UriBuilder::UriBuilder()
        : impl_(new Impl)
    {
    }

    bool UriBuilder::operator==(const UriBuilder& other) const {
        return (
            (impl_->scheme == other.impl_->scheme)
            && (impl_->hasAuthority == other.impl_->hasAuthority)
            && (
                !impl_->hasAuthority
                || (impl_->authority == other.impl_->authority)
            )
            && (impl_->path == other.impl_->path)
            && (impl_->hasQuery == other.impl_->hasQuery)
            && (
                !impl_->hasQuery
                || (impl_->query == other.impl_->query)
            )
            && (impl_->hasFragment == other.impl_->hasFragment)
            && (
                !impl_->hasFragment
                || (impl_->fragment == other.impl_->fragment)
            )
        );
    }

    bool UriBuilder::operator!=(const UriBuilder& other) const {
        return !(*this == other);
    }

    SchemeBuilder UriBuilder::GetScheme() const {
        return impl_->scheme;
    }

    void UriBuilder::SetScheme(const SchemeBuilder& scheme) {
        impl_->scheme = scheme;
    }

    bool UriBuilder::HasAuthority() const {
        return impl_->hasAuthority;
    }

    AuthorityBuilder UriBuilder::GetAuthority() const {
        return impl_->authority;
    }

    void UriBuilder::SetAuthority(const AuthorityBuilder& authority) {
        impl_->hasAuthority = true;
        impl_->authority = authority;
    }

    void UriBuilder::ClearAuthority() {
        impl_->hasAuthority = false;
        impl_->authority = AuthorityBuilder();
    }

    PathBuilder UriBuilder::GetPath() const {
        return impl_->path;
    }

    void UriBuilder::SetPath(const PathBuilder& path) {
        impl_->path = path;
    }

    bool UriBuilder::HasQuery() const {
        return impl_->hasQuery;
    }

    QueryBuilder UriBuilder::GetQuery() const {
        return impl_->query;
    }

    void UriBuilder::SetQuery(const QueryBuilder& query) {
        impl_->hasQuery = true;
        impl_->query = query;
    }

    void UriBuilder::ClearQuery() {
        impl_->hasQuery = false;
        impl_->query = QueryBuilder();
    }

    bool UriBuilder::HasFragment() const {
        return impl_->hasFragment;
    }

    FragmentBuilder UriBuilder::GetFragment() const {
        return impl_->fragment;
    }

    void UriBuilder::SetFragment(const FragmentBuilder& fragment) {
        impl_->hasFragment = true;
        impl_->fragment = fragment;
    }

    void UriBuilder::ClearFragment() {
        impl_->hasFragment = false;
        impl_->fragment = FragmentBuilder();
    }

    std::string UriBuilder::GenerateString() const {
        return GenerateReferenceString(
            &impl_->scheme,
            impl_->hasAuthority ? &impl_->authority : nullptr,
            impl_->path,
            impl_->hasQuery ? &impl_->query : nullptr,
            impl_->hasFragment ? &impl_->fragment : nullptr
        );
    }

    Uri::Uri()
        : hasAuthority_(false)
        , hasQuery_(false)
        , hasFragment_(false)
    {
    }

    Substring Uri::GetRaw() const {
        return raw_;
    }

    const Scheme& Uri::GetScheme() const {
        return scheme_;
    }

    bool Uri::HasAuthority() const {
        return hasAuthority_;
    }

    const Authority& Uri::GetAuthority() const {
        return authority_;
    }

    const Path& Uri::GetPath() const {
        return path_;
    }

    bool Uri::HasQuery() const {
        return hasQuery_;
    }

    const Query& Uri::GetQuery() const {
        return query_;
    }

    bool Uri::HasFragment() const {
        return hasFragment_;
    }

    const Fragment& Uri::GetFragment() const {
        return fragment_;
    }

    std::string Uri::ToString() const {
        return raw_.ToString();
    }

    UriBuilder Uri::GetBuilder() const {
        UriBuilder builder;
        builder.SetScheme(scheme_.GetBuilder());
        if (hasAuthority_) {
            builder.SetAuthority(authority_.GetBuilder());
        }
        builder.SetPath(path_.GetBuilder());
        if (hasQuery_) {
            builder.SetQuery(query_.GetBuilder());
        }
        if (hasFragment_) {
            builder.SetFragment(fragment_.GetBuilder());
        }
        return builder;
    }

}
