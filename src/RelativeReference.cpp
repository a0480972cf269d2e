/**
 * @file RelativeReference.cpp
 *
 * This module contains the implementation of the
 * Rfc3986::RelativeReference and Rfc3986::RelativeReferenceBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "GenerateReferenceString.hpp"

#include <Rfc3986/RelativeReference.hpp>

namespace Rfc3986 {

    /**
     * This contains the private properties of a
     * RelativeReferenceBuilder instance.
     */
    struct RelativeReferenceBuilder::Impl {
        bool hasAuthority = false;
        AuthorityBuilder authority;
        PathBuilder path;
        bool hasQuery = false;
        QueryBuilder query;
        bool hasFragment = false;
        FragmentBuilder fragment;
    };

    RelativeReferenceBuilder::~RelativeReferenceBuilder() noexcept = default;
    RelativeReferenceBuilder::RelativeReferenceBuilder(const RelativeReferenceBuilder& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    RelativeReferenceBuilder::RelativeReferenceBuilder(RelativeReferenceBuilder&&) noexcept = default;
    RelativeReferenceBuilder& RelativeReferenceBuilder::operator=(const RelativeReferenceBuilder& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    RelativeReferenceBuilder& RelativeReferenceBuilder::operator=(RelativeReferenceBuilder&&) noexcept = default;

    RelativeReferenceBuilder::RelativeReferenceBuilder()
        : impl_(new Impl)
    {
    }

    bool RelativeReferenceBuilder::operator==(const RelativeReferenceBuilder& other) const {
        return (
            (impl_->hasAuthority == other.impl_->hasAuthority)
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

    bool RelativeReferenceBuilder::operator!=(const RelativeReferenceBuilder& other) const {
        return !(*this == other);
    }

    bool RelativeReferenceBuilder::HasAuthority() const {
        return impl_->hasAuthority;
    }

    AuthorityBuilder RelativeReferenceBuilder::GetAuthority() const {
        return impl_->authority;
    }

    void RelativeReferenceBuilder::SetAuthority(const AuthorityBuilder& authority) {
        impl_->hasAuthority = true;
        impl_->authority = authority;
    }

    void RelativeReferenceBuilder::ClearAuthority() {
        impl_->hasAuthority = false;
        impl_->authority = AuthorityBuilder();
    }

    PathBuilder RelativeReferenceBuilder::GetPath() const {
        return impl_->path;
    }

    void RelativeReferenceBuilder::SetPath(const PathBuilder& path) {
        impl_->path = path;
    }

    bool RelativeReferenceBuilder::HasQuery() const {
        return impl_->hasQuery;
    }

    QueryBuilder RelativeReferenceBuilder::GetQuery() const {
        return impl_->query;
    }

    void RelativeReferenceBuilder::SetQuery(const QueryBuilder& query) {
        impl_->hasQuery = true;
        impl_->query = query;
    }

    void RelativeReferenceBuilder::ClearQuery() {
        impl_->hasQuery = false;
        impl_->query = QueryBuilder();
    }

    bool RelativeReferenceBuilder::HasFragment() const {
        return impl_->hasFragment;
    }

    FragmentBuilder RelativeReferenceBuilder::GetFragment() const {
        return impl_->fragment;
    }

    void RelativeReferenceBuilder::SetFragment(const FragmentBuilder& fragment) {
        impl_->hasFragment = true;
        impl_->fragment = fragment;
    }

    void RelativeReferenceBuilder::ClearFragment() {
        impl_->hasFragment = false;
        impl_->fragment = FragmentBuilder();
    }

    std::string RelativeReferenceBuilder::GenerateString() const {
        return GenerateReferenceString(
            nullptr,
            impl_->hasAuthority ? &impl_->authority : nullptr,
            impl_->path,
            impl_->hasQuery ? &impl_->query : nullptr,
            impl_->hasFragment ? &impl_->fragment : nullptr
        );
    }

    RelativeReference::RelativeReference()
        : hasAuthority_(false)
        , hasQuery_(false)
        , hasFragment_(false)
    {
    }

    Substring RelativeReference::GetRaw() const {
        return raw_;
    }

    bool RelativeReference::HasAuthority() const {
        return hasAuthority_;
    }

    const Authority& RelativeReference::GetAuthority() const {
        return authority_;
    }

    const Path& RelativeReference::GetPath() const {
        return path_;
    }

    bool RelativeReference::HasQuery() const {
        return hasQuery_;
    }

    const Query& RelativeReference::GetQuery() const {
        return query_;
    }

    bool RelativeReference::HasFragment() const {
        return hasFragment_;
    }

    const Fragment& RelativeReference::GetFragment() const {
        return fragment_;
    }

    std::string RelativeReference::ToString() const {
        return raw_.ToString();
    }

    RelativeReferenceBuilder RelativeReference::GetBuilder() const {
        RelativeReferenceBuilder builder;
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
