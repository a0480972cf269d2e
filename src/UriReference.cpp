/**
 * @file UriReference.cpp
 *
 * This module contains the implementation of the Rfc3986::UriReference
 * and Rfc3986::UriReferenceBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include <Rfc3986/UriReference.hpp>

namespace Rfc3986 {

    UriReferenceBuilder::UriReferenceBuilder()
        : isRelativeReference_(false)
    {
    }

    UriReferenceBuilder::UriReferenceBuilder(const UriBuilder& uri)
        : isRelativeReference_(false)
        , uri_(uri)
    {
    }

    UriReferenceBuilder::UriReferenceBuilder(const RelativeReferenceBuilder& relativeReference)
        : isRelativeReference_(true)
        , relativeReference_(relativeReference)
    {
    }

    bool UriReferenceBuilder::operator==(const UriReferenceBuilder& other) const {
        if (isRelativeReference_ != other.isRelativeReference_) {
            return false;
        }
        if (isRelativeReference_) {
            return (relativeReference_ == other.relativeReference_);
        } else {
            return (uri_ == other.uri_);
        }
    }

    bool UriReferenceBuilder::operator!=(const UriReferenceBuilder& other) const {
        return !(*this == other);
    }

    bool UriReferenceBuilder::IsRelativeReference() const {
        return isRelativeReference_;
    }

    UriBuilder UriReferenceBuilder::GetUri() const {
        return uri_;
    }

    RelativeReferenceBuilder UriReferenceBuilder::GetRelativeReference() const {
        return relativeReference_;
    }

    void UriReferenceBuilder::SetUri(const UriBuilder& uri) {
        isRelativeReference_ = false;
        uri_ = uri;
        relativeReference_ = RelativeReferenceBuilder();
    }

    void UriReferenceBuilder::SetRelativeReference(const RelativeReferenceBuilder& relativeReference) {
        isRelativeReference_ = true;
        uri_ = UriBuilder();
        relativeReference_ = relativeReference;
    }

    std::string UriReferenceBuilder::GenerateString() const {
        if (isRelativeReference_) {
            return relativeReference_.GenerateString();
        } else {
            return uri_.GenerateString();
        }
    }

    UriReference::UriReference()
        : isRelativeReference_(false)
    {
    }

    bool UriReference::IsRelativeReference() const {
        return isRelativeReference_;
    }

    const Uri& UriReference::GetUri() const {
        return uri_;
    }

    const RelativeReference& UriReference::GetRelativeReference() const {
        return relativeReference_;
    }

    Substring UriReference::GetRaw() const {
        if (isRelativeReference_) {
            return relativeReference_.GetRaw();
        } else {
            return uri_.GetRaw();
        }
    }

    std::string UriReference::ToString() const {
        return GetRaw().ToString();
    }

    UriReferenceBuilder UriReference::GetBuilder() const {
        if (isRelativeReference_) {
            return UriReferenceBuilder(relativeReference_.GetBuilder());
        } else {
            return UriReferenceBuilder(uri_.GetBuilder());
        }
    }

}
