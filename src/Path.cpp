/**
 * @file Path.cpp
 *
 * This module contains the implementation of the Rfc3986::Path and
 * Rfc3986::PathBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "DecodeElement.hpp"

#include <Rfc3986/Path.hpp>
#include <Rfc3986/PercentEncoding.hpp>

namespace Rfc3986 {

    /**
     * This contains the private properties of a PathBuilder instance.
     */
    struct PathBuilder::Impl {
        /**
         * This is the kind of the path.
         */
        PathBuilderKind kind = PathBuilderKind::Empty;

        /**
         * These are the segments of the path, not percent-encoded.
         */
        std::vector< std::string > segments;
    };

    PathBuilder::~PathBuilder() noexcept = default;
    PathBuilder::PathBuilder(const PathBuilder& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    PathBuilder::PathBuilder(PathBuilder&&) noexcept = default;
    PathBuilder& PathBuilder::operator=(const PathBuilder& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    PathBuilder& PathBuilder::operator=(PathBuilder&&) noexcept = default;

    PathBuilder::PathBuilder()
        : impl_(new Impl)
    {
    }

    PathBuilder::PathBuilder(
        PathBuilderKind kind,
        const std::vector< std::string >& segments
    )
        : impl_(new Impl)
    {
        impl_->kind = kind;
        if (kind != PathBuilderKind::Empty) {
            impl_->segments = segments;
        }
    }

    bool PathBuilder::operator==(const PathBuilder& other) const {
        return (
            (impl_->kind == other.impl_->kind)
            && (impl_->segments == other.impl_->segments)
        );
    }

    bool PathBuilder::operator!=(const PathBuilder& other) const {
        return !(*this == other);
    }

    PathBuilderKind PathBuilder::GetKind() const {
        return impl_->kind;
    }

    std::vector< std::string > PathBuilder::GetSegments() const {
        return impl_->segments;
    }

    void PathBuilder::SetSegments(const std::vector< std::string >& segments) {
        if (impl_->kind == PathBuilderKind::Empty) {
            if (segments.empty()) {
                return;
            }
            impl_->kind = PathBuilderKind::Absolute;
        }
        impl_->segments = segments;
    }

    PathBuilder PathBuilder::Parent() const {
        PathBuilder parent(*this);
        auto& segments = parent.impl_->segments;
        switch (impl_->kind) {
            case PathBuilderKind::Absolute: {
                if (!segments.empty()) {
                    segments.pop_back();
                }
            } break;

            case PathBuilderKind::Relative: {
                if (segments.empty()) {
                    segments.push_back("..");
                } else {
                    segments.pop_back();
                }
            } break;

            case PathBuilderKind::Empty:
            default: break;
        }
        return parent;
    }

    PathBuilder PathBuilder::Child(const std::string& name) const {
        PathBuilder child(*this);
        if (impl_->kind != PathBuilderKind::Empty) {
            child.impl_->segments.push_back(name);
        }
        return child;
    }

    std::string PathBuilder::GenerateString() const {
        std::string out;
        if (impl_->kind == PathBuilderKind::Empty) {
            return out;
        }
        if (impl_->kind == PathBuilderKind::Absolute) {
            out.push_back('/');
        }
        bool first = true;
        for (const auto& segment: impl_->segments) {
            if (!first) {
                out.push_back('/');
            }
            PercentEncode(segment, out);
            first = false;
        }
        return out;
    }

    Path::Path()
        : kind_(PathKind::Empty)
    {
    }

    PathKind Path::GetKind() const {
        return kind_;
    }

    Substring Path::GetRaw() const {
        return raw_;
    }

    const std::vector< Substring >& Path::GetSegments() const {
        return segments_;
    }

    std::string Path::ToString() const {
        return raw_.ToString();
    }

    PathBuilder Path::GetBuilder() const {
        PathBuilderKind kind;
        switch (kind_) {
            case PathKind::AbEmpty:
            case PathKind::Absolute: {
                kind = PathBuilderKind::Absolute;
            } break;

            case PathKind::NoScheme:
            case PathKind::Rootless: {
                kind = PathBuilderKind::Relative;
            } break;

            case PathKind::Empty:
            default: {
                return PathBuilder();
            }
        }
        std::vector< std::string > segments;
        segments.reserve(segments_.size());
        for (const auto& segment: segments_) {
            segments.push_back(DecodeElement(segment));
        }
        return PathBuilder(kind, segments);
    }

}
