/**
 * @file Authority.cpp
 *
 * This module contains the implementation of the Rfc3986::Authority and
 * Rfc3986::AuthorityBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include <Rfc3986/Authority.hpp>

namespace Rfc3986 {

    /**
     * This contains the private properties of an AuthorityBuilder instance.
     */
    struct AuthorityBuilder::Impl {
        /**
         * This flag indicates whether or not the
         * authority includes a userinfo element.
         */
        bool hasUserInfo = false;

        /**
         * This is the userinfo element of the authority.
         */
        UserInfoBuilder userInfo;

        /**
         * This is the host element of the authority.
         */
        HostInfoBuilder host;

        /**
         * This flag indicates whether or not the
         * authority includes a port number.
         */
        bool hasPort = false;

        /**
         * This is the port number element of the authority.
         */
        uint16_t port = 0;
    };

    AuthorityBuilder::~AuthorityBuilder() noexcept = default;
    AuthorityBuilder::AuthorityBuilder(const AuthorityBuilder& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    AuthorityBuilder::AuthorityBuilder(AuthorityBuilder&&) noexcept = default;
    AuthorityBuilder& AuthorityBuilder::operator=(const AuthorityBuilder& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    AuthorityBuilder& AuthorityBuilder::operator=(AuthorityBuilder&&) noexcept = default;

    AuthorityBuilder::AuthorityBuilder()
        : impl_(new Impl)
    {
    }

    bool AuthorityBuilder::operator==(const AuthorityBuilder& other) const {
        return (
            (impl_->hasUserInfo == other.impl_->hasUserInfo)
            && (
                !impl_->hasUserInfo
                || (impl_->userInfo == other.impl_->userInfo)
            )
            && (impl_->host == other.impl_->host)
            && (
                (!impl_->hasPort && !other.impl_->hasPort)
                || (
                    (impl_->hasPort && other.impl_->hasPort)
                    && (impl_->port == other.impl_->port)
                )
            )
        );
    }

    bool AuthorityBuilder::operator!=(const AuthorityBuilder& other) const {
        return !(*this == other);
    }

    bool AuthorityBuilder::HasUserInfo() const {
        return impl_->hasUserInfo;
    }

    UserInfoBuilder AuthorityBuilder::GetUserInfo() const {
        return impl_->userInfo;
    }

    void AuthorityBuilder::SetUserInfo(const UserInfoBuilder& userInfo) {
        impl_->hasUserInfo = true;
        impl_->userInfo = userInfo;
    }

    void AuthorityBuilder::ClearUserInfo() {
        impl_->hasUserInfo = false;
        impl_->userInfo = UserInfoBuilder();
    }

    HostInfoBuilder AuthorityBuilder::GetHost() const {
        return impl_->host;
    }

    void AuthorityBuilder::SetHost(const HostInfoBuilder& host) {
        impl_->host = host;
    }

    bool AuthorityBuilder::HasPort() const {
        return impl_->hasPort;
    }

    uint16_t AuthorityBuilder::GetPort() const {
        return impl_->port;
    }

    void AuthorityBuilder::SetPort(uint16_t port) {
        impl_->hasPort = true;
        impl_->port = port;
    }

    void AuthorityBuilder::ClearPort() {
        impl_->hasPort = false;
        impl_->port = 0;
    }

    std::string AuthorityBuilder::GenerateString() const {
        std::string out;
        if (impl_->hasUserInfo) {
            out += impl_->userInfo.GenerateString();
            out.push_back('@');
        }
        out += impl_->host.GenerateString();
        if (impl_->hasPort) {
            out.push_back(':');
            out += std::to_string(impl_->port);
        }
        return out;
    }

    Authority::Authority()
        : hasUserInfo_(false)
        , hasPort_(false)
        , port_(0)
    {
    }

    Substring Authority::GetRaw() const {
        return raw_;
    }

    bool Authority::HasUserInfo() const {
        return hasUserInfo_;
    }

    const UserInfo& Authority::GetUserInfo() const {
        return userInfo_;
    }

    const HostInfo& Authority::GetHost() const {
        return host_;
    }

    bool Authority::HasPort() const {
        return hasPort_;
    }

    uint16_t Authority::GetPort() const {
        return port_;
    }

    std::string Authority::ToString() const {
        return raw_.ToString();
    }

    AuthorityBuilder Authority::GetBuilder() const {
        AuthorityBuilder builder;
        if (hasUserInfo_) {
            builder.SetUserInfo(userInfo_.GetBuilder());
        }
        builder.SetHost(host_.GetBuilder());
        if (hasPort_) {
            builder.SetPort(port_);
        }
        return builder;
    }

}
