/**
 * @file UserInfo.cpp
 *
 * This module contains the implementation of the Rfc3986::UserInfo and
 * Rfc3986::UserInfoBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "DecodeElement.hpp"

#include <Rfc3986/PercentEncoding.hpp>
#include <Rfc3986/UserInfo.hpp>

namespace Rfc3986 {

    UserInfoBuilder::UserInfoBuilder()
        : hasPassword_(false)
    {
    }

    bool UserInfoBuilder::operator==(const UserInfoBuilder& other) const {
        return (
            (username_ == other.username_)
            && (hasPassword_ == other.hasPassword_)
            && (password_ == other.password_)
        );
    }

    bool UserInfoBuilder::operator!=(const UserInfoBuilder& other) const {
        return !(*this == other);
    }

    std::string UserInfoBuilder::GetUsername() const {
        return username_;
    }

    void UserInfoBuilder::SetUsername(const std::string& username) {
        username_ = username;
    }

    bool UserInfoBuilder::HasPassword() const {
        return hasPassword_;
    }

    std::string UserInfoBuilder::GetPassword() const {
        return password_;
    }

    void UserInfoBuilder::SetPassword(const std::string& password) {
        hasPassword_ = true;
        password_ = password;
    }

    void UserInfoBuilder::ClearPassword() {
        hasPassword_ = false;
        password_.clear();
    }

    std::string UserInfoBuilder::GenerateString() const {
        std::string out;
        PercentEncode(username_, out);
        if (hasPassword_) {
            out.push_back(':');
            PercentEncode(password_, out);
        }
        return out;
    }

    UserInfo::UserInfo()
        : isSplit_(false)
        , hasPassword_(false)
    {
    }

    Substring UserInfo::GetRaw() const {
        return raw_;
    }

    bool UserInfo::IsSplit() const {
        return isSplit_;
    }

    Substring UserInfo::GetUsername() const {
        return username_;
    }

    bool UserInfo::HasPassword() const {
        return hasPassword_;
    }

    Substring UserInfo::GetPassword() const {
        return password_;
    }

    std::string UserInfo::ToString() const {
        return raw_.ToString();
    }

    UserInfoBuilder UserInfo::GetBuilder() const {
        UserInfoBuilder builder;
        if (!isSplit_) {
            builder.SetUsername(DecodeElement(raw_));
            return builder;
        }
        builder.SetUsername(DecodeElement(username_));
        if (hasPassword_) {
            builder.SetPassword(DecodeElement(password_));
        }
        return builder;
    }

}
