/**
 * @file HostInfo.cpp
 *
 * This module contains the implementation of the Rfc3986::HostInfo and
 * Rfc3986::HostInfoBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "CharacterClasses.hpp"
#include "DecodeElement.hpp"

#include <Rfc3986/HostInfo.hpp>
#include <Rfc3986/PercentEncoding.hpp>

namespace {

    /**
     * This function determines whether or not the given text matches
     * the "IPvFuture" syntax:
     *
     *     "v" 1*HEXDIG "." 1*( unreserved / sub-delims / ":" )
     *
     * @param[in] address
     *     This is the text to check.
     *
     * @return
     *     An indication of whether or not the text is an IPvFuture
     *     address is returned.
     */
    bool IsIpvFuture(const std::string& address) {
        if (
            address.empty()
            || ((address[0] != 'v') && (address[0] != 'V'))
        ) {
            return false;
        }
        size_t i = 1;
        while (
            (i < address.length())
            && Rfc3986::Hexdig().Contains(address[i])
        ) {
            ++i;
        }
        if (
            (i == 1)
            || (i >= address.length())
            || (address[i] != '.')
        ) {
            return false;
        }
        ++i;
        if (i >= address.length()) {
            return false;
        }
        for (; i < address.length(); ++i) {
            if (!Rfc3986::IpvFutureLastPart().Contains(address[i])) {
                return false;
            }
        }
        return true;
    }

    /**
     * This function renders the given IPv4 address in
     * dotted-decimal form.
     *
     * @param[in] address
     *     This is the address to render.
     *
     * @return
     *     The rendered address is returned.
     */
    std::string RenderIpv4Address(const Rfc3986::Ipv4Octets& address) {
        std::string out;
        for (size_t i = 0; i < address.size(); ++i) {
            if (i > 0) {
                out.push_back('.');
            }
            out += std::to_string((unsigned int)address[i]);
        }
        return out;
    }

    /**
     * This function renders a 16-bit group of an IPv6 address
     * in lower-case hex, without leading zeroes.
     */
    std::string RenderHexGroup(unsigned int group) {
        static const char hexDigits[] = "0123456789abcdef";
        std::string out;
        int shift = 12;
        while (
            (shift > 0)
            && (((group >> shift) & 0x0F) == 0)
        ) {
            shift -= 4;
        }
        for (; shift >= 0; shift -= 4) {
            out.push_back(hexDigits[(group >> shift) & 0x0F]);
        }
        return out;
    }

    /**
     * This function renders the given IPv6 address in the form
     * recommended by RFC 5952 (https://tools.ietf.org/html/rfc5952):
     * lower-case hex groups without leading zeroes, the first longest
     * run of two or more zero groups replaced by "::", and IPv4-mapped
     * addresses ending in dotted-decimal form.
     *
     * @param[in] address
     *     This is the address to render.
     *
     * @return
     *     The rendered address is returned.
     */
    std::string RenderIpv6Address(const Rfc3986::Ipv6Octets& address) {
        unsigned int groups[8];
        for (size_t i = 0; i < 8; ++i) {
            groups[i] = ((unsigned int)address[i * 2] << 8) + address[i * 2 + 1];
        }
        bool isIpv4Mapped = (groups[5] == 0xFFFF);
        for (size_t i = 0; i < 5; ++i) {
            if (groups[i] != 0) {
                isIpv4Mapped = false;
            }
        }
        if (isIpv4Mapped) {
            Rfc3986::Ipv4Octets ipv4Address{{
                address[12], address[13], address[14], address[15]
            }};
            return "::ffff:" + RenderIpv4Address(ipv4Address);
        }
        size_t bestStart = 8;
        size_t bestLength = 1;
        for (size_t i = 0; i < 8;) {
            if (groups[i] != 0) {
                ++i;
                continue;
            }
            size_t runLength = 0;
            while (
                (i + runLength < 8)
                && (groups[i + runLength] == 0)
            ) {
                ++runLength;
            }
            if (runLength > bestLength) {
                bestStart = i;
                bestLength = runLength;
            }
            i += runLength;
        }
        std::string out;
        for (size_t i = 0; i < 8; ++i) {
            if (i == bestStart) {
                out += "::";
                i += bestLength - 1;
                continue;
            }
            if (
                !out.empty()
                && (out.back() != ':')
            ) {
                out.push_back(':');
            }
            out += RenderHexGroup(groups[i]);
        }
        return out;
    }

}

namespace Rfc3986 {

    HostInfoBuilder::HostInfoBuilder()
        : kind_(HostKind::RegistryName)
        , name_("localhost")
        , ipv4Address_()
        , ipv6Address_()
    {
    }

    bool HostInfoBuilder::operator==(const HostInfoBuilder& other) const {
        if (kind_ != other.kind_) {
            return false;
        }
        switch (kind_) {
            case HostKind::Ipv4Address: return (ipv4Address_ == other.ipv4Address_);
            case HostKind::Ipv6Address: return (ipv6Address_ == other.ipv6Address_);
            default: return (name_ == other.name_);
        }
    }

    bool HostInfoBuilder::operator!=(const HostInfoBuilder& other) const {
        return !(*this == other);
    }

    HostKind HostInfoBuilder::GetKind() const {
        return kind_;
    }

    std::string HostInfoBuilder::GetName() const {
        return name_;
    }

    Ipv4Octets HostInfoBuilder::GetIpv4Address() const {
        return ipv4Address_;
    }

    Ipv6Octets HostInfoBuilder::GetIpv6Address() const {
        return ipv6Address_;
    }

    void HostInfoBuilder::SetRegistryName(const std::string& name) {
        kind_ = HostKind::RegistryName;
        name_ = name;
    }

    void HostInfoBuilder::SetIpv4Address(const Ipv4Octets& address) {
        kind_ = HostKind::Ipv4Address;
        name_.clear();
        ipv4Address_ = address;
    }

    void HostInfoBuilder::SetIpv6Address(const Ipv6Octets& address) {
        kind_ = HostKind::Ipv6Address;
        name_.clear();
        ipv6Address_ = address;
    }

    bool HostInfoBuilder::SetIpvFuture(const std::string& address) {
        if (!IsIpvFuture(address)) {
            return false;
        }
        kind_ = HostKind::IpvFuture;
        name_ = address;
        return true;
    }

    std::string HostInfoBuilder::GenerateString() const {
        switch (kind_) {
            case HostKind::Ipv4Address: {
                return RenderIpv4Address(ipv4Address_);
            }

            case HostKind::Ipv6Address: {
                return "[" + RenderIpv6Address(ipv6Address_) + "]";
            }

            case HostKind::IpvFuture: {
                return "[" + name_ + "]";
            }

            case HostKind::RegistryName:
            default: {
                return PercentEncode(name_);
            }
        }
    }

    HostInfo::HostInfo()
        : kind_(HostKind::RegistryName)
        , ipv4Address_()
        , ipv6Address_()
    {
    }

    HostKind HostInfo::GetKind() const {
        return kind_;
    }

    Substring HostInfo::GetRaw() const {
        return raw_;
    }

    Ipv4Octets HostInfo::GetIpv4Address() const {
        return ipv4Address_;
    }

    Ipv6Octets HostInfo::GetIpv6Address() const {
        return ipv6Address_;
    }

    std::string HostInfo::ToString() const {
        return raw_.ToString();
    }

    HostInfoBuilder HostInfo::GetBuilder() const {
        HostInfoBuilder builder;
        switch (kind_) {
            case HostKind::Ipv4Address: {
                builder.SetIpv4Address(ipv4Address_);
            } break;

            case HostKind::Ipv6Address: {
                builder.SetIpv6Address(ipv6Address_);
            } break;

            case HostKind::IpvFuture: {
                // The parser has already matched the IPvFuture syntax.
                (void)builder.SetIpvFuture(raw_.ToString());
            } break;

            case HostKind::RegistryName:
            default: {
                builder.SetRegistryName(DecodeElement(raw_));
            } break;
        }
        return builder;
    }

}
