/**
 * @file Parser.cpp
 *
 * This module contains the implementation of the Rfc3986::Parser class.
 *
 * © 2018 by Richard Walters
 */

#include "CaseInsensitiveMatch.hpp"
#include "CharacterClasses.hpp"
#include "Parser.hpp"

namespace {

    /**
     * This function splits one parameter of a query into its key
     * and values.  The key ends at the first "=", and the values
     * following it are separated by ",".
     *
     * @param[in] text
     *     This points to the first character of the parameter.
     *
     * @param[in] length
     *     This is the number of characters in the parameter.
     *
     * @return
     *     The key and values of the parameter are returned.
     */
    Rfc3986::QueryParameter SplitQueryParameter(
        const char* text,
        size_t length
    ) {
        size_t keyLength = 0;
        while (
            (keyLength < length)
            && (text[keyLength] != '=')
        ) {
            ++keyLength;
        }
        Rfc3986::QueryParameter parameter;
        parameter.first = Rfc3986::Substring(text, keyLength);
        if (keyLength == length) {
            return parameter;
        }
        size_t valueStart = keyLength + 1;
        for (size_t i = valueStart; i <= length; ++i) {
            if (
                (i == length)
                || (text[i] == ',')
            ) {
                parameter.second.emplace_back(text + valueStart, i - valueStart);
                valueStart = i + 1;
            }
        }
        return parameter;
    }

    /**
     * This function splits the text of a query into parameters
     * separated by "&" or ";", skipping empty parameters.
     *
     * @param[in] raw
     *     This is the text of the query.
     *
     * @return
     *     The parameters of the query are returned.
     */
    std::vector< Rfc3986::QueryParameter > SplitQuery(const Rfc3986::Substring& raw) {
        std::vector< Rfc3986::QueryParameter > parameters;
        const auto text = raw.GetData();
        const auto length = raw.GetLength();
        size_t parameterStart = 0;
        for (size_t i = 0; i <= length; ++i) {
            if (
                (i < length)
                && (text[i] != '&')
                && (text[i] != ';')
            ) {
                continue;
            }
            if (i > parameterStart) {
                parameters.push_back(
                    SplitQueryParameter(text + parameterStart, i - parameterStart)
                );
            }
            parameterStart = i + 1;
        }
        return parameters;
    }

}

namespace Rfc3986 {

    Parser::Parser(
        const char* text,
        size_t length
    )
        : text_(text)
        , length_(length)
    {
    }

    bool Parser::ParseUri(Uri& uri) {
        position_ = 0;
        uri = Uri();
        if (!ParseScheme(uri.scheme_)) {
            uri = Uri();
            return false;
        }
        if (!Accept(':')) {
            Fail("\":\"");
            uri = Uri();
            return false;
        }
        if (
            !ParseHierPart(
                uri.hasAuthority_,
                uri.authority_,
                uri.path_,
                &Parser::ParsePathRootless
            )
        ) {
            Fail("hier-part");
            uri = Uri();
            return false;
        }
        ParseQueryAndFragment(
            uri.hasQuery_,
            uri.query_,
            uri.hasFragment_,
            uri.fragment_
        );
        if (!AtEnd()) {
            Fail("end of input");
            uri = Uri();
            return false;
        }
        uri.raw_ = Span(0);
        return true;
    }

    bool Parser::ParseRelativeReference(RelativeReference& relativeReference) {
        position_ = 0;
        relativeReference = RelativeReference();
        if (
            !ParseHierPart(
                relativeReference.hasAuthority_,
                relativeReference.authority_,
                relativeReference.path_,
                &Parser::ParsePathNoScheme
            )
        ) {
            Fail("relative-part");
            relativeReference = RelativeReference();
            return false;
        }
        ParseQueryAndFragment(
            relativeReference.hasQuery_,
            relativeReference.query_,
            relativeReference.hasFragment_,
            relativeReference.fragment_
        );
        if (!AtEnd()) {
            Fail("end of input");
            relativeReference = RelativeReference();
            return false;
        }
        relativeReference.raw_ = Span(0);
        return true;
    }

    bool Parser::ParseUriReference(UriReference& uriReference) {
        uriReference = UriReference();
        if (ParseUri(uriReference.uri_)) {
            uriReference.isRelativeReference_ = false;
            return true;
        }
        uriReference.uri_ = Uri();
        if (ParseRelativeReference(uriReference.relativeReference_)) {
            uriReference.isRelativeReference_ = true;
            return true;
        }
        uriReference.relativeReference_ = RelativeReference();
        return false;
    }

    bool Parser::ParsePath(Path& path) {
        static const PathProduction alternatives[] = {
            &Parser::ParsePathAbsolute,
            &Parser::ParsePathRootless,
            &Parser::ParsePathAbEmpty,
            &Parser::ParsePathEmpty,
        };
        position_ = 0;
        return ParseFirstPathAlternative(
            alternatives,
            sizeof(alternatives) / sizeof(alternatives[0]),
            true,
            path
        );
    }

    bool Parser::ParseScheme(Scheme& scheme) {
        static const struct {
            const char* literal;
            SchemeKind kind;
        } fastPaths[] = {
            {"https", SchemeKind::Https},
            {"http", SchemeKind::Http},
        };
        const auto start = position_;
        for (const auto& fastPath: fastPaths) {
            const auto matched = IsCaseInsensitiveMatch(
                text_ + position_,
                length_ - position_,
                fastPath.literal
            );
            if (matched == 0) {
                continue;
            }
            position_ += matched;
            if (PeekInSet(SchemeNotFirst())) {
                position_ = start;
                continue;
            }
            scheme.kind_ = fastPath.kind;
            scheme.raw_ = Span(start);
            return true;
        }
        if (!AcceptInSet(Alpha())) {
            Fail("scheme");
            return false;
        }
        while (AcceptInSet(SchemeNotFirst())) {
        }
        scheme.kind_ = SchemeKind::Other;
        scheme.raw_ = Span(start);
        return true;
    }

    bool Parser::ParseAuthority(Authority& authority) {
        const auto start = position_;
        authority = Authority();
        if (
            ParseUserInfo(authority.userInfo_)
            && Accept('@')
        ) {
            authority.hasUserInfo_ = true;
        } else {
            position_ = start;
            authority.userInfo_ = UserInfo();
        }
        if (!ParseHost(authority.host_)) {
            position_ = start;
            return false;
        }
        if (Accept(':')) {
            if (!ParsePort(authority.port_)) {
                position_ = start;
                return false;
            }
            authority.hasPort_ = true;
        }
        authority.raw_ = Span(start);
        return true;
    }

    bool Parser::ParseUserInfo(UserInfo& userInfo) {
        const auto start = position_;
        (void)ConsumeRun(UserInfoNotPctEncoded());
        userInfo = UserInfo();
        userInfo.raw_ = Span(start);
        SplitUserInfo(userInfo);
        return true;
    }

    bool Parser::ParseHost(HostInfo& host) {
        static const HostProduction alternatives[] = {
            &Parser::ParseIpv6Literal,
            &Parser::ParseIpvFutureLiteral,
            &Parser::ParseIpv4Host,
            &Parser::ParseRegName,
        };
        const auto start = position_;
        for (const auto alternative: alternatives) {
            position_ = start;
            host = HostInfo();
            if ((this->*alternative)(host)) {
                return true;
            }
        }
        position_ = start;
        Fail("host");
        return false;
    }

    bool Parser::ParsePort(uint16_t& port) {
        const auto start = position_;
        uint32_t portIn32Bits = 0;
        while (PeekInSet(Digit())) {
            portIn32Bits *= 10;
            portIn32Bits += (uint32_t)(text_[position_] - '0');
            if (
                (portIn32Bits & ~((1 << 16) - 1)) != 0
            ) {
                Fail("port");
                position_ = start;
                return false;
            }
            ++position_;
        }
        if (position_ == start) {
            Fail("port");
            return false;
        }
        port = (uint16_t)portIn32Bits;
        return true;
    }

    bool Parser::ParseQuery(Query& query) {
        const auto start = position_;
        (void)ConsumeRun(QueryOrFragmentNotPctEncoded());
        query = Query();
        query.raw_ = Span(start);
        query.parameters_ = SplitQuery(query.raw_);
        return true;
    }

    bool Parser::ParseFragment(Fragment& fragment) {
        const auto start = position_;
        (void)ConsumeRun(QueryOrFragmentNotPctEncoded());
        fragment = Fragment();
        fragment.raw_ = Span(start);
        return true;
    }

    bool Parser::AtEnd() const {
        return (position_ >= length_);
    }

    size_t Parser::GetPosition() const {
        return position_;
    }

    std::string Parser::GetDiagnostic(const char* production) const {
        std::string diagnostic = "\"";
        diagnostic += std::string(text_, length_);
        diagnostic += "\" does not match ";
        diagnostic += production;
        diagnostic += ": expected ";
        diagnostic += ((expected_ == nullptr) ? production : expected_);
        diagnostic += " at offset ";
        diagnostic += std::to_string(furthestFailure_);
        return diagnostic;
    }

    bool Parser::ParseHierPart(
        bool& hasAuthority,
        Authority& authority,
        Path& path,
        PathProduction rootlessProduction
    ) {
        const auto start = position_;
        hasAuthority = false;
        if (
            Accept('/')
            && Accept('/')
        ) {
            if (
                ParseAuthority(authority)
                && ParsePathAbEmpty(path)
            ) {
                hasAuthority = true;
                return true;
            }
            authority = Authority();
        }
        position_ = start;
        const PathProduction alternatives[] = {
            &Parser::ParsePathAbsolute,
            rootlessProduction,
            &Parser::ParsePathEmpty,
        };
        return ParseFirstPathAlternative(
            alternatives,
            sizeof(alternatives) / sizeof(alternatives[0]),
            false,
            path
        );
    }

    void Parser::ParseQueryAndFragment(
        bool& hasQuery,
        Query& query,
        bool& hasFragment,
        Fragment& fragment
    ) {
        hasQuery = (
            Accept('?')
            && ParseQuery(query)
        );
        hasFragment = (
            Accept('#')
            && ParseFragment(fragment)
        );
    }

    bool Parser::ParseFirstPathAlternative(
        const PathProduction* alternatives,
        size_t numAlternatives,
        bool wholeString,
        Path& path
    ) {
        const auto start = position_;
        for (size_t i = 0; i < numAlternatives; ++i) {
            position_ = start;
            path = Path();
            if (
                (this->*alternatives[i])(path)
                && (
                    !wholeString
                    || AtEnd()
                )
            ) {
                return true;
            }
        }
        position_ = start;
        path = Path();
        Fail("path");
        return false;
    }

    bool Parser::ParsePathAbEmpty(Path& path) {
        const auto start = position_;
        ParseSegments(path.segments_);
        if (path.segments_.empty()) {
            path.kind_ = PathKind::Empty;
        } else if (
            !path.segments_[0].IsEmpty()
            || (path.segments_.size() == 1)
        ) {
            path.kind_ = PathKind::Absolute;
        } else {
            path.kind_ = PathKind::AbEmpty;
        }
        path.raw_ = Span(start);
        return true;
    }

    bool Parser::ParsePathAbsolute(Path& path) {
        const auto start = position_;
        if (!Accept('/')) {
            Fail("path-absolute");
            return false;
        }
        const auto segmentStart = position_;
        (void)ConsumeRun(PcharNotPctEncoded());
        path.segments_.push_back(Span(segmentStart));
        if (!path.segments_[0].IsEmpty()) {
            ParseSegments(path.segments_);
        }
        path.kind_ = PathKind::Absolute;
        path.raw_ = Span(start);
        return true;
    }

    bool Parser::ParsePathNoScheme(Path& path) {
        const auto start = position_;
        if (ConsumeRun(SegmentNzNcNotPctEncoded()) == 0) {
            Fail("path-noscheme");
            return false;
        }
        path.segments_.push_back(Span(start));
        ParseSegments(path.segments_);
        path.kind_ = PathKind::NoScheme;
        path.raw_ = Span(start);
        return true;
    }

    bool Parser::ParsePathRootless(Path& path) {
        const auto start = position_;
        if (ConsumeRun(PcharNotPctEncoded()) == 0) {
            Fail("path-rootless");
            return false;
        }
        path.segments_.push_back(Span(start));
        ParseSegments(path.segments_);
        path.kind_ = PathKind::Rootless;
        path.raw_ = Span(start);
        return true;
    }

    bool Parser::ParsePathEmpty(Path& path) {
        if (
            PeekInSet(PcharNotPctEncoded())
            || Peek('%')
        ) {
            Fail("path-empty");
            return false;
        }
        path.kind_ = PathKind::Empty;
        path.raw_ = Span(position_);
        return true;
    }

    void Parser::ParseSegments(std::vector< Substring >& segments) {
        while (Accept('/')) {
            const auto segmentStart = position_;
            (void)ConsumeRun(PcharNotPctEncoded());
            segments.push_back(Span(segmentStart));
        }
    }

    bool Parser::ParseIpv6Literal(HostInfo& host) {
        if (!Accept('[')) {
            return false;
        }
        const auto start = position_;
        if (!ParseIpv6Address(host.ipv6Address_)) {
            Fail("IPv6address");
            return false;
        }
        host.raw_ = Span(start);
        if (!Accept(']')) {
            Fail("\"]\"");
            return false;
        }
        host.kind_ = HostKind::Ipv6Address;
        return true;
    }

    bool Parser::ParseIpvFutureLiteral(HostInfo& host) {
        if (!Accept('[')) {
            return false;
        }
        const auto start = position_;
        if (
            !(Accept('v') || Accept('V'))
            || !AcceptInSet(Hexdig())
        ) {
            Fail("IPvFuture");
            return false;
        }
        while (AcceptInSet(Hexdig())) {
        }
        if (
            !Accept('.')
            || !AcceptInSet(IpvFutureLastPart())
        ) {
            Fail("IPvFuture");
            return false;
        }
        while (AcceptInSet(IpvFutureLastPart())) {
        }
        host.raw_ = Span(start);
        if (!Accept(']')) {
            Fail("\"]\"");
            return false;
        }
        host.kind_ = HostKind::IpvFuture;
        return true;
    }

    bool Parser::ParseIpv4Host(HostInfo& host) {
        const auto start = position_;
        if (!ParseIpv4Address(host.ipv4Address_)) {
            return false;
        }
        if (
            PeekInSet(RegNameNotPctEncoded())
            || Peek('%')
        ) {
            return false;
        }
        host.kind_ = HostKind::Ipv4Address;
        host.raw_ = Span(start);
        return true;
    }

    bool Parser::ParseRegName(HostInfo& host) {
        const auto start = position_;
        (void)ConsumeRun(RegNameNotPctEncoded());
        host.kind_ = HostKind::RegistryName;
        host.raw_ = Span(start);
        return true;
    }

    bool Parser::ParseIpv6Address(Ipv6Octets& address) {
        static const Ipv6Shape shapes[] = {
            {false, 0, 6, Ipv6Tail::Ls32},
            {true, 0, 5, Ipv6Tail::Ls32},
            {true, 1, 4, Ipv6Tail::Ls32},
            {true, 2, 3, Ipv6Tail::Ls32},
            {true, 3, 2, Ipv6Tail::Ls32},
            {true, 4, 1, Ipv6Tail::Ls32},
            {true, 5, 0, Ipv6Tail::Ls32},
            {true, 6, 0, Ipv6Tail::H16},
            {true, 7, 0, Ipv6Tail::None},
        };
        const auto start = position_;
        for (const auto& shape: shapes) {
            position_ = start;
            if (ParseIpv6Shape(shape, address)) {
                return true;
            }
        }
        position_ = start;
        return false;
    }

    bool Parser::ParseIpv6Shape(
        const Ipv6Shape& shape,
        Ipv6Octets& address
    ) {
        std::vector< uint16_t > head;
        std::vector< uint16_t > tail;
        if (shape.elided) {
            ParseIpv6Prefix(shape.maxPrefixGroups, head);
            if (
                !Accept(':')
                || !Accept(':')
            ) {
                return false;
            }
        }
        for (size_t i = 0; i < shape.suffixGroups; ++i) {
            uint16_t group;
            if (
                !ParseH16(group)
                || !Accept(':')
            ) {
                return false;
            }
            tail.push_back(group);
        }
        switch (shape.tail) {
            case Ipv6Tail::Ls32: {
                if (!ParseLs32(tail)) {
                    return false;
                }
            } break;

            case Ipv6Tail::H16: {
                uint16_t group;
                if (!ParseH16(group)) {
                    return false;
                }
                tail.push_back(group);
            } break;

            case Ipv6Tail::None:
            default: break;
        }
        if (!Peek(']')) {
            return false;
        }
        address.fill(0);
        for (size_t i = 0; i < head.size(); ++i) {
            address[i * 2] = (uint8_t)(head[i] >> 8);
            address[i * 2 + 1] = (uint8_t)(head[i] & 0xFF);
        }
        const auto tailStart = 8 - tail.size();
        for (size_t i = 0; i < tail.size(); ++i) {
            address[(tailStart + i) * 2] = (uint8_t)(tail[i] >> 8);
            address[(tailStart + i) * 2 + 1] = (uint8_t)(tail[i] & 0xFF);
        }
        return true;
    }

    void Parser::ParseIpv6Prefix(
        size_t maxGroups,
        std::vector< uint16_t >& groups
    ) {
        while (groups.size() < maxGroups) {
            const auto groupStart = position_;
            uint16_t group;
            if (!ParseH16(group)) {
                position_ = groupStart;
                return;
            }
            groups.push_back(group);
            if (
                Peek(':')
                && (position_ + 1 < length_)
                && (text_[position_ + 1] == ':')
            ) {
                return;
            }
            if (!Accept(':')) {
                return;
            }
        }
    }

    bool Parser::ParseLs32(std::vector< uint16_t >& groups) {
        const auto start = position_;
        uint16_t high, low;
        if (
            ParseH16(high)
            && Accept(':')
            && ParseH16(low)
        ) {
            groups.push_back(high);
            groups.push_back(low);
            return true;
        }
        position_ = start;
        Ipv4Octets ipv4Address;
        if (!ParseIpv4Address(ipv4Address)) {
            return false;
        }
        groups.push_back((uint16_t)((ipv4Address[0] << 8) + ipv4Address[1]));
        groups.push_back((uint16_t)((ipv4Address[2] << 8) + ipv4Address[3]));
        return true;
    }

    bool Parser::ParseH16(uint16_t& group) {
        const auto start = position_;
        unsigned int value = 0;
        while (
            (position_ - start < 4)
            && PeekInSet(Hexdig())
        ) {
            value <<= 4;
            value += HexDigitValue(text_[position_]);
            ++position_;
        }
        if (position_ == start) {
            Fail("h16");
            return false;
        }
        group = (uint16_t)value;
        return true;
    }

    bool Parser::ParseIpv4Address(Ipv4Octets& address) {
        const auto start = position_;
        for (size_t i = 0; i < address.size(); ++i) {
            if (
                (
                    (i > 0)
                    && !Accept('.')
                )
                || !ParseDecOctet(address[i])
            ) {
                position_ = start;
                return false;
            }
        }
        return true;
    }

    bool Parser::ParseDecOctet(uint8_t& octet) {
        const auto start = position_;
        unsigned int value = 0;
        while (
            (position_ - start < 4)
            && PeekInSet(Digit())
        ) {
            value *= 10;
            value += (unsigned int)(text_[position_] - '0');
            ++position_;
        }
        const auto numDigits = position_ - start;
        if (
            (numDigits == 0)
            || (numDigits > 3)
            || (value > 255)
            || (
                (numDigits > 1)
                && (text_[start] == '0')
            )
        ) {
            position_ = start;
            Fail("dec-octet");
            return false;
        }
        octet = (uint8_t)value;
        return true;
    }

    void Parser::SplitUserInfo(UserInfo& userInfo) {
        Parser split(userInfo.raw_.GetData(), userInfo.raw_.GetLength());
        if (split.ConsumeRun(RegNameNotPctEncoded()) == 0) {
            return;
        }
        const auto username = split.Span(0);
        bool hasPassword = false;
        Substring password;
        if (split.Accept(':')) {
            const auto passwordStart = split.position_;
            (void)split.ConsumeRun(UserInfoNotPctEncoded());
            hasPassword = true;
            password = split.Span(passwordStart);
        }
        if (!split.AtEnd()) {
            return;
        }
        userInfo.isSplit_ = true;
        userInfo.username_ = username;
        userInfo.hasPassword_ = hasPassword;
        userInfo.password_ = password;
    }

    size_t Parser::ConsumeRun(const CharacterSet& characterSet) {
        const auto start = position_;
        while (
            AcceptInSet(characterSet)
            || AcceptPctEncoded()
        ) {
        }
        return position_ - start;
    }

    bool Parser::Peek(char c) const {
        return (
            (position_ < length_)
            && (text_[position_] == c)
        );
    }

    bool Parser::PeekInSet(const CharacterSet& characterSet) const {
        return (
            (position_ < length_)
            && characterSet.Contains(text_[position_])
        );
    }

    bool Parser::Accept(char c) {
        if (!Peek(c)) {
            return false;
        }
        ++position_;
        return true;
    }

    bool Parser::AcceptInSet(const CharacterSet& characterSet) {
        if (!PeekInSet(characterSet)) {
            return false;
        }
        ++position_;
        return true;
    }

    bool Parser::AcceptPctEncoded() {
        if (
            (position_ + 2 < length_)
            && (text_[position_] == '%')
            && Hexdig().Contains(text_[position_ + 1])
            && Hexdig().Contains(text_[position_ + 2])
        ) {
            position_ += 3;
            return true;
        }
        return false;
    }

    Substring Parser::Span(size_t start) const {
        return Substring(text_ + start, position_ - start);
    }

    void Parser::Fail(const char* production) {
        if (
            (expected_ == nullptr)
            || (position_ >= furthestFailure_)
        ) {
            furthestFailure_ = position_;
            expected_ = production;
        }
    }

}
