/**
 * @file Fragment.cpp
 *
 * This module contains the implementation of the Rfc3986::Fragment and
 * Rfc3986::FragmentBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "DecodeElement.hpp"

#include <Rfc3986/Fragment.hpp>
#include <Rfc3986/PercentEncoding.hpp>

namespace Rfc3986 {

    FragmentBuilder::FragmentBuilder() = default;

    FragmentBuilder::FragmentBuilder(const std::string& text)
        : text_(text)
    {
    }

    bool FragmentBuilder::operator==(const FragmentBuilder& other) const {
        return (text_ == other.text_);
    }

    bool FragmentBuilder::operator!=(const FragmentBuilder& other) const {
        return !(*this == other);
    }

    std::string FragmentBuilder::GetText() const {
        return text_;
    }

    void FragmentBuilder::SetText(const std::string& text) {
        text_ = text;
    }

    std::string FragmentBuilder::GenerateString() const {
        return PercentEncode(text_);
    }

    Substring Fragment::GetRaw() const {
        return raw_;
    }

    std::string Fragment::ToString() const {
        return raw_.ToString();
    }

    FragmentBuilder Fragment::GetBuilder() const {
        return FragmentBuilder(DecodeElement(raw_));
    }

}
