/**
 * @file CaseInsensitiveMatchTests.cpp
 *
 * This module contains the unit tests of the
 * Rfc3986::IsCaseInsensitiveMatch function.
 *
 * © 2018 by Richard Walters
 */

#include <gtest/gtest.h>
#include <src/CaseInsensitiveMatch.hpp>
#include <string.h>

TEST(CaseInsensitiveMatchTests, MatchesRegardlessOfCase) {
    const char* testVectors[] = {
        "example",
        "eXAmplE",
        "EXAMPLE",
    };
    for (auto testVector: testVectors) {
        ASSERT_EQ(
            (size_t)7,
            Rfc3986::IsCaseInsensitiveMatch(testVector, strlen(testVector), "example")
        ) << testVector;
    }
}

TEST(CaseInsensitiveMatchTests, MatchesPrefixOnly) {
    const char text[] = "HTTPS://www.example.com/";
    ASSERT_EQ((size_t)5, Rfc3986::IsCaseInsensitiveMatch(text, strlen(text), "https"));
    ASSERT_EQ((size_t)4, Rfc3986::IsCaseInsensitiveMatch(text, strlen(text), "http"));
}

TEST(CaseInsensitiveMatchTests, Mismatch) {
    ASSERT_EQ((size_t)0, Rfc3986::IsCaseInsensitiveMatch("foo1BAR", 7, "foo2bar"));
    ASSERT_EQ((size_t)0, Rfc3986::IsCaseInsensitiveMatch("ftp", 3, "http"));
}

TEST(CaseInsensitiveMatchTests, TextShorterThanLiteral) {
    ASSERT_EQ((size_t)0, Rfc3986::IsCaseInsensitiveMatch("http", 4, "https"));
    ASSERT_EQ((size_t)0, Rfc3986::IsCaseInsensitiveMatch("https", 3, "https"));
    ASSERT_EQ((size_t)0, Rfc3986::IsCaseInsensitiveMatch("", 0, "http"));
}
