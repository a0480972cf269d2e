/**
 * @file Parse.cpp
 *
 * This module contains the implementation of the functions which
 * parse URIs, URI references, relative references, and paths.
 *
 * © 2018 by Richard Walters
 */

#include "Logger.hpp"
#include "Parser.hpp"

#include <Rfc3986/Parse.hpp>
#include <string.h>

namespace {

    /**
     * This function matches the given string against one of the
     * top-level productions of the parser, logging the outcome.
     *
     * @param[in] text
     *     This points to the first character of the string to parse.
     *
     * @param[in] length
     *     This is the number of characters in the string to parse.
     *
     * @param[in] production
     *     This is the parser method for the production to match.
     *
     * @param[in] productionName
     *     This is the name of the production to match.
     *
     * @param[out] entity
     *     This is where to store the parsed entity.
     *
     * @param[out] error
     *     If not null, this is where to store the details of any failure.
     *
     * @return
     *     An indication of whether or not the whole string
     *     matched the production is returned.
     */
    template< typename Entity > bool RunParser(
        const char* text,
        size_t length,
        bool (Rfc3986::Parser::*production)(Entity&),
        const char* productionName,
        Entity& entity,
        Rfc3986::ParseError* error
    ) {
        Rfc3986::Parser parser(text, length);
        if ((parser.*production)(entity)) {
            if (Rfc3986::IsLogging(Rfc3986::LogLevel::Trace)) {
                Rfc3986::Log(
                    Rfc3986::LogLevel::Trace,
                    std::string("parsed ") + productionName + ": \"" + std::string(text, length) + "\""
                );
            }
            return true;
        }
        entity = Entity();
        const auto diagnostic = parser.GetDiagnostic(productionName);
        Rfc3986::Log(Rfc3986::LogLevel::Debug, diagnostic);
        if (error != nullptr) {
            error->message = diagnostic;
        }
        return false;
    }

}

namespace Rfc3986 {

    bool ParseUri(
        const char* text,
        Uri& uri
    ) {
        return RunParser(text, strlen(text), &Parser::ParseUri, "URI", uri, nullptr);
    }

    bool ParseUri(
        const char* text,
        Uri& uri,
        ParseError& error
    ) {
        return RunParser(text, strlen(text), &Parser::ParseUri, "URI", uri, &error);
    }

    bool ParseUri(
        const std::string& text,
        Uri& uri
    ) {
        return RunParser(text.data(), text.length(), &Parser::ParseUri, "URI", uri, nullptr);
    }

    bool ParseUri(
        const std::string& text,
        Uri& uri,
        ParseError& error
    ) {
        return RunParser(text.data(), text.length(), &Parser::ParseUri, "URI", uri, &error);
    }

    bool ParseUriReference(
        const char* text,
        UriReference& uriReference
    ) {
        return RunParser(
            text, strlen(text),
            &Parser::ParseUriReference, "URI-reference",
            uriReference, nullptr
        );
    }

    bool ParseUriReference(
        const char* text,
        UriReference& uriReference,
        ParseError& error
    ) {
        return RunParser(
            text, strlen(text),
            &Parser::ParseUriReference, "URI-reference",
            uriReference, &error
        );
    }

    bool ParseUriReference(
        const std::string& text,
        UriReference& uriReference
    ) {
        return RunParser(
            text.data(), text.length(),
            &Parser::ParseUriReference, "URI-reference",
            uriReference, nullptr
        );
    }

    bool ParseUriReference(
        const std::string& text,
        UriReference& uriReference,
        ParseError& error
    ) {
        return RunParser(
            text.data(), text.length(),
            &Parser::ParseUriReference, "URI-reference",
            uriReference, &error
        );
    }

    bool ParseRelativeReference(
        const char* text,
        RelativeReference& relativeReference
    ) {
        return RunParser(
            text, strlen(text),
            &Parser::ParseRelativeReference, "relative-ref",
            relativeReference, nullptr
        );
    }

    bool ParseRelativeReference(
        const char* text,
        RelativeReference& relativeReference,
        ParseError& error
    ) {
        return RunParser(
            text, strlen(text),
            &Parser::ParseRelativeReference, "relative-ref",
            relativeReference, &error
        );
    }

    bool ParseRelativeReference(
        const std::string& text,
        RelativeReference& relativeReference
    ) {
        return RunParser(
            text.data(), text.length(),
            &Parser::ParseRelativeReference, "relative-ref",
            relativeReference, nullptr
        );
    }

    bool ParseRelativeReference(
        const std::string& text,
        RelativeReference& relativeReference,
        ParseError& error
    ) {
        return RunParser(
            text.data(), text.length(),
            &Parser::ParseRelativeReference, "relative-ref",
            relativeReference, &error
        );
    }

    bool ParsePath(
        const char* text,
        Path& path
    ) {
        return RunParser(text, strlen(text), &Parser::ParsePath, "path", path, nullptr);
    }

    bool ParsePath(
        const char* text,
        Path& path,
        ParseError& error
    ) {
        return RunParser(text, strlen(text), &Parser::ParsePath, "path", path, &error);
    }

    bool ParsePath(
        const std::string& text,
        Path& path
    ) {
        return RunParser(text.data(), text.length(), &Parser::ParsePath, "path", path, nullptr);
    }

    bool ParsePath(
        const std::string& text,
        Path& path,
        ParseError& error
    ) {
        return RunParser(text.data(), text.length(), &Parser::ParsePath, "path", path, &error);
    }

}
