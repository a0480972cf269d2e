#ifndef RFC3986_QUERY_HPP
#define RFC3986_QUERY_HPP

/**
 * @file Query.hpp
 *
 * This module declares the Rfc3986::Query and
 * Rfc3986::QueryBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "Substring.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Rfc3986 {

    /**
     * This is the type used by QueryBuilder to hold one parameter
     * of a query: a key and its values, not percent-encoded.
     */
    typedef std::pair< std::string, std::vector< std::string > > QueryBuilderParameter;

    /**
     * This is the type used by Query to hold one parameter of a
     * query: a key and its values, still percent-encoded.
     */
    typedef std::pair< Substring, std::vector< Substring > > QueryParameter;

    /**
     * This class holds an owned, mutable "query" element of a URI,
     * as an ordered sequence of parameters.
     */
    class QueryBuilder {
        // Lifecycle management
    public:
        ~QueryBuilder() noexcept;
        QueryBuilder(const QueryBuilder& other);
        QueryBuilder(QueryBuilder&&) noexcept;
        QueryBuilder& operator=(const QueryBuilder& other);
        QueryBuilder& operator=(QueryBuilder&&) noexcept;

        // Public methods
    public:
        /**
         * This is the default constructor.  The query has no parameters.
         */
        QueryBuilder();

        bool operator==(const QueryBuilder& other) const;
        bool operator!=(const QueryBuilder& other) const;

        std::vector< QueryBuilderParameter > GetParameters() const;
        void SetParameters(const std::vector< QueryBuilderParameter >& parameters);

        /**
         * This method appends a parameter to the query.
         *
         * @param[in] key
         *     This is the key of the parameter.
         *
         * @param[in] values
         *     These are the values of the parameter, if any.
         */
        void AddParameter(
            const std::string& key,
            const std::vector< std::string >& values = {}
        );

        /**
         * This method constructs and returns the string rendering of
         * the query, without the leading "?".  Parameters are separated
         * by "&", a key is separated from its values by "=", and values
         * are separated by ",".
         *
         * @return
         *     The string rendering of the query is returned.
         */
        std::string GenerateString() const;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::unique_ptr< Impl > impl_;
    };

    /**
     * This class represents the "query" element of a parsed URI.
     *
     * In addition to the raw text, the query is split into parameters
     * at each "&" or ";".  Each parameter is split into a key and
     * values at the first "=", and its values are split at each ",".
     * Empty parameters are skipped.
     */
    class Query {
        // Public methods
    public:
        /**
         * This is the default constructor.  The query is empty.
         */
        Query();

        /**
         * This method returns the text matched for the query,
         * not including the leading "?".
         *
         * @return
         *     The text matched for the query is returned.
         */
        Substring GetRaw() const;

        const std::vector< QueryParameter >& GetParameters() const;

        std::string ToString() const;

        /**
         * This method returns an owned, mutable, percent-decoded
         * copy of the query.
         *
         * @return
         *     An owned, mutable copy of the query is returned.
         */
        QueryBuilder GetBuilder() const;

        // Private properties
    private:
        friend class Parser;

        Substring raw_;
        std::vector< QueryParameter > parameters_;
    };

}

#endif /* RFC3986_QUERY_HPP */
