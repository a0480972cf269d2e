/**
 * @file Query.cpp
 *
 * This module contains the implementation of the Rfc3986::Query and
 * Rfc3986::QueryBuilder classes.
 *
 * © 2018 by Richard Walters
 */

#include "DecodeElement.hpp"

#include <Rfc3986/PercentEncoding.hpp>
#include <Rfc3986/Query.hpp>

namespace Rfc3986 {

    /**
     * This contains the private properties of a QueryBuilder instance.
     */
    struct QueryBuilder::Impl {
        /**
         * These are the parameters of the query, in order.
         */
        std::vector< QueryBuilderParameter > parameters;
    };

    QueryBuilder::~QueryBuilder() noexcept = default;
    QueryBuilder::QueryBuilder(const QueryBuilder& other)
        : impl_(new Impl(*other.impl_))
    {
    }
    QueryBuilder::QueryBuilder(QueryBuilder&&) noexcept = default;
    QueryBuilder& QueryBuilder::operator=(const QueryBuilder& other) {
        if (this != &other) {
            *impl_ = *other.impl_;
        }
        return *this;
    }
    QueryBuilder& QueryBuilder::operator=(QueryBuilder&&) noexcept = default;

    QueryBuilder::QueryBuilder()
        : impl_(new Impl)
    {
    }

    bool QueryBuilder::operator==(const QueryBuilder& other) const {
        return (impl_->parameters == other.impl_->parameters);
    }

    bool QueryBuilder::operator!=(const QueryBuilder& other) const {
        return !(*this == other);
    }

    std::vector< QueryBuilderParameter > QueryBuilder::GetParameters() const {
        return impl_->parameters;
    }

    void QueryBuilder::SetParameters(const std::vector< QueryBuilderParameter >& parameters) {
        impl_->parameters = parameters;
    }

    void QueryBuilder::AddParameter(
        const std::string& key,
        const std::vector< std::string >& values
    ) {
        impl_->parameters.emplace_back(key, values);
    }

    std::string QueryBuilder::GenerateString() const {
        std::string out;
        bool firstParameter = true;
        for (const auto& parameter: impl_->parameters) {
            if (!firstParameter) {
                out.push_back('&');
            }
            firstParameter = false;
            PercentEncode(parameter.first, out);
            if (parameter.second.empty()) {
                continue;
            }
            out.push_back('=');
            bool firstValue = true;
            for (const auto& value: parameter.second) {
                if (!firstValue) {
                    out.push_back(',');
                }
                firstValue = false;
                PercentEncode(value, out);
            }
        }
        return out;
    }

    Query::Query() = default;

    Substring Query::GetRaw() const {
        return raw_;
    }

    const std::vector< QueryParameter >& Query::GetParameters() const {
        return parameters_;
    }

    std::string Query::ToString() const {
        return raw_.ToString();
    }

    QueryBuilder Query::GetBuilder() const {
        QueryBuilder builder;
        for (const auto& parameter: parameters_) {
            std::vector< std::string > values;
            values.reserve(parameter.second.size());
            for (const auto& value: parameter.second) {
                values.push_back(DecodeElement(value));
            }
            builder.AddParameter(DecodeElement(parameter.first), values);
        }
        return builder;
    }

}
