//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/ExchangeContext.hpp"
#include <algorithm>
#include <cctype>

namespace courier::web {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

ExchangeContext::ExchangeContext(
    std::string method,
    std::string path,
    Values params,
    Values headers,
    std::string body
)   : methodName(std::move(method))
    , targetPath(std::move(path))
    , paramValues(std::move(params))
    , headerValues()
    , bodyText(std::move(body))
{
    for(auto& [name, value] : headers) {
        headerValues[lowercase(name)] = value;
    }
}

const std::string& ExchangeContext::method() const {
    return methodName;
}

const std::string& ExchangeContext::path() const {
    return targetPath;
}

const ExchangeContext::Values& ExchangeContext::params() const {
    return paramValues;
}

const ExchangeContext::Values& ExchangeContext::headers() const {
    return headerValues;
}

const std::string& ExchangeContext::body() const {
    return bodyText;
}

std::optional<std::string> ExchangeContext::param(const std::string& name) const {
    auto found = paramValues.find(name);
    if(found == paramValues.end()) {
        return {};
    }
    return found->second;
}

std::optional<std::string> ExchangeContext::header(const std::string& name) const {
    auto found = headerValues.find(lowercase(name));
    if(found == headerValues.end()) {
        return {};
    }
    return found->second;
}

} // namespace courier::web
