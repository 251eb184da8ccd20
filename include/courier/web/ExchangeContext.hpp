//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_EXCHANGE_CONTEXT_H_
#define _COURIER_WEB_EXCHANGE_CONTEXT_H_

#include <map>
#include <optional>
#include <string>

namespace courier::web {

/**
 * A snapshot of the request data a controller action may depend on. It is
 * captured once, before any asynchronous stage runs, and copied by value
 * into those stages - the live request is never read from a worker.
 */
class ExchangeContext {
public:
    using Values = std::map<std::string, std::string>;

    ExchangeContext(
        std::string method,
        std::string path,
        Values params = Values(),
        Values headers = Values(),
        std::string body = std::string()
    );

    const std::string& method() const;
    const std::string& path() const;

    /**
     * @return The merged query and path parameters.
     */
    const Values& params() const;
    const Values& headers() const;
    const std::string& body() const;

    std::optional<std::string> param(const std::string& name) const;

    /**
     * Look up a header. Header names are compared case insensitively.
     */
    std::optional<std::string> header(const std::string& name) const;

private:
    std::string methodName;
    std::string targetPath;
    Values paramValues;
    Values headerValues;
    std::string bodyText;
};

} // namespace courier::web

#endif
