//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_BEAST_EXCHANGE_H_
#define _COURIER_WEB_BEAST_EXCHANGE_H_

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <boost/beast/http.hpp>
#include "Exchange.hpp"

namespace courier::web {

using BeastRequest = boost::beast::http::request<boost::beast::http::string_body>;
using BeastResponse = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * Turns a view name and model into a response body. Supplied by the
 * host's template engine.
 */
class ViewRenderer {
public:
    virtual std::string render(const std::string& view, const Model& model) const = 0;
    virtual ~ViewRenderer() = default;
};

using ViewRendererRef = std::shared_ptr<const ViewRenderer>;

/**
 * Serializes a `Respond` payload into a response body.
 */
using PayloadEncoder = std::function<std::string(const std::any&)>;

/**
 * Receives the finished response, typically to write it to the socket
 * the request arrived on.
 */
using ResponseSink = std::function<void(BeastResponse&&)>;

/**
 * An exchange for a Boost.Beast request. Applying a response action builds
 * a complete `http::response` and hands it to the sink:
 *
 *   - Render uses the view renderer and the view content type,
 *   - Respond uses the payload encoder and the payload content type, an
 *     empty payload yields an empty body,
 *   - RespondErrors renders the view with the field errors under the
 *     model key "errors" and the configured errors status.
 */
class BeastExchange final : public Exchange {
public:
    struct Options {
        std::string payloadContentType = "application/json";
        std::string viewContentType = "text/html; charset=utf-8";
        std::string server = "courier";
        int errorsStatus = 422;
    };

    /**
     * Take the request snapshot of a Beast request. Query parameters are
     * decoded from the target and merged with the given path parameters,
     * path parameters taking precedence.
     *
     * @param request The request to take the snapshot of.
     * @param pathParams Parameters extracted by the host's router.
     * @return The request snapshot.
     */
    static ExchangeContext snapshot(
        const BeastRequest& request,
        const ExchangeContext::Values& pathParams = ExchangeContext::Values()
    );

    BeastExchange(
        const BeastRequest& request,
        const ViewRendererRef& renderer,
        const PayloadEncoder& encoder,
        const ResponseSink& sink,
        const Options& options,
        const ExchangeContext::Values& pathParams = ExchangeContext::Values()
    );

    BeastExchange(
        const BeastRequest& request,
        const ViewRendererRef& renderer,
        const PayloadEncoder& encoder,
        const ResponseSink& sink
    );

    /**
     * Build the response for an action without writing it.
     */
    BeastResponse build(const ResponseAction& action) const;

protected:
    void write(const ResponseAction& action) override;

private:
    unsigned version;
    bool keepAlive;
    ViewRendererRef renderer;
    PayloadEncoder encoder;
    ResponseSink sink;
    Options options;
};

} // namespace courier::web

#endif
