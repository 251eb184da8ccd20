//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/BeastExchange.hpp"

namespace courier::web {

namespace http = boost::beast::http;

namespace {

int hexValue(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string decode(boost::beast::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());

    for(std::size_t i = 0; i < encoded.size(); i++) {
        auto c = encoded[i];
        if(c == '+') {
            decoded.push_back(' ');
        } else if(c == '%' && i + 2 < encoded.size() && hexValue(encoded[i + 1]) >= 0 && hexValue(encoded[i + 2]) >= 0) {
            decoded.push_back(static_cast<char>(hexValue(encoded[i + 1]) * 16 + hexValue(encoded[i + 2])));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }

    return decoded;
}

void parseQuery(boost::beast::string_view query, ExchangeContext::Values& params) {
    while(!query.empty()) {
        auto separator = query.find('&');
        auto pair = query.substr(0, separator);

        if(!pair.empty()) {
            auto equals = pair.find('=');
            if(equals == boost::beast::string_view::npos) {
                params.emplace(decode(pair), "");
            } else {
                params.emplace(decode(pair.substr(0, equals)), decode(pair.substr(equals + 1)));
            }
        }

        if(separator == boost::beast::string_view::npos) {
            break;
        }
        query = query.substr(separator + 1);
    }
}

} // namespace

ExchangeContext BeastExchange::snapshot(const BeastRequest& request, const ExchangeContext::Values& pathParams) {
    auto target = request.target();
    auto questionMark = target.find('?');

    ExchangeContext::Values params(pathParams);
    std::string path;

    if(questionMark == boost::beast::string_view::npos) {
        path = std::string(target);
    } else {
        path = std::string(target.substr(0, questionMark));
        parseQuery(target.substr(questionMark + 1), params);
    }

    ExchangeContext::Values headers;
    for(auto& field : request) {
        headers[std::string(field.name_string())] = std::string(field.value());
    }

    return ExchangeContext(
        std::string(request.method_string()),
        path,
        params,
        headers,
        request.body()
    );
}

BeastExchange::BeastExchange(
    const BeastRequest& request,
    const ViewRendererRef& renderer,
    const PayloadEncoder& encoder,
    const ResponseSink& sink,
    const Options& options,
    const ExchangeContext::Values& pathParams
)   : Exchange(snapshot(request, pathParams))
    , version(request.version())
    , keepAlive(request.keep_alive())
    , renderer(renderer)
    , encoder(encoder)
    , sink(sink)
    , options(options)
{}

BeastExchange::BeastExchange(
    const BeastRequest& request,
    const ViewRendererRef& renderer,
    const PayloadEncoder& encoder,
    const ResponseSink& sink
)   : BeastExchange(request, renderer, encoder, sink, Options())
{}

BeastResponse BeastExchange::build(const ResponseAction& action) const {
    BeastResponse response;
    response.version(version);
    response.keep_alive(keepAlive);
    response.set(http::field::server, options.server);

    switch(action.kind()) {
        case ActionKind::Render: {
            auto& render = action.asRender();
            response.result(http::status::ok);
            response.set(http::field::content_type, options.viewContentType);
            response.body() = renderer->render(render.view, render.model);
            break;
        }
        case ActionKind::Respond: {
            auto& respond = action.asRespond();
            response.result(static_cast<unsigned>(respond.status));
            if(respond.payload.has_value()) {
                response.set(http::field::content_type, options.payloadContentType);
                response.body() = encoder(respond.payload);
            }
            break;
        }
        case ActionKind::RespondErrors: {
            auto& respondErrors = action.asRespondErrors();
            Model model;
            model["errors"] = respondErrors.errors;
            response.result(static_cast<unsigned>(options.errorsStatus));
            response.set(http::field::content_type, options.viewContentType);
            response.body() = renderer->render(respondErrors.view, model);
            break;
        }
    }

    response.prepare_payload();
    return response;
}

void BeastExchange::write(const ResponseAction& action) {
    sink(build(action));
}

} // namespace courier::web
