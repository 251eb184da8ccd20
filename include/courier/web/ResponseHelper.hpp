//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_RESPONSE_HELPER_H_
#define _COURIER_WEB_RESPONSE_HELPER_H_

#include <any>
#include <string>
#include "../Producer.hpp"
#include "ResponseAction.hpp"

namespace courier::web {

/**
 * Builds response actions for controller actions. The dispatcher owns one
 * instance and passes it into every action it invokes.
 */
class ResponseHelper {
public:
    ResponseAction render(const std::string& view, const Model& model = Model()) const;
    ResponseAction respond(const std::any& payload, int status = 200) const;
    ResponseAction respondErrors(const Errors& errors, const std::string& view) const;
    ResponseAction notFound() const;

    /**
     * Respond with the value of a domain producer.
     *
     * @param producer The producer of the payload.
     * @param status The status to respond with.
     * @return A producer of the response action.
     */
    template <class T>
    ProducerRef<ResponseAction> respondWith(const ProducerRef<T>& producer, int status = 200) const;

    /**
     * Render a view with the model built from the value of a domain producer.
     */
    template <class T>
    ProducerRef<ResponseAction> renderWith(
        const std::string& view,
        const ProducerRef<T>& producer,
        const std::function<Model(const T&)>& toModel
    ) const;

    /**
     * Turn a validation failure of the given producer into a RespondErrors
     * action for the given view. Every other failure passes through.
     */
    ProducerRef<ResponseAction> recoverValidation(
        const ProducerRef<ResponseAction>& producer,
        const std::string& view
    ) const;
};

template <class T>
ProducerRef<ResponseAction> ResponseHelper::respondWith(const ProducerRef<T>& producer, int status) const {
    return producer->template map<ResponseAction>([status](const T& value) {
        return ResponseAction::respond(value, status);
    });
}

template <class T>
ProducerRef<ResponseAction> ResponseHelper::renderWith(
    const std::string& view,
    const ProducerRef<T>& producer,
    const std::function<Model(const T&)>& toModel
) const {
    return producer->template map<ResponseAction>([view, toModel](const T& value) {
        return ResponseAction::render(view, toModel(value));
    });
}

} // namespace courier::web

#endif
