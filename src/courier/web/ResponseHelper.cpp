//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/ResponseHelper.hpp"

namespace courier::web {

ResponseAction ResponseHelper::render(const std::string& view, const Model& model) const {
    return ResponseAction::render(view, model);
}

ResponseAction ResponseHelper::respond(const std::any& payload, int status) const {
    return ResponseAction::respond(payload, status);
}

ResponseAction ResponseHelper::respondErrors(const Errors& errors, const std::string& view) const {
    return ResponseAction::respondErrors(errors, view);
}

ResponseAction ResponseHelper::notFound() const {
    return ResponseAction::respond(std::any(), 404);
}

ProducerRef<ResponseAction> ResponseHelper::recoverValidation(
    const ProducerRef<ResponseAction>& producer,
    const std::string& view
) const {
    return producer->onErrorReturn([view](const Error& error) {
        if(!error.isA(category::VALIDATION)) {
            throw error;
        }
        return ResponseAction::respondErrors(error.fieldErrors(), view);
    });
}

} // namespace courier::web
