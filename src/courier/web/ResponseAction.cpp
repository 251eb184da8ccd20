//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/web/ResponseAction.hpp"

namespace courier::web {

ResponseAction::ResponseAction(const Render& render)
    : value(render)
{}

ResponseAction::ResponseAction(const Respond& respond)
    : value(respond)
{}

ResponseAction::ResponseAction(const RespondErrors& respondErrors)
    : value(respondErrors)
{}

ResponseAction ResponseAction::render(const std::string& view, const Model& model) {
    return ResponseAction(Render{view, model});
}

ResponseAction ResponseAction::respond(const std::any& payload, int status) {
    return ResponseAction(Respond{payload, status});
}

ResponseAction ResponseAction::respondErrors(const Errors& errors, const std::string& view) {
    return ResponseAction(RespondErrors{errors, view});
}

ActionKind ResponseAction::kind() const {
    switch(value.index()) {
        case 0:
            return ActionKind::Render;
        case 1:
            return ActionKind::Respond;
        default:
            return ActionKind::RespondErrors;
    }
}

const Render& ResponseAction::asRender() const {
    return std::get<Render>(value);
}

const Respond& ResponseAction::asRespond() const {
    return std::get<Respond>(value);
}

const RespondErrors& ResponseAction::asRespondErrors() const {
    return std::get<RespondErrors>(value);
}

std::string ResponseAction::describe() const {
    switch(kind()) {
        case ActionKind::Render:
            return "Render(" + asRender().view + ")";
        case ActionKind::Respond:
            return "Respond(" + std::to_string(asRespond().status) + ")";
        default:
            return "RespondErrors(" + asRespondErrors().view + ", "
                + std::to_string(asRespondErrors().errors.size()) + " errors)";
    }
}

} // namespace courier::web
