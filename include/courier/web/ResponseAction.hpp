//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_WEB_RESPONSE_ACTION_H_
#define _COURIER_WEB_RESPONSE_ACTION_H_

#include <any>
#include <map>
#include <string>
#include <variant>
#include "../Errors.hpp"

namespace courier::web {

/**
 * The data handed to a view. Values are type erased and interpreted
 * by the view renderer.
 */
using Model = std::map<std::string, std::any>;

struct Render {
    std::string view;
    Model model;
};

/**
 * Respond with a payload and a status code. An empty payload stands
 * for a response without a body.
 */
struct Respond {
    std::any payload;
    int status;
};

struct RespondErrors {
    Errors errors;
    std::string view;
};

enum class ActionKind { Render, Respond, RespondErrors };

/**
 * An immutable description of the effect to apply to an HTTP exchange. A
 * controller action produces exactly one of these per request and the
 * dispatcher applies it exactly once.
 */
class ResponseAction {
public:
    ResponseAction(const Render& render);
    ResponseAction(const Respond& respond);
    ResponseAction(const RespondErrors& respondErrors);

    static ResponseAction render(const std::string& view, const Model& model = Model());
    static ResponseAction respond(const std::any& payload, int status = 200);
    static ResponseAction respondErrors(const Errors& errors, const std::string& view);

    ActionKind kind() const;

    /**
     * Access the held action. Throws std::bad_variant_access when
     * the action is of a different kind.
     */
    const Render& asRender() const;
    const Respond& asRespond() const;
    const RespondErrors& asRespondErrors() const;

    /**
     * @return A short human readable description used in log output.
     */
    std::string describe() const;

private:
    std::variant<Render, Respond, RespondErrors> value;
};

} // namespace courier::web

#endif
