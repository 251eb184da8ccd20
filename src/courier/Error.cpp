//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/Error.hpp"

namespace courier {

Error Error::upstream(const std::string& message, std::exception_ptr cause) {
    Error error(category::UPSTREAM, message, "");
    error.causePtr = std::move(cause);
    return error;
}

Error Error::validation(const Errors& errors, const std::string& message) {
    Error error(category::VALIDATION, message, category::UPSTREAM);
    error.errors = errors;
    return error;
}

Error Error::emptyResult(const std::string& message) {
    return Error(category::EMPTY_RESULT, message, "");
}

Error Error::timeout(int64_t milliseconds) {
    return Error(
        category::TIMEOUT,
        "No result produced within " + std::to_string(milliseconds) + "ms",
        ""
    );
}

Error Error::defect(const std::string& message, std::exception_ptr cause) {
    Error error(category::DEFECT, message, "");
    error.causePtr = std::move(cause);
    return error;
}

Error::Error(const std::string& name, const std::string& message, const std::string& parent)
    : std::runtime_error(message)
    , categoryName(name)
    , parentName(parent == name ? "" : parent)
    , errors()
    , causePtr(nullptr)
{}

const std::string& Error::category() const {
    return categoryName;
}

const std::string& Error::parentCategory() const {
    return parentName;
}

bool Error::isA(const std::string& category) const {
    return categoryName == category || (!parentName.empty() && parentName == category);
}

const Errors& Error::fieldErrors() const {
    return errors;
}

std::exception_ptr Error::cause() const {
    return causePtr;
}

std::optional<Error> ErrorConversion<Error>::convert(const std::exception& failure) {
    if(auto error = dynamic_cast<const Error*>(&failure)) {
        return *error;
    }

    return Error::defect(failure.what(), std::current_exception());
}

AlreadyConsumed::AlreadyConsumed()
    : std::logic_error("Producer already consumed and cannot be subscribed again.")
{}

} // namespace courier
