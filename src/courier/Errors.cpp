//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#include "courier/Errors.hpp"

namespace courier {

bool operator==(const FieldError& left, const FieldError& right) {
    return left.field == right.field
        && left.code == right.code
        && left.message == right.message;
}

Errors::Errors(std::initializer_list<FieldError> errors)
    : errors(errors)
{}

Errors& Errors::reject(const std::string& field, const std::string& code, const std::string& message) {
    errors.push_back(FieldError{field, code, message});
    return *this;
}

bool Errors::hasErrors() const {
    return !errors.empty();
}

bool Errors::hasFieldErrors(const std::string& field) const {
    for(auto& error : errors) {
        if(error.field == field) {
            return true;
        }
    }
    return false;
}

std::size_t Errors::size() const {
    return errors.size();
}

std::vector<FieldError> Errors::fieldErrors(const std::string& field) const {
    std::vector<FieldError> result;
    for(auto& error : errors) {
        if(error.field == field) {
            result.push_back(error);
        }
    }
    return result;
}

const std::vector<FieldError>& Errors::all() const {
    return errors;
}

bool operator==(const Errors& left, const Errors& right) {
    return left.all() == right.all();
}

} // namespace courier
