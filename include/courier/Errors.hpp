//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_ERRORS_H_
#define _COURIER_ERRORS_H_

#include <string>
#include <vector>

namespace courier {

/**
 * A single rejected field of a bound or validated object.
 */
struct FieldError {
    std::string field;
    std::string code;
    std::string message;
};

bool operator==(const FieldError& left, const FieldError& right);

/**
 * An ordered set of field errors produced by a validation step.
 * Insertion order is kept so rendered error lists are stable.
 */
class Errors {
public:
    Errors() = default;
    Errors(std::initializer_list<FieldError> errors);

    /**
     * Record a rejected field.
     *
     * @return This error set for chaining.
     */
    Errors& reject(const std::string& field, const std::string& code, const std::string& message);

    bool hasErrors() const;
    bool hasFieldErrors(const std::string& field) const;
    std::size_t size() const;

    /**
     * @return The errors recorded for the given field, in insertion order.
     */
    std::vector<FieldError> fieldErrors(const std::string& field) const;

    const std::vector<FieldError>& all() const;

private:
    std::vector<FieldError> errors;
};

bool operator==(const Errors& left, const Errors& right);

} // namespace courier

#endif
