//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_ERROR_H_
#define _COURIER_ERROR_H_

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "Errors.hpp"

namespace courier {

/**
 * Well known failure categories. Collaborators may use their own
 * category names in addition to these.
 */
namespace category {
constexpr const char* UPSTREAM = "upstream";
constexpr const char* VALIDATION = "validation";
constexpr const char* EMPTY_RESULT = "empty";
constexpr const char* TIMEOUT = "timeout";
constexpr const char* DEFECT = "defect";
}

/**
 * The failure value carried by producers. Every error belongs to a
 * category and optionally to a parent category - a validation failure
 * is an upstream failure which additionally carries field errors.
 *
 * Error derives from std::runtime_error so that functions passed to
 * producer operators may simply throw it to fail the producer.
 */
class Error : public std::runtime_error {
public:
    /**
     * A failure propagated from a data collaborator.
     *
     * @param message The description of the failure.
     * @param cause The exception which caused the failure, if any.
     */
    static Error upstream(const std::string& message, std::exception_ptr cause = nullptr);

    /**
     * A validation failure carrying structured field errors.
     */
    static Error validation(const Errors& errors, const std::string& message = "Validation failed");

    /**
     * Explicitly turn the absence of a result into a failure.
     */
    static Error emptyResult(const std::string& message = "No result produced");

    /**
     * The failure raised when a producer did not terminate in time.
     */
    static Error timeout(int64_t milliseconds);

    /**
     * An unexpected exception raised by a producer stage - a throwing
     * map function, or a producer subscribed a second time. Defects have
     * no parent category, so an `upstream` handler never receives them.
     *
     * @param message The description of the failure.
     * @param cause The exception which was raised.
     */
    static Error defect(const std::string& message, std::exception_ptr cause = nullptr);

    /**
     * Construct an error in an arbitrary category.
     *
     * @param name The category handlers are looked up by.
     * @param message The description of the failure.
     * @param parent The category this one specializes, empty for none.
     */
    Error(const std::string& name, const std::string& message, const std::string& parent = category::UPSTREAM);

    const std::string& category() const;
    const std::string& parentCategory() const;

    /**
     * Check if this error belongs to the given category either
     * directly or via its parent category.
     */
    bool isA(const std::string& category) const;

    /**
     * @return The field errors of a validation failure - empty otherwise.
     */
    const Errors& fieldErrors() const;

    /**
     * @return The exception which caused this failure, or nullptr.
     */
    std::exception_ptr cause() const;

private:
    std::string categoryName;
    std::string parentName;
    Errors errors;
    std::exception_ptr causePtr;
};

/**
 * Thrown when a dispatcher invariant is broken - for example a second
 * response being applied to an exchange which already has one.
 */
class ProtocolViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Thrown when a producer which cannot be restarted is subscribed to
 * a second time.
 */
class AlreadyConsumed : public std::logic_error {
public:
    AlreadyConsumed();
};

/**
 * Turns an exception which is not of the error type E into an E, so that
 * an operator can deliver it downstream instead of letting it escape onto
 * a scheduler thread. Error types constructible from a message are built
 * from `what()`. For any other error type `convert` returns nothing and
 * the exception keeps propagating.
 */
template <class E>
struct ErrorConversion {
    static std::optional<E> convert(const std::exception& failure) {
        if constexpr(std::is_constructible_v<E, std::string>) {
            return E(std::string(failure.what()));
        } else {
            return std::nullopt;
        }
    }
};

/**
 * An `Error` is passed through unchanged. Anything else becomes a
 * `defect` carrying the current exception as its cause, so this must be
 * called from within a catch block.
 */
template <>
struct ErrorConversion<Error> {
    static std::optional<Error> convert(const std::exception& failure);
};

} // namespace courier

#endif
