//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _COURIER_OUTCOME_H_
#define _COURIER_OUTCOME_H_

#include <optional>
#include <utility>

namespace courier {

/**
 * The way a producer subscription terminated.
 */
enum class Termination { Value, Empty, Failure };

/**
 * An outcome holds the terminal result of a producer: exactly one of
 * a value, nothing at all, or an error. It differs from std::variant
 * in that it can hold the same type for both the value and the error
 * while retaining explicit knowledge of which one it holds.
 */
template <typename T, typename E>
class Outcome {
public:
    /**
     * Construct an outcome holding a value.
     *
     * @param value The value to hold.
     * @return An outcome holding the value.
     */
    static Outcome<T,E> value(const T& value);

    /**
     * Construct an outcome holding a value.
     *
     * @param value The value to hold.
     * @return An outcome holding the value.
     */
    static Outcome<T,E> value(T&& value);

    /**
     * Construct an outcome holding neither a value nor an error.
     *
     * @return An empty outcome.
     */
    static Outcome<T,E> empty();

    /**
     * Construct an outcome holding an error.
     *
     * @param error The error to hold.
     * @return An outcome holding the error.
     */
    static Outcome<T,E> error(const E& error);

    bool is_value() const;
    bool is_empty() const;
    bool is_error() const;

    /**
     * @return The kind of termination this outcome represents.
     */
    Termination termination() const;

    /**
     * Get the held value. Only valid when `is_value` is true.
     *
     * @return The held value.
     */
    const T& get_value() const;

    /**
     * Get the held error. Only valid when `is_error` is true.
     *
     * @return The held error.
     */
    const E& get_error() const;

    Outcome(const Outcome<T,E>&) = default;
    Outcome(Outcome<T,E>&&) = default;
    Outcome<T,E>& operator=(const Outcome<T,E>&) = default;
    Outcome<T,E>& operator=(Outcome<T,E>&&) = default;

private:
    Outcome() = default;
    std::optional<T> valueOpt;
    std::optional<E> errorOpt;
};

template <class T, class E>
Outcome<T,E> Outcome<T,E>::value(const T& value) {
    Outcome<T,E> outcome;
    outcome.valueOpt = value;
    return outcome;
}

template <class T, class E>
Outcome<T,E> Outcome<T,E>::value(T&& value) {
    Outcome<T,E> outcome;
    outcome.valueOpt = std::move(value);
    return outcome;
}

template <class T, class E>
Outcome<T,E> Outcome<T,E>::empty() {
    return Outcome<T,E>();
}

template <class T, class E>
Outcome<T,E> Outcome<T,E>::error(const E& error) {
    Outcome<T,E> outcome;
    outcome.errorOpt = error;
    return outcome;
}

template <class T, class E>
bool Outcome<T,E>::is_value() const {
    return valueOpt.has_value();
}

template <class T, class E>
bool Outcome<T,E>::is_empty() const {
    return !valueOpt.has_value() && !errorOpt.has_value();
}

template <class T, class E>
bool Outcome<T,E>::is_error() const {
    return errorOpt.has_value();
}

template <class T, class E>
Termination Outcome<T,E>::termination() const {
    if(valueOpt.has_value()) {
        return Termination::Value;
    } else if(errorOpt.has_value()) {
        return Termination::Failure;
    } else {
        return Termination::Empty;
    }
}

template <class T, class E>
const T& Outcome<T,E>::get_value() const {
    return *valueOpt;
}

template <class T, class E>
const E& Outcome<T,E>::get_error() const {
    return *errorOpt;
}

} // namespace courier

#endif
