#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cf {

// A value that passed validation.
template <typename O>
struct Success {
    O value;
};

// A value that did not pass validation. `value` is the original input and
// `reason` a human-readable explanation.
template <typename I>
struct Failure {
    I value;
    std::string reason;
};

template <typename O>
bool operator==(const Success<O>& lhs, const Success<O>& rhs) {
    return lhs.value == rhs.value;
}

template <typename O>
bool operator!=(const Success<O>& lhs, const Success<O>& rhs) {
    return not(lhs == rhs);
}

template <typename I>
bool operator==(const Failure<I>& lhs, const Failure<I>& rhs) {
    return lhs.reason == rhs.reason && lhs.value == rhs.value;
}

template <typename I>
bool operator!=(const Failure<I>& lhs, const Failure<I>& rhs) {
    return not(lhs == rhs);
}

// Outcome of validating an I into an O: always exactly one of Success<O> or
// Failure<I>.
template <typename I, typename O>
class Result {
  public:
    using input_type = I;
    using output_type = O;

  private:
    std::variant<Success<O>, Failure<I> > m_state;

  public:
    template <typename U, typename = std::enable_if_t<std::is_constructible<O, U&&>::value> >
    Result(Success<U> s) : m_state(std::in_place_index<0>, Success<O>{O(std::move(s.value))}) {}

    template <typename J, typename = std::enable_if_t<std::is_constructible<I, J&&>::value> >
    Result(Failure<J> f)
        : m_state(std::in_place_index<1>, Failure<I>{I(std::move(f.value)), std::move(f.reason)}) {}

    bool isSuccess() const noexcept { return m_state.index() == 0; }
    bool isFailure() const noexcept { return m_state.index() == 1; }

    const Success<O>& asSuccess() const {
        if (isFailure())
            throw std::logic_error("result is a failure: " + std::get<1>(m_state).reason);
        return std::get<0>(m_state);
    }

    const Failure<I>& failure() const {
        if (isSuccess()) throw std::logic_error("result is a success, not a failure");
        return std::get<1>(m_state);
    }

    const O& value() const& { return asSuccess().value; }

    O value() && {
        asSuccess();
        return std::move(std::get<0>(m_state).value);
    }

    const std::string& reason() const { return failure().reason; }
    const I& failedValue() const { return failure().value; }

    bool operator==(const Result& rhs) const { return m_state == rhs.m_state; }
    bool operator!=(const Result& rhs) const { return not(*this == rhs); }
};

// A validator: a pure function from an I to a Result<I,O>.
template <typename I, typename O>
using Validator = std::function<Result<I, O>(const I&)>;

// Result type returned by callable F when invoked with an I.
template <typename F, typename I>
using invoke_result_of_t = std::decay_t<std::invoke_result_t<const F&, const I&> >;

// Builds a Success<T> result with the value.
template <typename T>
Success<std::decay_t<T> > success(T&& value) {
    return Success<std::decay_t<T> >{std::forward<T>(value)};
}

// Builds a failure result.
template <typename T>
Failure<std::decay_t<T> > failure(T&& value, std::string reason) {
    return Failure<std::decay_t<T> >{std::forward<T>(value), std::move(reason)};
}

// Unwraps the value of Success<T> to T
template <typename T>
const T& value(const Success<T>& s) {
    return s.value;
}

template <typename I, typename O>
bool is_success(const Result<I, O>& result) noexcept {
    return result.isSuccess();
}

template <typename I, typename O>
bool is_failure(const Result<I, O>& result) noexcept {
    return result.isFailure();
}

// When `result` is a success returns `next(value)`, otherwise the failure.
// `next` must return a Result<I, B>.
template <typename I, typename A, typename F>
auto map_success(const Result<I, A>& result, F&& next) -> std::decay_t<std::invoke_result_t<F, const A&> > {
    using R = std::decay_t<std::invoke_result_t<F, const A&> >;
    if (result.isSuccess()) return next(result.value());
    return R(result.failure());
}

// When `result` is a failure returns `next(failure)`, otherwise the success.
template <typename I, typename A, typename F>
auto map_failure(const Result<I, A>& result, F&& next)
            -> std::decay_t<std::invoke_result_t<F, const Failure<I>&> > {
    using R = std::decay_t<std::invoke_result_t<F, const Failure<I>&> >;
    if (result.isFailure()) return next(result.failure());
    return R(result.asSuccess());
}

// Folds both variants of `result` into a common type.
template <typename I, typename A, typename S, typename F>
auto map_result(const Result<I, A>& result, S&& on_success, F&& on_failure)
            -> std::common_type_t<std::invoke_result_t<S, const A&>, std::invoke_result_t<F, const Failure<I>&> > {
    if (result.isSuccess()) return on_success(result.value());
    return on_failure(result.failure());
}

}  // namespace cf
