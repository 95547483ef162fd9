#pragma once

#include <cf/debug.h>
#include <cf/failure_path.h>
#include <cf/result.h>
#include <cf/value.h>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cf {

// Result type of a parser F over a Value, and the type it parses into:
//
//     auto parse_person = parse_object_of(field("name", &Person::name, parse_string));
//     using P = parser_type_t<decltype(parse_person)>;  // Person
template <typename F>
using result_type_t = invoke_result_of_t<F, Value>;

template <typename F>
using parser_type_t = typename result_type_t<F>::output_type;

// Scalar parsers. Each checks the runtime category only and never coerces; on
// failure the reason is "typeof value is <type>".
Result<Value, std::string> parse_string(const Value& value);
Result<Value, double> parse_number(const Value& value);
Result<Value, bool> parse_boolean(const Value& value);
Result<Value, undefined_t> parse_undefined(const Value& value);
Result<Value, Value::object_t> parse_object(const Value& value);
Result<Value, Value::array_t> parse_array(const Value& value);

// Accepts anything. For members that are not clearly documented.
Result<Value, Value> parse_any_value(const Value& value);

Failure<Value> fail_type_of(const Value& value);

// Given any parser, allows `null` as a successful (empty) result:
//
//     auto parse = optional(parse_number);
//     parse(Value::null());  // Success, std::nullopt
//     parse(5);              // Success, 5.0
//     parse("5");            // Failure
template <typename F>
Validator<Value, std::optional<parser_type_t<F> > > optional(F parser) {
    using O = parser_type_t<F>;
    return [parser](const Value& value) -> Result<Value, std::optional<O> > {
        if (value.isNull()) return success(std::optional<O>());
        auto parsed = parser(value);
        if (parsed.isFailure()) return parsed.failure();
        return success(std::optional<O>(std::move(parsed).value()));
    };
}

// Like optional() but for the absence sentinel instead of null.
template <typename F>
Validator<Value, std::optional<parser_type_t<F> > > voidable(F parser) {
    using O = parser_type_t<F>;
    return [parser](const Value& value) -> Result<Value, std::optional<O> > {
        if (value.isUndefined()) return success(std::optional<O>());
        auto parsed = parser(value);
        if (parsed.isFailure()) return parsed.failure();
        return success(std::optional<O>(std::move(parsed).value()));
    };
}

// Maps a parser of A into a parser of B with a function A -> Result<I, B>.
// Any failure, from the parser or from `next`, reports the input given to the
// returned parser. For example, a parser that requires a positive number:
//
//     auto parse = map_parser(parse_number, [](double n) -> Result<Value, double> {
//         if (n > 0) return success(n);
//         return failure(n, "is not positive");
//     });
template <typename I = Value, typename F, typename Next>
Validator<I, typename invoke_result_of_t<Next, typename invoke_result_of_t<F, I>::output_type>::output_type>
map_parser(F parser, Next next) {
    using A = typename invoke_result_of_t<F, I>::output_type;
    using R = invoke_result_of_t<Next, A>;
    return [parser, next](const I& value) -> R {
        return map_failure(map_success(parser(value), next),
                           [&value](const Failure<I>& failed) -> R { return Failure<I>{value, failed.reason}; });
    };
}

// Parses an array whose members all pass `parser`:
//
//     auto parse = parse_array_of(parse_number);
//     parse(Value::array({1, "2", 3}));  // Failure "Failed at '1': typeof value is string"
template <typename F>
Validator<Value, std::vector<parser_type_t<F> > > parse_array_of(F parser) {
    using O = parser_type_t<F>;
    return [parser](const Value& value) -> Result<Value, std::vector<O> > {
        if (!value.isArray()) return parse_array(value).failure();
        const auto& items = value.asArray();
        std::vector<O> out;
        out.reserve(items.size());
        for (std::size_t index = 0; index < items.size(); ++index) {
            auto parsed = parser(items[index]);
            if (parsed.isFailure()) return keyed_failure(value, index, parsed.failure());
            out.push_back(std::move(parsed).value());
        }
        return success(std::move(out));
    };
}

// Parses an object whose every member passes `parser`, keeping all keys.
template <typename F>
Validator<Value, std::map<std::string, parser_type_t<F> > > parse_indexed_object_of(F parser) {
    using O = parser_type_t<F>;
    return [parser](const Value& value) -> Result<Value, std::map<std::string, O> > {
        if (value.isNull() || value.isUndefined()) return failure(value, "value is null or undefined");
        if (!value.isObject()) return fail_type_of(value);
        std::map<std::string, O> out;
        for (auto const& p : value.asObject()) {
            auto parsed = parser(p.second);
            if (parsed.isFailure()) return keyed_failure(value, p.first, parsed.failure());
            out.emplace(p.first, std::move(parsed).value());
        }
        return success(std::move(out));
    };
}

// One declared member of a record T: the key to read and how to store its
// parsed value. Returns the member's failure, if any.
template <typename T>
struct Field {
    std::string name;
    std::function<std::optional<Failure<Value> >(const Value&, T&)> assign;
};

template <typename T, typename M, typename F>
Field<T> field(std::string name, M T::*member, F parser) {
    return Field<T>{std::move(name), [member, parser](const Value& value, T& record) -> std::optional<Failure<Value> > {
                        auto parsed = parser(value);
                        if (parsed.isFailure()) return parsed.failure();
                        record.*member = std::move(parsed).value();
                        return std::nullopt;
                    }};
}

// Parses an object into a record T, one declared field at a time and in
// declaration order. A missing member is handed to the field's parser as
// undefined. Undeclared members are ignored. T must be default-constructible.
//
//     struct Person { std::string name; double age = 0; };
//     auto parse = parse_object_of(field("name", &Person::name, parse_string),
//                                  field("age", &Person::age, parse_number));
template <typename T>
Validator<Value, T> parse_object_of(std::vector<Field<T> > fields) {
    return [fields = std::move(fields)](const Value& value) -> Result<Value, T> {
        T record{};
        for (auto const& f : fields) {
            if (auto failed = f.assign(value.member(f.name), record)) return keyed_failure(value, f.name, *failed);
        }
        return success(std::move(record));
    };
}

template <typename T, typename... Fields>
Validator<Value, T> parse_object_of(Field<T> first, Fields... rest) {
    return parse_object_of(std::vector<Field<T> >{std::move(first), std::move(rest)...});
}

namespace detail {

template <typename... Ts>
struct type_list {};

template <typename T, typename... Ts>
struct contains : std::disjunction<std::is_same<T, Ts>...> {};

// Drops repeated types, keeping first occurrences in order.
template <typename Seen, typename... Ts>
struct unique;

template <typename... Seen>
struct unique<type_list<Seen...> > {
    using type = type_list<Seen...>;
};

template <typename... Seen, typename T, typename... Ts>
struct unique<type_list<Seen...>, T, Ts...>
    : std::conditional_t<contains<T, Seen...>::value, unique<type_list<Seen...>, Ts...>,
                         unique<type_list<Seen..., T>, Ts...> > {};

template <typename List>
struct as_one_of;

template <typename T>
struct as_one_of<type_list<T> > {
    using type = T;
};

template <typename T, typename U, typename... Ts>
struct as_one_of<type_list<T, U, Ts...> > {
    using type = std::variant<T, U, Ts...>;
};

template <typename Out, typename O>
Out widen(O&& parsed) {
    if constexpr (std::is_same<Out, std::decay_t<O> >::value)
        return std::forward<O>(parsed);
    else
        return Out(std::in_place_type<std::decay_t<O> >, std::forward<O>(parsed));
}

template <typename Out>
std::optional<Out> first_success(const Value&) {
    return std::nullopt;
}

template <typename Out, typename P, typename... Ps>
std::optional<Out> first_success(const Value& value, const P& parser, const Ps&... parsers) {
    auto parsed = parser(value);
    if (parsed.isSuccess()) return std::optional<Out>(widen<Out>(std::move(parsed).value()));
    return first_success<Out>(value, parsers...);
}

}  // namespace detail

// The type parse_one_of() produces: the shared output type when every parser
// has the same one, otherwise a std::variant of the distinct output types.
template <typename... Os>
using one_of_t = typename detail::as_one_of<typename detail::unique<detail::type_list<>, Os...>::type>::type;

// Given a list of parsers, returns a parser that succeeds with the first one
// that succeeds, trying them in order:
//
//     auto parse = parse_one_of(parse_number, parse_exactly("Infinity"));
//     parse(1);           // Success, variant holding 1.0
//     parse("Infinity");  // Success, variant holding "Infinity"
template <typename F>
Validator<Value, parser_type_t<F> > parse_one_of(F parser) {
    return parser;
}

template <typename F, typename G, typename... Rest>
Validator<Value, one_of_t<parser_type_t<F>, parser_type_t<G>, parser_type_t<Rest>...> > parse_one_of(F first,
                                                                                                       G second,
                                                                                                       Rest... rest) {
    using Out = one_of_t<parser_type_t<F>, parser_type_t<G>, parser_type_t<Rest>...>;
    constexpr std::size_t count = 2 + sizeof...(Rest);
    return [first, second, rest...](const Value& value) -> Result<Value, Out> {
        if (auto matched = detail::first_success<Out>(value, first, second, rest...))
            return success(std::move(*matched));
        std::string reason =
                    "'" + value.to_string() + "' did not match any of " + std::to_string(count) + " validators";
        debug::log(reason);
        return failure(value, reason);
    };
}

namespace detail {

template <typename S, typename = void>
struct literal {};

template <typename S>
struct literal<S, std::enable_if_t<std::is_arithmetic<S>::value && !std::is_same<S, bool>::value> > {
    using type = double;
};

template <>
struct literal<bool> {
    using type = bool;
};

template <>
struct literal<const char*> {
    using type = std::string;
};

template <>
struct literal<char*> {
    using type = std::string;
};

template <>
struct literal<std::string> {
    using type = std::string;
};

}  // namespace detail

// The C++ type parse_exactly() yields for a literal of type S.
template <typename S>
using literal_t = typename detail::literal<S>::type;

// Returns a parser that succeeds when the value is exactly equal to `option`
// (a string, number or boolean). Useful for enumerations:
//
//     auto parse = parse_one_of(parse_exactly("admin"), parse_exactly("user"));
template <typename S>
Validator<Value, literal_t<S> > parse_exactly(S option) {
    using L = literal_t<S>;
    L literal(option);
    Value expected(literal);
    return [literal, expected](const Value& value) -> Result<Value, L> {
        if (value == expected) return success(literal);
        return failure(value, "is not " + expected.to_string());
    };
}

}  // namespace cf
