#include <catch2/catch_test_macros.hpp>
#include <cf/conform.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace cf;

namespace {
struct Child {
    double id = 0;
};

struct Parent {
    std::string name;
    Child child;
};

struct Named {
    std::string name;
};

bool operator==(const Named& a, const Named& b) { return a.name == b.name; }
}  // namespace

TEST_CASE("Arrays of optional numbers", "[examples]") {
    auto parse = parse_array_of(optional(parse_number));

    auto result = parse(Value::array({1, nullptr, 3}));
    REQUIRE(result.value() == std::vector<std::optional<double> >{1.0, std::nullopt, 3.0});

    Value bad = Value::array({1, false, 3});
    auto failed = parse(bad);
    REQUIRE(failed.reason() == "Failed at '1': typeof value is boolean");
    REQUIRE(failed.failedValue() == bad);
}

TEST_CASE("Records allow undefined members through parse_undefined", "[examples]") {
    struct Person {
        std::string name;
        std::variant<undefined_t, std::string> age;
    };
    auto parse = parse_object_of(field("name", &Person::name, parse_string),
                                 field("age", &Person::age, parse_one_of(parse_undefined, parse_string)));

    Value empty = Value::object_t{};
    REQUIRE(parse(empty).reason() == "Failed at 'name': typeof value is undefined");
    REQUIRE(parse(empty).failedValue() == empty);

    Value numeric_age{{"name", "Hello"}, {"age", 10}};
    REQUIRE(parse(numeric_age).reason() == "Failed at 'age': '10' did not match any of 2 validators");
    REQUIRE(parse(numeric_age).failedValue() == numeric_age);

    auto ok = parse(Value{{"name", "Hello"}});
    REQUIRE(ok.value().name == "Hello");
    REQUIRE(std::holds_alternative<undefined_t>(ok.value().age));
}

TEST_CASE("Nested records", "[examples]") {
    auto parse = parse_object_of(field("name", &Parent::name, parse_string),
                                 field("child", &Parent::child, parse_object_of(field("id", &Child::id, parse_number))));

    Value valid{{"name", "Valid"}, {"child", Value{{"id", 1}}}};
    auto ok = parse(valid);
    REQUIRE(ok.value().name == "Valid");
    REQUIRE(ok.value().child.id == 1.0);

    Value invalid{{"name", "Invalid"}, {"child", Value{{"id", "not-number"}}}};
    auto failed = parse(invalid);
    REQUIRE(failed.reason() == "Failed at 'child': Failed at 'id': typeof value is string");
    REQUIRE(failed.failedValue() == invalid);
}

TEST_CASE("Indexed objects of exact values", "[examples]") {
    auto parse = parse_indexed_object_of(parse_one_of(parse_exactly("one"), parse_exactly(1)));

    auto result = parse(Value{{"a", "one"}, {"b", 1}});
    REQUIRE(std::get<std::string>(result.value().at("a")) == "one");
    REQUIRE(std::get<double>(result.value().at("b")) == 1.0);

    REQUIRE(parse(Value{{"a", "two"}}).reason() == "Failed at 'a': 'two' did not match any of 2 validators");
}

TEST_CASE("Arrays of alternatives", "[examples]") {
    auto parse = parse_array_of(parse_one_of(parse_number, parse_boolean));

    REQUIRE(parse(Value::array({})).value().empty());
    REQUIRE(parse(Value::array({1, 2, true, false})).value().size() == 4);

    Value bad = Value::array({nullptr, true});
    auto failed = parse(bad);
    REQUIRE(failed.reason() == "Failed at '0': 'null' did not match any of 2 validators");
    REQUIRE(failed.failedValue() == bad);
}

TEST_CASE("Alternatives may include records", "[examples]") {
    auto parse = parse_one_of(parse_number, parse_boolean, parse_string,
                              parse_object_of(field("name", &Named::name, parse_string)));

    REQUIRE(std::get<double>(parse(1).value()) == 1.0);
    REQUIRE(std::get<std::string>(parse("a").value()) == "a");
    REQUIRE(std::get<Named>(parse(Value{{"name", "Ellen Ripley"}}).value()) == Named{"Ellen Ripley"});
    REQUIRE(parse(Value{{"name", 5}}).reason() == "'{\"name\":5}' did not match any of 4 validators");
}

TEST_CASE("Records keep only the declared subset of their input", "[examples]") {
    auto parse = parse_object_of(field("name", &Named::name, parse_string));

    for (auto const& input : {Value{{"name", "a"}}, Value{{"name", "b"}, {"extra", 1}},
                              Value{{"name", "c"}, {"nested", Value{{"deep", true}}}}}) {
        auto result = parse(input);
        REQUIRE(result.isSuccess());
        REQUIRE(result.value() == Named{input.at("name").asString()});
    }
}
