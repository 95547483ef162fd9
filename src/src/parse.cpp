#include <cf/parse.h>

namespace cf {

Failure<Value> fail_type_of(const Value& value) { return failure(value, "typeof value is " + value.type_name()); }

Result<Value, std::string> parse_string(const Value& value) {
    if (value.isString()) return success(value.asString());
    return fail_type_of(value);
}

Result<Value, double> parse_number(const Value& value) {
    if (value.isNumber()) return success(value.asNumber());
    return fail_type_of(value);
}

Result<Value, bool> parse_boolean(const Value& value) {
    if (value.isBool()) return success(value.asBool());
    return fail_type_of(value);
}

Result<Value, undefined_t> parse_undefined(const Value& value) {
    if (value.isUndefined()) return success(undefined);
    return fail_type_of(value);
}

Result<Value, Value::object_t> parse_object(const Value& value) {
    if (value.isObject()) return success(value.asObject());
    return fail_type_of(value);
}

Result<Value, Value::array_t> parse_array(const Value& value) {
    if (value.isArray()) return success(value.asArray());
    return fail_type_of(value);
}

Result<Value, Value> parse_any_value(const Value& value) { return success(value); }

}  // namespace cf
