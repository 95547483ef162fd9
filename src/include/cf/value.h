#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cf {

// The absence sentinel: a member that was never set. Distinct from null.
struct undefined_t {
    bool operator==(const undefined_t&) const noexcept { return true; }
    bool operator!=(const undefined_t&) const noexcept { return false; }
};

inline constexpr undefined_t undefined{};

// A decoded, dynamically-typed value handed to the validators. The set of
// categories is closed: undefined, null, boolean, number, string, array and
// object. Numbers are always stored as double.
class Value {
  public:
    enum TYPE { Undefined, Null, Boolean, Number, String, Array, Object };

    using array_t = std::vector<Value>;
    using object_t = std::map<std::string, Value>;

  private:
    std::variant<undefined_t, std::nullptr_t, bool, double, std::string, array_t, object_t> v;

  public:
    Value() = default;
    Value(undefined_t) {}
    Value(std::nullptr_t) : v(nullptr) {}
    Value(bool b) : v(b) {}
    Value(int n) : v(static_cast<double>(n)) {}
    Value(int64_t n) : v(static_cast<double>(n)) {}
    Value(double x) : v(x) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const array_t& a) : v(a) {}
    Value(array_t&& a) : v(std::move(a)) {}
    Value(const object_t& o) : v(o) {}
    Value(object_t&& o) : v(std::move(o)) {}

    // Construct an object from an initializer list of (key, value) pairs
    Value(std::initializer_list<std::pair<const std::string, Value> > members)
        : v(object_t(members)) {}

    static Value null() { return Value(nullptr); }

    static Value array(std::initializer_list<Value> items) { return Value(array_t(items)); }

    TYPE type() const noexcept { return static_cast<TYPE>(v.index()); }

    // Name of the runtime category, as reported in failure reasons.
    std::string type_name() const;

    bool isUndefined() const noexcept { return type() == Undefined; }
    bool isNull() const noexcept { return type() == Null; }
    bool isBool() const noexcept { return type() == Boolean; }
    bool isNumber() const noexcept { return type() == Number; }
    bool isString() const noexcept { return type() == String; }
    bool isArray() const noexcept { return type() == Array; }
    bool isObject() const noexcept { return type() == Object; }

    bool asBool() const {
        if (isBool()) return std::get<bool>(v);
        throw std::runtime_error("not a bool");
    }

    double asNumber() const {
        if (isNumber()) return std::get<double>(v);
        throw std::runtime_error("not a number");
    }

    const std::string& asString() const {
        if (isString()) return std::get<std::string>(v);
        throw std::runtime_error("not a string");
    }

    const array_t& asArray() const {
        if (isArray()) return std::get<array_t>(v);
        throw std::runtime_error("not an array");
    }

    const object_t& asObject() const {
        if (isObject()) return std::get<object_t>(v);
        throw std::runtime_error("not an object");
    }

    size_t size() const noexcept {
        switch (type()) {
            case Array:
                return std::get<array_t>(v).size();
            case Object:
                return std::get<object_t>(v).size();
            default:
                return 0;
        }
    }

    bool has(const std::string& key) const noexcept { return find(key) != nullptr; }

    // Member lookup that never throws: null when this is not an object or the
    // key is missing.
    const Value* find(const std::string& key) const noexcept {
        if (!isObject()) return nullptr;
        const auto& members = std::get<object_t>(v);
        auto it = members.find(key);
        if (it == members.end()) return nullptr;
        return &it->second;
    }

    // The member at `key`, or undefined when there is none.
    const Value& member(const std::string& key) const noexcept;

    const Value& at(const std::string& key) const {
        if (const Value* member = find(key)) return *member;

        // didn't find it, throw a decent error message
        std::ostringstream ss;
        ss << "Could not find key <" << key << "> available options are: ";
        bool first = true;
        for (auto const& k : keys()) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << k << '"';
        }
        throw std::out_of_range(ss.str());
    }

    const Value& at(int index) const {
        const auto& items = asArray();
        if (index < 0 || static_cast<size_t>(index) >= items.size())
            throw std::out_of_range("Index " + std::to_string(index) + " out of range for array of size " +
                                    std::to_string(items.size()));
        return items[static_cast<size_t>(index)];
    }

    std::vector<std::string> keys() const {
        if (!isObject()) return {};
        std::vector<std::string> out;
        out.reserve(std::get<object_t>(v).size());
        for (auto const& p : std::get<object_t>(v)) out.push_back(p.first);
        return out;
    }

    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    // Compact JSON. Undefined renders as `undefined`.
    std::string dump() const;

    // Display form used inside failure reasons: strings are written raw,
    // scalars in their natural form, containers as compact JSON.
    std::string to_string() const;
};

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    os << value.dump();
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const undefined_t&) {
    os << "undefined";
    return os;
}

}  // namespace cf
