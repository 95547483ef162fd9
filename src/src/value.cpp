#include <cf/value.h>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <sstream>
#include <system_error>

namespace cf {

namespace {
    // Helper function to escape JSON strings
    std::string escape_json_string(const std::string& s) {
        std::string result;
        result.reserve(s.size() + 2);
        result.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        result += buf;
                    } else {
                        result.push_back(c);
                    }
                    break;
            }
        }
        result.push_back('"');
        return result;
    }

    // Shortest text that reads back as the same double, laid out the way
    // JavaScript prints numbers: plain digits for 1e-7 < |x| < 1e21, otherwise
    // exponent form such as 1e+21 or 1.5e-7.
    std::string format_number(double x) {
        if (std::isnan(x)) return "NaN";
        if (std::isinf(x)) return x < 0 ? "-Infinity" : "Infinity";
        if (x == 0) return "0";

        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), std::fabs(x), std::chars_format::scientific);
        if (res.ec != std::errc()) throw std::logic_error("could not format number");
        std::string sci(buf, res.ptr);

        auto e = sci.find('e');
        std::string digits;
        for (size_t i = 0; i < e; ++i) {
            if (sci[i] != '.') digits.push_back(sci[i]);
        }
        int k = static_cast<int>(digits.size());
        int n = std::stoi(sci.substr(e + 1)) + 1;

        std::string out = x < 0 ? "-" : "";
        if (k <= n && n <= 21) {
            out += digits + std::string(static_cast<size_t>(n - k), '0');
        } else if (0 < n && n <= 21) {
            out += digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
        } else if (-6 < n && n <= 0) {
            out += "0." + std::string(static_cast<size_t>(-n), '0') + digits;
        } else {
            out += digits.substr(0, 1);
            if (k > 1) out += "." + digits.substr(1);
            out += n - 1 < 0 ? "e-" : "e+";
            out += std::to_string(std::abs(n - 1));
        }
        return out;
    }
}

std::string Value::type_name() const {
    switch (type()) {
        case Undefined:
            return "undefined";
        case Null:
            return "null";
        case Boolean:
            return "boolean";
        case Number:
            return "number";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
    }
    throw std::logic_error("Not a valid type");
}

const Value& Value::member(const std::string& key) const noexcept {
    static const Value absent;
    if (const Value* found = find(key)) return *found;
    return absent;
}

bool Value::operator==(const Value& rhs) const { return v == rhs.v; }

std::string Value::dump() const {
    std::function<void(const Value&, std::ostringstream&)> write;
    write = [&](const Value& d, std::ostringstream& ss) {
        switch (d.type()) {
            case Undefined:
                ss << "undefined";
                return;
            case Null:
                ss << "null";
                return;
            case Boolean:
                ss << (std::get<bool>(d.v) ? "true" : "false");
                return;
            case Number:
                ss << format_number(std::get<double>(d.v));
                return;
            case String:
                ss << escape_json_string(std::get<std::string>(d.v));
                return;
            case Array: {
                ss << '[';
                bool first = true;
                for (auto const& el : std::get<array_t>(d.v)) {
                    if (!first) ss << ",";
                    first = false;
                    write(el, ss);
                }
                ss << ']';
                return;
            }
            case Object: {
                ss << '{';
                bool first = true;
                for (auto const& p : std::get<object_t>(d.v)) {
                    if (!first) ss << ",";
                    first = false;
                    ss << escape_json_string(p.first) << ':';
                    write(p.second, ss);
                }
                ss << '}';
                return;
            }
        }
    };

    std::ostringstream out;
    write(*this, out);
    return out.str();
}

std::string Value::to_string() const {
    switch (type()) {
        case Undefined:
            return "undefined";
        case Null:
            return "null";
        case Boolean:
            return std::get<bool>(v) ? "true" : "false";
        case Number:
            return format_number(std::get<double>(v));
        case String:
            return std::get<std::string>(v);
        default:
            break;
    }
    return dump();
}

}  // namespace cf
