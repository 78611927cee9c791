#include <trialflow/core/value.hpp>
#include <trialflow/core/error.hpp>

#include <iomanip>
#include <sstream>

namespace trialflow::core {

namespace {

[[noreturn]] void throw_kind_mismatch(const char* wanted, const Value& value) {
    throw ValueTypeError(std::string("expected ") + wanted + " value, got " + value.kind_name());
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

} // anonymous namespace

bool Value::as_bool() const {
    if (const auto* b = std::get_if<bool>(&storage_)) {
        return *b;
    }
    throw_kind_mismatch("bool", *this);
}

int64_t Value::as_int() const {
    if (const auto* i = std::get_if<int64_t>(&storage_)) {
        return *i;
    }
    throw_kind_mismatch("int", *this);
}

double Value::as_double() const {
    if (const auto* d = std::get_if<double>(&storage_)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&storage_)) {
        return static_cast<double>(*i);
    }
    throw_kind_mismatch("number", *this);
}

const std::string& Value::as_string() const {
    if (const auto* s = std::get_if<std::string>(&storage_)) {
        return *s;
    }
    throw_kind_mismatch("string", *this);
}

const Array& Value::as_array() const {
    if (const auto* a = std::get_if<Array>(&storage_)) {
        return *a;
    }
    throw_kind_mismatch("array", *this);
}

const Object& Value::as_object() const {
    if (const auto* o = std::get_if<Object>(&storage_)) {
        return *o;
    }
    throw_kind_mismatch("object", *this);
}

std::string Value::to_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, Array>) {
            std::string out = "[";
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) {
                    out += ';';
                }
                out += v[i].to_string();
            }
            out += ']';
            return out;
        } else {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, item] : v) {
                if (!first) {
                    out += ';';
                }
                first = false;
                out += key;
                out += ':';
                out += item.to_string();
            }
            out += '}';
            return out;
        }
    }, storage_);
}

const char* Value::kind_name() const noexcept {
    switch (storage_.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "unknown";
    }
}

bool Value::operator==(const Value& other) const {
    return storage_ == other.storage_;
}

} // namespace trialflow::core
