#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace trialflow::core {

class Value;

/// @brief Ordered list of values (JSON array).
/// @ingroup core_types
using Array = std::vector<Value>;

/// @brief String-keyed mapping of values (JSON object), sorted by key.
/// @ingroup core_types
using Object = std::map<std::string, Value>;

/// @brief Dynamically typed value used by settings, results and participant details.
///
/// A Value holds exactly one of: nothing (null), a boolean, a signed
/// integer, a floating-point number, a string, an Array or an Object.
/// Integers and floating-point numbers are kept distinct so that a
/// trial number round-trips as `3` rather than `3.0`.
///
/// Typed accessors throw ValueTypeError when the held kind does not
/// match; `as_double()` additionally accepts integers.
///
/// @code
/// Value v = 42;
/// v.as_int();       // 42
/// v.as_double();    // 42.0
/// v.to_string();    // "42"
/// @endcode
///
/// @see Settings, ResultRow
/// @ingroup core_types
class Value {
public:
    /// @brief Underlying storage, in declaration order of the kinds.
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Array, Object>;

    /// @brief Construct a null value.
    Value() = default;

    Value(bool value) : storage_(value) {}                                       // NOLINT(google-explicit-constructor)
    Value(int value) : storage_(static_cast<int64_t>(value)) {}                  // NOLINT(google-explicit-constructor)
    Value(long value) : storage_(static_cast<int64_t>(value)) {}                 // NOLINT(google-explicit-constructor)
    Value(long long value) : storage_(static_cast<int64_t>(value)) {}            // NOLINT(google-explicit-constructor)
    Value(unsigned value) : storage_(static_cast<int64_t>(value)) {}             // NOLINT(google-explicit-constructor)
    /// Unsigned values above INT64_MAX are stored as double.
    Value(unsigned long value) : storage_(from_unsigned(value)) {}               // NOLINT(google-explicit-constructor)
    Value(unsigned long long value) : storage_(from_unsigned(value)) {}          // NOLINT(google-explicit-constructor)
    Value(double value) : storage_(value) {}                                     // NOLINT(google-explicit-constructor)
    Value(const char* value) : storage_(std::string(value)) {}                   // NOLINT(google-explicit-constructor)
    Value(std::string value) : storage_(std::move(value)) {}                     // NOLINT(google-explicit-constructor)
    Value(Array value) : storage_(std::move(value)) {}                           // NOLINT(google-explicit-constructor)
    Value(Object value) : storage_(std::move(value)) {}                          // NOLINT(google-explicit-constructor)

    /// @name Kind queries
    /// @{
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(storage_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(storage_); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<int64_t>(storage_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(storage_); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(storage_); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(storage_); }
    /// @}

    /// @name Typed access
    /// @brief Each accessor throws ValueTypeError on a kind mismatch.
    /// @{
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int64_t as_int() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] const Object& as_object() const;
    /// @}

    /// @brief Render the value as a single text cell.
    ///
    /// Null renders as the empty string, booleans as `true`/`false`,
    /// numbers in their shortest round-trip form, strings verbatim.
    /// Arrays render as `[a;b]` and objects as `{k:v;k:v}` so that the
    /// result never contains a comma of its own.
    ///
    /// @return Text form of the value.
    [[nodiscard]] std::string to_string() const;

    /// @brief Name of the held kind ("null", "bool", "int", ...), for messages.
    [[nodiscard]] const char* kind_name() const noexcept;

    /// @brief Access the underlying variant.
    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    bool operator==(const Value& other) const;

private:
    static Storage from_unsigned(unsigned long long value) noexcept {
        if (value > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
            return Storage(std::in_place_type<double>, static_cast<double>(value));
        }
        return Storage(std::in_place_type<int64_t>, static_cast<int64_t>(value));
    }

    Storage storage_;
};

} // namespace trialflow::core
