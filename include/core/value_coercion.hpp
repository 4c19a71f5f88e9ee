#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tpccgw {

// ============================================================================
// Backend Parameter Types
// ============================================================================

/**
 * @brief Backend-native parameter type tags
 *
 * The small fixed set every supported backend can bind. NUMERIC values are
 * bound as FLOAT64 and cast by the backend on assignment.
 */
enum class ParamType : uint8_t {
    STRING,
    BOOL,
    INT64,
    FLOAT64,
    TIMESTAMP
};

[[nodiscard]] inline const char* param_type_to_string(ParamType type) {
    switch (type) {
        case ParamType::STRING: return "STRING";
        case ParamType::BOOL: return "BOOL";
        case ParamType::INT64: return "INT64";
        case ParamType::FLOAT64: return "FLOAT64";
        case ParamType::TIMESTAMP: return "TIMESTAMP";
        default: return "STRING";
    }
}

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A value paired with its backend type tag
 *
 * Timestamps are stored as ISO-8601 UTC text with type TIMESTAMP.
 * A null value always carries type STRING (untyped null).
 */
struct TypedParam {
    ParamType type = ParamType::STRING;
    Value value;
    std::string coercion_error;     // non-empty: value has no faithful backend form

    [[nodiscard]] bool is_null() const { return tpccgw::is_null(value); }

    /// Text form sent on the wire, nullopt for SQL NULL
    [[nodiscard]] std::optional<std::string> wire_text() const {
        if (is_null()) return std::nullopt;
        return value_to_string(value);
    }

    static TypedParam null() { return TypedParam{}; }

    static TypedParam invalid(std::string reason) {
        TypedParam p;
        p.coercion_error = std::move(reason);
        return p;
    }

    [[nodiscard]] bool valid() const { return coercion_error.empty(); }

    bool operator==(const TypedParam&) const = default;
};

// ============================================================================
// Coercion
// ============================================================================

namespace detail {

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

template<typename T> struct is_variant : std::false_type {};
template<typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template<typename T>
concept Streamable = requires(std::ostream& os, const T& v) { os << v; };

} // namespace detail

/**
 * @brief Map an application scalar to its backend-native typed parameter
 *
 * Classification order matters:
 *  1. null (std::nullopt, std::monostate, nullptr, null char pointer)
 *  2. bool (before integers: bool is an integral type)
 *  3. integral -> INT64 (unsigned values above INT64 max are rejected)
 *  4. floating point -> FLOAT64
 *  5. text -> STRING
 *  6. system_clock time point -> TIMESTAMP
 *  7. anything streamable -> STRING of its text rendering
 *
 * Nulls carry no type; the backend infers it from context, which fails for
 * statements where the null's type is ambiguous.
 */
template<typename T>
[[nodiscard]] TypedParam coerce_value(const T& value) {
    using U = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<U, TypedParam>) {
        return value;
    } else if constexpr (detail::is_optional<U>::value) {
        if (!value) return TypedParam::null();
        return coerce_value(*value);
    } else if constexpr (std::is_same_v<U, std::monostate> || std::is_same_v<U, std::nullptr_t>) {
        return TypedParam::null();
    } else if constexpr (detail::is_variant<U>::value) {
        return std::visit([](const auto& inner) { return coerce_value(inner); }, value);
    } else if constexpr (std::is_same_v<U, bool>) {
        return TypedParam{ParamType::BOOL, Value{value}};
    } else if constexpr (std::is_integral_v<U>) {
        if constexpr (std::is_unsigned_v<U> && sizeof(U) >= sizeof(int64_t)) {
            if (value > static_cast<U>(std::numeric_limits<int64_t>::max())) {
                return TypedParam::invalid(std::format("unsigned value {} exceeds the INT64 range", value));
            }
        }
        return TypedParam{ParamType::INT64, Value{static_cast<int64_t>(value)}};
    } else if constexpr (std::is_floating_point_v<U>) {
        return TypedParam{ParamType::FLOAT64, Value{static_cast<double>(value)}};
    } else if constexpr (std::is_pointer_v<std::decay_t<U>> &&
                         std::is_convertible_v<std::decay_t<U>, const char*>) {
        const char* p = value;
        if (!p) return TypedParam::null();
        return TypedParam{ParamType::STRING, Value{std::string(p)}};
    } else if constexpr (std::is_convertible_v<const U&, std::string_view>) {
        return TypedParam{ParamType::STRING, Value{std::string(std::string_view(value))}};
    } else if constexpr (std::is_same_v<U, Timestamp>) {
        return TypedParam{ParamType::TIMESTAMP, Value{utils::format_iso8601_utc(value)}};
    } else if constexpr (detail::Streamable<U>) {
        std::ostringstream os;
        os << value;
        return TypedParam{ParamType::STRING, Value{os.str()}};
    } else {
        static_assert(detail::Streamable<U>, "coerce_value: type has no text rendering");
        return TypedParam::null();
    }
}

} // namespace tpccgw
