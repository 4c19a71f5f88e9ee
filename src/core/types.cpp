#include "core/types.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace tpccgw {

namespace {

/// Whole part of `d` when it lies inside the int64 range
std::optional<int64_t> truncate_to_int64(double d) {
    // 2^63 is exact in double; [-2^63, 2^63) converts without overflow
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(d) || d < -kLimit || d >= kLimit) return std::nullopt;
    return static_cast<int64_t>(d);
}

} // anonymous namespace

std::string value_to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            return std::format("{}", x);
        }
    }, v);
}

std::optional<int64_t> ResultRow::get_int(std::string_view name) const {
    const Value* v = find(name);
    if (!v) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(v)) return *i;
    if (const auto* d = std::get_if<double>(v)) return truncate_to_int64(*d);
    if (const auto* b = std::get_if<bool>(v)) return *b ? 1 : 0;
    if (const auto* s = std::get_if<std::string>(v)) {
        if (auto parsed = utils::try_parse_int<int64_t>(*s)) return parsed;
        if (auto parsed = utils::try_parse_double(*s)) return truncate_to_int64(*parsed);
    }
    return std::nullopt;
}

std::optional<double> ResultRow::get_double(std::string_view name) const {
    const Value* v = find(name);
    if (!v) return std::nullopt;
    if (const auto* d = std::get_if<double>(v)) return *d;
    if (const auto* i = std::get_if<int64_t>(v)) return static_cast<double>(*i);
    if (const auto* s = std::get_if<std::string>(v)) return utils::try_parse_double(*s);
    return std::nullopt;
}

std::optional<std::string> ResultRow::get_string(std::string_view name) const {
    const Value* v = find(name);
    if (!v || is_null(*v)) return std::nullopt;
    return value_to_string(*v);
}

} // namespace tpccgw
