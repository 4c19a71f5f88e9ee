#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>

namespace tpccgw {

/// Key order follows insertion, so rendered rows keep projection order
using Json = nlohmann::ordered_json;

namespace json {

[[nodiscard]] inline Json from_value(const Value& v) {
    return std::visit([](const auto& x) -> Json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return x;
        }
    }, v);
}

/// Object with keys in projection order
[[nodiscard]] inline Json from_row(const ResultRow& row) {
    Json obj = Json::object();
    for (const auto& [name, value] : row.columns()) {
        obj[name] = from_value(value);
    }
    return obj;
}

[[nodiscard]] inline Json from_rows(const ResultSet& rows) {
    Json arr = Json::array();
    for (const auto& row : rows) {
        arr.push_back(from_row(row));
    }
    return arr;
}

} // namespace json

} // namespace tpccgw
