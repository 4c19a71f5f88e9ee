#include <catch2/catch_test_macros.hpp>
#include "core/value_coercion.hpp"

#include <chrono>
#include <limits>
#include <optional>

using namespace tpccgw;

TEST_CASE("coerce_value", "[coercion]") {

    SECTION("Nulls carry no type") {
        REQUIRE(coerce_value(std::optional<int>{}).is_null());
        REQUIRE(coerce_value(std::monostate{}).is_null());
        REQUIRE(coerce_value(nullptr).is_null());
        const char* none = nullptr;
        REQUIRE(coerce_value(none).is_null());
        REQUIRE(coerce_value(std::optional<int>{}).type == ParamType::STRING);
        REQUIRE_FALSE(coerce_value(std::optional<int>{}).wire_text().has_value());
    }

    SECTION("Bool is checked before integers") {
        auto p = coerce_value(true);
        REQUIRE(p.type == ParamType::BOOL);
        REQUIRE(p.value == Value{true});
        REQUIRE(p.wire_text() == "true");
    }

    SECTION("Integers widen to INT64") {
        auto p = coerce_value(static_cast<short>(12));
        REQUIRE(p.type == ParamType::INT64);
        REQUIRE(p.value == Value{int64_t{12}});
        REQUIRE(coerce_value(uint32_t{7}).type == ParamType::INT64);
    }

    SECTION("Unsigned values beyond INT64 are flagged, not wrapped") {
        auto edge = coerce_value(uint64_t{9223372036854775807ULL});
        REQUIRE(edge.valid());
        REQUIRE(edge.value == Value{std::numeric_limits<int64_t>::max()});

        auto over = coerce_value(uint64_t{9223372036854775808ULL});
        REQUIRE_FALSE(over.valid());
        REQUIRE(over.coercion_error.find("9223372036854775808") != std::string::npos);
        REQUIRE(over.is_null());
    }

    SECTION("Floating point maps to FLOAT64") {
        auto p = coerce_value(12.5f);
        REQUIRE(p.type == ParamType::FLOAT64);
        REQUIRE(p.value == Value{12.5});
    }

    SECTION("Text maps to STRING") {
        REQUIRE(coerce_value("abc").type == ParamType::STRING);
        REQUIRE(coerce_value(std::string("abc")).value == Value{std::string("abc")});
        REQUIRE(coerce_value(std::string_view("xy")).wire_text() == "xy");
    }

    SECTION("Time points become ISO-8601 TIMESTAMP text") {
        const auto tp = std::chrono::system_clock::time_point{} + std::chrono::hours(24);
        auto p = coerce_value(tp);
        REQUIRE(p.type == ParamType::TIMESTAMP);
        const auto text = std::get<std::string>(p.value);
        REQUIRE(text.starts_with("1970-01-02T00:00:00"));
    }

    SECTION("Optional with a value unwraps") {
        auto p = coerce_value(std::optional<int64_t>{42});
        REQUIRE(p.type == ParamType::INT64);
        REQUIRE(p.value == Value{int64_t{42}});
    }

    SECTION("Variant dispatches on the held alternative") {
        Value v = 3.25;
        REQUIRE(coerce_value(v).type == ParamType::FLOAT64);
        v = std::string("s");
        REQUIRE(coerce_value(v).type == ParamType::STRING);
        v = std::monostate{};
        REQUIRE(coerce_value(v).is_null());
    }

    SECTION("Typed params pass through") {
        TypedParam tp{ParamType::TIMESTAMP, Value{std::string("2024-01-01T00:00:00Z")}};
        REQUIRE(coerce_value(tp) == tp);
    }
}

TEST_CASE("ResultRow typed views", "[coercion]") {
    ResultRow row{
        {"count", Value{int64_t{5}}},
        {"amount", Value{12.75}},
        {"text_num", Value{std::string("3.5")}},
        {"name", Value{std::string("BARBAR")}},
        {"missing", Value{}}
    };

    REQUIRE(row.get_int("count") == 5);
    REQUIRE(row.get_double("count") == 5.0);
    REQUIRE(row.get_int("amount") == 12);
    REQUIRE(row.get_double("text_num") == 3.5);
    REQUIRE(row.get_string("name") == "BARBAR");
    REQUIRE_FALSE(row.get_int("name").has_value());
    REQUIRE_FALSE(row.get_string("missing").has_value());
    REQUIRE_FALSE(row.get_int("absent").has_value());

    SECTION("set replaces in place and keeps order") {
        row.set("count", Value{int64_t{6}});
        REQUIRE(row.columns().front().first == "count");
        REQUIRE(row.get_int("count") == 6);
        REQUIRE(row.size() == 5);
    }

    SECTION("Doubles outside the int64 range have no integer view") {
        row.set("huge", Value{1e19});
        row.set("tiny", Value{-1e19});
        row.set("huge_text", Value{std::string("1e300")});
        row.set("nan", Value{std::numeric_limits<double>::quiet_NaN()});
        row.set("low_edge", Value{-9223372036854775808.0});
        REQUIRE_FALSE(row.get_int("huge").has_value());
        REQUIRE_FALSE(row.get_int("tiny").has_value());
        REQUIRE_FALSE(row.get_int("huge_text").has_value());
        REQUIRE_FALSE(row.get_int("nan").has_value());
        REQUIRE(row.get_int("low_edge") == std::numeric_limits<int64_t>::min());
    }
}
