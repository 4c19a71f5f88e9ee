#pragma once

#include "core/error.hpp"
#include "core/value_coercion.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tpccgw {

// ============================================================================
// Query Template
// ============================================================================

enum class ParamStyle {
    NONE,           // no placeholders, text passed through untouched
    NAMED,          // @identifier
    POSITIONAL      // %s, consumed in order; %% is a literal percent
};

/**
 * @brief Immutable SQL template plus its declared placeholder style
 */
struct Query {
    std::string text;
    ParamStyle style = ParamStyle::NAMED;

    static Query named(std::string sql) { return {std::move(sql), ParamStyle::NAMED}; }
    static Query positional(std::string sql) { return {std::move(sql), ParamStyle::POSITIONAL}; }
    static Query plain(std::string sql) { return {std::move(sql), ParamStyle::NONE}; }
};

// ============================================================================
// Parameter Sources
// ============================================================================

/**
 * @brief Name -> value parameter source for @name placeholders
 */
class NamedParams {
public:
    template<typename T>
    NamedParams& set(std::string name, const T& value) {
        values_.insert_or_assign(std::move(name), coerce_value(value));
        return *this;
    }

    [[nodiscard]] const TypedParam* find(std::string_view name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

private:
    std::map<std::string, TypedParam, std::less<>> values_;
};

/**
 * @brief Ordered parameter source for %s placeholders
 */
class PositionalParams {
public:
    template<typename T>
    PositionalParams& add(const T& value) {
        values_.push_back(coerce_value(value));
        return *this;
    }

    [[nodiscard]] size_t size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] const TypedParam& operator[](size_t i) const { return values_[i]; }

private:
    std::vector<TypedParam> values_;
};

/// Exactly one source kind per call; monostate means "no parameters"
using ParamSource = std::variant<std::monostate, NamedParams, PositionalParams>;

// ============================================================================
// Translation Output
// ============================================================================

/**
 * @brief Ordered $1..$N -> typed value binding for one invocation
 *
 * values[0] binds $1. Owned by the call that built it.
 */
struct ParameterSet {
    std::vector<TypedParam> values;

    [[nodiscard]] size_t size() const { return values.size(); }
    [[nodiscard]] bool empty() const { return values.empty(); }
    [[nodiscard]] const TypedParam& at_position(size_t position) const {
        return values.at(position - 1);
    }
};

struct TranslatedQuery {
    std::string sql;                    // placeholders rewritten to $1..$N
    ParameterSet params;
    std::vector<std::string> names;     // names[i] is bound to $(i+1); empty for positional
};

/**
 * @brief Rewrites application placeholders into the backend's $N markers
 *
 * Named style: every distinct @name is assigned the next position on its
 * first appearance; later occurrences of the same name reuse that position,
 * so a repeated name always binds the same value in every place it appears.
 * A placeholder with no supplied value, and a supplied value no placeholder
 * references, are both translation errors.
 *
 * Positional style: each %s consumes the next value; the count of markers
 * and values must match exactly.
 *
 * Text inside single-quoted literals, double-quoted identifiers, -- line
 * comments and block comments is copied verbatim. "@@" and "::" casts are
 * left untouched.
 */
class ParameterTranslator {
public:
    [[nodiscard]] static Result<TranslatedQuery> translate(
        const Query& query, const ParamSource& source);

private:
    static Result<TranslatedQuery> translate_named(
        const std::string& sql, const NamedParams& params);

    static Result<TranslatedQuery> translate_positional(
        const std::string& sql, const PositionalParams& params);

    /// Length of a quoted/comment region starting at i, 0 if none starts there
    static size_t skip_verbatim(std::string_view sql, size_t i);
};

} // namespace tpccgw
