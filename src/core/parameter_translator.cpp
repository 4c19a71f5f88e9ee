#include "core/parameter_translator.hpp"

#include <cctype>
#include <format>
#include <unordered_map>

namespace tpccgw {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================

Result<TranslatedQuery> ParameterTranslator::translate(
    const Query& query, const ParamSource& source) {

    switch (query.style) {
        case ParamStyle::NONE: {
            const bool has_values = std::visit([](const auto& s) {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, std::monostate>) {
                    return false;
                } else {
                    return !s.empty();
                }
            }, source);
            if (has_values) {
                return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                    "Parameters supplied for a query without placeholders");
            }
            return Result<TranslatedQuery>::ok(TranslatedQuery{query.text, {}, {}});
        }

        case ParamStyle::NAMED: {
            if (std::holds_alternative<PositionalParams>(source)) {
                return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                    "Positional parameters supplied for a named-parameter query");
            }
            static const NamedParams empty{};
            const auto* named = std::get_if<NamedParams>(&source);
            return translate_named(query.text, named ? *named : empty);
        }

        case ParamStyle::POSITIONAL: {
            if (std::holds_alternative<NamedParams>(source)) {
                return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                    "Named parameters supplied for a positional-parameter query");
            }
            static const PositionalParams empty{};
            const auto* positional = std::get_if<PositionalParams>(&source);
            return translate_positional(query.text, positional ? *positional : empty);
        }
    }

    return Result<TranslatedQuery>::error(ErrorCategory::INTERNAL_ERROR, "Unknown parameter style");
}

// ============================================================================
// Lexical Skipping
// ============================================================================

size_t ParameterTranslator::skip_verbatim(std::string_view sql, size_t i) {
    const char c = sql[i];
    const size_t n = sql.size();

    // 'literal' and "identifier"; doubled quote is an escaped quote
    if (c == '\'' || c == '"') {
        size_t j = i + 1;
        while (j < n) {
            if (sql[j] == c) {
                if (j + 1 < n && sql[j + 1] == c) {
                    j += 2;
                    continue;
                }
                return j + 1 - i;
            }
            ++j;
        }
        return n - i;   // unterminated: rest of text is verbatim
    }

    if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
        const size_t end = sql.find('\n', i);
        return (end == std::string_view::npos) ? n - i : end - i;
    }

    if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
        const size_t end = sql.find("*/", i + 2);
        return (end == std::string_view::npos) ? n - i : end + 2 - i;
    }

    return 0;
}

// ============================================================================
// Named Style
// ============================================================================

Result<TranslatedQuery> ParameterTranslator::translate_named(
    const std::string& sql, const NamedParams& params) {

    TranslatedQuery out;
    out.sql.reserve(sql.size() + 8);
    std::unordered_map<std::string, size_t> positions;

    const std::string_view text(sql);
    size_t i = 0;
    while (i < text.size()) {
        if (const size_t verbatim = skip_verbatim(text, i); verbatim > 0) {
            out.sql.append(text.substr(i, verbatim));
            i += verbatim;
            continue;
        }

        const char c = text[i];
        if (c != '@') {
            out.sql += c;
            ++i;
            continue;
        }

        // @@ system variables pass through
        if (i + 1 < text.size() && text[i + 1] == '@') {
            out.sql.append("@@");
            i += 2;
            continue;
        }

        if (i + 1 >= text.size() || !is_ident_start(text[i + 1])) {
            out.sql += c;
            ++i;
            continue;
        }

        size_t end = i + 1;
        while (end < text.size() && is_ident_char(text[end])) ++end;
        std::string name(text.substr(i + 1, end - i - 1));

        auto it = positions.find(name);
        if (it == positions.end()) {
            const TypedParam* value = params.find(name);
            if (!value) {
                return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                    std::format("Missing value for parameter @{}", name));
            }
            if (!value->valid()) {
                return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                    std::format("Parameter @{}: {}", name, value->coercion_error));
            }
            out.params.values.push_back(*value);
            out.names.push_back(name);
            it = positions.emplace(std::move(name), out.params.values.size()).first;
        }

        out.sql += std::format("${}", it->second);
        i = end;
    }

    for (const auto& [name, value] : params) {
        if (!positions.contains(name)) {
            return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                std::format("Parameter @{} is not referenced by the query", name));
        }
    }

    return Result<TranslatedQuery>::ok(std::move(out));
}

// ============================================================================
// Positional Style
// ============================================================================

Result<TranslatedQuery> ParameterTranslator::translate_positional(
    const std::string& sql, const PositionalParams& params) {

    TranslatedQuery out;
    out.sql.reserve(sql.size() + 8);

    const std::string_view text(sql);
    size_t next = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (const size_t verbatim = skip_verbatim(text, i); verbatim > 0) {
            out.sql.append(text.substr(i, verbatim));
            i += verbatim;
            continue;
        }

        const char c = text[i];
        if (c == '%' && i + 1 < text.size()) {
            if (text[i + 1] == '%') {
                out.sql += '%';
                i += 2;
                continue;
            }
            if (text[i + 1] == 's') {
                if (next >= params.size()) {
                    return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                        std::format("Query has more than {} %s placeholders", params.size()));
                }
                if (!params[next].valid()) {
                    return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
                        std::format("Parameter {}: {}", next + 1, params[next].coercion_error));
                }
                out.params.values.push_back(params[next]);
                ++next;
                out.sql += std::format("${}", next);
                i += 2;
                continue;
            }
        }

        out.sql += c;
        ++i;
    }

    if (next != params.size()) {
        return Result<TranslatedQuery>::error(ErrorCategory::TRANSLATION,
            std::format("Query has {} %s placeholders but {} values were supplied",
                        next, params.size()));
    }

    return Result<TranslatedQuery>::ok(std::move(out));
}

} // namespace tpccgw
