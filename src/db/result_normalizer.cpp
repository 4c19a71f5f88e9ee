#include "db/result_normalizer.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace tpccgw {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

/// Keyword match at position i with word boundaries on both sides
bool keyword_at(std::string_view sql, size_t i, std::string_view kw) {
    if (i + kw.size() > sql.size()) return false;
    if (i > 0 && is_ident_char(sql[i - 1])) return false;
    if (!utils::iequals(sql.substr(i, kw.size()), kw)) return false;
    const size_t after = i + kw.size();
    return after == sql.size() || !is_ident_char(sql[after]);
}

/// Skip a quoted run starting at i; returns index just past it
size_t skip_quoted(std::string_view sql, size_t i) {
    const char q = sql[i];
    size_t j = i + 1;
    while (j < sql.size()) {
        if (sql[j] == q) {
            if (j + 1 < sql.size() && sql[j + 1] == q) {
                j += 2;
                continue;
            }
            return j + 1;
        }
        ++j;
    }
    return sql.size();
}

std::string unquote_identifier(std::string_view ident) {
    if (ident.size() >= 2 && ident.front() == '"' && ident.back() == '"') {
        return std::string(ident.substr(1, ident.size() - 2));
    }
    // Unquoted identifiers fold to lower case on PostgreSQL-wire backends
    return utils::to_lower(ident);
}

bool is_identifier_chain(std::string_view expr) {
    if (expr.empty()) return false;
    bool in_quote = false;
    for (const char c : expr) {
        if (c == '"') {
            in_quote = !in_quote;
            continue;
        }
        if (in_quote) continue;
        if (!is_ident_char(c) && c != '.') return false;
    }
    return !in_quote;
}

} // anonymous namespace

// ============================================================================
// Normalization
// ============================================================================

ResultSet ResultNormalizer::normalize(const DbResultSet& raw, std::string_view sql) {
    ResultSet rows;
    if (raw.rows.empty()) return rows;

    const auto names = column_names(raw, sql);
    rows.reserve(raw.rows.size());

    for (const auto& raw_row : raw.rows) {
        ResultRow row;
        for (size_t j = 0; j < raw_row.size(); ++j) {
            const auto type = j < raw.column_types.size()
                ? raw.column_types[j].generic_type
                : GenericColumnType::UNKNOWN;
            std::string name = j < names.size() ? names[j] : std::format("col_{}", j + 1);
            row.set(std::move(name), decode_cell(raw_row[j], type));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<std::string> ResultNormalizer::column_names(
    const DbResultSet& raw, std::string_view sql) {

    const size_t cell_count = raw.rows.empty() ? raw.column_names.size() : raw.rows.front().size();

    if (!raw.column_names.empty() && raw.column_names.size() == cell_count) {
        return raw.column_names;
    }
    return infer_column_names(sql, cell_count);
}

Value ResultNormalizer::decode_cell(const std::optional<std::string>& cell, GenericColumnType type) {
    if (!cell) return Value{};
    const std::string& text = *cell;

    switch (decoding_for(type)) {
        case CellDecoding::AS_BOOL:
            if (text == "t" || utils::iequals(text, "true")) return Value{true};
            if (text == "f" || utils::iequals(text, "false")) return Value{false};
            return Value{text};
        case CellDecoding::AS_INT64:
            if (auto v = utils::try_parse_int<int64_t>(text)) return Value{*v};
            return Value{text};
        case CellDecoding::AS_FLOAT64:
            if (auto v = utils::try_parse_double(text)) return Value{*v};
            return Value{text};
        case CellDecoding::AS_ISO8601:
            return Value{to_iso8601(text)};
        case CellDecoding::AS_TEXT:
            break;
    }
    return Value{text};
}

std::string ResultNormalizer::to_iso8601(std::string_view pg_timestamp) {
    std::string out(pg_timestamp);

    const size_t space = out.find(' ');
    if (space == std::string::npos) return out;
    out[space] = 'T';

    // Zone offset follows the time part: "+00", "-05", "+05:30"
    const size_t zone = out.find_first_of("+-", space);
    if (zone != std::string::npos && out.size() - zone == 3) {
        out += ":00";
    }
    return out;
}

// ============================================================================
// Projection Inference (no-metadata branch)
// ============================================================================

std::vector<std::string> ResultNormalizer::split_projection(std::string_view sql) {
    std::vector<std::string> items;

    // Locate the first top-level SELECT
    size_t i = 0;
    int depth = 0;
    size_t start = std::string_view::npos;
    while (i < sql.size()) {
        const char c = sql[i];
        if (c == '\'' || c == '"') { i = skip_quoted(sql, i); continue; }
        if (c == '(') ++depth;
        else if (c == ')') --depth;
        else if (depth == 0 && keyword_at(sql, i, "select")) {
            start = i + 6;
            break;
        }
        ++i;
    }
    if (start == std::string_view::npos) return items;

    // Skip DISTINCT / ALL
    size_t p = start;
    while (p < sql.size() && std::isspace(static_cast<unsigned char>(sql[p]))) ++p;
    if (keyword_at(sql, p, "distinct")) start = p + 8;
    else if (keyword_at(sql, p, "all")) start = p + 3;

    depth = 0;
    size_t item_start = start;
    i = start;
    while (i < sql.size()) {
        const char c = sql[i];
        if (c == '\'' || c == '"') { i = skip_quoted(sql, i); continue; }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        } else if (depth == 0 && c == ',') {
            items.push_back(utils::trim(sql.substr(item_start, i - item_start)));
            item_start = i + 1;
        } else if (depth == 0 && keyword_at(sql, i, "from")) {
            break;
        }
        ++i;
    }
    const auto last = utils::trim(sql.substr(item_start, i - item_start));
    if (!last.empty()) items.push_back(last);
    return items;
}

std::string ResultNormalizer::name_for_expression(std::string_view expr) {
    // Explicit "AS alias" at depth 0, last one wins
    int depth = 0;
    size_t as_pos = std::string_view::npos;
    for (size_t i = 0; i < expr.size(); ++i) {
        const char c = expr[i];
        if (c == '\'' || c == '"') { i = skip_quoted(expr, i) - 1; continue; }
        if (c == '(') ++depth;
        else if (c == ')') --depth;
        else if (depth == 0 && keyword_at(expr, i, "as")) as_pos = i;
    }
    if (as_pos != std::string_view::npos) {
        return unquote_identifier(utils::trim(expr.substr(as_pos + 2)));
    }

    // Plain column reference: last segment of a dotted chain
    if (is_identifier_chain(expr)) {
        const size_t dot = expr.rfind('.');
        return unquote_identifier(dot == std::string_view::npos ? expr : expr.substr(dot + 1));
    }

    // Implicit alias: "<expr> alias" where <expr> ends in ')' or an identifier
    const size_t space = expr.find_last_of(" \t\n");
    if (space != std::string_view::npos) {
        const auto tail = expr.substr(space + 1);
        const auto head = utils::trim(expr.substr(0, space));
        if (!head.empty() && is_identifier_chain(tail) && tail.find('.') == std::string_view::npos &&
            !utils::iequals(tail, "end") && (head.back() == ')' || is_ident_char(head.back()))) {
            return unquote_identifier(tail);
        }
    }

    // Bare function call: the backend names it after the function
    const size_t paren = expr.find('(');
    if (paren != std::string_view::npos && paren > 0 && expr.back() == ')') {
        const auto fn = utils::trim(expr.substr(0, paren));
        if (is_identifier_chain(fn)) {
            const size_t dot = fn.rfind('.');
            return utils::to_lower(dot == std::string::npos ? fn : fn.substr(dot + 1));
        }
    }

    return "";
}

std::vector<std::string> ResultNormalizer::infer_column_names(
    std::string_view sql, size_t column_count) {

    const auto items = split_projection(sql);

    std::vector<std::string> names;
    names.reserve(column_count);
    bool after_wildcard = false;
    for (size_t i = 0; i < column_count; ++i) {
        std::string name;
        // A wildcard expands to an unknown number of columns; positions from
        // it onwards cannot be attributed
        if (i < items.size() && !after_wildcard) {
            const auto& item = items[i];
            if (item == "*" || item.ends_with(".*")) {
                after_wildcard = true;
            } else {
                name = name_for_expression(item);
            }
        }
        if (name.empty()) name = std::format("col_{}", i + 1);
        names.push_back(std::move(name));
    }
    return names;
}

} // namespace tpccgw
