#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tpccgw {

/**
 * @brief Turns driver result sets into ordered name -> Value rows
 *
 * Two explicit branches for column names:
 *  - metadata present: names come from the driver, cells decode by type;
 *  - metadata absent: names are inferred from the statement's projection
 *    (alias, else last identifier, else col_<n>). The inference is
 *    best-effort and loses information for expressions without aliases.
 *
 * Timestamps are rendered as ISO-8601 text ("2024-05-01T12:30:00+00:00").
 */
class ResultNormalizer {
public:
    [[nodiscard]] static ResultSet normalize(const DbResultSet& raw, std::string_view sql);

    /// Column names used for `raw` (metadata or inferred)
    [[nodiscard]] static std::vector<std::string> column_names(
        const DbResultSet& raw, std::string_view sql);

    [[nodiscard]] static Value decode_cell(
        const std::optional<std::string>& cell, GenericColumnType type);

    /**
     * @brief Infer output column names from a SELECT projection
     * @param sql Statement text
     * @param column_count Number of cells per row; names are padded or
     *        truncated to this count
     */
    [[nodiscard]] static std::vector<std::string> infer_column_names(
        std::string_view sql, size_t column_count);

    /// "2024-05-01 12:30:00.5+00" -> "2024-05-01T12:30:00.5+00:00"
    [[nodiscard]] static std::string to_iso8601(std::string_view pg_timestamp);

private:
    static std::vector<std::string> split_projection(std::string_view sql);
    static std::string name_for_expression(std::string_view expr);
};

} // namespace tpccgw
