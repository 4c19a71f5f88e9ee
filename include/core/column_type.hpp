#pragma once

#include <cstdint>
#include <string>

namespace tpccgw {

/**
 * @brief Backend-agnostic column type, as reported by the driver
 *
 * TPC-C tables only use the integer, numeric, text, boolean and timestamp
 * families; everything else is kept for diagnostics and decodes as text.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,
    SMALLINT,
    INTEGER,
    BIGINT,
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,            // c_balance, i_price, ol_amount
    TEXT,
    VARCHAR,
    CHAR,               // s_dist_NN, c_credit
    BOOLEAN,
    DATE,
    TIMESTAMP,
    TIMESTAMP_TZ,       // Spanner reports every timestamp as timestamptz
    BYTES,
    JSON,
};

/// How a text cell of a given column type becomes a row Value
enum class CellDecoding : uint8_t {
    AS_TEXT,
    AS_INT64,
    AS_FLOAT64,
    AS_BOOL,
    AS_ISO8601,
};

[[nodiscard]] inline CellDecoding decoding_for(GenericColumnType t) {
    switch (t) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return CellDecoding::AS_INT64;
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return CellDecoding::AS_FLOAT64;
        case GenericColumnType::BOOLEAN:
            return CellDecoding::AS_BOOL;
        case GenericColumnType::TIMESTAMP:
        case GenericColumnType::TIMESTAMP_TZ:
            return CellDecoding::AS_ISO8601;
        default:
            return CellDecoding::AS_TEXT;
    }
}

/**
 * @brief Column type as decoded plus the driver's own identification
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID; 0 when scripted
    std::string vendor_type_name;

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

/// Lowercase name used when no vendor name is known (scripted result sets)
[[nodiscard]] inline const char* column_type_name(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::SMALLINT: return "smallint";
        case GenericColumnType::INTEGER: return "integer";
        case GenericColumnType::BIGINT: return "bigint";
        case GenericColumnType::REAL: return "real";
        case GenericColumnType::DOUBLE_PRECISION: return "double precision";
        case GenericColumnType::NUMERIC: return "numeric";
        case GenericColumnType::TEXT: return "text";
        case GenericColumnType::VARCHAR: return "varchar";
        case GenericColumnType::CHAR: return "char";
        case GenericColumnType::BOOLEAN: return "boolean";
        case GenericColumnType::DATE: return "date";
        case GenericColumnType::TIMESTAMP: return "timestamp";
        case GenericColumnType::TIMESTAMP_TZ: return "timestamptz";
        case GenericColumnType::BYTES: return "bytea";
        case GenericColumnType::JSON: return "json";
        default: return "unknown";
    }
}

} // namespace tpccgw
