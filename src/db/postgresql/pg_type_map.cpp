#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace tpccgw {

namespace {

namespace oid {
    constexpr uint32_t BOOL = 16;
    constexpr uint32_t BYTEA = 17;
    constexpr uint32_t INT8 = 20;
    constexpr uint32_t INT2 = 21;
    constexpr uint32_t INT4 = 23;
    constexpr uint32_t TEXT = 25;
    constexpr uint32_t OID = 26;
    constexpr uint32_t JSON = 114;
    constexpr uint32_t FLOAT4 = 700;
    constexpr uint32_t FLOAT8 = 701;
    constexpr uint32_t BPCHAR = 1042;
    constexpr uint32_t VARCHAR = 1043;
    constexpr uint32_t DATE = 1082;
    constexpr uint32_t TIMESTAMP = 1114;
    constexpr uint32_t TIMESTAMPTZ = 1184;
    constexpr uint32_t NUMERIC = 1700;
    constexpr uint32_t JSONB = 3802;
} // namespace oid

const char* oid_name(uint32_t o) {
    switch (o) {
        case oid::BOOL: return "bool";
        case oid::BYTEA: return "bytea";
        case oid::INT8: return "int8";
        case oid::INT2: return "int2";
        case oid::INT4: return "int4";
        case oid::TEXT: return "text";
        case oid::OID: return "oid";
        case oid::JSON: return "json";
        case oid::FLOAT4: return "float4";
        case oid::FLOAT8: return "float8";
        case oid::BPCHAR: return "bpchar";
        case oid::VARCHAR: return "varchar";
        case oid::DATE: return "date";
        case oid::TIMESTAMP: return "timestamp";
        case oid::TIMESTAMPTZ: return "timestamptz";
        case oid::NUMERIC: return "numeric";
        case oid::JSONB: return "jsonb";
        default: return "";
    }
}

} // anonymous namespace

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t o) {
    static const std::unordered_map<uint32_t, GenericColumnType> OID_TO_GENERIC = {
        {oid::INT2, GenericColumnType::SMALLINT},
        {oid::INT4, GenericColumnType::INTEGER},
        {oid::INT8, GenericColumnType::BIGINT},
        {oid::OID, GenericColumnType::INTEGER},
        {oid::FLOAT4, GenericColumnType::REAL},
        {oid::FLOAT8, GenericColumnType::DOUBLE_PRECISION},
        {oid::NUMERIC, GenericColumnType::NUMERIC},
        {oid::TEXT, GenericColumnType::TEXT},
        {oid::VARCHAR, GenericColumnType::VARCHAR},
        {oid::BPCHAR, GenericColumnType::CHAR},
        {oid::BOOL, GenericColumnType::BOOLEAN},
        {oid::DATE, GenericColumnType::DATE},
        {oid::TIMESTAMP, GenericColumnType::TIMESTAMP},
        {oid::TIMESTAMPTZ, GenericColumnType::TIMESTAMP_TZ},
        {oid::BYTEA, GenericColumnType::BYTES},
        {oid::JSON, GenericColumnType::JSON},
        {oid::JSONB, GenericColumnType::JSON},
    };

    const auto it = OID_TO_GENERIC.find(o);
    return it != OID_TO_GENERIC.end() ? it->second : GenericColumnType::UNKNOWN;
}

uint32_t PgTypeMap::param_type_to_oid(ParamType type) {
    switch (type) {
        case ParamType::BOOL: return oid::BOOL;
        case ParamType::INT64: return oid::INT8;
        case ParamType::FLOAT64: return oid::FLOAT8;
        case ParamType::TIMESTAMP: return oid::TIMESTAMPTZ;
        case ParamType::STRING:
        default: return 0;
    }
}

ColumnTypeInfo PgTypeMap::build_type_info(uint32_t o) {
    return ColumnTypeInfo(oid_to_generic_type(o), o, oid_name(o));
}

} // namespace tpccgw
