#pragma once

#include "core/column_type.hpp"
#include "core/value_coercion.hpp"
#include <cstdint>
#include <string>

namespace tpccgw {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps between PG type OIDs, GenericColumnType and bound parameter types.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief OID sent with a bound parameter of the given type
     *
     * STRING maps to 0 (unspecified) so the server infers the type from
     * context; a text literal bound against a BIGINT column is then parsed
     * as BIGINT and rejected with 22P02 when malformed.
     */
    [[nodiscard]] static uint32_t param_type_to_oid(ParamType type);

    /**
     * @brief Build a ColumnTypeInfo from a result column OID
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(uint32_t oid);
};

} // namespace tpccgw
