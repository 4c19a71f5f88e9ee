#include "db/sql_dialect.hpp"
#include <string>

namespace tpccgw {

std::string SqlDialect::text_type(int length) const {
    std::string out;
    out.reserve(short_text_type.size() + 4);
    for (size_t i = 0; i < short_text_type.size(); ++i) {
        if (short_text_type[i] == '%' && i + 1 < short_text_type.size() &&
            short_text_type[i + 1] == 'd') {
            out += std::to_string(length);
            ++i;
        } else {
            out += short_text_type[i];
        }
    }
    return out;
}

SqlDialect SqlDialect::postgresql() {
    SqlDialect d;
    d.type = DatabaseType::POSTGRESQL;
    d.provider_name = "PostgreSQL";
    d.begin_read_only = "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY";
    d.begin_read_write = "BEGIN ISOLATION LEVEL SERIALIZABLE";
    d.bigint_type = "BIGINT";
    d.numeric_type = "NUMERIC";
    d.short_text_type = "VARCHAR(%d)";
    d.timestamp_type = "TIMESTAMP";
    d.current_timestamp = "CURRENT_TIMESTAMP";
    return d;
}

SqlDialect SqlDialect::spanner() {
    SqlDialect d;
    d.type = DatabaseType::SPANNER;
    d.provider_name = "Google Spanner";
    // Spanner read-only transactions are strong snapshot reads;
    // read-write transactions are always serializable
    d.begin_read_only = "BEGIN READ ONLY";
    d.begin_read_write = "BEGIN READ WRITE";
    d.bigint_type = "bigint";
    d.numeric_type = "numeric";
    d.short_text_type = "varchar(%d)";
    d.timestamp_type = "timestamptz";
    d.current_timestamp = "CURRENT_TIMESTAMP";
    return d;
}

SqlDialect SqlDialect::for_type(DatabaseType type) {
    switch (type) {
        case DatabaseType::SPANNER: return spanner();
        case DatabaseType::POSTGRESQL:
        default: return postgresql();
    }
}

} // namespace tpccgw
