#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"

namespace tpccgw {

SqlDialect PgBackend::dialect() const {
    return SqlDialect::postgresql();
}

std::shared_ptr<IConnectionFactory> PgBackend::create_connection_factory() {
    return std::make_shared<PgConnectionFactory>();
}

SqlDialect SpannerBackend::dialect() const {
    return SqlDialect::spanner();
}

std::shared_ptr<IConnectionFactory> SpannerBackend::create_connection_factory() {
    // Spanner sessions always report UTC; SET TIME ZONE is not needed
    return std::make_shared<PgConnectionFactory>(false);
}

} // namespace tpccgw
