#pragma once
#include "geosql/common.hpp"
#include "geosql/core/options.hpp"

namespace geosql {

namespace core {

// Maps the geosql_* settings onto GeosqlOptions
struct GeosqlConfig {
	static constexpr const char *SCHEMA = "geosql_schema";
	static constexpr const char *DEFAULT_SRID = "geosql_default_srid";
	static constexpr const char *DEFAULT_COLUMN_TYPE = "geosql_default_column_type";
	static constexpr const char *AUTO_TRANSFORM = "geosql_auto_transform";
	static constexpr const char *SQL_GENERATOR = "geosql_sql_generator";
	static constexpr const char *STRICT_RINGS = "geosql_strict_rings";

	static void Register(DatabaseInstance &db);
	// Snapshot of the settings as seen by this client
	static GeosqlOptions Read(ClientContext &context);
};

} // namespace core

} // namespace geosql
