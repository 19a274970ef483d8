#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/options.hpp"
#include "geosql/core/sql/column_config.hpp"
#include "geosql/core/sql/sql_generator.hpp"

namespace geosql {

namespace core {

// Produces the SQL expression that stores a geometry into a configured column. Reconciles the geometry's SRID
// with the column's, either by wrapping the expression in ST_Transform (auto transform) or by failing.
class GeometryBinder {
private:
	GeosqlOptions options;
	unique_ptr<SQLGenerator> generator;

public:
	explicit GeometryBinder(GeosqlOptions options);

	const GeosqlOptions &GetOptions() const {
		return options;
	}
	const SQLGenerator &GetGenerator() const {
		return *generator;
	}

	// True if the geometry carries an SRID different from the column SRID
	static bool RequiresTransform(const Geometry &geometry, int32_t column_srid);

	string ToGeometrySQL(const Geometry &geometry, int32_t column_srid) const;
	// Throws UnsupportedGeometryForGeographyException for a GEOMETRYCOLLECTION
	string ToGeographySQL(const Geometry &geometry, int32_t column_srid) const;

	// Route by column kind. A GEOMETRYCOLLECTION always takes the geometry path.
	string ToInsertableSQL(const Geometry &geometry, const ColumnConfig &column) const;
	string ToInsertableSQL(const Geometry &geometry, const GeometryColumnRegistry &registry,
	                       const string &column) const;

private:
	void CheckSRID(const Geometry &geometry, int32_t column_srid) const;
	string Transform(const string &expression, int32_t column_srid) const;
};

} // namespace core

} // namespace geosql
