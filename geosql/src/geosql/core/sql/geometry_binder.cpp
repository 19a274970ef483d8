#include "geosql/core/sql/geometry_binder.hpp"
#include "geosql/core/exception.hpp"

namespace geosql {

namespace core {

GeometryBinder::GeometryBinder(GeosqlOptions options_p)
    : options(std::move(options_p)), generator(SQLGenerator::Create(options.generator)) {
}

bool GeometryBinder::RequiresTransform(const Geometry &geometry, int32_t column_srid) {
	return geometry.HasSRID() && geometry.GetSRID() != column_srid;
}

void GeometryBinder::CheckSRID(const Geometry &geometry, int32_t column_srid) const {
	if (RequiresTransform(geometry, column_srid) && !options.auto_transform) {
		throw SRIDMismatchException(column_srid, geometry.GetSRID());
	}
}

string GeometryBinder::Transform(const string &expression, int32_t column_srid) const {
	return StringUtil::Format("%s.ST_Transform(%s, %d)", options.schema, expression, column_srid);
}

string GeometryBinder::ToGeometrySQL(const Geometry &geometry, int32_t column_srid) const {
	CheckSRID(geometry, column_srid);
	if (!RequiresTransform(geometry, column_srid)) {
		// A geometry without SRID is stored in the column's SRID
		return generator->ToGeometrySQL(geometry, options.schema, column_srid);
	}
	auto expression = generator->ToGeometrySQL(geometry, options.schema, geometry.GetSRID());
	return Transform(expression, column_srid);
}

string GeometryBinder::ToGeographySQL(const Geometry &geometry, int32_t column_srid) const {
	if (geometry.GetType() == GeometryType::GEOMETRYCOLLECTION) {
		throw UnsupportedGeometryForGeographyException(geometry.GetTypeName());
	}
	CheckSRID(geometry, column_srid);
	if (!RequiresTransform(geometry, column_srid)) {
		return generator->ToGeographySQL(geometry, options.schema, column_srid);
	}
	// Geography can not be transformed directly, go through geometry
	auto expression = generator->ToGeometrySQL(geometry, options.schema, geometry.GetSRID());
	return StringUtil::Format("%s.geography(%s)", options.schema, Transform(expression, column_srid));
}

string GeometryBinder::ToInsertableSQL(const Geometry &geometry, const ColumnConfig &column) const {
	if (column.kind == ColumnKind::GEOGRAPHY && geometry.GetType() != GeometryType::GEOMETRYCOLLECTION) {
		return ToGeographySQL(geometry, column.srid);
	}
	return ToGeometrySQL(geometry, column.srid);
}

string GeometryBinder::ToInsertableSQL(const Geometry &geometry, const GeometryColumnRegistry &registry,
                                       const string &column) const {
	return ToInsertableSQL(geometry, registry.Get(column));
}

} // namespace core

} // namespace geosql
