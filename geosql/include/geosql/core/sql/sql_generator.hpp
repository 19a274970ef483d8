#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"

namespace geosql {

namespace core {

// Turns a geometry into a PostGIS constructor call. The SRID is emitted as given: reconciling it with the
// target column is up to the caller (see GeometryBinder).
class SQLGenerator {
public:
	virtual ~SQLGenerator() {
	}

	virtual string GetName() const = 0;

	// <schema>.<geometry constructor>(..., <srid>)
	virtual string ToGeometrySQL(const Geometry &geometry, const string &schema, int32_t srid) const = 0;
	// <schema>.<geography constructor>(...) with the SRID embedded in the argument. Must not be called with a
	// GEOMETRYCOLLECTION.
	virtual string ToGeographySQL(const Geometry &geometry, const string &schema, int32_t srid) const = 0;

	// Use the geometry's own SRID, or 0 if it has none
	string ToGeometrySQL(const Geometry &geometry, const string &schema) const {
		return ToGeometrySQL(geometry, schema, GetEmittedSRID(geometry));
	}
	string ToGeographySQL(const Geometry &geometry, const string &schema) const {
		return ToGeographySQL(geometry, schema, GetEmittedSRID(geometry));
	}

	// Look up a generator by name ("wkt" or "wkb"), throws InvalidInputException otherwise
	static unique_ptr<SQLGenerator> Create(const string &name);
	static bool IsKnown(const string &name);

	// Quote a string as a SQL literal
	static string QuoteLiteral(const string &text);

protected:
	static int32_t GetEmittedSRID(const Geometry &geometry) {
		return geometry.HasSRID() ? geometry.GetSRID() : SRID_UNKNOWN;
	}
};

// <schema>.ST_GeomFromText('<WKT>', <srid>)
class WKTGenerator final : public SQLGenerator {
public:
	using SQLGenerator::ToGeographySQL;
	using SQLGenerator::ToGeometrySQL;

	string GetName() const override {
		return "wkt";
	}
	string ToGeometrySQL(const Geometry &geometry, const string &schema, int32_t srid) const override;
	string ToGeographySQL(const Geometry &geometry, const string &schema, int32_t srid) const override;
};

// <schema>.ST_GeomFromWKB(decode('<hex>', 'hex'), <srid>)
class WKBGenerator final : public SQLGenerator {
public:
	using SQLGenerator::ToGeographySQL;
	using SQLGenerator::ToGeometrySQL;

	string GetName() const override {
		return "wkb";
	}
	string ToGeometrySQL(const Geometry &geometry, const string &schema, int32_t srid) const override;
	string ToGeographySQL(const Geometry &geometry, const string &schema, int32_t srid) const override;
};

} // namespace core

} // namespace geosql
