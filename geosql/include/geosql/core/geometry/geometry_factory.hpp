#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"

namespace geosql {

namespace core {

// Builds geometry trees. Every geometry created by a factory carries the factory's SRID (or none), so all
// parts of a tree built through one factory agree on it.
class GeometryFactory {
private:
	bool has_srid;
	int32_t srid;

public:
	// Maximum number of collections that may enclose one another
	static constexpr const uint32_t MAX_NESTING_DEPTH = 256;

	GeometryFactory() : has_srid(false), srid(SRID_UNKNOWN) {
	}
	explicit GeometryFactory(int32_t srid) : has_srid(true), srid(srid) {
	}

	bool HasSRID() const {
		return has_srid;
	}
	int32_t GetSRID() const {
		return srid;
	}

	// Points
	Geometry CreatePoint(double x, double y) const;
	Geometry CreatePointZ(double x, double y, double z) const;
	Geometry CreatePointM(double x, double y, double m) const;
	Geometry CreatePointZM(double x, double y, double z, double m) const;
	Geometry CreatePoint(const VertexXYZM &vertex, Dimension dimension) const;
	Geometry CreateEmptyPoint(Dimension dimension = Dimension()) const;

	// Longitude is stored as x and latitude as y, always with SRID 4326
	static Geometry CreateGeodeticPoint(double latitude, double longitude);
	static Geometry CreateGeodeticPoint(double latitude, double longitude, double altitude);
	static Geometry CreateGeodeticPoint(double latitude, double longitude, double altitude, double m);
	static Geometry CreateGeodeticPointM(double latitude, double longitude, double m);

	// Single part
	Geometry CreateLineString(vector<VertexXYZM> vertices, Dimension dimension) const;

	// Multi part. Children must match the dimension and SRID of the factory.
	Geometry CreatePolygon(vector<vector<VertexXYZM>> rings, Dimension dimension) const;
	Geometry CreateMultiPoint(vector<Geometry> points, Dimension dimension) const;
	Geometry CreateMultiLineString(vector<Geometry> lines, Dimension dimension) const;
	Geometry CreateMultiPolygon(vector<Geometry> polygons, Dimension dimension) const;
	Geometry CreateGeometryCollection(vector<Geometry> items, Dimension dimension) const;

	// Create an empty geometry of any type
	Geometry CreateEmpty(GeometryType type, Dimension dimension) const;

private:
	Geometry Create(GeometryType type, Dimension dimension) const;
	Geometry CreateCollection(GeometryType type, GeometryType part_type, vector<Geometry> items,
	                          Dimension dimension) const;
	void CheckPart(GeometryType type, const Geometry &part, Dimension dimension) const;
	static uint32_t NestingDepth(const Geometry &geom);
};

} // namespace core

} // namespace geosql
