#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry_factory.hpp"

namespace geosql {

namespace core {

constexpr const uint32_t GeometryFactory::MAX_NESTING_DEPTH;

Geometry GeometryFactory::Create(GeometryType type, Dimension dimension) const {
	return Geometry(type, dimension, has_srid, srid);
}

//------------------------------------------------------------------------------
// Points
//------------------------------------------------------------------------------
Geometry GeometryFactory::CreatePoint(double x, double y) const {
	return CreatePoint(VertexXYZM(x, y), Dimension::FromCoordinates(x, y));
}

Geometry GeometryFactory::CreatePointZ(double x, double y, double z) const {
	return CreatePoint(VertexXYZM(x, y, z, 0), Dimension::FromCoordinates(x, y, &z));
}

Geometry GeometryFactory::CreatePointM(double x, double y, double m) const {
	return CreatePoint(VertexXYZM(x, y, 0, m), Dimension::FromCoordinates(x, y, nullptr, &m));
}

Geometry GeometryFactory::CreatePointZM(double x, double y, double z, double m) const {
	return CreatePoint(VertexXYZM(x, y, z, m), Dimension::FromCoordinates(x, y, &z, &m));
}

Geometry GeometryFactory::CreatePoint(const VertexXYZM &vertex, Dimension dimension) const {
	auto point = Create(GeometryType::POINT, dimension);
	point.vertices.push_back(vertex);
	return point;
}

Geometry GeometryFactory::CreateEmptyPoint(Dimension dimension) const {
	return CreatePoint(VertexXYZM::Empty(), dimension);
}

Geometry GeometryFactory::CreateGeodeticPoint(double latitude, double longitude) {
	return GeometryFactory(SRID_WGS84).CreatePoint(longitude, latitude);
}

Geometry GeometryFactory::CreateGeodeticPoint(double latitude, double longitude, double altitude) {
	return GeometryFactory(SRID_WGS84).CreatePointZ(longitude, latitude, altitude);
}

Geometry GeometryFactory::CreateGeodeticPoint(double latitude, double longitude, double altitude, double m) {
	return GeometryFactory(SRID_WGS84).CreatePointZM(longitude, latitude, altitude, m);
}

Geometry GeometryFactory::CreateGeodeticPointM(double latitude, double longitude, double m) {
	return GeometryFactory(SRID_WGS84).CreatePointM(longitude, latitude, m);
}

//------------------------------------------------------------------------------
// Single part
//------------------------------------------------------------------------------
Geometry GeometryFactory::CreateLineString(vector<VertexXYZM> vertices, Dimension dimension) const {
	auto line = Create(GeometryType::LINESTRING, dimension);
	line.vertices = std::move(vertices);
	return line;
}

//------------------------------------------------------------------------------
// Multi part
//------------------------------------------------------------------------------
void GeometryFactory::CheckPart(GeometryType type, const Geometry &part, Dimension dimension) const {
	if (part.GetDimension() != dimension) {
		throw InvalidInputException("Can not add a %s %s to a %s %s", part.GetDimension().ToString(),
		                            part.GetTypeName(), dimension.ToString(), GeometryTypes::ToString(type));
	}
	if (part.HasSRID() != has_srid || (has_srid && part.GetSRID() != srid)) {
		throw InvalidInputException("Can not add a %s with SRID %d to a %s with SRID %d", part.GetTypeName(),
		                            part.HasSRID() ? part.GetSRID() : SRID_UNKNOWN, GeometryTypes::ToString(type),
		                            has_srid ? srid : SRID_UNKNOWN);
	}
}

// Number of collection levels in the tree, 0 for points, linestrings and polygons
uint32_t GeometryFactory::NestingDepth(const Geometry &geom) {
	if (!GeometryTypes::IsCollection(geom.GetType())) {
		return 0;
	}
	uint32_t depth = 0;
	for (auto &part : geom.parts) {
		depth = MaxValue(depth, NestingDepth(part));
	}
	return depth + 1;
}

Geometry GeometryFactory::CreatePolygon(vector<vector<VertexXYZM>> rings, Dimension dimension) const {
	auto polygon = Create(GeometryType::POLYGON, dimension);
	polygon.parts.reserve(rings.size());
	for (auto &ring : rings) {
		polygon.parts.push_back(CreateLineString(std::move(ring), dimension));
	}
	return polygon;
}

Geometry GeometryFactory::CreateCollection(GeometryType type, GeometryType part_type, vector<Geometry> items,
                                           Dimension dimension) const {
	auto collection = Create(type, dimension);
	for (auto &item : items) {
		if (type != GeometryType::GEOMETRYCOLLECTION && item.GetType() != part_type) {
			throw InvalidInputException("Can not add a %s to a %s", item.GetTypeName(), GeometryTypes::ToString(type));
		}
		CheckPart(type, item, dimension);
		if (NestingDepth(item) >= MAX_NESTING_DEPTH) {
			throw InvalidInputException("Can not nest a %s more than %d levels deep", GeometryTypes::ToString(type),
			                            MAX_NESTING_DEPTH);
		}
	}
	collection.parts = std::move(items);
	return collection;
}

Geometry GeometryFactory::CreateMultiPoint(vector<Geometry> points, Dimension dimension) const {
	return CreateCollection(GeometryType::MULTIPOINT, GeometryType::POINT, std::move(points), dimension);
}

Geometry GeometryFactory::CreateMultiLineString(vector<Geometry> lines, Dimension dimension) const {
	return CreateCollection(GeometryType::MULTILINESTRING, GeometryType::LINESTRING, std::move(lines), dimension);
}

Geometry GeometryFactory::CreateMultiPolygon(vector<Geometry> polygons, Dimension dimension) const {
	return CreateCollection(GeometryType::MULTIPOLYGON, GeometryType::POLYGON, std::move(polygons), dimension);
}

Geometry GeometryFactory::CreateGeometryCollection(vector<Geometry> items, Dimension dimension) const {
	return CreateCollection(GeometryType::GEOMETRYCOLLECTION, GeometryType::GEOMETRYCOLLECTION, std::move(items),
	                        dimension);
}

Geometry GeometryFactory::CreateEmpty(GeometryType type, Dimension dimension) const {
	if (type == GeometryType::POINT) {
		return CreateEmptyPoint(dimension);
	}
	return Create(type, dimension);
}

} // namespace core

} // namespace geosql
