#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/exception.hpp"

namespace geosql {

namespace core {

//------------------------------------------------------------------------------
// Equality
//------------------------------------------------------------------------------
bool Geometry::operator==(const Geometry &other) const {
	if (type != other.type || dimension != other.dimension || has_srid != other.has_srid) {
		return false;
	}
	if (has_srid && srid != other.srid) {
		return false;
	}
	if (vertices.size() != other.vertices.size() || parts.size() != other.parts.size()) {
		return false;
	}
	for (idx_t i = 0; i < vertices.size(); i++) {
		if (!vertices[i].Equals(other.vertices[i], dimension)) {
			return false;
		}
	}
	for (idx_t i = 0; i < parts.size(); i++) {
		if (parts[i] != other.parts[i]) {
			return false;
		}
	}
	return true;
}

//------------------------------------------------------------------------------
// Point
//------------------------------------------------------------------------------
double Point::GetZ(const Geometry &geom) {
	if (!geom.Is3D()) {
		throw InvalidInputException("Point has no Z component");
	}
	return GetVertex(geom).z;
}

double Point::GetM(const Geometry &geom) {
	if (!geom.IsMeasured()) {
		throw InvalidInputException("Point has no M component");
	}
	return GetVertex(geom).m;
}

void Point::SetX(Geometry &geom, double x) {
	D_ASSERT(geom.GetType() == TYPE);
	geom.vertices[0].x = x;
}

void Point::SetY(Geometry &geom, double y) {
	D_ASSERT(geom.GetType() == TYPE);
	geom.vertices[0].y = y;
}

void Point::SetZ(Geometry &geom, double z) {
	D_ASSERT(geom.GetType() == TYPE);
	geom.vertices[0].z = z;
	RederiveDimension(geom, true, geom.IsMeasured());
}

void Point::SetM(Geometry &geom, double m) {
	D_ASSERT(geom.GetType() == TYPE);
	geom.vertices[0].m = m;
	RederiveDimension(geom, geom.Is3D(), true);
}

void Point::ClearZ(Geometry &geom) {
	D_ASSERT(geom.GetType() == TYPE);
	geom.vertices[0].z = 0;
	RederiveDimension(geom, false, geom.IsMeasured());
}

void Point::ClearM(Geometry &geom) {
	D_ASSERT(geom.GetType() == TYPE);
	geom.vertices[0].m = 0;
	RederiveDimension(geom, geom.Is3D(), false);
}

void Point::RederiveDimension(Geometry &geom, bool has_z, bool has_m) {
	auto &vertex = geom.vertices[0];
	geom.dimension = Dimension::FromCoordinates(vertex.x, vertex.y, has_z ? &vertex.z : nullptr,
	                                            has_m ? &vertex.m : nullptr);
}

//------------------------------------------------------------------------------
// Point (geodetic)
//------------------------------------------------------------------------------
bool Point::IsGeodetic(const Geometry &geom) {
	return !geom.HasSRID() || geom.GetSRID() == SRID_WGS84 || geom.GetSRID() == SRID_UNKNOWN;
}

void Point::CheckGeodetic(const Geometry &geom) {
	if (!IsGeodetic(geom)) {
		throw GeodeticMismatchException(geom.GetSRID());
	}
}

double Point::GetLatitude(const Geometry &geom) {
	CheckGeodetic(geom);
	return GetY(geom);
}

double Point::GetLongitude(const Geometry &geom) {
	CheckGeodetic(geom);
	return GetX(geom);
}

double Point::GetAltitude(const Geometry &geom) {
	CheckGeodetic(geom);
	return GetZ(geom);
}

void Point::SetLatitude(Geometry &geom, double latitude) {
	CheckGeodetic(geom);
	SetY(geom, latitude);
}

void Point::SetLongitude(Geometry &geom, double longitude) {
	CheckGeodetic(geom);
	SetX(geom, longitude);
}

void Point::SetAltitude(Geometry &geom, double altitude) {
	CheckGeodetic(geom);
	SetZ(geom, altitude);
}

} // namespace core

} // namespace geosql
