#pragma once

#include "geosql/common.hpp"
#include "geosql/core/geometry/dimension.hpp"
#include "geosql/core/geometry/geometry_type.hpp"
#include "geosql/core/geometry/vertex.hpp"

namespace geosql {

namespace core {

class Geometry;
class GeometryFactory;

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
// A plain owned tree. Points hold exactly one vertex (NaN for the empty point), linestrings hold their vertices,
// and every other type holds its children in `parts`. Polygon rings are stored as LINESTRING parts.

class Geometry {
	friend class GeometryFactory;
	friend struct SinglePartGeometry;
	friend struct MultiPartGeometry;
	friend struct Point;

private:
	GeometryType type;
	Dimension dimension;
	bool has_srid;
	int32_t srid;
	vector<VertexXYZM> vertices;
	vector<Geometry> parts;

	Geometry(GeometryType type, Dimension dimension, bool has_srid, int32_t srid)
	    : type(type), dimension(dimension), has_srid(has_srid), srid(srid) {
	}

public:
	// By default, create an empty 2D point without SRID
	Geometry()
	    : type(GeometryType::POINT), dimension(Dimension::Type::D2), has_srid(false), srid(SRID_UNKNOWN),
	      vertices(1, VertexXYZM::Empty()) {
	}

public:
	GeometryType GetType() const {
		return type;
	}
	Dimension GetDimension() const {
		return dimension;
	}
	bool HasSRID() const {
		return has_srid;
	}
	// Only meaningful if HasSRID() is true
	int32_t GetSRID() const {
		return srid;
	}
	bool Is3D() const {
		return dimension.HasZDimension();
	}
	bool IsMeasured() const {
		return dimension.IsMeasured();
	}

	bool IsEmpty() const {
		if (type == GeometryType::POINT) {
			return vertices[0].IsNaN(dimension);
		}
		if (type == GeometryType::LINESTRING) {
			return vertices.empty();
		}
		return parts.empty();
	}

	bool IsCollection() const {
		return GeometryTypes::IsCollection(type);
	}
	bool IsMultiPart() const {
		return GeometryTypes::IsMultiPart(type);
	}
	bool IsSinglePart() const {
		return GeometryTypes::IsSinglePart(type);
	}

	string GetTypeName() const {
		return GeometryTypes::ToString(type);
	}

	// Structural equality. NaN components compare equal so empty points round-trip.
	bool operator==(const Geometry &other) const;
	bool operator!=(const Geometry &other) const {
		return !(*this == other);
	}

public:
	// Used for tag dispatching
	struct Tags {
		// Base types
		struct AnyGeometry {};
		struct SinglePartGeometry : public AnyGeometry {};
		struct MultiPartGeometry : public AnyGeometry {};
		struct CollectionGeometry : public MultiPartGeometry {};
		// Concrete types
		struct Point : public SinglePartGeometry {};
		struct LineString : public SinglePartGeometry {};
		struct Polygon : public MultiPartGeometry {};
		struct MultiPoint : public CollectionGeometry {};
		struct MultiLineString : public CollectionGeometry {};
		struct MultiPolygon : public CollectionGeometry {};
		struct GeometryCollection : public CollectionGeometry {};
	};

	template <class T, class... ARGS>
	static auto Match(Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<Geometry &>(), std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::GEOMETRYCOLLECTION:
			return T::Case(Tags::GeometryCollection {}, geom, std::forward<ARGS>(args)...);
		default:
			throw NotImplementedException("Geometry::Match");
		}
	}

	template <class T, class... ARGS>
	static auto Match(const Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<const Geometry &>(),
	                        std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::GEOMETRYCOLLECTION:
			return T::Case(Tags::GeometryCollection {}, geom, std::forward<ARGS>(args)...);
		default:
			throw NotImplementedException("Geometry::Match");
		}
	}
};

//------------------------------------------------------------------------------
// SinglePartGeometry
//------------------------------------------------------------------------------
struct SinglePartGeometry {
	static uint32_t VertexCount(const Geometry &geom) {
		D_ASSERT(geom.IsSinglePart());
		return static_cast<uint32_t>(geom.vertices.size());
	}
	static const VertexXYZM &GetVertex(const Geometry &geom, uint32_t index) {
		D_ASSERT(geom.IsSinglePart());
		D_ASSERT(index < geom.vertices.size());
		return geom.vertices[index];
	}
	static const vector<VertexXYZM> &Vertices(const Geometry &geom) {
		D_ASSERT(geom.IsSinglePart());
		return geom.vertices;
	}
};

//------------------------------------------------------------------------------
// MultiPartGeometry
//------------------------------------------------------------------------------
struct MultiPartGeometry {
	static uint32_t PartCount(const Geometry &geom) {
		D_ASSERT(geom.IsMultiPart());
		return static_cast<uint32_t>(geom.parts.size());
	}
	static const Geometry &Part(const Geometry &geom, uint32_t index) {
		D_ASSERT(geom.IsMultiPart());
		D_ASSERT(index < geom.parts.size());
		return geom.parts[index];
	}
	static const vector<Geometry> &Parts(const Geometry &geom) {
		D_ASSERT(geom.IsMultiPart());
		return geom.parts;
	}
};

struct CollectionGeometry : public MultiPartGeometry {};

//------------------------------------------------------------------------------
// Point
//------------------------------------------------------------------------------
struct Point : public SinglePartGeometry {
	static const VertexXYZM &GetVertex(const Geometry &geom) {
		D_ASSERT(geom.GetType() == TYPE);
		return geom.vertices[0];
	}

	static double GetX(const Geometry &geom) {
		return GetVertex(geom).x;
	}
	static double GetY(const Geometry &geom) {
		return GetVertex(geom).y;
	}
	// Throws if the point has no Z component
	static double GetZ(const Geometry &geom);
	// Throws if the point has no M component
	static double GetM(const Geometry &geom);

	// Setting x or y leaves the dimension untouched
	static void SetX(Geometry &geom, double x);
	static void SetY(Geometry &geom, double y);
	// Setting or clearing z/m re-derives the dimension
	static void SetZ(Geometry &geom, double z);
	static void SetM(Geometry &geom, double m);
	static void ClearZ(Geometry &geom);
	static void ClearM(Geometry &geom);

	// Geodetic accessors, only valid for SRID 4326, SRID 0 or no SRID
	static bool IsGeodetic(const Geometry &geom);
	static double GetLatitude(const Geometry &geom);
	static double GetLongitude(const Geometry &geom);
	static double GetAltitude(const Geometry &geom);
	static void SetLatitude(Geometry &geom, double latitude);
	static void SetLongitude(Geometry &geom, double longitude);
	static void SetAltitude(Geometry &geom, double altitude);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::POINT;

private:
	static void RederiveDimension(Geometry &geom, bool has_z, bool has_m);
	static void CheckGeodetic(const Geometry &geom);
};

//------------------------------------------------------------------------------
// LineString
//------------------------------------------------------------------------------
struct LineString : public SinglePartGeometry {
	static bool IsClosed(const Geometry &geom) {
		D_ASSERT(geom.GetType() == TYPE);
		auto count = VertexCount(geom);
		if (count == 0) {
			return false;
		}
		auto &first = GetVertex(geom, 0);
		auto &last = GetVertex(geom, count - 1);
		return first.Equals(last, geom.GetDimension());
	}

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::LINESTRING;
};

//------------------------------------------------------------------------------
// LinearRing (special case of LineString)
//------------------------------------------------------------------------------
struct LinearRing : public LineString {
	static bool IsClosed(const Geometry &geom) {
		// Unlike a linestring, an empty ring counts as closed
		if (LinearRing::VertexCount(geom) == 0) {
			return true;
		}
		return LineString::IsClosed(geom);
	}

	// Rings are stored as the LINESTRING parts of a polygon
	static const constexpr GeometryType TYPE = GeometryType::LINESTRING;
};

//------------------------------------------------------------------------------
// Polygon
//------------------------------------------------------------------------------
struct Polygon : public MultiPartGeometry {
	static const Geometry &ExteriorRing(const Geometry &geom) {
		D_ASSERT(geom.GetType() == TYPE);
		D_ASSERT(Polygon::PartCount(geom) > 0);
		return Polygon::Part(geom, 0);
	}

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::POLYGON;
};

//------------------------------------------------------------------------------
// MultiPoint
//------------------------------------------------------------------------------
struct MultiPoint : public CollectionGeometry {
	static const constexpr GeometryType TYPE = GeometryType::MULTIPOINT;
};

//------------------------------------------------------------------------------
// MultiLineString
//------------------------------------------------------------------------------
struct MultiLineString : public CollectionGeometry {
	static const constexpr GeometryType TYPE = GeometryType::MULTILINESTRING;
};

//------------------------------------------------------------------------------
// MultiPolygon
//------------------------------------------------------------------------------
struct MultiPolygon : public CollectionGeometry {
	static const constexpr GeometryType TYPE = GeometryType::MULTIPOLYGON;
};

//------------------------------------------------------------------------------
// GeometryCollection
//------------------------------------------------------------------------------
struct GeometryCollection : public CollectionGeometry {
	static const constexpr GeometryType TYPE = GeometryType::GEOMETRYCOLLECTION;
};

} // namespace core

} // namespace geosql
