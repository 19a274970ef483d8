#include <catch2/catch.hpp>

#include "geosql/core/exception.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/geometry/geometry_factory.hpp"

using namespace geosql;
using namespace geosql::core;

TEST_CASE("Point accessors", "[geometry]") {
	GeometryFactory factory(4326);
	auto point = factory.CreatePointZM(1, 2, 3, 4);

	REQUIRE(point.GetType() == GeometryType::POINT);
	REQUIRE(point.HasSRID());
	REQUIRE(point.GetSRID() == 4326);
	REQUIRE(point.Is3D());
	REQUIRE(point.IsMeasured());
	REQUIRE_FALSE(point.IsEmpty());
	REQUIRE(Point::GetX(point) == 1);
	REQUIRE(Point::GetY(point) == 2);
	REQUIRE(Point::GetZ(point) == 3);
	REQUIRE(Point::GetM(point) == 4);
}

TEST_CASE("Point without Z or M refuses to read them", "[geometry]") {
	GeometryFactory factory;
	auto point = factory.CreatePoint(1, 2);
	REQUIRE_FALSE(point.HasSRID());
	REQUIRE_THROWS_AS(Point::GetZ(point), InvalidInputException);
	REQUIRE_THROWS_AS(Point::GetM(point), InvalidInputException);
}

TEST_CASE("Point setters re-derive the dimension", "[geometry]") {
	GeometryFactory factory;
	auto point = factory.CreatePoint(1, 2);
	REQUIRE(point.GetDimension() == Dimension::Type::D2);

	Point::SetZ(point, 5);
	REQUIRE(point.GetDimension() == Dimension::Type::Z);
	REQUIRE(Point::GetZ(point) == 5);

	Point::SetM(point, 6);
	REQUIRE(point.GetDimension() == Dimension::Type::ZM);

	Point::ClearZ(point);
	REQUIRE(point.GetDimension() == Dimension::Type::M);
	REQUIRE(Point::GetM(point) == 6);

	Point::ClearM(point);
	REQUIRE(point.GetDimension() == Dimension::Type::D2);

	// x and y do not affect the dimension
	Point::SetX(point, 10);
	Point::SetY(point, 20);
	REQUIRE(point.GetDimension() == Dimension::Type::D2);
	REQUIRE(Point::GetX(point) == 10);
	REQUIRE(Point::GetY(point) == 20);
}

TEST_CASE("Geodetic accessors", "[geometry]") {
	auto point = GeometryFactory::CreateGeodeticPoint(48.7, 9.1);
	REQUIRE(point.GetSRID() == SRID_WGS84);
	REQUIRE(Point::GetX(point) == 9.1);
	REQUIRE(Point::GetY(point) == 48.7);
	REQUIRE(Point::GetLatitude(point) == 48.7);
	REQUIRE(Point::GetLongitude(point) == 9.1);

	Point::SetLatitude(point, 50);
	Point::SetLongitude(point, 8);
	Point::SetAltitude(point, 250);
	REQUIRE(Point::GetY(point) == 50);
	REQUIRE(Point::GetX(point) == 8);
	REQUIRE(Point::GetAltitude(point) == 250);
	REQUIRE(point.Is3D());

	auto with_altitude = GeometryFactory::CreateGeodeticPoint(1, 2, 3);
	REQUIRE(Point::GetAltitude(with_altitude) == 3);

	// SRID 0 and no SRID are accepted too
	auto unknown = GeometryFactory(SRID_UNKNOWN).CreatePoint(1, 2);
	REQUIRE(Point::GetLatitude(unknown) == 2);
	auto none = GeometryFactory().CreatePoint(1, 2);
	REQUIRE(Point::GetLongitude(none) == 1);
}

TEST_CASE("Geodetic accessors reject projected points", "[geometry]") {
	auto point = GeometryFactory(3857).CreatePoint(1000, 2000);
	REQUIRE_FALSE(Point::IsGeodetic(point));
	REQUIRE_THROWS_AS(Point::GetLatitude(point), GeodeticMismatchException);
	REQUIRE_THROWS_AS(Point::SetLongitude(point, 1), GeodeticMismatchException);
	try {
		Point::GetLongitude(point);
		FAIL("expected GeodeticMismatchException");
	} catch (GeodeticMismatchException &ex) {
		REQUIRE(ex.GetSRID() == 3857);
	}
}

TEST_CASE("Empty geometries", "[geometry]") {
	GeometryFactory factory;
	Geometry default_point;
	REQUIRE(default_point.GetType() == GeometryType::POINT);
	REQUIRE(default_point.IsEmpty());

	REQUIRE(factory.CreateEmptyPoint(Dimension::Type::Z).IsEmpty());
	REQUIRE(factory.CreateEmpty(GeometryType::LINESTRING, Dimension()).IsEmpty());
	REQUIRE(factory.CreateEmpty(GeometryType::POLYGON, Dimension()).IsEmpty());
	REQUIRE(factory.CreateEmpty(GeometryType::GEOMETRYCOLLECTION, Dimension()).IsEmpty());

	// A point with only some NaN components is not empty
	auto nan = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_FALSE(factory.CreatePoint(nan, 1).IsEmpty());
}

TEST_CASE("Geometry equality treats NaN as equal", "[geometry]") {
	GeometryFactory factory(4326);
	REQUIRE(factory.CreateEmptyPoint() == factory.CreateEmptyPoint());
	REQUIRE(factory.CreatePoint(1, 2) == factory.CreatePoint(1, 2));
	REQUIRE(factory.CreatePoint(1, 2) != factory.CreatePoint(2, 1));
	REQUIRE(factory.CreatePoint(1, 2) != GeometryFactory(3857).CreatePoint(1, 2));
	REQUIRE(factory.CreatePoint(1, 2) != GeometryFactory().CreatePoint(1, 2));
	REQUIRE(factory.CreatePoint(1, 2) != factory.CreatePointZ(1, 2, 0));
}

TEST_CASE("Ring closure", "[geometry]") {
	GeometryFactory factory;
	auto closed = factory.CreateLineString({{0, 0}, {1, 0}, {1, 1}, {0, 0}}, Dimension());
	auto open = factory.CreateLineString({{0, 0}, {1, 0}, {1, 1}}, Dimension());
	auto empty = factory.CreateLineString({}, Dimension());

	REQUIRE(LineString::IsClosed(closed));
	REQUIRE_FALSE(LineString::IsClosed(open));
	REQUIRE_FALSE(LineString::IsClosed(empty));
	REQUIRE(LinearRing::IsClosed(empty));
}

TEST_CASE("Empty point keeps the requested dimension", "[geometry]") {
	auto empty = GeometryFactory().CreateEmptyPoint(Dimension::Type::Z);
	REQUIRE(empty.IsEmpty());
	REQUIRE(empty.Is3D());
	REQUIRE_FALSE(empty.IsMeasured());
	REQUIRE(std::isnan(Point::GetX(empty)));
	REQUIRE(std::isnan(Point::GetY(empty)));
	REQUIRE(std::isnan(Point::GetZ(empty)));
}

TEST_CASE("Geodetic point stores latitude as y", "[geometry]") {
	auto berlin = GeometryFactory::CreateGeodeticPoint(52.5, 13.4);
	REQUIRE(Point::GetLatitude(berlin) == 52.5);
	REQUIRE(Point::GetLongitude(berlin) == 13.4);
	REQUIRE(Point::GetY(berlin) == 52.5);
	REQUIRE_FALSE(berlin.Is3D());
}

TEST_CASE("Geodetic point with altitude and measure", "[geometry]") {
	auto point = GeometryFactory::CreateGeodeticPoint(52.5, 13.4, 34, 1.5);
	REQUIRE(point.GetSRID() == SRID_WGS84);
	REQUIRE(point.GetDimension() == Dimension::Type::ZM);
	REQUIRE(Point::GetLatitude(point) == 52.5);
	REQUIRE(Point::GetLongitude(point) == 13.4);
	REQUIRE(Point::GetAltitude(point) == 34);
	REQUIRE(Point::GetM(point) == 1.5);

	auto measured = GeometryFactory::CreateGeodeticPointM(52.5, 13.4, 1.5);
	REQUIRE(measured.GetDimension() == Dimension::Type::M);
	REQUIRE(Point::GetX(measured) == 13.4);
	REQUIRE(Point::GetM(measured) == 1.5);
	REQUIRE_FALSE(measured.Is3D());
}
