#include <catch2/catch.hpp>

#include "geosql/core/exception.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/geometry/geometry_factory.hpp"
#include "geosql/core/geometry/wkb_reader.hpp"

using namespace geosql;
using namespace geosql::core;

static Geometry ReadHex(const string &hex) {
	WKBReader reader;
	return reader.DeserializeHex(hex);
}

static Geometry ReadHexStrict(const string &hex) {
	WKBReaderOptions options;
	options.strict_rings = true;
	WKBReader reader(options);
	return reader.DeserializeHex(hex);
}

TEST_CASE("Read a point with SRID", "[wkb_reader]") {
	// POINT(9.1 48.7) in WGS84, as PostGIS returns it
	const data_t bytes[] = {0x01, 0x01, 0x00, 0x00, 0x20, 0xE6, 0x10, 0x00, 0x00, 0x33, 0x33, 0x33, 0x33, 0x33,
	                        0x33, 0x22, 0x40, 0x9A, 0x99, 0x99, 0x99, 0x99, 0x59, 0x48, 0x40};
	WKBReader reader;
	auto point = reader.Deserialize(bytes, sizeof(bytes));

	REQUIRE(point.GetType() == GeometryType::POINT);
	REQUIRE(point.GetDimension() == Dimension::Type::D2);
	REQUIRE(point.HasSRID());
	REQUIRE(point.GetSRID() == 4326);
	REQUIRE(Point::GetX(point) == 9.1);
	REQUIRE(Point::GetY(point) == 48.7);
}

TEST_CASE("Read a big endian point", "[wkb_reader]") {
	auto point = ReadHex("0020000001000010E63FF00000000000004000000000000000");
	REQUIRE(point.GetSRID() == 4326);
	REQUIRE(Point::GetX(point) == 1);
	REQUIRE(Point::GetY(point) == 2);
}

TEST_CASE("Read Z and M from EWKB flags and ISO codes", "[wkb_reader]") {
	auto zm = ReadHex("01010000C0000000000000F03F000000000000004000000000000008400000000000001040");
	REQUIRE(zm.GetDimension() == Dimension::Type::ZM);
	REQUIRE_FALSE(zm.HasSRID());
	REQUIRE(Point::GetZ(zm) == 3);
	REQUIRE(Point::GetM(zm) == 4);

	auto iso_z = ReadHex("01E9030000000000000000F03F00000000000000400000000000000840");
	REQUIRE(iso_z.GetDimension() == Dimension::Type::Z);
	REQUIRE(Point::GetZ(iso_z) == 3);

	auto m = ReadHex("0101000060E6100000000000000000F03F00000000000000400000000000001040");
	REQUIRE(m.GetDimension() == Dimension::Type::M);
	REQUIRE(m.GetSRID() == 4326);
	REQUIRE(Point::GetM(m) == 4);
}

TEST_CASE("Read an empty point", "[wkb_reader]") {
	auto point = ReadHex("0101000000000000000000F87F000000000000F87F");
	REQUIRE(point.IsEmpty());
	REQUIRE(point == GeometryFactory().CreateEmptyPoint());
}

TEST_CASE("Read composites", "[wkb_reader]") {
	SECTION("linestring") {
		auto line = ReadHex("01020000000200000000000000000000000000000000000000000000000000F03F000000000000F03F");
		REQUIRE(line.GetType() == GeometryType::LINESTRING);
		REQUIRE(LineString::VertexCount(line) == 2);
		REQUIRE(LineString::GetVertex(line, 1).x == 1);
	}
	SECTION("polygon") {
		auto polygon = ReadHex("0103000020110F0000010000000400000000000000000000000000000000000000000000000000F03F0000000"
		                       "000000000000000000000F03F000000000000F03F00000000000000000000000000000000");
		REQUIRE(polygon.GetType() == GeometryType::POLYGON);
		REQUIRE(polygon.GetSRID() == 3857);
		REQUIRE(Polygon::PartCount(polygon) == 1);
		auto &ring = Polygon::ExteriorRing(polygon);
		REQUIRE(LinearRing::VertexCount(ring) == 4);
		REQUIRE(LinearRing::IsClosed(ring));
		REQUIRE(ring.GetSRID() == 3857);
	}
	SECTION("multipoint") {
		auto multi = ReadHex("0104000020E6100000020000000101000000000000000000F03F000000000000004001010000000000000000"
		                     "000008400000000000001040");
		REQUIRE(multi.GetType() == GeometryType::MULTIPOINT);
		REQUIRE(MultiPoint::PartCount(multi) == 2);
		auto &second = MultiPoint::Part(multi, 1);
		REQUIRE(second.GetSRID() == 4326);
		REQUIRE(Point::GetX(second) == 3);
		REQUIRE(Point::GetY(second) == 4);
	}
	SECTION("geometrycollection") {
		auto collection = ReadHex("0107000020E6100000020000000101000000000000000000F03F00000000000000400102000000020000"
		                          "0000000000000000000000000000000000000000000000F03F000000000000F03F");
		REQUIRE(collection.GetType() == GeometryType::GEOMETRYCOLLECTION);
		REQUIRE(GeometryCollection::PartCount(collection) == 2);
		REQUIRE(GeometryCollection::Part(collection, 0).GetType() == GeometryType::POINT);
		REQUIRE(GeometryCollection::Part(collection, 1).GetType() == GeometryType::LINESTRING);
	}
	SECTION("multilinestring") {
		auto multi = ReadHex("01050000000200000001020000000200000000000000000000000000000000000000000000000000F03F000000000000"
		                     "F03F01020000000300000000000000000000400000000000000040000000000000084000000000000008400000000000"
		                     "0010400000000000001040");
		REQUIRE(multi.GetType() == GeometryType::MULTILINESTRING);
		REQUIRE(MultiLineString::PartCount(multi) == 2);
		auto &second = MultiLineString::Part(multi, 1);
		REQUIRE(LineString::VertexCount(second) == 3);
		REQUIRE(LineString::GetVertex(second, 2).y == 4);
	}
	SECTION("multipolygon") {
		auto multi = ReadHex("0106000000020000000103000000010000000400000000000000000000000000000000000000000000000000F03F0000"
		                     "000000000000000000000000F03F000000000000F03F0000000000000000000000000000000001030000000100000004"
		                     "000000000000000000004000000000000000400000000000000840000000000000004000000000000008400000000000"
		                     "00084000000000000000400000000000000040");
		REQUIRE(multi.GetType() == GeometryType::MULTIPOLYGON);
		REQUIRE(MultiPolygon::PartCount(multi) == 2);
		auto &ring = Polygon::ExteriorRing(MultiPolygon::Part(multi, 1));
		REQUIRE(LinearRing::VertexCount(ring) == 4);
		REQUIRE(LinearRing::IsClosed(ring));
		REQUIRE(LinearRing::GetVertex(ring, 1).x == 3);
	}
	SECTION("nested geometrycollection") {
		auto collection = ReadHex("0107000000020000000101000000000000000000F03F0000000000000040010700000001000000010200000002000000"
		                          "00000000000000000000000000000000000000000000F03F000000000000F03F");
		REQUIRE(GeometryCollection::PartCount(collection) == 2);
		auto &inner = GeometryCollection::Part(collection, 1);
		REQUIRE(inner.GetType() == GeometryType::GEOMETRYCOLLECTION);
		REQUIRE(GeometryCollection::PartCount(inner) == 1);
		REQUIRE(GeometryCollection::Part(inner, 0).GetType() == GeometryType::LINESTRING);
	}
	SECTION("empty collection") {
		auto collection = ReadHex("010700000000000000");
		REQUIRE(collection.IsEmpty());
	}
}

TEST_CASE("Nested SRID must agree with the root", "[wkb_reader]") {
	auto same = ReadHex("0104000020E6100000010000000101000020E6100000000000000000F03F0000000000000040");
	REQUIRE(MultiPoint::Part(same, 0).GetSRID() == 4326);

	REQUIRE_THROWS_AS(ReadHex("0104000020E6100000010000000101000020110F0000000000000000F03F0000000000000040"),
	                  MalformedWKBException);
	REQUIRE_THROWS_AS(ReadHex("0104000000010000000101000020E6100000000000000000F03F0000000000000040"),
	                  MalformedWKBException);
}

TEST_CASE("Nested parts carry their own byte order", "[wkb_reader]") {
	// big endian point inside a little endian multipoint
	auto mixed = ReadHex("01040000000100000000000000013FF00000000000004000000000000000");
	REQUIRE(MultiPoint::PartCount(mixed) == 1);
	REQUIRE(Point::GetX(MultiPoint::Part(mixed, 0)) == 1);
	REQUIRE(Point::GetY(MultiPoint::Part(mixed, 0)) == 2);

	// and the other way around
	auto reversed = ReadHex("0000000004000000010101000000000000000000F03F0000000000000040");
	REQUIRE(reversed == mixed);
}

TEST_CASE("Nested parts must match the parent", "[wkb_reader]") {
	// XYZ point inside an XY multipoint
	REQUIRE_THROWS_AS(ReadHex("0104000000010000000101000080000000000000F03F00000000000000400000000000000840"),
	                  MalformedWKBException);
	// linestring inside a multipoint
	REQUIRE_THROWS_AS(ReadHex("01040000000100000001020000000200000000000000000000000000000000000000000000000000F03F00"
	                          "0000000000F03F"),
	                  MalformedWKBException);
}

TEST_CASE("Malformed input", "[wkb_reader]") {
	SECTION("truncated") {
		REQUIRE_THROWS_WITH(ReadHex("0101000020E6100000000000000000F03F000000000000"),
		                    Catch::Contains("unexpected end of buffer"));
	}
	SECTION("truncated inside a composite") {
		const string multi = "0104000020E6100000020000000101000000000000000000F03F000000000000004001010000000000"
		                     "00000000000840000000000000";
		REQUIRE_THROWS_WITH(ReadHex(multi), Catch::Contains("unexpected end of buffer"));
	}
	SECTION("empty") {
		REQUIRE_THROWS_AS(ReadHex(""), MalformedWKBException);
	}
	SECTION("corrupt count") {
		REQUIRE_THROWS_WITH(ReadHex("0102000000FFFFFF7F"), Catch::Contains("exceeds what the remaining"));
	}
	SECTION("trailing bytes") {
		REQUIRE_THROWS_WITH(ReadHex("0101000000000000000000F03F000000000000004000"),
		                    Catch::Contains("trailing bytes"));
	}
	SECTION("unknown type") {
		REQUIRE_THROWS_WITH(ReadHex("0108000000000000000000F03F0000000000000040"),
		                    Catch::Contains("unknown geometry type code"));
	}
	SECTION("invalid byte order") {
		REQUIRE_THROWS_WITH(ReadHex("0201000000000000000000F03F0000000000000040"),
		                    Catch::Contains("invalid byte order"));
	}
	SECTION("invalid hex") {
		REQUIRE_THROWS_AS(ReadHex("0101000"), MalformedWKBException);
		REQUIRE_THROWS_AS(ReadHex("0Z01000000000000000000F03F0000000000000040"), MalformedWKBException);
	}
}

TEST_CASE("Hex input is case insensitive", "[wkb_reader]") {
	auto upper = ReadHex("0101000020E6100000000000000000F03F0000000000000040");
	auto lower = ReadHex("0101000020e6100000000000000000f03f0000000000000040");
	REQUIRE(upper == lower);
}

TEST_CASE("Strict ring validation", "[wkb_reader]") {
	const string open_ring = "0103000000010000000400000000000000000000000000000000000000000000000000F03F00000000000000"
	                         "00000000000000F03F000000000000F03F0000000000000000000000000000F03F";
	const string short_ring = "0103000000010000000300000000000000000000000000000000000000000000000000F03F000000000000"
	                          "000000000000000000000000000000000000";

	// Accepted unless strict ring checks are enabled
	REQUIRE_NOTHROW(ReadHex(open_ring));
	REQUIRE_NOTHROW(ReadHex(short_ring));

	REQUIRE_THROWS_WITH(ReadHexStrict(open_ring), Catch::Contains("is not closed"));
	REQUIRE_THROWS_WITH(ReadHexStrict(short_ring), Catch::Contains("at least 4 are required"));
}

// Each level is a GEOMETRYCOLLECTION holding the next one, the innermost is empty
static vector<data_t> NestedCollections(idx_t levels) {
	const data_t level[] = {0x01, 0x07, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00};
	const data_t innermost[] = {0x01, 0x07, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
	vector<data_t> buffer;
	buffer.reserve((levels + 1) * sizeof(level));
	for (idx_t i = 0; i < levels; i++) {
		buffer.insert(buffer.end(), level, level + sizeof(level));
	}
	buffer.insert(buffer.end(), innermost, innermost + sizeof(innermost));
	return buffer;
}

TEST_CASE("Collection nesting is bounded", "[wkb_reader]") {
	WKBReader reader;

	auto deep = NestedCollections(100000);
	REQUIRE_THROWS_AS(reader.Deserialize(deep.data(), deep.size()), MalformedWKBException);
	REQUIRE_THROWS_WITH(reader.Deserialize(deep.data(), deep.size()), Catch::Contains("nesting exceeds 256 levels"));

	// The root plus 255 enclosed collections is the deepest accepted tree
	auto limit = NestedCollections(GeometryFactory::MAX_NESTING_DEPTH - 1);
	auto geom = reader.Deserialize(limit.data(), limit.size());
	REQUIRE(geom.GetType() == GeometryType::GEOMETRYCOLLECTION);
	REQUIRE(GeometryCollection::PartCount(geom) == 1);

	auto over = NestedCollections(GeometryFactory::MAX_NESTING_DEPTH);
	REQUIRE_THROWS_WITH(reader.Deserialize(over.data(), over.size()), Catch::Contains("nesting exceeds"));
}
