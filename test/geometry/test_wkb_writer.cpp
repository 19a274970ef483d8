#include <catch2/catch.hpp>

#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/geometry/geometry_factory.hpp"
#include "geosql/core/geometry/wkb_reader.hpp"
#include "geosql/core/geometry/wkb_writer.hpp"

using namespace geosql;
using namespace geosql::core;

static void RequireHexRoundTrip(const string &hex) {
	WKBReader reader;
	auto geom = reader.DeserializeHex(hex);
	REQUIRE(WKBWriter::WriteHex(geom) == hex);
}

TEST_CASE("Re-encoding little endian EWKB is byte identical", "[wkb_writer]") {
	// point with SRID
	RequireHexRoundTrip("0101000020E6100000000000000000F03F0000000000000040");
	// POINT(9.1 48.7) in WGS84, coordinates that are not exactly representable
	RequireHexRoundTrip("0101000020E610000033333333333322409A99999999594840");
	// XYZM point without SRID
	RequireHexRoundTrip("01010000C0000000000000F03F000000000000004000000000000008400000000000001040");
	// empty point
	RequireHexRoundTrip("0101000000000000000000F87F000000000000F87F");
	// polygon in SRID 3857
	RequireHexRoundTrip("0103000020110F0000010000000400000000000000000000000000000000000000000000000000F03F00000000"
	                    "00000000000000000000F03F000000000000F03F00000000000000000000000000000000");
	// multipoint, the SRID is only written on the root
	RequireHexRoundTrip("0104000020E6100000020000000101000000000000000000F03F000000000000004001010000000000000000"
	                    "000008400000000000001040");
	// empty collection
	RequireHexRoundTrip("010700000000000000");
}

TEST_CASE("Big endian and ISO input is written as little endian EWKB", "[wkb_writer]") {
	WKBReader reader;
	auto big_endian = reader.DeserializeHex(string("0020000001000010E63FF00000000000004000000000000000"));
	REQUIRE(WKBWriter::WriteHex(big_endian) == "0101000020E6100000000000000000F03F0000000000000040");

	auto iso = reader.DeserializeHex(string("01E9030000000000000000F03F00000000000000400000000000000840"));
	REQUIRE(WKBWriter::WriteHex(iso) == "0101000080000000000000F03F00000000000000400000000000000840");

	// a big endian part inside a little endian multipoint
	auto mixed = reader.DeserializeHex(string("01040000000100000000000000013FF00000000000004000000000000000"));
	REQUIRE(WKBWriter::WriteHex(mixed) == "0104000000010000000101000000000000000000F03F0000000000000040");
}

TEST_CASE("Write big endian", "[wkb_writer]") {
	auto point = GeometryFactory(4326).CreatePoint(1, 2);
	WKBWriterOptions options;
	options.byte_order = WKBByteOrder::XDR;
	REQUIRE(WKBWriter::WriteHex(point, options) == "0020000001000010E63FF00000000000004000000000000000");
}

TEST_CASE("SRID options", "[wkb_writer]") {
	auto point = GeometryFactory(4326).CreatePoint(1, 2);

	WKBWriterOptions without_srid;
	without_srid.include_srid = false;
	REQUIRE(WKBWriter::WriteHex(point, without_srid) == "0101000000000000000000F03F0000000000000040");

	// An override also applies to a geometry without SRID
	WKBWriterOptions override_srid;
	override_srid.override_srid = true;
	override_srid.srid = 3857;
	REQUIRE(WKBWriter::WriteHex(point, override_srid) == "0101000020110F0000000000000000F03F0000000000000040");
	auto plain = GeometryFactory().CreatePoint(1, 2);
	REQUIRE(WKBWriter::WriteHex(plain, override_srid) == "0101000020110F0000000000000000F03F0000000000000040");
}

TEST_CASE("Decode of encode preserves the geometry", "[wkb_writer]") {
	GeometryFactory factory(31467);
	auto dimension = Dimension::FromFlags(true, true);
	auto line = factory.CreateLineString({{0, 0, 1, 2}, {1, 1, 3, 4}}, dimension);
	auto polygon = factory.CreatePolygon({{{0, 0, 0, 0}, {4, 0, 0, 0}, {4, 4, 0, 0}, {0, 0, 0, 0}},
	                                      {{1, 1, 0, 0}, {2, 1, 0, 0}, {2, 2, 0, 0}, {1, 1, 0, 0}}},
	                                     dimension);
	auto collection = factory.CreateGeometryCollection(
	    {factory.CreatePointZM(1, 2, 3, 4), line, polygon,
	     factory.CreateMultiLineString({line, line}, dimension), factory.CreateEmptyPoint(dimension)},
	    dimension);

	vector<data_t> buffer;
	WKBWriter::Write(collection, buffer);
	REQUIRE(buffer.size() == WKBWriter::GetRequiredSize(collection));

	WKBReader reader;
	auto decoded = reader.Deserialize(buffer.data(), buffer.size());
	REQUIRE(decoded == collection);
}
