#include "geosql/common.hpp"
#include "geosql/core/geometry/wkb_reader.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/exception.hpp"

namespace geosql {

namespace core {

// EWKB type word flags
static constexpr const uint32_t EWKB_Z_FLAG = 0x80000000;
static constexpr const uint32_t EWKB_M_FLAG = 0x40000000;
static constexpr const uint32_t EWKB_SRID_FLAG = 0x20000000;
static constexpr const uint32_t EWKB_UNUSED_BITS = 0x1FFF0000;

// <byte order> + <type> + <count or smallest point payload>
static constexpr const idx_t MIN_NESTED_WKB_SIZE = sizeof(uint8_t) + sizeof(uint32_t) + sizeof(uint32_t);

// Collections deeper than this are rejected
static constexpr const uint32_t MAX_NESTING_DEPTH = GeometryFactory::MAX_NESTING_DEPTH;

//------------------------------------------------------------------------------
// Entry points
//------------------------------------------------------------------------------
Geometry WKBReader::Deserialize(const string_t &wkb) const {
	return Deserialize(const_data_ptr_cast(wkb.GetData()), wkb.GetSize());
}

Geometry WKBReader::Deserialize(const_data_ptr_t wkb, idx_t size) const {
	Cursor cursor(wkb, wkb + size);

	auto little_endian = ReadByteOrder(cursor);
	auto type = ReadType(cursor, little_endian);

	// The root SRID (if any) is handed down to every part through the factory
	GeometryFactory factory;
	if (type.has_srid) {
		factory = GeometryFactory(static_cast<int32_t>(ReadInt(cursor, little_endian)));
	}

	auto geom = ReadBody(cursor, factory, little_endian, type, 0);
	if (cursor.Remaining() != 0) {
		throw MalformedWKBException("%llu trailing bytes after %s", cursor.Remaining(), geom.GetTypeName());
	}
	return geom;
}

Geometry WKBReader::DeserializeHex(const string &hex) const {
	return DeserializeHex(string_t(hex.c_str(), static_cast<uint32_t>(hex.size())));
}

Geometry WKBReader::DeserializeHex(const string_t &hex) const {
	auto size = hex.GetSize();
	auto data = hex.GetData();
	if (size % 2 != 0) {
		throw MalformedWKBException("hex input has odd length %llu", size);
	}
	vector<data_t> buffer(size / 2);
	for (idx_t i = 0; i < size; i += 2) {
		auto hi = Blob::HEX_MAP[static_cast<uint8_t>(data[i])];
		auto lo = Blob::HEX_MAP[static_cast<uint8_t>(data[i + 1])];
		if (hi < 0 || lo < 0) {
			throw MalformedWKBException("invalid hex character at offset %llu", hi < 0 ? i : i + 1);
		}
		buffer[i / 2] = static_cast<data_t>((hi << 4) | lo);
	}
	return Deserialize(buffer.data(), buffer.size());
}

//------------------------------------------------------------------------------
// Primitives
//------------------------------------------------------------------------------
bool WKBReader::ReadByteOrder(Cursor &cursor) {
	auto byte_order = cursor.Read<uint8_t>();
	if (byte_order > 1) {
		throw MalformedWKBException("invalid byte order %d at offset %llu", byte_order, cursor.Position() - 1);
	}
	return byte_order == 1;
}

uint32_t WKBReader::ReadInt(Cursor &cursor, bool little_endian) {
	if (little_endian) {
		return cursor.Read<uint32_t>();
	} else {
		return cursor.ReadBigEndian<uint32_t>();
	}
}

double WKBReader::ReadDouble(Cursor &cursor, bool little_endian) {
	if (little_endian) {
		return cursor.Read<double>();
	} else {
		return cursor.ReadBigEndian<double>();
	}
}

WKBReader::WKBType WKBReader::ReadType(Cursor &cursor, bool little_endian) {
	auto wkb_type = ReadInt(cursor, little_endian);

	// Check for ISO WKB Z and M codes
	uint32_t iso_wkb_props = (wkb_type & 0xffff) / 1000;
	GeometryType geometry_type;
	if (iso_wkb_props > 3 || (wkb_type & EWKB_UNUSED_BITS) != 0 ||
	    !GeometryTypes::TryFromWKBCode((wkb_type & 0xffff) % 1000, geometry_type)) {
		throw MalformedWKBException("unknown geometry type code %d", wkb_type);
	}
	bool has_z = (iso_wkb_props == 1) || (iso_wkb_props == 3);
	bool has_m = (iso_wkb_props == 2) || (iso_wkb_props == 3);

	// Check for EWKB Z and M flags
	has_z = has_z || ((wkb_type & EWKB_Z_FLAG) != 0);
	has_m = has_m || ((wkb_type & EWKB_M_FLAG) != 0);
	bool has_srid = (wkb_type & EWKB_SRID_FLAG) != 0;

	WKBType result;
	result.type = geometry_type;
	result.dimension = Dimension::FromFlags(has_z, has_m);
	result.has_srid = has_srid;
	return result;
}

uint32_t WKBReader::ReadCount(Cursor &cursor, bool little_endian, idx_t min_element_size, const char *what) {
	auto count = ReadInt(cursor, little_endian);
	// Never trust the count: each element needs at least min_element_size bytes
	if (count > cursor.Remaining() / min_element_size) {
		throw MalformedWKBException("%s count %d exceeds what the remaining %llu bytes can hold", what, count,
		                            cursor.Remaining());
	}
	return count;
}

VertexXYZM WKBReader::ReadVertex(Cursor &cursor, bool little_endian, Dimension dimension) {
	VertexXYZM vertex;
	vertex.x = ReadDouble(cursor, little_endian);
	vertex.y = ReadDouble(cursor, little_endian);
	if (dimension.HasZDimension()) {
		vertex.z = ReadDouble(cursor, little_endian);
	}
	if (dimension.IsMeasured()) {
		vertex.m = ReadDouble(cursor, little_endian);
	}
	return vertex;
}

vector<VertexXYZM> WKBReader::ReadVertices(Cursor &cursor, bool little_endian, Dimension dimension) {
	auto vertex_size = dimension.CoordinateCount() * sizeof(double);
	auto count = ReadCount(cursor, little_endian, vertex_size, "vertex");
	vector<VertexXYZM> vertices;
	vertices.reserve(count);
	for (uint32_t i = 0; i < count; i++) {
		vertices.push_back(ReadVertex(cursor, little_endian, dimension));
	}
	return vertices;
}

//------------------------------------------------------------------------------
// Geometries
//------------------------------------------------------------------------------
Geometry WKBReader::ReadPoint(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
                              Dimension dimension) const {
	auto vertex = ReadVertex(cursor, little_endian, dimension);
	if (vertex.IsNaN(dimension)) {
		return factory.CreateEmptyPoint(dimension);
	}
	return factory.CreatePoint(vertex, dimension);
}

Geometry WKBReader::ReadLineString(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
                                   Dimension dimension) const {
	return factory.CreateLineString(ReadVertices(cursor, little_endian, dimension), dimension);
}

Geometry WKBReader::ReadPolygon(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
                                Dimension dimension) const {
	auto ring_count = ReadCount(cursor, little_endian, sizeof(uint32_t), "ring");
	vector<vector<VertexXYZM>> rings;
	rings.reserve(ring_count);
	for (uint32_t i = 0; i < ring_count; i++) {
		rings.push_back(ReadVertices(cursor, little_endian, dimension));
	}
	auto polygon = factory.CreatePolygon(std::move(rings), dimension);

	if (options.strict_rings) {
		for (uint32_t i = 0; i < Polygon::PartCount(polygon); i++) {
			auto &ring = Polygon::Part(polygon, i);
			auto vertex_count = LinearRing::VertexCount(ring);
			if (vertex_count != 0 && vertex_count < 4) {
				throw MalformedWKBException("polygon ring %d has %d vertices, at least 4 are required", i,
				                            vertex_count);
			}
			if (!LinearRing::IsClosed(ring)) {
				throw MalformedWKBException("polygon ring %d is not closed", i);
			}
		}
	}
	return polygon;
}

Geometry WKBReader::ReadCollection(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
                                   GeometryType type, Dimension dimension, uint32_t depth) const {
	if (depth >= MAX_NESTING_DEPTH) {
		throw MalformedWKBException("%s nesting exceeds %d levels at offset %llu", GeometryTypes::ToString(type),
		                            MAX_NESTING_DEPTH, cursor.Position());
	}
	auto count = ReadCount(cursor, little_endian, MIN_NESTED_WKB_SIZE, "part");
	vector<Geometry> parts;
	parts.reserve(count);
	for (uint32_t i = 0; i < count; i++) {
		parts.push_back(ReadNested(cursor, factory, type, dimension, depth + 1));
	}
	switch (type) {
	case GeometryType::MULTIPOINT:
		return factory.CreateMultiPoint(std::move(parts), dimension);
	case GeometryType::MULTILINESTRING:
		return factory.CreateMultiLineString(std::move(parts), dimension);
	case GeometryType::MULTIPOLYGON:
		return factory.CreateMultiPolygon(std::move(parts), dimension);
	case GeometryType::GEOMETRYCOLLECTION:
		return factory.CreateGeometryCollection(std::move(parts), dimension);
	default:
		throw InternalException("WKBReader::ReadCollection called with %s", GeometryTypes::ToString(type));
	}
}

Geometry WKBReader::ReadNested(Cursor &cursor, const GeometryFactory &factory, GeometryType parent_type,
                               Dimension parent_dimension, uint32_t depth) const {
	auto little_endian = ReadByteOrder(cursor);
	auto type = ReadType(cursor, little_endian);

	// PostGIS never writes nested SRIDs, but tolerate one that agrees with the root
	if (type.has_srid) {
		auto nested_srid = static_cast<int32_t>(ReadInt(cursor, little_endian));
		if (!factory.HasSRID()) {
			throw MalformedWKBException("nested %s declares SRID %d but the outer geometry has no SRID",
			                            GeometryTypes::ToString(type.type), nested_srid);
		}
		if (nested_srid != factory.GetSRID()) {
			throw MalformedWKBException("nested %s declares SRID %d but the outer SRID is %d",
			                            GeometryTypes::ToString(type.type), nested_srid, factory.GetSRID());
		}
	}

	if (type.dimension != parent_dimension) {
		throw MalformedWKBException("%s %s can not be part of a %s %s", type.dimension.ToString(),
		                            GeometryTypes::ToString(type.type), parent_dimension.ToString(),
		                            GeometryTypes::ToString(parent_type));
	}

	GeometryType expected_type = type.type;
	switch (parent_type) {
	case GeometryType::MULTIPOINT:
		expected_type = GeometryType::POINT;
		break;
	case GeometryType::MULTILINESTRING:
		expected_type = GeometryType::LINESTRING;
		break;
	case GeometryType::MULTIPOLYGON:
		expected_type = GeometryType::POLYGON;
		break;
	default:
		break;
	}
	if (type.type != expected_type) {
		throw MalformedWKBException("expected %s inside %s, found %s", GeometryTypes::ToString(expected_type),
		                            GeometryTypes::ToString(parent_type), GeometryTypes::ToString(type.type));
	}

	return ReadBody(cursor, factory, little_endian, type, depth);
}

Geometry WKBReader::ReadBody(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
                             const WKBType &type, uint32_t depth) const {
	switch (type.type) {
	case GeometryType::POINT:
		return ReadPoint(cursor, factory, little_endian, type.dimension);
	case GeometryType::LINESTRING:
		return ReadLineString(cursor, factory, little_endian, type.dimension);
	case GeometryType::POLYGON:
		return ReadPolygon(cursor, factory, little_endian, type.dimension);
	case GeometryType::MULTIPOINT:
	case GeometryType::MULTILINESTRING:
	case GeometryType::MULTIPOLYGON:
	case GeometryType::GEOMETRYCOLLECTION:
		return ReadCollection(cursor, factory, little_endian, type.type, type.dimension, depth);
	default:
		throw MalformedWKBException("unknown geometry type %s", GeometryTypes::ToString(type.type));
	}
}

} // namespace core

} // namespace geosql
