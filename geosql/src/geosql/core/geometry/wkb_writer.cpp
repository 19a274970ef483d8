#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/geometry/wkb_writer.hpp"
#include "geosql/core/geometry/cursor.hpp"

namespace geosql {

namespace core {

static constexpr const uint32_t EWKB_Z_FLAG = 0x80000000;
static constexpr const uint32_t EWKB_M_FLAG = 0x40000000;
static constexpr const uint32_t EWKB_SRID_FLAG = 0x20000000;

//------------------------------------------------------------------------------
// Size Calculator
//------------------------------------------------------------------------------
struct WKBSizeCalculator {
	static uint32_t VertexSize(const Geometry &geom) {
		return sizeof(double) * geom.GetDimension().CoordinateCount();
	}

	static uint32_t Case(Geometry::Tags::Point, const Geometry &geom) {
		// <byte order> + <type> + <x> + <y> (+ <z> + <m>)
		// WKB Points always write points even if empty
		return sizeof(uint8_t) + sizeof(uint32_t) + VertexSize(geom);
	}

	static uint32_t Case(Geometry::Tags::LineString, const Geometry &geom) {
		// <byte order> + <type> + <count> + <points>
		return sizeof(uint8_t) + sizeof(uint32_t) + sizeof(uint32_t) +
		       LineString::VertexCount(geom) * VertexSize(geom);
	}

	static uint32_t Case(Geometry::Tags::Polygon, const Geometry &geom) {
		// <byte order> + <type> + <ring_count> + <rings>
		uint32_t size = sizeof(uint8_t) + sizeof(uint32_t) + sizeof(uint32_t);
		for (auto &ring : Polygon::Parts(geom)) {
			// <count> + <points>
			size += sizeof(uint32_t) + LinearRing::VertexCount(ring) * VertexSize(ring);
		}
		return size;
	}

	static uint32_t Case(Geometry::Tags::CollectionGeometry, const Geometry &geom) {
		// <byte order> + <type> + <geometry_count>
		uint32_t size = sizeof(uint8_t) + sizeof(uint32_t) + sizeof(uint32_t);
		for (auto &part : CollectionGeometry::Parts(geom)) {
			// + <geometry>
			size += Geometry::Match<WKBSizeCalculator>(part);
		}
		return size;
	}

	static uint32_t Execute(const Geometry &geom, const WKBWriterOptions &options) {
		auto size = Geometry::Match<WKBSizeCalculator>(geom);
		if (options.WritesSRID(geom)) {
			// <srid>
			size += sizeof(int32_t);
		}
		return size;
	}
};

//------------------------------------------------------------------------------
// Serializer
//------------------------------------------------------------------------------
class WKBSerializer {
private:
	WriteCursor &cursor;
	bool little_endian;

	template <class T>
	void Write(T value) {
		if (little_endian) {
			cursor.Write<T>(value);
		} else {
			cursor.WriteBigEndian<T>(value);
		}
	}

	void WriteHeader(const Geometry &geom, bool write_srid, int32_t srid) {
		// <byte order>
		cursor.Write<uint8_t>(little_endian ? 1 : 0);
		uint32_t type_id = GeometryTypes::ToWKBCode(geom.GetType());
		if (geom.Is3D()) {
			type_id |= EWKB_Z_FLAG;
		}
		if (geom.IsMeasured()) {
			type_id |= EWKB_M_FLAG;
		}
		if (write_srid) {
			type_id |= EWKB_SRID_FLAG;
		}
		// <type>
		Write<uint32_t>(type_id);
		if (write_srid) {
			// <srid>
			Write<int32_t>(srid);
		}
	}

	void WriteVertex(const VertexXYZM &vertex, Dimension dimension) {
		Write<double>(vertex.x);
		Write<double>(vertex.y);
		if (dimension.HasZDimension()) {
			Write<double>(vertex.z);
		}
		if (dimension.IsMeasured()) {
			Write<double>(vertex.m);
		}
	}

	void WriteVertices(const Geometry &geom) {
		auto &vertices = SinglePartGeometry::Vertices(geom);
		Write<uint32_t>(static_cast<uint32_t>(vertices.size()));
		for (auto &vertex : vertices) {
			WriteVertex(vertex, geom.GetDimension());
		}
	}

public:
	WKBSerializer(WriteCursor &cursor, bool little_endian) : cursor(cursor), little_endian(little_endian) {
	}

	void Serialize(const Geometry &geom, bool write_srid, int32_t srid) {
		WriteHeader(geom, write_srid, srid);
		switch (geom.GetType()) {
		case GeometryType::POINT:
			if (geom.IsEmpty()) {
				WriteVertex(VertexXYZM::Empty(), geom.GetDimension());
			} else {
				WriteVertex(Point::GetVertex(geom), geom.GetDimension());
			}
			break;
		case GeometryType::LINESTRING:
			WriteVertices(geom);
			break;
		case GeometryType::POLYGON:
			Write<uint32_t>(Polygon::PartCount(geom));
			for (auto &ring : Polygon::Parts(geom)) {
				WriteVertices(ring);
			}
			break;
		default:
			Write<uint32_t>(CollectionGeometry::PartCount(geom));
			for (auto &part : CollectionGeometry::Parts(geom)) {
				Serialize(part, false, srid);
			}
			break;
		}
	}
};

//------------------------------------------------------------------------------
// WKBWriter
//------------------------------------------------------------------------------
uint32_t WKBWriter::GetRequiredSize(const Geometry &geometry, const WKBWriterOptions &options) {
	return WKBSizeCalculator::Execute(geometry, options);
}

void WKBWriter::Write(const Geometry &geometry, vector<data_t> &buffer, const WKBWriterOptions &options) {
	auto size = GetRequiredSize(geometry, options);
	buffer.resize(size);
	WriteCursor cursor(buffer.data(), buffer.data() + size);
	WKBSerializer serializer(cursor, options.byte_order == WKBByteOrder::NDR);
	serializer.Serialize(geometry, options.WritesSRID(geometry), options.GetSRID(geometry));
	D_ASSERT(cursor.IsAtEnd());
}

string_t WKBWriter::Write(const Geometry &geometry, Vector &result, const WKBWriterOptions &options) {
	auto size = GetRequiredSize(geometry, options);
	auto blob = StringVector::EmptyString(result, size);
	auto data = data_ptr_cast(blob.GetDataWriteable());
	WriteCursor cursor(data, data + size);
	WKBSerializer serializer(cursor, options.byte_order == WKBByteOrder::NDR);
	serializer.Serialize(geometry, options.WritesSRID(geometry), options.GetSRID(geometry));
	blob.Finalize();
	return blob;
}

string WKBWriter::WriteHex(const Geometry &geometry, const WKBWriterOptions &options) {
	vector<data_t> buffer;
	Write(geometry, buffer, options);
	string result;
	result.reserve(buffer.size() * 2);
	for (auto byte : buffer) {
		result += Blob::HEX_TABLE[byte >> 4];
		result += Blob::HEX_TABLE[byte & 0x0F];
	}
	return result;
}

} // namespace core

} // namespace geosql
