#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/cursor.hpp"
#include "geosql/core/geometry/geometry.hpp"
#include "geosql/core/geometry/geometry_factory.hpp"

namespace geosql {

namespace core {

struct WKBReaderOptions {
	// Reject polygon rings that are not closed or have fewer than 4 vertices
	bool strict_rings;

	WKBReaderOptions() : strict_rings(false) {
	}
};

// Decodes PostGIS extended WKB (and ISO WKB) into a Geometry tree.
// Stateless: a single reader can be shared between threads.
class WKBReader {
private:
	WKBReaderOptions options;

	struct WKBType {
		GeometryType type;
		Dimension dimension;
		bool has_srid;
	};

	// Primitives
	static bool ReadByteOrder(Cursor &cursor);
	static uint32_t ReadInt(Cursor &cursor, bool little_endian);
	static double ReadDouble(Cursor &cursor, bool little_endian);
	static WKBType ReadType(Cursor &cursor, bool little_endian);
	static uint32_t ReadCount(Cursor &cursor, bool little_endian, idx_t min_element_size, const char *what);
	static VertexXYZM ReadVertex(Cursor &cursor, bool little_endian, Dimension dimension);
	static vector<VertexXYZM> ReadVertices(Cursor &cursor, bool little_endian, Dimension dimension);

	// Geometries
	Geometry ReadPoint(Cursor &cursor, const GeometryFactory &factory, bool little_endian, Dimension dimension) const;
	Geometry ReadLineString(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
	                        Dimension dimension) const;
	Geometry ReadPolygon(Cursor &cursor, const GeometryFactory &factory, bool little_endian,
	                     Dimension dimension) const;
	// depth is the number of collections enclosing the geometry being read
	Geometry ReadCollection(Cursor &cursor, const GeometryFactory &factory, bool little_endian, GeometryType type,
	                        Dimension dimension, uint32_t depth) const;
	Geometry ReadNested(Cursor &cursor, const GeometryFactory &factory, GeometryType parent_type,
	                    Dimension parent_dimension, uint32_t depth) const;
	Geometry ReadBody(Cursor &cursor, const GeometryFactory &factory, bool little_endian, const WKBType &type,
	                  uint32_t depth) const;

public:
	WKBReader() {
	}
	explicit WKBReader(WKBReaderOptions options) : options(options) {
	}

	Geometry Deserialize(const string_t &wkb) const;
	Geometry Deserialize(const_data_ptr_t wkb, idx_t size) const;
	// Hex encoded EWKB, as returned by PostGIS over the text protocol
	Geometry DeserializeHex(const string_t &hex) const;
	Geometry DeserializeHex(const string &hex) const;
};

} // namespace core

} // namespace geosql
