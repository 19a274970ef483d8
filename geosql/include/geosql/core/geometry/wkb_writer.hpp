#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"

namespace geosql {

namespace core {

enum class WKBByteOrder : uint8_t {
	XDR = 0, // Big endian
	NDR = 1, // Little endian
};

struct WKBWriterOptions {
	WKBByteOrder byte_order;
	// Write the SRID flag and value on the root geometry (EWKB). Nested geometries never carry one.
	bool include_srid;
	// Write this SRID instead of the geometry's own, also when the geometry has none
	bool override_srid;
	int32_t srid;

	WKBWriterOptions() : byte_order(WKBByteOrder::NDR), include_srid(true), override_srid(false), srid(0) {
	}

	bool WritesSRID(const Geometry &geometry) const {
		return include_srid && (override_srid || geometry.HasSRID());
	}
	int32_t GetSRID(const Geometry &geometry) const {
		return override_srid ? srid : geometry.GetSRID();
	}
};

struct WKBWriter {
	// Write a geometry to an EWKB blob into a buffer
	static void Write(const Geometry &geometry, vector<data_t> &buffer,
	                  const WKBWriterOptions &options = WKBWriterOptions());

	// Write a geometry to an EWKB blob attached to a vector
	static string_t Write(const Geometry &geometry, Vector &result,
	                      const WKBWriterOptions &options = WKBWriterOptions());

	// Write a geometry as upper case hex encoded EWKB
	static string WriteHex(const Geometry &geometry, const WKBWriterOptions &options = WKBWriterOptions());

	// Number of bytes Write will produce
	static uint32_t GetRequiredSize(const Geometry &geometry, const WKBWriterOptions &options = WKBWriterOptions());
};

} // namespace core

} // namespace geosql
