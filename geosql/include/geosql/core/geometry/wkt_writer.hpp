#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/geometry.hpp"

namespace geosql {

namespace core {

// Renders the WKT dialect accepted by the PostGIS constructor functions, e.g. POINTZ(1 2 3) or
// MULTIPOINT((1 2),(3 4)). Throws InvalidInputException for NaN coordinates outside of an empty point.
struct WKTWriter {
	static string Write(const Geometry &geometry);
	static void Write(const Geometry &geometry, string &out);
};

} // namespace core

} // namespace geosql
