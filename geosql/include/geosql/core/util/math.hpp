#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/vertex.hpp"

namespace geosql {

namespace core {

struct MathUtil {
	// Shortest fixed notation with at most 15 decimals and no trailing zeros
	static string format_coord(double d);
	// Append the components present in the dimension to the output, separated by a space
	static void format_vertex(string &out, const VertexXYZM &vertex, Dimension dimension);
};

} // namespace core

} // namespace geosql
