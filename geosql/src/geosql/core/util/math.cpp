#include "geosql/core/util/math.hpp"

namespace geosql {

namespace core {

// Exported by libgeos, but not declared in any public header
extern "C" int geos_d2sfixed_buffered_n(double f, uint32_t precision, char *result);

static constexpr const uint32_t COORD_PRECISION = 15;

static void AppendCoord(string &out, double d) {
	// sign + 309 integer digits is the worst case for fixed notation of a double
	char buf[330];
	auto len = geos_d2sfixed_buffered_n(d, COORD_PRECISION, buf);
	out.append(buf, static_cast<size_t>(len));
}

string MathUtil::format_coord(double d) {
	string result;
	AppendCoord(result, d);
	return result;
}

void MathUtil::format_vertex(string &out, const VertexXYZM &vertex, Dimension dimension) {
	AppendCoord(out, vertex.x);
	out += ' ';
	AppendCoord(out, vertex.y);
	if (dimension.HasZDimension()) {
		out += ' ';
		AppendCoord(out, vertex.z);
	}
	if (dimension.IsMeasured()) {
		out += ' ';
		AppendCoord(out, vertex.m);
	}
}

} // namespace core

} // namespace geosql
