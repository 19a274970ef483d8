#include "geosql/common.hpp"
#include "geosql/core/geometry/wkt_writer.hpp"
#include "geosql/core/util/math.hpp"

namespace geosql {

namespace core {

static void WriteVertex(const Geometry &geom, const VertexXYZM &vertex, string &out) {
	auto dimension = geom.GetDimension();
	if (vertex.HasNaN(dimension)) {
		throw InvalidInputException("%s contains a NaN coordinate, NaN is only allowed for an empty point",
		                            geom.GetTypeName());
	}
	MathUtil::format_vertex(out, vertex, dimension);
}

static void WriteVertices(const Geometry &geom, string &out) {
	auto &vertices = SinglePartGeometry::Vertices(geom);
	if (vertices.empty()) {
		out += "EMPTY";
		return;
	}
	out += '(';
	for (idx_t i = 0; i < vertices.size(); i++) {
		if (i > 0) {
			out += ',';
		}
		WriteVertex(geom, vertices[i], out);
	}
	out += ')';
}

// Writes the body of a geometry, without its keyword
struct WKTBodyWriter {
	static void Case(Geometry::Tags::Point, const Geometry &geom, string &out) {
		if (geom.IsEmpty()) {
			out += "EMPTY";
			return;
		}
		out += '(';
		WriteVertex(geom, Point::GetVertex(geom), out);
		out += ')';
	}

	static void Case(Geometry::Tags::LineString, const Geometry &geom, string &out) {
		WriteVertices(geom, out);
	}

	static void Case(Geometry::Tags::Polygon, const Geometry &geom, string &out) {
		if (geom.IsEmpty()) {
			out += "EMPTY";
			return;
		}
		out += '(';
		bool first = true;
		for (auto &ring : Polygon::Parts(geom)) {
			if (!first) {
				out += ',';
			}
			first = false;
			WriteVertices(ring, out);
		}
		out += ')';
	}

	static void Case(Geometry::Tags::CollectionGeometry, const Geometry &geom, string &out) {
		if (geom.IsEmpty()) {
			out += "EMPTY";
			return;
		}
		// Parts of a typed collection are written without their keyword
		auto typed = geom.GetType() != GeometryType::GEOMETRYCOLLECTION;
		out += '(';
		bool first = true;
		for (auto &part : CollectionGeometry::Parts(geom)) {
			if (!first) {
				out += ',';
			}
			first = false;
			if (typed) {
				Geometry::Match<WKTBodyWriter>(part, out);
			} else {
				WKTWriter::Write(part, out);
			}
		}
		out += ')';
	}
};

void WKTWriter::Write(const Geometry &geometry, string &out) {
	out += geometry.GetTypeName();
	out += geometry.GetDimension().Suffix();
	if (geometry.IsEmpty()) {
		out += " EMPTY";
		return;
	}
	Geometry::Match<WKTBodyWriter>(geometry, out);
}

string WKTWriter::Write(const Geometry &geometry) {
	string result;
	Write(geometry, result);
	return result;
}

} // namespace core

} // namespace geosql
