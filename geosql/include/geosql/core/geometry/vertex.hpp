#pragma once

#include "geosql/common.hpp"
#include "geosql/core/geometry/dimension.hpp"

namespace geosql {

namespace core {

// A single coordinate tuple. Components outside the owning geometry's Dimension are ignored.
struct VertexXYZM {
	double x;
	double y;
	double z;
	double m;

public:
	VertexXYZM() : x(0), y(0), z(0), m(0) {
	}
	VertexXYZM(double x_p, double y_p) : x(x_p), y(y_p), z(0), m(0) {
	}
	VertexXYZM(double x_p, double y_p, double z_p, double m_p) : x(x_p), y(y_p), z(z_p), m(m_p) {
	}

	static VertexXYZM Empty() {
		auto nan = std::numeric_limits<double>::quiet_NaN();
		return VertexXYZM(nan, nan, nan, nan);
	}

	double operator[](const idx_t i) const {
		D_ASSERT(i < 4);
		return i == 0 ? x : i == 1 ? y : i == 2 ? z : m;
	}

	// True if every component present in the dimension is NaN
	bool IsNaN(Dimension dimension) const {
		if (!std::isnan(x) || !std::isnan(y)) {
			return false;
		}
		if (dimension.HasZDimension() && !std::isnan(z)) {
			return false;
		}
		if (dimension.IsMeasured() && !std::isnan(m)) {
			return false;
		}
		return true;
	}

	// True if any component present in the dimension is NaN
	bool HasNaN(Dimension dimension) const {
		return std::isnan(x) || std::isnan(y) || (dimension.HasZDimension() && std::isnan(z)) ||
		       (dimension.IsMeasured() && std::isnan(m));
	}

	// NaN compares equal to NaN here
	bool Equals(const VertexXYZM &other, Dimension dimension) const {
		if (!ComponentEquals(x, other.x) || !ComponentEquals(y, other.y)) {
			return false;
		}
		if (dimension.HasZDimension() && !ComponentEquals(z, other.z)) {
			return false;
		}
		if (dimension.IsMeasured() && !ComponentEquals(m, other.m)) {
			return false;
		}
		return true;
	}

private:
	static bool ComponentEquals(double a, double b) {
		return a == b || (std::isnan(a) && std::isnan(b));
	}
};

} // namespace core

} // namespace geosql
