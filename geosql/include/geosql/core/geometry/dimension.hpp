#pragma once
#include "geosql/common.hpp"

namespace geosql {

namespace core {

// The coordinate layout of a geometry. Always derived from which components are present.
class Dimension {
public:
	enum class Type : uint8_t { D2 = 0, Z = 1, M = 2, ZM = 3 };

private:
	static constexpr const uint8_t Z_FLAG = 0x01;
	static constexpr const uint8_t M_FLAG = 0x02;
	Type type;

public:
	Dimension() : type(Type::D2) {
	}
	// NOLINTNEXTLINE
	Dimension(Type type) : type(type) {
	}

	// Presence of z/m decides the result, their value (NaN included) does not
	static Dimension FromCoordinates(double x, double y, const double *z = nullptr, const double *m = nullptr) {
		(void)x;
		(void)y;
		return FromFlags(z != nullptr, m != nullptr);
	}

	static Dimension FromFlags(bool has_z, bool has_m) {
		return Dimension(static_cast<Type>((has_z ? Z_FLAG : 0) | (has_m ? M_FLAG : 0)));
	}

	Type GetType() const {
		return type;
	}

	inline bool HasZDimension() const {
		return (static_cast<uint8_t>(type) & Z_FLAG) != 0;
	}
	inline bool IsMeasured() const {
		return (static_cast<uint8_t>(type) & M_FLAG) != 0;
	}

	// Number of doubles per vertex
	uint32_t CoordinateCount() const {
		return 2 + (HasZDimension() ? 1 : 0) + (IsMeasured() ? 1 : 0);
	}

	// The OGC keyword suffix, e.g. POINTZ or POINTM
	const char *Suffix() const {
		switch (type) {
		case Type::Z:
			return "Z";
		case Type::M:
			return "M";
		case Type::ZM:
			return "ZM";
		default:
			return "";
		}
	}

	string ToString() const {
		switch (type) {
		case Type::Z:
			return "XYZ";
		case Type::M:
			return "XYM";
		case Type::ZM:
			return "XYZM";
		default:
			return "XY";
		}
	}

	bool operator==(const Dimension &other) const {
		return type == other.type;
	}
	bool operator!=(const Dimension &other) const {
		return type != other.type;
	}
};

} // namespace core

} // namespace geosql
