#pragma once
#include "geosql/common.hpp"

namespace geosql {

namespace core {

//------------------------------------------------------------------------------
// Decoding
//------------------------------------------------------------------------------

// Raised for truncated buffers, unknown type codes and corrupted counts
class MalformedWKBException : public SerializationException {
public:
	explicit MalformedWKBException(const string &msg) : SerializationException("Malformed WKB: " + msg) {
	}

	template <typename... ARGS>
	explicit MalformedWKBException(const string &msg, ARGS... params)
	    : MalformedWKBException(ConstructMessage(msg, params...)) {
	}
};

//------------------------------------------------------------------------------
// Model / generation
//------------------------------------------------------------------------------

class GeodeticMismatchException : public InvalidInputException {
public:
	explicit GeodeticMismatchException(int32_t srid)
	    : InvalidInputException(
	          ConstructMessage("Geodetic accessors require SRID 4326 or 0, but the point has SRID %d", srid)),
	      srid(srid) {
	}

	int32_t GetSRID() const {
		return srid;
	}

private:
	int32_t srid;
};

class UnsupportedGeometryForGeographyException : public InvalidInputException {
public:
	explicit UnsupportedGeometryForGeographyException(const string &type_name)
	    : InvalidInputException(ConstructMessage("%s can not be stored in a geography column", type_name)) {
	}
};

class SRIDMismatchException : public InvalidInputException {
public:
	SRIDMismatchException(int32_t column_srid, int32_t geometry_srid)
	    : InvalidInputException(ConstructMessage(
	          "SRID mismatch: column expects SRID %d but the geometry has SRID %d (enable auto transform to convert)",
	          column_srid, geometry_srid)),
	      column_srid(column_srid), geometry_srid(geometry_srid) {
	}

	int32_t GetColumnSRID() const {
		return column_srid;
	}
	int32_t GetGeometrySRID() const {
		return geometry_srid;
	}

private:
	int32_t column_srid;
	int32_t geometry_srid;
};

//------------------------------------------------------------------------------
// Column configuration
//------------------------------------------------------------------------------

class MissingColumnConfigurationException : public InvalidInputException {
public:
	explicit MissingColumnConfigurationException(const string &column)
	    : InvalidInputException(ConstructMessage("No geometry configuration declared for column '%s'", column)) {
	}
};

} // namespace core

} // namespace geosql
