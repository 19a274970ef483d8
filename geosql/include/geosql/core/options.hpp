#pragma once
#include "geosql/common.hpp"
#include "geosql/core/sql/column_config.hpp"

namespace geosql {

namespace core {

// Everything the codec needs from the outside world, passed in explicitly
struct GeosqlOptions {
	// Schema qualifying the PostGIS functions in generated SQL
	string schema;
	// Column configuration used when none is given
	ColumnConfig default_column;
	// Wrap mismatching geometries in ST_Transform instead of failing
	bool auto_transform;
	// Name of the active SQL generator, "wkt" or "wkb"
	string generator;
	// Reject unclosed polygon rings while decoding
	bool strict_rings;

	GeosqlOptions() : schema("public"), auto_transform(false), generator("wkt"), strict_rings(false) {
	}

	bool operator==(const GeosqlOptions &other) const {
		return schema == other.schema && default_column == other.default_column &&
		       auto_transform == other.auto_transform && generator == other.generator &&
		       strict_rings == other.strict_rings;
	}
	bool operator!=(const GeosqlOptions &other) const {
		return !(*this == other);
	}
};

} // namespace core

} // namespace geosql
