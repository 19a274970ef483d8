#pragma once
#include "geosql/common.hpp"

namespace geosql {

namespace core {

// The PostGIS storage kind of a column
enum class ColumnKind : uint8_t { GEOMETRY = 0, GEOGRAPHY };

struct ColumnKinds {
	// Case insensitive, throws InvalidInputException for anything but geometry/geography
	static ColumnKind FromString(const string &name);
	static string ToString(ColumnKind kind);
};

struct ColumnConfig {
	ColumnKind kind;
	int32_t srid;

	ColumnConfig() : kind(ColumnKind::GEOMETRY), srid(SRID_WGS84) {
	}
	ColumnConfig(ColumnKind kind, int32_t srid) : kind(kind), srid(srid) {
	}

	bool operator==(const ColumnConfig &other) const {
		return kind == other.kind && srid == other.srid;
	}
	bool operator!=(const ColumnConfig &other) const {
		return !(*this == other);
	}
};

// Per-column geometry configuration of a table
class GeometryColumnRegistry {
private:
	ColumnConfig default_config;
	vector<string> column_names;
	unordered_map<string, ColumnConfig> columns;

public:
	GeometryColumnRegistry() {
	}
	explicit GeometryColumnRegistry(ColumnConfig default_config) : default_config(default_config) {
	}

	// Declare a column using the registry default. Redeclaring a column replaces its configuration.
	void Declare(const string &column);
	void Declare(const string &column, ColumnConfig config);

	bool Contains(const string &column) const;
	// Throws MissingColumnConfigurationException if the column was never declared
	const ColumnConfig &Get(const string &column) const;
	// In declaration order
	const vector<string> &GetColumnNames() const {
		return column_names;
	}
	const ColumnConfig &GetDefault() const {
		return default_config;
	}
};

} // namespace core

} // namespace geosql
