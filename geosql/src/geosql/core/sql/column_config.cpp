#include "geosql/core/sql/column_config.hpp"
#include "geosql/core/exception.hpp"

namespace geosql {

namespace core {

//------------------------------------------------------------------------------
// ColumnKinds
//------------------------------------------------------------------------------
ColumnKind ColumnKinds::FromString(const string &name) {
	if (StringUtil::CIEquals(name, "geometry")) {
		return ColumnKind::GEOMETRY;
	}
	if (StringUtil::CIEquals(name, "geography")) {
		return ColumnKind::GEOGRAPHY;
	}
	throw InvalidInputException("Unknown column type '%s', expected 'geometry' or 'geography'", name);
}

string ColumnKinds::ToString(ColumnKind kind) {
	switch (kind) {
	case ColumnKind::GEOMETRY:
		return "geometry";
	case ColumnKind::GEOGRAPHY:
		return "geography";
	default:
		throw InternalException("Unknown ColumnKind %d", static_cast<int>(kind));
	}
}

//------------------------------------------------------------------------------
// GeometryColumnRegistry
//------------------------------------------------------------------------------
void GeometryColumnRegistry::Declare(const string &column) {
	Declare(column, default_config);
}

void GeometryColumnRegistry::Declare(const string &column, ColumnConfig config) {
	auto entry = columns.find(column);
	if (entry != columns.end()) {
		entry->second = config;
		return;
	}
	column_names.push_back(column);
	columns.emplace(column, config);
}

bool GeometryColumnRegistry::Contains(const string &column) const {
	return columns.find(column) != columns.end();
}

const ColumnConfig &GeometryColumnRegistry::Get(const string &column) const {
	auto entry = columns.find(column);
	if (entry == columns.end()) {
		throw MissingColumnConfigurationException(column);
	}
	return entry->second;
}

} // namespace core

} // namespace geosql
