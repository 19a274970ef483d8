#include "geosql/core/config.hpp"
#include "geosql/core/sql/column_config.hpp"
#include "geosql/core/sql/sql_generator.hpp"

#include "duckdb/main/client_context.hpp"
#include "duckdb/main/config.hpp"

namespace geosql {

namespace core {

constexpr const char *GeosqlConfig::SCHEMA;
constexpr const char *GeosqlConfig::DEFAULT_SRID;
constexpr const char *GeosqlConfig::DEFAULT_COLUMN_TYPE;
constexpr const char *GeosqlConfig::AUTO_TRANSFORM;
constexpr const char *GeosqlConfig::SQL_GENERATOR;
constexpr const char *GeosqlConfig::STRICT_RINGS;

//------------------------------------------------------------------------------
// Validation
//------------------------------------------------------------------------------
static void SetDefaultColumnType(ClientContext &context, SetScope scope, Value &parameter) {
	// Throws for anything but geometry/geography
	auto kind = ColumnKinds::FromString(parameter.ToString());
	parameter = Value(ColumnKinds::ToString(kind));
}

static void SetSQLGenerator(ClientContext &context, SetScope scope, Value &parameter) {
	auto name = StringUtil::Lower(parameter.ToString());
	if (!SQLGenerator::IsKnown(name)) {
		throw InvalidInputException("Unknown SQL generator '%s', expected 'wkt' or 'wkb'", name);
	}
	parameter = Value(name);
}

static void SetSchema(ClientContext &context, SetScope scope, Value &parameter) {
	if (parameter.ToString().empty()) {
		throw InvalidInputException("%s can not be empty", GeosqlConfig::SCHEMA);
	}
}

//------------------------------------------------------------------------------
// Register
//------------------------------------------------------------------------------
void GeosqlConfig::Register(DatabaseInstance &db) {
	auto &config = DBConfig::GetConfig(db);
	const GeosqlOptions defaults;

	config.AddExtensionOption(SCHEMA, "Schema that qualifies the PostGIS functions in generated SQL",
	                          LogicalType::VARCHAR, Value(defaults.schema), SetSchema);
	config.AddExtensionOption(DEFAULT_SRID, "SRID of a column when none is given", LogicalType::INTEGER,
	                          Value::INTEGER(defaults.default_column.srid));
	config.AddExtensionOption(DEFAULT_COLUMN_TYPE, "Column type when none is given: geometry or geography",
	                          LogicalType::VARCHAR, Value(ColumnKinds::ToString(defaults.default_column.kind)),
	                          SetDefaultColumnType);
	config.AddExtensionOption(AUTO_TRANSFORM,
	                          "Wrap geometries with a mismatching SRID in ST_Transform instead of raising an error",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(defaults.auto_transform));
	config.AddExtensionOption(SQL_GENERATOR, "Constructor used in generated SQL: wkt or wkb", LogicalType::VARCHAR,
	                          Value(defaults.generator), SetSQLGenerator);
	config.AddExtensionOption(STRICT_RINGS, "Reject unclosed polygon rings when decoding EWKB", LogicalType::BOOLEAN,
	                          Value::BOOLEAN(defaults.strict_rings));
}

//------------------------------------------------------------------------------
// Read
//------------------------------------------------------------------------------
GeosqlOptions GeosqlConfig::Read(ClientContext &context) {
	GeosqlOptions options;
	Value value;
	if (context.TryGetCurrentSetting(SCHEMA, value) && !value.IsNull()) {
		options.schema = value.ToString();
	}
	if (context.TryGetCurrentSetting(DEFAULT_SRID, value) && !value.IsNull()) {
		options.default_column.srid = value.GetValue<int32_t>();
	}
	if (context.TryGetCurrentSetting(DEFAULT_COLUMN_TYPE, value) && !value.IsNull()) {
		options.default_column.kind = ColumnKinds::FromString(value.ToString());
	}
	if (context.TryGetCurrentSetting(AUTO_TRANSFORM, value) && !value.IsNull()) {
		options.auto_transform = BooleanValue::Get(value);
	}
	if (context.TryGetCurrentSetting(SQL_GENERATOR, value) && !value.IsNull()) {
		options.generator = value.ToString();
	}
	if (context.TryGetCurrentSetting(STRICT_RINGS, value) && !value.IsNull()) {
		options.strict_rings = BooleanValue::Get(value);
	}
	return options;
}

} // namespace core

} // namespace geosql
