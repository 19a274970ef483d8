#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/functions/scalar.hpp"
#include "geosql/doc_util.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"

namespace geosql {

namespace core {

//------------------------------------------------------------------------------
// ST_AsGeometrySQL
//------------------------------------------------------------------------------
static void AsGeometrySQLFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);
	auto column_srid = lstate.binder.GetOptions().default_column.srid;

	UnaryExecutor::Execute<string_t, string_t>(input, result, args.size(), [&](const string_t &ewkb) {
		auto geom = lstate.Decode(ewkb, is_hex);
		lstate.LogTransform(state, geom, column_srid);
		return StringVector::AddString(result, lstate.binder.ToGeometrySQL(geom, column_srid));
	});
}

//------------------------------------------------------------------------------
// ST_AsGeographySQL
//------------------------------------------------------------------------------
static void AsGeographySQLFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);
	auto column_srid = lstate.binder.GetOptions().default_column.srid;

	UnaryExecutor::Execute<string_t, string_t>(input, result, args.size(), [&](const string_t &ewkb) {
		auto geom = lstate.Decode(ewkb, is_hex);
		lstate.LogTransform(state, geom, column_srid);
		return StringVector::AddString(result, lstate.binder.ToGeographySQL(geom, column_srid));
	});
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *GEOMETRY_DOC_DESCRIPTION = R"(
    Returns the SQL expression that constructs the geometry in a PostGIS geometry column.

    The geometry keeps its own SRID, a geometry without SRID gets `geosql_default_srid`.
    If the SRIDs differ the expression is wrapped in `ST_Transform` when `geosql_auto_transform` is enabled,
    otherwise an error is raised.
)";

static constexpr const char *GEOMETRY_DOC_EXAMPLE = R"(
SELECT ST_AsGeometrySQL('0101000020E6100000000000000000F03F0000000000000040');
----
public.ST_GeomFromText('POINT(1 2)', 4326)
)";

static constexpr const char *GEOGRAPHY_DOC_DESCRIPTION = R"(
    Returns the SQL expression that constructs the geometry in a PostGIS geography column.

    GEOMETRYCOLLECTIONs can not be stored as geography and raise an error.
)";

static constexpr const char *GEOGRAPHY_DOC_EXAMPLE = R"(
SELECT ST_AsGeographySQL('0101000020E6100000000000000000F03F0000000000000040');
----
public.ST_GeogFromText('SRID=4326;POINT(1 2)')
)";

static constexpr DocTag DOC_TAGS[] = {{"ext", "geosql"}, {"category", "conversion"}};

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStAsGeometrySQL(ExtensionLoader &loader) {
	ScalarFunctionSet geometry_set("ST_AsGeometrySQL");
	ScalarFunctionSet geography_set("ST_AsGeographySQL");
	for (auto &type : GeosqlFunction::EWKBTypes()) {
		geometry_set.AddFunction(GeosqlFunction::Create({type}, LogicalType::VARCHAR, AsGeometrySQLFunction));
		geography_set.AddFunction(GeosqlFunction::Create({type}, LogicalType::VARCHAR, AsGeographySQLFunction));
	}

	DocUtil::RegisterFunction(loader, std::move(geometry_set), GEOMETRY_DOC_DESCRIPTION, GEOMETRY_DOC_EXAMPLE,
	                          DOC_TAGS);
	DocUtil::RegisterFunction(loader, std::move(geography_set), GEOGRAPHY_DOC_DESCRIPTION, GEOGRAPHY_DOC_EXAMPLE,
	                          DOC_TAGS);
}

} // namespace core

} // namespace geosql
