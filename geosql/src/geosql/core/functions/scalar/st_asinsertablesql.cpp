#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/functions/scalar.hpp"
#include "geosql/core/sql/column_config.hpp"
#include "geosql/doc_util.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/common/vector_operations/ternary_executor.hpp"

namespace geosql {

namespace core {

//------------------------------------------------------------------------------
// ST_AsInsertableSQL(ewkb)
//------------------------------------------------------------------------------
static void AsInsertableSQLFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);
	auto &column = lstate.binder.GetOptions().default_column;

	UnaryExecutor::Execute<string_t, string_t>(input, result, args.size(), [&](const string_t &ewkb) {
		auto geom = lstate.Decode(ewkb, is_hex);
		lstate.LogTransform(state, geom, column.srid);
		return StringVector::AddString(result, lstate.binder.ToInsertableSQL(geom, column));
	});
}

//------------------------------------------------------------------------------
// ST_AsInsertableSQL(ewkb, column_type, column_srid)
//------------------------------------------------------------------------------
static void AsInsertableSQLColumnFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);

	TernaryExecutor::Execute<string_t, string_t, int32_t, string_t>(
	    input, args.data[1], args.data[2], result, args.size(),
	    [&](const string_t &ewkb, const string_t &column_type, int32_t column_srid) {
		    ColumnConfig column(ColumnKinds::FromString(column_type.GetString()), column_srid);
		    auto geom = lstate.Decode(ewkb, is_hex);
		    lstate.LogTransform(state, geom, column.srid);
		    return StringVector::AddString(result, lstate.binder.ToInsertableSQL(geom, column));
	    });
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
    Returns the SQL expression that stores the geometry in a column of the given type and SRID.

    Without column arguments the column is described by `geosql_default_column_type` and `geosql_default_srid`.
    `column_type` is either `geometry` or `geography`. GEOMETRYCOLLECTIONs always use the geometry constructor,
    even for geography columns.
)";

static constexpr const char *DOC_EXAMPLE = R"(
SELECT ST_AsInsertableSQL('0101000020E6100000000000000000F03F0000000000000040', 'geography', 4326);
----
public.ST_GeogFromText('SRID=4326;POINT(1 2)')
)";

static constexpr DocTag DOC_TAGS[] = {{"ext", "geosql"}, {"category", "conversion"}};

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStAsInsertableSQL(ExtensionLoader &loader) {
	ScalarFunctionSet set("ST_AsInsertableSQL");
	for (auto &type : GeosqlFunction::EWKBTypes()) {
		set.AddFunction(GeosqlFunction::Create({type}, LogicalType::VARCHAR, AsInsertableSQLFunction));
		set.AddFunction(GeosqlFunction::Create({type, LogicalType::VARCHAR, LogicalType::INTEGER},
		                                       LogicalType::VARCHAR, AsInsertableSQLColumnFunction));
	}
	DocUtil::RegisterFunction(loader, std::move(set), DOC_DESCRIPTION, DOC_EXAMPLE, DOC_TAGS);
}

} // namespace core

} // namespace geosql
