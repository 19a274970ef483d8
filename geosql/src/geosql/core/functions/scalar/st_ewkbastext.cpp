#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/functions/scalar.hpp"
#include "geosql/core/geometry/wkt_writer.hpp"
#include "geosql/doc_util.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"

namespace geosql {

namespace core {

static void EWKBAsTextFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);

	UnaryExecutor::Execute<string_t, string_t>(input, result, args.size(), [&](const string_t &ewkb) {
		auto geom = lstate.Decode(ewkb, is_hex);
		return StringVector::AddString(result, WKTWriter::Write(geom));
	});
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
    Decodes an EWKB value and returns the geometry as WKT, in the form passed to the PostGIS constructors.

    The SRID is not part of the output, use `ST_EWKBSRID` to read it.
)";

static constexpr const char *DOC_EXAMPLE = R"(
SELECT ST_EWKBAsText('01010000A0E6100000000000000000F03F00000000000000400000000000000840');
----
POINTZ(1 2 3)
)";

static constexpr DocTag DOC_TAGS[] = {{"ext", "geosql"}, {"category", "conversion"}};

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStEWKBAsText(ExtensionLoader &loader) {
	ScalarFunctionSet set("ST_EWKBAsText");
	for (auto &type : GeosqlFunction::EWKBTypes()) {
		set.AddFunction(GeosqlFunction::Create({type}, LogicalType::VARCHAR, EWKBAsTextFunction));
	}
	DocUtil::RegisterFunction(loader, std::move(set), DOC_DESCRIPTION, DOC_EXAMPLE, DOC_TAGS);
}

} // namespace core

} // namespace geosql
