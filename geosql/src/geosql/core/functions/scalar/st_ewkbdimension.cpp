#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/functions/scalar.hpp"
#include "geosql/doc_util.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"

namespace geosql {

namespace core {

static void EWKBDimensionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);

	UnaryExecutor::Execute<string_t, string_t>(input, result, args.size(), [&](const string_t &ewkb) {
		auto geom = lstate.Decode(ewkb, is_hex);
		return StringVector::AddString(result, geom.GetDimension().ToString());
	});
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
    Returns the coordinate dimension of an EWKB value: `XY`, `XYZ`, `XYM` or `XYZM`.
)";

static constexpr const char *DOC_EXAMPLE = R"(
SELECT ST_EWKBDimension('01010000A0E6100000000000000000F03F00000000000000400000000000000840');
----
XYZ
)";

static constexpr DocTag DOC_TAGS[] = {{"ext", "geosql"}, {"category", "property"}};

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStEWKBDimension(ExtensionLoader &loader) {
	ScalarFunctionSet set("ST_EWKBDimension");
	for (auto &type : GeosqlFunction::EWKBTypes()) {
		set.AddFunction(GeosqlFunction::Create({type}, LogicalType::VARCHAR, EWKBDimensionFunction));
	}
	DocUtil::RegisterFunction(loader, std::move(set), DOC_DESCRIPTION, DOC_EXAMPLE, DOC_TAGS);
}

} // namespace core

} // namespace geosql
