#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/functions/scalar.hpp"
#include "geosql/doc_util.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"

namespace geosql {

namespace core {

static void EWKBSRIDFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	auto &input = args.data[0];
	auto is_hex = GeosqlFunctionLocalState::IsHexInput(input);

	UnaryExecutor::ExecuteWithNulls<string_t, int32_t>(
	    input, result, args.size(), [&](const string_t &ewkb, ValidityMask &mask, idx_t idx) -> int32_t {
		    auto geom = lstate.Decode(ewkb, is_hex);
		    if (!geom.HasSRID()) {
			    mask.SetInvalid(idx);
			    return 0;
		    }
		    return geom.GetSRID();
	    });
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
    Returns the SRID embedded in an EWKB value, or NULL if the value carries none.
)";

static constexpr const char *DOC_EXAMPLE = R"(
SELECT ST_EWKBSRID('0101000020E6100000000000000000F03F0000000000000040');
----
4326
)";

static constexpr DocTag DOC_TAGS[] = {{"ext", "geosql"}, {"category", "property"}};

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStEWKBSRID(ExtensionLoader &loader) {
	ScalarFunctionSet set("ST_EWKBSRID");
	for (auto &type : GeosqlFunction::EWKBTypes()) {
		set.AddFunction(GeosqlFunction::Create({type}, LogicalType::INTEGER, EWKBSRIDFunction));
	}
	DocUtil::RegisterFunction(loader, std::move(set), DOC_DESCRIPTION, DOC_EXAMPLE, DOC_TAGS);
}

} // namespace core

} // namespace geosql
