#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/functions/scalar.hpp"
#include "geosql/core/geometry/wkb_writer.hpp"
#include "geosql/doc_util.hpp"

#include "duckdb/common/vector_operations/unary_executor.hpp"

namespace geosql {

namespace core {

// Decode and re-encode, so the result is validated little endian EWKB
static void EWKBFromHexFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = GeosqlFunctionLocalState::Get(state);
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](const string_t &hex) {
		auto geom = lstate.reader.DeserializeHex(hex);
		return WKBWriter::Write(geom, result);
	});
}

//------------------------------------------------------------------------------
// Documentation
//------------------------------------------------------------------------------
static constexpr const char *DOC_DESCRIPTION = R"(
    Parses hex encoded EWKB, as PostGIS returns it over the text protocol, into an EWKB blob.

    The blob is always written in little endian byte order and keeps the SRID.
)";

static constexpr const char *DOC_EXAMPLE = R"(
SELECT ST_EWKBFromHex('0101000000000000000000F03F0000000000000040');
----
\x01\x01\x00\x00\x00\x00\x00\x00\x00\x00\x00\xF0?\x00\x00\x00\x00\x00\x00\x00@
)";

static constexpr DocTag DOC_TAGS[] = {{"ext", "geosql"}, {"category", "conversion"}};

//------------------------------------------------------------------------------
// Register functions
//------------------------------------------------------------------------------
void CoreScalarFunctions::RegisterStEWKBFromHex(ExtensionLoader &loader) {
	ScalarFunctionSet set("ST_EWKBFromHex");
	set.AddFunction(GeosqlFunction::Create({LogicalType::VARCHAR}, LogicalType::BLOB, EWKBFromHexFunction));
	DocUtil::RegisterFunction(loader, std::move(set), DOC_DESCRIPTION, DOC_EXAMPLE, DOC_TAGS);
}

} // namespace core

} // namespace geosql
