#include "geosql/common.hpp"
#include "geosql/core/functions/common.hpp"
#include "geosql/core/config.hpp"

#include "duckdb/execution/expression_executor_state.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

namespace geosql {

namespace core {

unique_ptr<FunctionData> GeosqlBindData::Bind(ClientContext &context, ScalarFunction &bound_function,
                                              vector<unique_ptr<Expression>> &arguments) {
	return make_uniq<GeosqlBindData>(GeosqlConfig::Read(context));
}

static WKBReaderOptions GetReaderOptions(const GeosqlOptions &options) {
	WKBReaderOptions reader_options;
	reader_options.strict_rings = options.strict_rings;
	return reader_options;
}

GeosqlFunctionLocalState::GeosqlFunctionLocalState(const GeosqlOptions &options)
    : reader(GetReaderOptions(options)), binder(options) {
}

unique_ptr<FunctionLocalState> GeosqlFunctionLocalState::Init(ExpressionState &state,
                                                              const BoundFunctionExpression &expr,
                                                              FunctionData *bind_data) {
	D_ASSERT(bind_data);
	auto &data = bind_data->Cast<GeosqlBindData>();
	return make_uniq<GeosqlFunctionLocalState>(data.options);
}

GeosqlFunctionLocalState &GeosqlFunctionLocalState::Get(ExpressionState &state) {
	return ExecuteFunctionState::GetFunctionState(state)->Cast<GeosqlFunctionLocalState>();
}

void GeosqlFunctionLocalState::LogTransform(ExpressionState &state, const Geometry &geometry,
                                            int32_t column_srid) const {
	if (!binder.GetOptions().auto_transform || !GeometryBinder::RequiresTransform(geometry, column_srid)) {
		return;
	}
	DUCKDB_LOG_DEBUG(state.GetContext(), "geosql: transforming %s from SRID %d to SRID %d", geometry.GetTypeName(),
	                 geometry.GetSRID(), column_srid);
}

//------------------------------------------------------------------------------
// GeosqlFunction
//------------------------------------------------------------------------------
ScalarFunction GeosqlFunction::Create(vector<LogicalType> arguments, LogicalType return_type,
                                      scalar_function_t function) {
	ScalarFunction result(std::move(arguments), std::move(return_type), std::move(function));
	result.bind = GeosqlBindData::Bind;
	result.init_local_state = GeosqlFunctionLocalState::Init;
	return result;
}

} // namespace core

} // namespace geosql
