#pragma once
#include "geosql/common.hpp"
#include "geosql/core/geometry/wkb_reader.hpp"
#include "geosql/core/options.hpp"
#include "geosql/core/sql/geometry_binder.hpp"

namespace geosql {

namespace core {

// Settings captured when the function expression is bound
struct GeosqlBindData final : public FunctionData {
	GeosqlOptions options;

	explicit GeosqlBindData(GeosqlOptions options_p) : options(std::move(options_p)) {
	}

	unique_ptr<FunctionData> Copy() const override {
		return make_uniq<GeosqlBindData>(options);
	}
	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<GeosqlBindData>();
		return options == other.options;
	}

	static unique_ptr<FunctionData> Bind(ClientContext &context, ScalarFunction &bound_function,
	                                     vector<unique_ptr<Expression>> &arguments);
};

struct GeosqlFunctionLocalState : FunctionLocalState {
public:
	WKBReader reader;
	GeometryBinder binder;

public:
	explicit GeosqlFunctionLocalState(const GeosqlOptions &options);
	static unique_ptr<FunctionLocalState> Init(ExpressionState &state, const BoundFunctionExpression &expr,
	                                           FunctionData *bind_data);
	static GeosqlFunctionLocalState &Get(ExpressionState &state);

	// EWKB arguments arrive either as BLOB or as hex encoded VARCHAR
	Geometry Decode(const string_t &input, bool is_hex) const {
		return is_hex ? reader.DeserializeHex(input) : reader.Deserialize(input);
	}
	static bool IsHexInput(const Vector &input) {
		return input.GetType().id() == LogicalTypeId::VARCHAR;
	}

	// Log at DEBUG when the binder is about to wrap the geometry in ST_Transform
	void LogTransform(ExpressionState &state, const Geometry &geometry, int32_t column_srid) const;
};

struct GeosqlFunction {
	// A scalar function bound to the geosql settings, see GeosqlFunctionLocalState
	static ScalarFunction Create(vector<LogicalType> arguments, LogicalType return_type,
	                             scalar_function_t function);
	// Overloads for the accepted EWKB argument types, BLOB and hex VARCHAR
	static vector<LogicalType> EWKBTypes() {
		return {LogicalType::BLOB, LogicalType::VARCHAR};
	}
};

} // namespace core

} // namespace geosql
