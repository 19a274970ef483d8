#pragma once
#include "geosql/common.hpp"

namespace geosql {

namespace core {

struct CoreScalarFunctions {
public:
	static void Register(ExtensionLoader &loader) {
		RegisterStAsGeometrySQL(loader);
		RegisterStAsInsertableSQL(loader);
		RegisterStEWKBAsText(loader);
		RegisterStEWKBDimension(loader);
		RegisterStEWKBFromHex(loader);
		RegisterStEWKBSRID(loader);
	}

private:
	// Also registers ST_AsGeographySQL
	static void RegisterStAsGeometrySQL(ExtensionLoader &loader);
	static void RegisterStAsInsertableSQL(ExtensionLoader &loader);
	static void RegisterStEWKBAsText(ExtensionLoader &loader);
	static void RegisterStEWKBDimension(ExtensionLoader &loader);
	static void RegisterStEWKBFromHex(ExtensionLoader &loader);
	static void RegisterStEWKBSRID(ExtensionLoader &loader);
};

} // namespace core

} // namespace geosql
