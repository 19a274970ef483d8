#include "geosql/core/module.hpp"

#include "geosql/common.hpp"
#include "geosql/core/config.hpp"
#include "geosql/core/functions/scalar.hpp"

namespace geosql {

namespace core {

void CoreModule::Register(ExtensionLoader &loader) {
	GeosqlConfig::Register(loader.GetDatabaseInstance());
	CoreScalarFunctions::Register(loader);
}

} // namespace core

} // namespace geosql
