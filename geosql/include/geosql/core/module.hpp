#pragma once
#include "geosql/common.hpp"

namespace geosql {

namespace core {

struct CoreModule {
public:
	static void Register(ExtensionLoader &loader);
};

} // namespace core

} // namespace geosql
