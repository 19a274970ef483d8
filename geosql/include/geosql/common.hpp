#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/blob.hpp"
#include "duckdb/common/types/string_type.hpp"
#include "duckdb/common/unordered_map.hpp"
#include "duckdb/common/vector.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include <cmath>
#include <limits>

namespace geosql {

using namespace duckdb;

// Well known SRIDs
static constexpr const int32_t SRID_UNKNOWN = 0;
static constexpr const int32_t SRID_WGS84 = 4326;

} // namespace geosql
