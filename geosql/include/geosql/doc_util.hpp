#pragma once
#include "duckdb.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace geosql {

struct DocTag {
	const char *key;
	const char *value;
};

struct DocUtil {
	// Register a function set together with its description, example and tags
	static void RegisterFunction(duckdb::ExtensionLoader &loader, duckdb::ScalarFunctionSet set,
	                             const char *description, const char *example,
	                             const duckdb::unordered_map<duckdb::string, duckdb::string> &tags);

	template <size_t N>
	static void RegisterFunction(duckdb::ExtensionLoader &loader, duckdb::ScalarFunctionSet set,
	                             const char *description, const char *example, const DocTag (&tags)[N]) {
		duckdb::unordered_map<duckdb::string, duckdb::string> tag_map;
		for (size_t i = 0; i < N; i++) {
			tag_map[tags[i].key] = tags[i].value;
		}
		RegisterFunction(loader, std::move(set), description, example, tag_map);
	}
};

} // namespace geosql
