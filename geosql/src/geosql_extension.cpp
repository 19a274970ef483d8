#define DUCKDB_EXTENSION_MAIN

#include "geosql_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/parser/parsed_data/create_scalar_function_info.hpp"

#include "geosql/core/module.hpp"
#include "geosql/doc_util.hpp"

// Strip the common indentation of a raw string literal, as well as leading newlines and trailing whitespace
static duckdb::string RemoveIndentAndTrailingWhitespace(const char *text) {
	duckdb::string result;
	while (*text == '\n') {
		text++;
	}

	// The first line decides the indent
	auto indent_start = text;
	while (isspace(*text) && *text != '\n') {
		text++;
	}
	auto indent_len = text - indent_start;

	while (*text) {
		result += *text;
		if (*text++ != '\n') {
			continue;
		}
		auto matched = true;
		for (auto i = 0; i < indent_len; i++) {
			if (text[i] != indent_start[i]) {
				matched = false;
				break;
			}
		}
		if (matched) {
			text += indent_len;
		}
	}

	result.erase(result.find_last_not_of(" \n\r\t") + 1);
	return result;
}

void geosql::DocUtil::RegisterFunction(duckdb::ExtensionLoader &loader, duckdb::ScalarFunctionSet set,
                                       const char *description, const char *example,
                                       const duckdb::unordered_map<duckdb::string, duckdb::string> &tags) {
	duckdb::CreateScalarFunctionInfo info(std::move(set));

	duckdb::FunctionDescription doc;
	if (description != nullptr) {
		doc.description = RemoveIndentAndTrailingWhitespace(description);
	}
	if (example != nullptr) {
		doc.examples.push_back(RemoveIndentAndTrailingWhitespace(example));
	}
	info.descriptions.push_back(std::move(doc));

	for (auto &tag : tags) {
		info.tags[tag.first] = tag.second;
	}
	loader.RegisterFunction(std::move(info));
}

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	geosql::core::CoreModule::Register(loader);
	DUCKDB_LOG_INFO(loader.GetDatabaseInstance(), "geosql: registered functions and settings");
}

void GeosqlExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string GeosqlExtension::Name() {
	return "geosql";
}

std::string GeosqlExtension::Version() const {
#ifdef EXT_VERSION_GEOSQL
	return EXT_VERSION_GEOSQL;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(geosql, loader) {
	duckdb::LoadInternal(loader);
}
}
