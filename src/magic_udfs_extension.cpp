#define DUCKDB_EXTENSION_MAIN // must precede DuckDB headers
#include "magic_udfs_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "magic/magic_functions.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	auto &instance = loader.GetDatabaseInstance();

	auto &config = DBConfig::GetConfig(instance);
	config.AddExtensionOption(MAGIC_IGNORE_MISSING_FILES,
	                          "Return NULL from the *_file magic functions for paths that do not exist",
	                          LogicalType::BOOLEAN, Value::BOOLEAN(false));

	const ScalarFunctionSet scalar_sets[] = {
	    GetDetectMimeFunctionSet(),          GetDetectExtensionFunctionSet(),      GetDetectKindFunctionSet(),
	    GetDetectMimeFileFunctionSet(),      GetMatchMimeFileFunctionSet(),        GetMatchExtensionFileFunctionSet(),
	    GetMatchMimeFunctionSet(),           GetMatchExtensionFunctionSet(),       GetMimeEqualsFunctionSet(),
	    GetMimeEqualsAnyFunctionSet(),       GetMimeIsSupportedFunctionSet(),      GetExtensionIsSupportedFunctionSet()};
	for (const auto &set : scalar_sets) {
		loader.RegisterFunction(set);
	}
	loader.RegisterFunction(GetMimeTypesTableFunction());

	const idx_t function_count = sizeof(scalar_sets) / sizeof(scalar_sets[0]) + 1;
	DUCKDB_LOG_INFO(instance, "magic_udfs: registered %d functions", function_count);
}

void MagicUdfsExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string MagicUdfsExtension::Name() {
	return "magic_udfs";
}

std::string MagicUdfsExtension::Version() const {
#ifdef EXT_VERSION_MAGIC_UDFS
	return EXT_VERSION_MAGIC_UDFS;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(magic_udfs, loader) {
	duckdb::LoadInternal(loader);
}
}
