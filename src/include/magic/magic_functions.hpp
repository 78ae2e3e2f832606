#pragma once

#include "duckdb.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/function/table_function.hpp"

namespace duckdb {

// Name of the extension option read by the *_file functions.
static constexpr const char *MAGIC_IGNORE_MISSING_FILES = "magic_ignore_missing_files";

// detect_mime / detect_extension / detect_kind over BLOB and VARCHAR input
ScalarFunctionSet GetDetectMimeFunctionSet();
ScalarFunctionSet GetDetectExtensionFunctionSet();
ScalarFunctionSet GetDetectKindFunctionSet();

// Same detection, but on the first bytes of a file read through DuckDB's file system
ScalarFunctionSet GetDetectMimeFileFunctionSet();
ScalarFunctionSet GetMatchMimeFileFunctionSet();
ScalarFunctionSet GetMatchExtensionFileFunctionSet();

// Registry lookups: does the input satisfy any predicate registered for the key?
ScalarFunctionSet GetMatchMimeFunctionSet();
ScalarFunctionSet GetMatchExtensionFunctionSet();

ScalarFunctionSet GetMimeEqualsFunctionSet();
ScalarFunctionSet GetMimeEqualsAnyFunctionSet();
ScalarFunctionSet GetMimeIsSupportedFunctionSet();
ScalarFunctionSet GetExtensionIsSupportedFunctionSet();

// mime_types(): one row per node of the signature tree, in traversal order
TableFunction GetMimeTypesTableFunction();

} // namespace duckdb
