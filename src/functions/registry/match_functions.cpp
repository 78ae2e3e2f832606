#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/function_set.hpp"

#include "magic/magic_functions.hpp"
#include "magic/mime_detector.hpp"

namespace duckdb {

struct MatchMimeKey {
	static bool Match(const string_t &input, const string_t &mime) {
		return MimeDetector::MatchMime(const_data_ptr_cast(input.GetData()), input.GetSize(), mime.GetString());
	}
};

struct MatchExtensionKey {
	static bool Match(const string_t &input, const string_t &extension) {
		return MimeDetector::MatchExtension(const_data_ptr_cast(input.GetData()), input.GetSize(),
		                                    extension.GetString());
	}
};

template <class OP>
static void MatchScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	BinaryExecutor::Execute<string_t, string_t, bool>(args.data[0], args.data[1], result, args.size(),
	                                                  [](const string_t &input, const string_t &key) {
		                                                  return OP::Match(input, key);
	                                                  });
}

template <class OP>
static ScalarFunctionSet MakeMatchSet(const char *name) {
	ScalarFunctionSet set(name);
	set.AddFunction(
	    ScalarFunction({LogicalType::BLOB, LogicalType::VARCHAR}, LogicalType::BOOLEAN, MatchScalar<OP>));
	set.AddFunction(
	    ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::BOOLEAN, MatchScalar<OP>));
	return set;
}

ScalarFunctionSet GetMatchMimeFunctionSet() {
	return MakeMatchSet<MatchMimeKey>("match_mime");
}

ScalarFunctionSet GetMatchExtensionFunctionSet() {
	return MakeMatchSet<MatchExtensionKey>("match_extension");
}

} // namespace duckdb
