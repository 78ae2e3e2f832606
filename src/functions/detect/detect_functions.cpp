#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/function_set.hpp"

#include "magic/magic_functions.hpp"
#include "magic/mime_detector.hpp"

#include <string>

namespace duckdb {

template <class OP>
static void DetectScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](const string_t &input) {
		const auto &format = MimeDetector::Detect(input);
		return StringVector::AddString(result, OP::Describe(format));
	});
}

struct DescribeMime {
	static std::string Describe(const MimeType &format) {
		return format.Mime();
	}
};

struct DescribeExtension {
	static std::string Describe(const MimeType &format) {
		return format.Extension();
	}
};

struct DescribeKind {
	static std::string Describe(const MimeType &format) {
		return MimeKindToString(format.Kind());
	}
};

// BLOB and VARCHAR share the string_t payload, so one body serves both overloads.
template <class OP>
static ScalarFunctionSet MakeDetectSet(const char *name) {
	ScalarFunctionSet set(name);
	set.AddFunction(ScalarFunction({LogicalType::BLOB}, LogicalType::VARCHAR, DetectScalar<OP>));
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, DetectScalar<OP>));
	return set;
}

ScalarFunctionSet GetDetectMimeFunctionSet() {
	return MakeDetectSet<DescribeMime>("detect_mime");
}

ScalarFunctionSet GetDetectExtensionFunctionSet() {
	return MakeDetectSet<DescribeExtension>("detect_extension");
}

ScalarFunctionSet GetDetectKindFunctionSet() {
	return MakeDetectSet<DescribeKind>("detect_kind");
}

} // namespace duckdb
