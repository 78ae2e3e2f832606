#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/function_set.hpp"

#include "magic/magic_functions.hpp"
#include "magic/mime_detector.hpp"

#include <string>
#include <vector>

namespace duckdb {

static void MimeEqualsScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	BinaryExecutor::Execute<string_t, string_t, bool>(
	    args.data[0], args.data[1], result, args.size(), [](const string_t &mime, const string_t &candidate) {
		    return MimeDetector::Equals(mime.GetString(), candidate.GetString());
	    });
}

// mime_equals_any(candidate, targets): NULL elements of `targets` never match.
static void MimeEqualsAnyScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	const idx_t count = args.size();

	UnifiedVectorFormat candidate_uvf;
	args.data[0].ToUnifiedFormat(count, candidate_uvf);
	auto candidates = UnifiedVectorFormat::GetData<string_t>(candidate_uvf);

	Vector &list_vec = args.data[1];
	UnifiedVectorFormat list_uvf;
	list_vec.ToUnifiedFormat(count, list_uvf);
	auto list_entries = UnifiedVectorFormat::GetData<list_entry_t>(list_uvf);

	auto &child = ListVector::GetEntry(list_vec);
	UnifiedVectorFormat child_uvf;
	child.ToUnifiedFormat(ListVector::GetListSize(list_vec), child_uvf);
	auto child_vals = UnifiedVectorFormat::GetData<string_t>(child_uvf);

	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto out = FlatVector::GetData<bool>(result);

	std::vector<std::string> targets;
	for (idx_t row = 0; row < count; ++row) {
		const auto cid = candidate_uvf.sel->get_index(row);
		const auto lid = list_uvf.sel->get_index(row);
		if (!candidate_uvf.validity.RowIsValid(cid) || !list_uvf.validity.RowIsValid(lid)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}

		targets.clear();
		const auto &entry = list_entries[lid];
		for (idx_t k = 0; k < entry.length; ++k) {
			const auto eid = child_uvf.sel->get_index(entry.offset + k);
			if (child_uvf.validity.RowIsValid(eid)) {
				targets.push_back(child_vals[eid].GetString());
			}
		}
		out[row] = MimeDetector::EqualsAny(candidates[cid].GetString(), targets);
	}

	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

static void MimeIsSupportedScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	UnaryExecutor::Execute<string_t, bool>(args.data[0], result, args.size(), [](const string_t &mime) {
		return MimeDetector::IsSupported(mime.GetString());
	});
}

static void ExtensionIsSupportedScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	UnaryExecutor::Execute<string_t, bool>(args.data[0], result, args.size(), [](const string_t &extension) {
		return MimeDetector::IsSupportedExtension(extension.GetString());
	});
}

ScalarFunctionSet GetMimeEqualsFunctionSet() {
	ScalarFunctionSet set("mime_equals");
	set.AddFunction(
	    ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::BOOLEAN, MimeEqualsScalar));
	return set;
}

ScalarFunctionSet GetMimeEqualsAnyFunctionSet() {
	ScalarFunctionSet set("mime_equals_any");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::LIST(LogicalType::VARCHAR)},
	                               LogicalType::BOOLEAN, MimeEqualsAnyScalar));
	return set;
}

ScalarFunctionSet GetMimeIsSupportedFunctionSet() {
	ScalarFunctionSet set("mime_is_supported");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, MimeIsSupportedScalar));
	return set;
}

ScalarFunctionSet GetExtensionIsSupportedFunctionSet() {
	ScalarFunctionSet set("extension_is_supported");
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, LogicalType::BOOLEAN, ExtensionIsSupportedScalar));
	return set;
}

} // namespace duckdb
