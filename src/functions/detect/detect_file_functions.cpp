#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

#include "magic/magic_functions.hpp"
#include "magic/mime_detector.hpp"

#include <string>
#include <utility>
#include <vector>

namespace duckdb {

// Snapshot of magic_ignore_missing_files taken when the expression is bound
struct MagicFileBindData : public FunctionData {
	bool ignore_missing_files = false;

	unique_ptr<FunctionData> Copy() const override {
		auto res = make_uniq<MagicFileBindData>();
		res->ignore_missing_files = ignore_missing_files;
		return std::move(res);
	}
	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<MagicFileBindData>();
		return ignore_missing_files == other.ignore_missing_files;
	}
};

static unique_ptr<FunctionData> MagicFileBind(ClientContext &context, ScalarFunction &,
                                              vector<unique_ptr<Expression>> &) {
	auto bind_data = make_uniq<MagicFileBindData>();
	Value setting;
	if (context.TryGetCurrentSetting(MAGIC_IGNORE_MISSING_FILES, setting) && !setting.IsNull()) {
		bind_data->ignore_missing_files = setting.GetValue<bool>();
	}
	return std::move(bind_data);
}

// Fills `buffer` with the head of `path`. Returns false only for a missing file when
// the bind data says to skip those; every other failure throws IOException.
static bool ReadHeadForRow(ClientContext &context, const MagicFileBindData &bind_data, const std::string &path,
                           std::vector<data_t> &buffer) {
	auto &fs = FileSystem::GetFileSystem(context);
	if (!bind_data.ignore_missing_files) {
		buffer = MimeDetector::ReadFileHead(fs, path);
		return true;
	}
	if (!MimeDetector::TryReadFileHead(fs, path, buffer)) {
		DUCKDB_LOG_WARN(context, "magic_udfs: skipping missing file '%s'", path);
		return false;
	}
	return true;
}

// -----------------------------------------------------------------------------
// detect_mime_file(path)
// -----------------------------------------------------------------------------
static void DetectMimeFileScalar(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &fexpr = state.expr.Cast<BoundFunctionExpression>();
	auto &bind_data = fexpr.bind_info->Cast<MagicFileBindData>();
	auto &context = state.GetContext();

	UnifiedVectorFormat path_uvf;
	args.data[0].ToUnifiedFormat(args.size(), path_uvf);
	auto paths = UnifiedVectorFormat::GetData<string_t>(path_uvf);

	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto out = FlatVector::GetData<string_t>(result);

	std::vector<data_t> buffer;
	for (idx_t row = 0; row < args.size(); ++row) {
		const auto idx = path_uvf.sel->get_index(row);
		if (!path_uvf.validity.RowIsValid(idx)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		const auto path = paths[idx].GetString();
		if (!ReadHeadForRow(context, bind_data, path, buffer)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		const auto &format = MimeDetector::Detect(buffer.data(), buffer.size());
		DUCKDB_LOG_DEBUG(context, "magic_udfs: '%s' detected as %s", path, format.Mime());
		out[row] = StringVector::AddString(result, format.Mime());
	}

	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

// -----------------------------------------------------------------------------
// match_mime_file(path, mime) / match_extension_file(path, ext)
// -----------------------------------------------------------------------------
struct MatchMimeOperator {
	static bool Match(const std::vector<data_t> &head, const std::string &mime) {
		return MimeDetector::MatchMime(head.data(), head.size(), mime);
	}
};

struct MatchExtensionOperator {
	static bool Match(const std::vector<data_t> &head, const std::string &extension) {
		return MimeDetector::MatchExtension(head.data(), head.size(), extension);
	}
};

template <class OP>
static void MatchFileScalar(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &fexpr = state.expr.Cast<BoundFunctionExpression>();
	auto &bind_data = fexpr.bind_info->Cast<MagicFileBindData>();
	auto &context = state.GetContext();

	UnifiedVectorFormat path_uvf;
	UnifiedVectorFormat key_uvf;
	args.data[0].ToUnifiedFormat(args.size(), path_uvf);
	args.data[1].ToUnifiedFormat(args.size(), key_uvf);
	auto paths = UnifiedVectorFormat::GetData<string_t>(path_uvf);
	auto keys = UnifiedVectorFormat::GetData<string_t>(key_uvf);

	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto out = FlatVector::GetData<bool>(result);

	std::vector<data_t> buffer;
	for (idx_t row = 0; row < args.size(); ++row) {
		const auto path_idx = path_uvf.sel->get_index(row);
		const auto key_idx = key_uvf.sel->get_index(row);
		if (!path_uvf.validity.RowIsValid(path_idx) || !key_uvf.validity.RowIsValid(key_idx)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		const auto path = paths[path_idx].GetString();
		if (!ReadHeadForRow(context, bind_data, path, buffer)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		const auto key = keys[key_idx].GetString();
		out[row] = OP::Match(buffer, key);
		DUCKDB_LOG_DEBUG(context, "magic_udfs: '%s' matches '%s': %s", path, key, out[row] ? "true" : "false");
	}

	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

static ScalarFunction MakeFileFunction(vector<LogicalType> arguments, LogicalType return_type,
                                       scalar_function_t function) {
	ScalarFunction fn(std::move(arguments), std::move(return_type), std::move(function), MagicFileBind);
	fn.stability = FunctionStability::VOLATILE;
	return fn;
}

ScalarFunctionSet GetDetectMimeFileFunctionSet() {
	ScalarFunctionSet set("detect_mime_file");
	set.AddFunction(MakeFileFunction({LogicalType::VARCHAR}, LogicalType::VARCHAR, DetectMimeFileScalar));
	return set;
}

ScalarFunctionSet GetMatchMimeFileFunctionSet() {
	ScalarFunctionSet set("match_mime_file");
	set.AddFunction(MakeFileFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::BOOLEAN,
	                                 MatchFileScalar<MatchMimeOperator>));
	return set;
}

ScalarFunctionSet GetMatchExtensionFileFunctionSet() {
	ScalarFunctionSet set("match_extension_file");
	set.AddFunction(MakeFileFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::BOOLEAN,
	                                 MatchFileScalar<MatchExtensionOperator>));
	return set;
}

} // namespace duckdb
