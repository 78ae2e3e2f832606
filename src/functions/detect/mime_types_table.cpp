#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"

#include "magic/magic_functions.hpp"
#include "magic/mime_tree.hpp"

#include <string>
#include <vector>

namespace duckdb {

struct MimeTypesState : public GlobalTableFunctionState {
	idx_t offset = 0;
};

static unique_ptr<FunctionData> MimeTypesBind(ClientContext &, TableFunctionBindInput &,
                                              vector<LogicalType> &return_types, vector<string> &names) {
	names = {"mime", "extension", "aliases", "extension_aliases", "kind", "parent", "depth"};
	return_types = {LogicalType::VARCHAR,
	                LogicalType::VARCHAR,
	                LogicalType::LIST(LogicalType::VARCHAR),
	                LogicalType::LIST(LogicalType::VARCHAR),
	                LogicalType::VARCHAR,
	                LogicalType::VARCHAR,
	                LogicalType::BIGINT};
	return nullptr;
}

static unique_ptr<GlobalTableFunctionState> MimeTypesInit(ClientContext &, TableFunctionInitInput &) {
	return make_uniq<MimeTypesState>();
}

static Value StringList(const std::vector<std::string> &values) {
	vector<Value> items;
	for (const auto &value : values) {
		items.emplace_back(value);
	}
	return Value::LIST(LogicalType::VARCHAR, std::move(items));
}

static void MimeTypesScan(ClientContext &, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<MimeTypesState>();
	const auto &nodes = MimeTree::Get().Nodes();

	idx_t count = 0;
	while (state.offset < nodes.size() && count < STANDARD_VECTOR_SIZE) {
		const auto &node = *nodes[state.offset++];
		output.SetValue(0, count, Value(node.Mime()));
		output.SetValue(1, count, Value(node.Extension()));
		output.SetValue(2, count, StringList(node.Aliases()));
		output.SetValue(3, count, StringList(node.ExtensionAliases()));
		output.SetValue(4, count, Value(MimeKindToString(node.Kind())));
		output.SetValue(5, count, node.Parent() ? Value(node.Parent()->Mime()) : Value(LogicalType::VARCHAR));
		output.SetValue(6, count, Value::BIGINT(static_cast<int64_t>(node.Depth())));
		count++;
	}
	output.SetCardinality(count);
}

TableFunction GetMimeTypesTableFunction() {
	return TableFunction("mime_types", {}, MimeTypesScan, MimeTypesBind, MimeTypesInit);
}

} // namespace duckdb
