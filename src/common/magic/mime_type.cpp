#include "magic/mime_type.hpp"

#include "duckdb/common/string_util.hpp"

#include <utility>

namespace duckdb {

std::string NormalizeMime(const std::string &mime) {
	auto normalized = mime.substr(0, mime.find(';'));
	StringUtil::Trim(normalized);
	return normalized;
}

MimeType::MimeType(std::string mime_p, std::string extension_p, signature_matcher_t matcher_p, MimeKind kind_p)
    : mime(std::move(mime_p)), extension(std::move(extension_p)), matcher(matcher_p), kind(kind_p) {
	D_ASSERT(matcher);
}

MimeType &MimeType::WithAliases(std::vector<std::string> aliases_p) {
	aliases = std::move(aliases_p);
	return *this;
}

MimeType &MimeType::WithExtensionAliases(std::vector<std::string> extension_aliases_p) {
	extension_aliases = std::move(extension_aliases_p);
	return *this;
}

MimeType &MimeType::AddChild(unique_ptr<MimeType> child) {
	D_ASSERT(child && !child->parent);
	child->parent = this;
	children.push_back(std::move(child));
	return *children.back();
}

MimeKind MimeType::Kind() const {
	auto result = kind;
	for (auto node = parent; node; node = node->parent) {
		result |= node->kind;
	}
	return result;
}

idx_t MimeType::Depth() const {
	idx_t depth = 0;
	for (auto node = parent; node; node = node->parent) {
		depth++;
	}
	return depth;
}

bool MimeType::Is(const std::string &expected) const {
	const auto wanted = NormalizeMime(expected);
	if (wanted == NormalizeMime(mime)) {
		return true;
	}
	for (const auto &alias : aliases) {
		if (wanted == NormalizeMime(alias)) {
			return true;
		}
	}
	return false;
}

const MimeType &MimeType::MatchBytes(const_data_ptr_t input, idx_t size) const {
	for (const auto &child : children) {
		if (child->Matches(input, size)) {
			return child->MatchBytes(input, size);
		}
	}
	return *this;
}

void MimeType::Flatten(std::vector<const MimeType *> &out) const {
	out.push_back(this);
	for (const auto &child : children) {
		child->Flatten(out);
	}
}

} // namespace duckdb
