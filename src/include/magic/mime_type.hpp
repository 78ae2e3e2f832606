#pragma once

#include "duckdb.hpp"
#include "magic/mime_kind.hpp"

#include <memory>
#include <string>
#include <vector>

namespace duckdb {

// Detection predicate for one signature. Must be pure and must not read past `size`;
// an empty input is valid and simply fails to match.
typedef bool (*signature_matcher_t)(const_data_ptr_t input, idx_t size);

// Drops any parameter suffix (everything from the first ';') and surrounding
// whitespace: "text/html; charset=utf-8" -> "text/html".
std::string NormalizeMime(const std::string &mime);

// One node of the detection tree. Children are owned by their parent; the parent
// pointer is a back-reference assigned by AddChild and never owns anything.
// Nodes are only mutated while the tree is being assembled, after that they are
// reachable solely through const references.
class MimeType {
public:
	MimeType(std::string mime, std::string extension, signature_matcher_t matcher,
	         MimeKind kind = MimeKind::UNKNOWN);

	MimeType(const MimeType &) = delete;
	MimeType &operator=(const MimeType &) = delete;

	MimeType &WithAliases(std::vector<std::string> aliases_p);
	MimeType &WithExtensionAliases(std::vector<std::string> extension_aliases_p);
	// Appends `child` after the existing children and returns it.
	MimeType &AddChild(unique_ptr<MimeType> child);

	const std::string &Mime() const {
		return mime;
	}
	const std::string &Extension() const {
		return extension;
	}
	const std::vector<std::string> &Aliases() const {
		return aliases;
	}
	const std::vector<std::string> &ExtensionAliases() const {
		return extension_aliases;
	}
	const std::vector<unique_ptr<MimeType>> &Children() const {
		return children;
	}
	const MimeType *Parent() const {
		return parent;
	}
	signature_matcher_t Matcher() const {
		return matcher;
	}

	// Flags set on this node only.
	MimeKind OwnKind() const {
		return kind;
	}
	// Flags of this node and all of its ancestors.
	MimeKind Kind() const;
	// Number of edges between this node and the root.
	idx_t Depth() const;

	bool Matches(const_data_ptr_t input, idx_t size) const {
		return matcher(input, size);
	}

	// Normalized comparison against the MIME string and every alias.
	bool Is(const std::string &expected) const;

	// Most specific descendant (or this node) accepting `input`. Walks children in
	// order, descends into the first match and never backtracks to its siblings.
	const MimeType &MatchBytes(const_data_ptr_t input, idx_t size) const;

	// Appends this node and its descendants in pre-order.
	void Flatten(std::vector<const MimeType *> &out) const;

private:
	std::string mime;
	std::string extension;
	std::vector<std::string> aliases;
	std::vector<std::string> extension_aliases;
	signature_matcher_t matcher;
	MimeKind kind;
	std::vector<unique_ptr<MimeType>> children;
	const MimeType *parent = nullptr;
};

} // namespace duckdb
