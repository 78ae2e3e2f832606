#pragma once

#include "duckdb.hpp"
#include "magic/mime_type.hpp"

#include <string>
#include <vector>

namespace duckdb {

static constexpr const char *MIME_OCTET_STREAM = "application/octet-stream";

// The built-in signature tree. Built on first access (thread-safe, exactly once) and
// immutable afterwards; every caller observes the same root.
class MimeTree {
public:
	static const MimeTree &Get();

	// Fallback node (application/octet-stream); accepts every input.
	const MimeType &Root() const {
		return *root;
	}
	// Every node in pre-order, root first.
	const std::vector<const MimeType *> &Nodes() const {
		return nodes;
	}
	// First node in pre-order whose MIME string or an alias equals `mime` after
	// normalization; nullptr if there is none.
	const MimeType *Find(const std::string &mime) const;

private:
	MimeTree();

	unique_ptr<MimeType> root;
	std::vector<const MimeType *> nodes;
};

} // namespace duckdb
