#pragma once

#include "duckdb.hpp"

namespace duckdb {

// Content-based file type detection: detect_*, match_*, mime_* scalar functions and
// the mime_types() catalog.
class MagicUdfsExtension : public Extension {
public:
	// Registers the detection functions and the magic_ignore_missing_files option
	void Load(ExtensionLoader &loader) override;

	// "magic_udfs", the name used by LOAD and `require`
	std::string Name() override;

	// EXT_VERSION_MAGIC_UDFS when the build defines it, empty otherwise
	std::string Version() const override;
};

} // namespace duckdb
