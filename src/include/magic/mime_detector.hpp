#pragma once

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "magic/matcher_registry.hpp"
#include "magic/mime_type.hpp"

#include <string>
#include <vector>

namespace duckdb {

// Entry point for content-based detection. Stateless apart from the process-wide
// signature tree and the two registries (MIME and extension keys), both created on
// first use. Every operation is safe to call from multiple threads.
class MimeDetector {
public:
	// Bytes inspected per input; longer inputs are truncated before any predicate runs.
	static constexpr idx_t READ_LIMIT = 3072;

	// Most specific format for the first READ_LIMIT bytes, the octet-stream root if
	// nothing matches.
	static const MimeType &Detect(const_data_ptr_t input, idx_t size);
	static const MimeType &Detect(const string_t &input);
	// Reads the head of `path` through `fs`. Throws IOException when it cannot be read.
	static const MimeType &DetectFile(FileSystem &fs, const std::string &path);
	// As DetectFile, but nullptr for a file that does not exist.
	static const MimeType *TryDetectFile(FileSystem &fs, const std::string &path);

	// At most READ_LIMIT bytes from the start of the file. Throws IOException when the
	// file cannot be opened or read.
	static std::vector<data_t> ReadFileHead(FileSystem &fs, const std::string &path);
	// As ReadFileHead, but returns false (leaving `buffer` empty) for a missing file.
	static bool TryReadFileHead(FileSystem &fs, const std::string &path, std::vector<data_t> &buffer);

	static bool Equals(const MimeType &format, const std::string &candidate);
	// `mime` is looked up in the tree so that its aliases count; an unknown string
	// compares by normalized value only.
	static bool Equals(const std::string &mime, const std::string &candidate);
	static bool EqualsAny(const std::string &candidate, const std::vector<std::string> &targets);

	// ".png" for "png", " .png " and ".png"; empty stays empty.
	static std::string NormalizeExtension(const std::string &extension);

	static void RegisterMime(const std::string &mime, byte_predicate_t predicate);
	static void RegisterExtension(const std::string &extension, byte_predicate_t predicate);
	static bool IsSupported(const std::string &mime);
	static bool IsSupportedExtension(const std::string &extension);

	static bool MatchMime(const_data_ptr_t input, idx_t size, const std::string &mime);
	static bool MatchExtension(const_data_ptr_t input, idx_t size, const std::string &extension);
	static bool MatchFile(FileSystem &fs, const std::string &path, const std::string &mime);
	static bool MatchFileExtension(FileSystem &fs, const std::string &path, const std::string &extension);
};

} // namespace duckdb
