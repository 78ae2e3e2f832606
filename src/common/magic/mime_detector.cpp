#include "magic/mime_detector.hpp"
#include "magic/mime_tree.hpp"

#include "duckdb/common/string_util.hpp"

#include <functional>
#include <mutex>
#include <utility>

namespace duckdb {

// -----------------------------------------------------------------------------
// Registries
// -----------------------------------------------------------------------------
struct DetectorRegistries {
	MatcherRegistry mimes;
	MatcherRegistry extensions;
};

static void AddIfNotEmpty(MatcherRegistry &registry, const std::string &key, signature_matcher_t matcher) {
	if (!key.empty()) {
		registry.Register(key, matcher);
	}
}

// Every node of the tree answers for its own MIME string, aliases and extensions.
static void RegisterBuiltins(DetectorRegistries &registries) {
	for (auto node : MimeTree::Get().Nodes()) {
		const auto matcher = node->Matcher();
		AddIfNotEmpty(registries.mimes, NormalizeMime(node->Mime()), matcher);
		for (const auto &alias : node->Aliases()) {
			AddIfNotEmpty(registries.mimes, NormalizeMime(alias), matcher);
		}
		AddIfNotEmpty(registries.extensions, MimeDetector::NormalizeExtension(node->Extension()), matcher);
		for (const auto &alias : node->ExtensionAliases()) {
			AddIfNotEmpty(registries.extensions, MimeDetector::NormalizeExtension(alias), matcher);
		}
	}
}

static DetectorRegistries &GetRegistries() {
	static DetectorRegistries registries;
	static std::once_flag builtins_registered;
	std::call_once(builtins_registered, RegisterBuiltins, std::ref(registries));
	return registries;
}

static idx_t Truncate(idx_t size) {
	return MinValue<idx_t>(size, MimeDetector::READ_LIMIT);
}

// -----------------------------------------------------------------------------
// Detection
// -----------------------------------------------------------------------------
const MimeType &MimeDetector::Detect(const_data_ptr_t input, idx_t size) {
	return MimeTree::Get().Root().MatchBytes(input, Truncate(size));
}

const MimeType &MimeDetector::Detect(const string_t &input) {
	return Detect(const_data_ptr_cast(input.GetData()), input.GetSize());
}

static void ReadHead(FileHandle &handle, std::vector<data_t> &buffer) {
	buffer.resize(MimeDetector::READ_LIMIT);
	idx_t total = 0;
	while (total < MimeDetector::READ_LIMIT) {
		const auto read = handle.Read(buffer.data() + total, MimeDetector::READ_LIMIT - total);
		if (read <= 0) {
			break;
		}
		total += static_cast<idx_t>(read);
	}
	buffer.resize(total);
}

std::vector<data_t> MimeDetector::ReadFileHead(FileSystem &fs, const std::string &path) {
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ);
	std::vector<data_t> buffer;
	ReadHead(*handle, buffer);
	return buffer;
}

bool MimeDetector::TryReadFileHead(FileSystem &fs, const std::string &path, std::vector<data_t> &buffer) {
	buffer.clear();
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ | FileFlags::FILE_FLAGS_NULL_IF_NOT_EXISTS);
	if (!handle) {
		return false;
	}
	ReadHead(*handle, buffer);
	return true;
}

const MimeType &MimeDetector::DetectFile(FileSystem &fs, const std::string &path) {
	const auto buffer = ReadFileHead(fs, path);
	return Detect(buffer.data(), buffer.size());
}

const MimeType *MimeDetector::TryDetectFile(FileSystem &fs, const std::string &path) {
	std::vector<data_t> buffer;
	if (!TryReadFileHead(fs, path, buffer)) {
		return nullptr;
	}
	return &Detect(buffer.data(), buffer.size());
}

// -----------------------------------------------------------------------------
// Comparison
// -----------------------------------------------------------------------------
bool MimeDetector::Equals(const MimeType &format, const std::string &candidate) {
	return format.Is(candidate);
}

bool MimeDetector::Equals(const std::string &mime, const std::string &candidate) {
	auto format = MimeTree::Get().Find(mime);
	if (format) {
		return Equals(*format, candidate);
	}
	return NormalizeMime(mime) == NormalizeMime(candidate);
}

bool MimeDetector::EqualsAny(const std::string &candidate, const std::vector<std::string> &targets) {
	for (const auto &target : targets) {
		if (Equals(target, candidate)) {
			return true;
		}
	}
	return false;
}

std::string MimeDetector::NormalizeExtension(const std::string &extension) {
	auto normalized = extension;
	StringUtil::Trim(normalized);
	if (!normalized.empty() && normalized[0] != '.') {
		normalized.insert(normalized.begin(), '.');
	}
	return normalized;
}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------
void MimeDetector::RegisterMime(const std::string &mime, byte_predicate_t predicate) {
	GetRegistries().mimes.Register(NormalizeMime(mime), std::move(predicate));
}

void MimeDetector::RegisterExtension(const std::string &extension, byte_predicate_t predicate) {
	GetRegistries().extensions.Register(NormalizeExtension(extension), std::move(predicate));
}

bool MimeDetector::IsSupported(const std::string &mime) {
	return GetRegistries().mimes.IsRegistered(NormalizeMime(mime));
}

bool MimeDetector::IsSupportedExtension(const std::string &extension) {
	return GetRegistries().extensions.IsRegistered(NormalizeExtension(extension));
}

bool MimeDetector::MatchMime(const_data_ptr_t input, idx_t size, const std::string &mime) {
	return GetRegistries().mimes.Matches(NormalizeMime(mime), input, Truncate(size));
}

bool MimeDetector::MatchExtension(const_data_ptr_t input, idx_t size, const std::string &extension) {
	return GetRegistries().extensions.Matches(NormalizeExtension(extension), input, Truncate(size));
}

bool MimeDetector::MatchFile(FileSystem &fs, const std::string &path, const std::string &mime) {
	const auto buffer = ReadFileHead(fs, path);
	return MatchMime(buffer.data(), buffer.size(), mime);
}

bool MimeDetector::MatchFileExtension(FileSystem &fs, const std::string &path, const std::string &extension) {
	const auto buffer = ReadFileHead(fs, path);
	return MatchExtension(buffer.data(), buffer.size(), extension);
}

} // namespace duckdb
