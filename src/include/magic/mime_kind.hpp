#pragma once

#include "duckdb.hpp"
#include <cstdint>
#include <string>

namespace duckdb {

// Format categories. A format may belong to several at once (XLSX is SPREADSHEET and,
// through its ZIP parent, ARCHIVE).
enum class MimeKind : uint32_t {
	UNKNOWN = 0,
	ARCHIVE = 1u << 0,
	VIDEO = 1u << 1,
	AUDIO = 1u << 2,
	IMAGE = 1u << 3,
	DOCUMENT = 1u << 4,
	TEXT = 1u << 5,
	FONT = 1u << 6,
	EXECUTABLE = 1u << 7,
	APPLICATION = 1u << 8,
	MODEL = 1u << 9,
	DATABASE = 1u << 10,
	SPREADSHEET = 1u << 11,
	PRESENTATION = 1u << 12
};

inline MimeKind operator|(MimeKind lhs, MimeKind rhs) {
	return static_cast<MimeKind>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

inline MimeKind &operator|=(MimeKind &lhs, MimeKind rhs) {
	lhs = lhs | rhs;
	return lhs;
}

// True if every bit of `flag` is set in `kinds`. UNKNOWN is contained in everything.
inline bool HasKind(MimeKind kinds, MimeKind flag) {
	const auto bits = static_cast<uint32_t>(flag);
	return (static_cast<uint32_t>(kinds) & bits) == bits;
}

// "IMAGE", "ARCHIVE | SPREADSHEET", ... in bit order; "UNKNOWN" when no bit is set.
std::string MimeKindToString(MimeKind kind);

} // namespace duckdb
