#pragma once

#include "duckdb.hpp"
#include "duckdb/common/string_util.hpp"

#include <cstdint>
#include <cstring>

namespace duckdb {

// ---- Bounds-checked helpers shared by the signature predicates ----
// Every helper returns false (or a neutral value) instead of reading past `size`.

inline bool BytesAt(const_data_ptr_t input, idx_t size, idx_t offset, const char *sig, idx_t sig_size) {
	if (offset > size || size - offset < sig_size) {
		return false;
	}
	return memcmp(input + offset, sig, sig_size) == 0;
}

// String-literal overloads; the terminating NUL of the literal is not part of the
// signature, embedded NULs are.
template <idx_t N>
inline bool HasPrefix(const_data_ptr_t input, idx_t size, const char (&sig)[N]) {
	return BytesAt(input, size, 0, sig, N - 1);
}

template <idx_t N>
inline bool HasBytesAt(const_data_ptr_t input, idx_t size, idx_t offset, const char (&sig)[N]) {
	return BytesAt(input, size, offset, sig, N - 1);
}

// Caller guarantees offset + 2 <= size.
inline uint16_t LoadU16LE(const_data_ptr_t p) {
	return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// Caller guarantees offset + 4 <= size.
inline uint32_t LoadU32LE(const_data_ptr_t p) {
	return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

inline uint32_t LoadU32BE(const_data_ptr_t p) {
	return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

// Position of the first occurrence of `needle` at or after `from`, or `size` if absent.
inline idx_t FindBytes(const_data_ptr_t input, idx_t size, idx_t from, const char *needle, idx_t needle_size) {
	if (needle_size == 0 || needle_size > size) {
		return size;
	}
	for (idx_t pos = from; pos + needle_size <= size; pos++) {
		if (input[pos] == static_cast<data_t>(needle[0]) && memcmp(input + pos, needle, needle_size) == 0) {
			return pos;
		}
	}
	return size;
}

template <idx_t N>
inline bool ContainsBytes(const_data_ptr_t input, idx_t size, const char (&needle)[N]) {
	return FindBytes(input, size, 0, needle, N - 1) < size;
}

// Offset of the first byte that is not ASCII whitespace.
inline idx_t SkipWhitespace(const_data_ptr_t input, idx_t size) {
	idx_t pos = 0;
	while (pos < size && StringUtil::CharacterIsSpace(static_cast<char>(input[pos]))) {
		pos++;
	}
	return pos;
}

// ASCII case-insensitive prefix test; `lower_sig` must already be lower case.
inline bool HasPrefixIgnoreCase(const_data_ptr_t input, idx_t size, const char *lower_sig) {
	const idx_t sig_size = strlen(lower_sig);
	if (size < sig_size) {
		return false;
	}
	for (idx_t i = 0; i < sig_size; i++) {
		if (StringUtil::CharacterToLower(static_cast<char>(input[i])) != lower_sig[i]) {
			return false;
		}
	}
	return true;
}

inline idx_t CountByte(const_data_ptr_t input, idx_t size, data_t target) {
	idx_t count = 0;
	for (idx_t i = 0; i < size; i++) {
		count += input[i] == target;
	}
	return count;
}

} // namespace duckdb
