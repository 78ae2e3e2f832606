#pragma once

#include "duckdb.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace duckdb {
namespace test {

// Signature, IHDR chunk, and optionally an acTL chunk right after it.
inline std::vector<data_t> PngBytes(bool animated) {
	std::vector<data_t> png(64, 0);
	memcpy(png.data(), "\x89PNG\r\n\x1a\n", 8);
	png[11] = 0x0D;
	memcpy(png.data() + 12, "IHDR", 4);
	if (animated) {
		png[36] = 0x08;
		memcpy(png.data() + 37, "acTL", 4);
	}
	return png;
}

// 64-bit little-endian ELF header with the given e_type.
inline std::vector<data_t> ElfBytes(data_t type) {
	std::vector<data_t> elf(64, 0);
	memcpy(elf.data(), "\x7f" "ELF", 4);
	elf[4] = 2;
	elf[5] = 1;
	elf[6] = 1;
	elf[16] = type;
	return elf;
}

// A single ftyp box carrying `brand` as major and compatible brand.
inline std::vector<data_t> FtypBytes(const char *brand) {
	std::vector<data_t> box(24, 0);
	box[3] = 24;
	memcpy(box.data() + 4, "ftyp", 4);
	memcpy(box.data() + 8, brand, 4);
	memcpy(box.data() + 16, brand, 4);
	return box;
}

// Stored (uncompressed) ZIP local file header followed by the entry name and data.
inline void AppendZipEntry(std::vector<data_t> &zip, const std::string &name, const std::string &content = "") {
	data_t header[30] = {'P', 'K', 3, 4, 20, 0};
	const auto content_size = static_cast<uint32_t>(content.size());
	for (idx_t i = 0; i < 4; i++) {
		header[18 + i] = static_cast<data_t>(content_size >> (8 * i));
		header[22 + i] = static_cast<data_t>(content_size >> (8 * i));
	}
	header[26] = static_cast<data_t>(name.size() & 0xFF);
	header[27] = static_cast<data_t>(name.size() >> 8);
	zip.insert(zip.end(), header, header + sizeof(header));
	zip.insert(zip.end(), name.begin(), name.end());
	zip.insert(zip.end(), content.begin(), content.end());
}

// ustar header for an empty regular file, with a valid checksum.
inline std::vector<data_t> TarHeader(const std::string &name) {
	std::vector<data_t> tar(512, 0);
	auto put = [&](idx_t offset, const char *field) {
		memcpy(tar.data() + offset, field, strlen(field));
	};
	put(0, name.c_str());
	put(100, "0000644");
	put(108, "0001750");
	put(116, "0001750");
	put(124, "00000000000");
	put(136, "14712345670");
	tar[156] = '0';
	put(257, "ustar");
	put(263, "00");

	memset(tar.data() + 148, ' ', 8);
	unsigned sum = 0;
	for (auto c : tar) {
		sum += c;
	}
	char checksum[8];
	snprintf(checksum, sizeof(checksum), "%06o", sum);
	memcpy(tar.data() + 148, checksum, 7);
	return tar;
}

inline std::vector<data_t> Bytes(const std::string &text) {
	return std::vector<data_t>(text.begin(), text.end());
}

} // namespace test
} // namespace duckdb
