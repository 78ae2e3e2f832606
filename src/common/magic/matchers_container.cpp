#include "magic/signature_matchers.hpp"
#include "magic/byte_matchers.hpp"

namespace duckdb {

// -----------------------------------------------------------------------------
// ZIP local file headers
// -----------------------------------------------------------------------------
static constexpr idx_t ZIP_LOCAL_HEADER_SIZE = 30;
static constexpr idx_t ZIP_ENTRY_SCAN_LIMIT = 100;

struct ZipEntryName {
	const_data_ptr_t data;
	idx_t size;

	bool Equals(const char *name) const {
		return size == strlen(name) && memcmp(data, name, size) == 0;
	}
	bool StartsWith(const char *prefix) const {
		const idx_t prefix_size = strlen(prefix);
		return size >= prefix_size && memcmp(data, prefix, prefix_size) == 0;
	}
};

// Walks the local file headers of a (possibly truncated) archive prefix. Entries
// whose name does not fit in the buffer end the walk.
class ZipEntryIterator {
public:
	ZipEntryIterator(const_data_ptr_t input, idx_t size) : input(input), size(size), pos(0) {
	}

	bool Next(ZipEntryName &entry) {
		if (pos >= size) {
			return false;
		}
		const idx_t header_start = FindBytes(input, size, pos, "PK\x03\x04", 4);
		if (header_start >= size || header_start + ZIP_LOCAL_HEADER_SIZE > size) {
			return false;
		}
		const idx_t name_size = LoadU16LE(input + header_start + 26);
		const idx_t extra_size = LoadU16LE(input + header_start + 28);
		const idx_t name_start = header_start + ZIP_LOCAL_HEADER_SIZE;
		if (name_start + name_size > size) {
			return false;
		}
		entry.data = input + name_start;
		entry.size = name_size;
		pos = name_start + name_size + extra_size;
		return true;
	}

private:
	const_data_ptr_t input;
	idx_t size;
	idx_t pos;
};

struct ZipSearchEntry {
	const char *name;
	// Directories match by prefix, files by exact name.
	bool is_dir;
};

template <idx_t N>
static bool EntryMatches(const ZipEntryName &entry, const ZipSearchEntry (&search)[N]) {
	for (auto &candidate : search) {
		if (candidate.is_dir ? entry.StartsWith(candidate.name) : entry.Equals(candidate.name)) {
			return true;
		}
	}
	return false;
}

template <idx_t N>
static bool ZipHas(const_data_ptr_t input, idx_t size, const ZipSearchEntry (&search)[N], idx_t stop_after) {
	ZipEntryIterator iterator(input, size);
	ZipEntryName entry;
	for (idx_t i = 0; i < stop_after && iterator.Next(entry); i++) {
		if (EntryMatches(entry, search)) {
			return true;
		}
	}
	return false;
}

// Office Open XML: like ZipHas, but the first entry must be one that Office
// writers put first.
template <idx_t N>
static bool MatchOfficeOpenXml(const_data_ptr_t input, idx_t size, const ZipSearchEntry (&search)[N]) {
	static const char *const FIRST_ENTRIES[] = {"[Content_Types].xml", "_rels/.rels", "docProps", "customXml",
	                                            "[trash]"};
	ZipEntryIterator iterator(input, size);
	ZipEntryName entry;
	for (idx_t i = 0; i < ZIP_ENTRY_SCAN_LIMIT && iterator.Next(entry); i++) {
		if (EntryMatches(entry, search)) {
			return true;
		}
		if (i != 0) {
			continue;
		}
		bool expected_first = false;
		for (auto name : FIRST_ENTRIES) {
			expected_first = expected_first || entry.Equals(name);
		}
		if (!expected_first) {
			return false;
		}
	}
	return false;
}

bool MatchZip(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "PK\x03\x04") || HasPrefix(input, size, "PK\x05\x06") ||
	       HasPrefix(input, size, "PK\x07\x08");
}

bool MatchDocx(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"word/", true}};
	return MatchOfficeOpenXml(input, size, SEARCH);
}

bool MatchXlsx(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"xl/", true}};
	return MatchOfficeOpenXml(input, size, SEARCH);
}

bool MatchPptx(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"ppt/", true}};
	return MatchOfficeOpenXml(input, size, SEARCH);
}

bool MatchVsdx(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"visio/", true}};
	return MatchOfficeOpenXml(input, size, SEARCH);
}

// The uncompressed "mimetype" entry comes first, so its content follows the
// first local header directly.
bool MatchEpub(const_data_ptr_t input, idx_t size) {
	return HasBytesAt(input, size, ZIP_LOCAL_HEADER_SIZE, "mimetypeapplication/epub+zip");
}

// Executable jars carry 0xCAFE as the first extra field id of the first entry.
static bool IsExecutableJar(const_data_ptr_t input, idx_t size) {
	if (size < ZIP_LOCAL_HEADER_SIZE) {
		return false;
	}
	const idx_t offset = ZIP_LOCAL_HEADER_SIZE + LoadU16LE(input + 26);
	return offset + 2 <= size && LoadU16LE(input + offset) == 0xCAFE;
}

bool MatchJar(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"META-INF/MANIFEST.MF", false}, {"META-INF/", true}};
	return IsExecutableJar(input, size) || ZipHas(input, size, SEARCH, 1);
}

bool MatchApk(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"AndroidManifest.xml", false},
	                                        {"META-INF/com/android/build/gradle/app-metadata.properties", false},
	                                        {"classes.dex", false},
	                                        {"resources.arsc", false},
	                                        {"res/drawable", true}};
	return ZipHas(input, size, SEARCH, ZIP_ENTRY_SCAN_LIMIT);
}

bool MatchKmz(const_data_ptr_t input, idx_t size) {
	static const ZipSearchEntry SEARCH[] = {{"doc.kml", false}};
	return ZipHas(input, size, SEARCH, ZIP_ENTRY_SCAN_LIMIT);
}

template <idx_t N>
static bool MatchOpenDocument(const_data_ptr_t input, idx_t size, const char (&mime)[N]) {
	return HasBytesAt(input, size, ZIP_LOCAL_HEADER_SIZE, "mimetype") &&
	       HasBytesAt(input, size, ZIP_LOCAL_HEADER_SIZE + 8, mime);
}

bool MatchOdt(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.text");
}

bool MatchOds(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.spreadsheet");
}

bool MatchOdp(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.presentation");
}

bool MatchOdg(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.graphics");
}

bool MatchOdf(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.formula");
}

bool MatchOdc(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.chart");
}

bool MatchOtt(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.text-template");
}

bool MatchOts(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.spreadsheet-template");
}

bool MatchOtp(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.presentation-template");
}

bool MatchOtg(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.oasis.opendocument.graphics-template");
}

bool MatchSxc(const_data_ptr_t input, idx_t size) {
	return MatchOpenDocument(input, size, "application/vnd.sun.xml.calc");
}

// Chrome extension: a "Cr24" header with key and signature, then a ZIP archive.
bool MatchCrx(const_data_ptr_t input, idx_t size) {
	if (size < 16 || !HasPrefix(input, size, "Cr24")) {
		return false;
	}
	const uint64_t zip_offset = 16 + uint64_t(LoadU32LE(input + 8)) + uint64_t(LoadU32LE(input + 12));
	if (zip_offset > size) {
		return false;
	}
	return MatchZip(input + zip_offset, size - zip_offset);
}

// -----------------------------------------------------------------------------
// OLE compound files
// -----------------------------------------------------------------------------
bool MatchOle(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xd0\xcf\x11\xe0\xa1\xb1\x1a\xe1");
}

// Compares the CLSID of the root storage entry, located in the first directory
// sector. Version 4 files (sector shift 0x0C) use 4096-byte sectors.
static bool OleHasClsid(const_data_ptr_t input, idx_t size, const data_t *clsid, idx_t clsid_size) {
	const uint64_t sector_size = (size >= 28 && input[26] == 0x04 && input[27] == 0x00) ? 4096 : 512;
	if (size < sector_size || size < 52) {
		return false;
	}
	const uint64_t first_dir_sector = LoadU32LE(input + 48);
	const uint64_t offset = sector_size * (1 + first_dir_sector) + 80;
	const idx_t compare_size = MinValue<idx_t>(clsid_size, 16);
	if (offset + compare_size > size) {
		return false;
	}
	return memcmp(input + offset, clsid, compare_size) == 0;
}

template <idx_t N>
static bool OleHasClsid(const_data_ptr_t input, idx_t size, const data_t (&clsid)[N]) {
	return OleHasClsid(input, size, clsid, N);
}

bool MatchMsi(const_data_ptr_t input, idx_t size) {
	static const data_t CLSID[] = {0x84, 0x10, 0x0C, 0x00, 0x00, 0x00, 0x00, 0x00,
	                               0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};
	return MatchOle(input, size) && OleHasClsid(input, size, CLSID);
}

bool MatchAaf(const_data_ptr_t input, idx_t size) {
	static const data_t CLSID[] = {0xAA, 0xF0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	                               0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};
	return MatchOle(input, size) && OleHasClsid(input, size, CLSID);
}

bool MatchMsg(const_data_ptr_t input, idx_t size) {
	static const data_t CLSID[] = {0x0B, 0x0D, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00,
	                               0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};
	return MatchOle(input, size) && OleHasClsid(input, size, CLSID);
}

bool MatchPub(const_data_ptr_t input, idx_t size) {
	static const data_t CLSID[] = {0x01, 0x12, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00,
	                               0x00, 0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};
	return MatchOle(input, size) && OleHasClsid(input, size, CLSID);
}

bool MatchOneNote(const_data_ptr_t input, idx_t size) {
	static const data_t CLSID[] = {0x43, 0xAD, 0x43, 0x36, 0x5E, 0x47, 0x96, 0x48,
	                               0x8B, 0x42, 0x04, 0x40, 0xE7, 0x87, 0xC9, 0x30};
	return MatchOle(input, size) && OleHasClsid(input, size, CLSID);
}

// Word 97-2003, Word 6/7 and Word picture documents.
bool MatchDoc(const_data_ptr_t input, idx_t size) {
	if (!MatchOle(input, size)) {
		return false;
	}
	static const data_t VARIANTS[] = {0x06, 0x00, 0x07};
	data_t clsid[] = {0x00, 0x09, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00,
	                  0xc0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x46};
	for (auto variant : VARIANTS) {
		clsid[0] = variant;
		if (OleHasClsid(input, size, clsid)) {
			return true;
		}
	}
	return false;
}

// UTF-16LE stream name anywhere between the directory area and the end of the
// inspected prefix.
template <idx_t N>
static bool HasOleStreamName(const_data_ptr_t input, idx_t size, const data_t (&name)[N]) {
	if (size <= 1152) {
		return false;
	}
	const idx_t end = MinValue<idx_t>(size, 4096);
	return FindBytes(input, end, 1152, reinterpret_cast<const char *>(name), N) < end;
}

bool MatchXls(const_data_ptr_t input, idx_t size) {
	if (!MatchOle(input, size)) {
		return false;
	}
	static const data_t EXCEL_V5[] = {0x10, 0x08, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00};
	static const data_t EXCEL_V7[] = {0x20, 0x08, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00};
	if (OleHasClsid(input, size, EXCEL_V5) || OleHasClsid(input, size, EXCEL_V7)) {
		return true;
	}
	if (size > 520) {
		if (HasBytesAt(input, size, 512, "\x09\x08\x10\x00\x00\x06\x05\x00")) {
			return true;
		}
		static const data_t SECTOR_TYPES[] = {0x10, 0x1F, 0x22, 0x23, 0x28, 0x29};
		if (HasBytesAt(input, size, 512, "\xfd\xff\xff\xff")) {
			for (auto type : SECTOR_TYPES) {
				if (input[516] == type) {
					return true;
				}
			}
		}
	}
	static const data_t WORKBOOK[] = {'W', 0, 'k', 0, 's', 0, 'S', 0, 'S', 0, 'W', 0, 'o',
	                                  0,   'r', 0, 'k', 0, 'B', 0, 'o', 0, 'o', 0, 'k'};
	return HasOleStreamName(input, size, WORKBOOK);
}

bool MatchPpt(const_data_ptr_t input, idx_t size) {
	if (!MatchOle(input, size)) {
		return false;
	}
	static const data_t POWERPOINT_V4[] = {0x10, 0x8d, 0x81, 0x64, 0x9b, 0x4f, 0xcf, 0x11,
	                                       0x86, 0xea, 0x00, 0xaa, 0x00, 0xb9, 0x29, 0xe8};
	static const data_t POWERPOINT_V7[] = {0x70, 0xae, 0x7b, 0xea, 0x3b, 0xfb, 0xcd, 0x11,
	                                       0xa9, 0x03, 0x00, 0xaa, 0x00, 0x51, 0x0e, 0xa3};
	if (OleHasClsid(input, size, POWERPOINT_V4) || OleHasClsid(input, size, POWERPOINT_V7)) {
		return true;
	}
	if (size < 520) {
		return false;
	}
	if (HasBytesAt(input, size, 512, "\xa0\x46\x1d\xf0") || HasBytesAt(input, size, 512, "\x00\x6e\x1e\xf0") ||
	    HasBytesAt(input, size, 512, "\x0f\x00\xe8\x03")) {
		return true;
	}
	if (HasBytesAt(input, size, 512, "\xfd\xff\xff\xff") && input[518] == 0x00 && input[519] == 0x00) {
		return true;
	}
	static const data_t POWERPOINT_DOCUMENT[] = {'P', 0, 'o', 0, 'w', 0, 'e', 0, 'r', 0, 'P', 0, 'o', 0,
	                                             'i', 0, 'n', 0, 't', 0, ' ', 0, 'D', 0, 'o', 0, 'c', 0,
	                                             'u', 0, 'm', 0, 'e', 0, 'n', 0, 't'};
	return HasOleStreamName(input, size, POWERPOINT_DOCUMENT);
}

bool MatchFasoo(const_data_ptr_t input, idx_t size) {
	return MatchOle(input, size) && size > 520 && HasBytesAt(input, size, 512, "FASOO   ");
}

bool MatchPgpNetShare(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "-----BEGIN PGP");
}

// -----------------------------------------------------------------------------
// TAR
// -----------------------------------------------------------------------------
static constexpr idx_t TAR_RECORD_SIZE = 512;

// Octal field: leading spaces and NULs skipped, terminated by a space or NUL.
static bool ParseTarOctal(const_data_ptr_t field, idx_t size, int64_t &result) {
	idx_t pos = 0;
	while (pos < size && (field[pos] == ' ' || field[pos] == 0)) {
		pos++;
	}
	result = 0;
	idx_t digits = 0;
	for (; pos < size && field[pos] != ' ' && field[pos] != 0; pos++) {
		if (field[pos] < '0' || field[pos] > '7') {
			return false;
		}
		result = (result << 3) | (field[pos] - '0');
		digits++;
	}
	return digits > 0;
}

// No magic number for pre-POSIX archives, so the header checksum decides. Both the
// unsigned and the historical signed sums are accepted.
bool MatchTar(const_data_ptr_t input, idx_t size) {
	if (size < TAR_RECORD_SIZE) {
		return false;
	}
	// Gentoo binary packages
	if (FindBytes(input, 100, 0, "/gpkg-1\x00", 8) < 100) {
		return false;
	}
	int64_t recorded = 0;
	if (!ParseTarOctal(input + 148, 8, recorded)) {
		return false;
	}
	int64_t unsigned_sum = 0;
	int64_t signed_sum = 0;
	for (idx_t i = 0; i < TAR_RECORD_SIZE; i++) {
		const data_t c = (i >= 148 && i < 156) ? ' ' : input[i];
		unsigned_sum += c;
		signed_sum += static_cast<int8_t>(c);
	}
	return recorded == unsigned_sum || recorded == signed_sum;
}

// -----------------------------------------------------------------------------
// ISO base media file format
// -----------------------------------------------------------------------------

// Leading ftyp box with a plausible size.
bool MatchMp4(const_data_ptr_t input, idx_t size) {
	if (size < 12) {
		return false;
	}
	const idx_t box_size = LoadU32BE(input);
	if (box_size < 12 || box_size % 4 != 0 || box_size > size) {
		return false;
	}
	return HasBytesAt(input, size, 4, "ftyp");
}

static bool HasMajorBrand(const_data_ptr_t input, idx_t size, const char *const *brands, idx_t count) {
	if (size < 12 || !HasBytesAt(input, size, 4, "ftyp")) {
		return false;
	}
	for (idx_t i = 0; i < count; i++) {
		if (memcmp(input + 8, brands[i], 4) == 0) {
			return true;
		}
	}
	return false;
}

template <idx_t N>
static bool HasMajorBrand(const_data_ptr_t input, idx_t size, const char *const (&brands)[N]) {
	return HasMajorBrand(input, size, brands, N);
}

bool MatchAvif(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"avif", "avis"};
	return HasMajorBrand(input, size, BRANDS);
}

bool Match3gpp(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"3gp4", "3gp5", "3gp6", "3gp7", "3gp8", "3gp9", "3gpa", "3gpp"};
	return HasMajorBrand(input, size, BRANDS);
}

bool Match3gpp2(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"3g24", "3g25", "3g26", "3g27", "3g28", "3g29", "3g2a", "3g2b", "3g2c"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchAudioMp4(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"M4A "};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchM4a(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"M4A "};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchM4v(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"M4V "};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchHeic(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"heic", "heix"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchHeicSequence(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"hevc"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchHeif(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"mif1", "msf1"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchHeifSequence(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"msf1"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchMj2(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"mj2s", "mjp2"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchDvb(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"dvb1"};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchQuickTime(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"qt  "};
	return HasMajorBrand(input, size, BRANDS);
}

bool MatchMqv(const_data_ptr_t input, idx_t size) {
	static const char *const BRANDS[] = {"mqt "};
	return HasMajorBrand(input, size, BRANDS);
}

// -----------------------------------------------------------------------------
// Matroska
// -----------------------------------------------------------------------------

// Width in bytes of an EBML variable-size integer, from its leading byte.
static idx_t EbmlVintWidth(data_t lead) {
	idx_t width = 1;
	data_t mask = 0x80;
	while (width < 8 && (lead & mask) == 0) {
		mask >>= 1;
		width++;
	}
	return width;
}

// Reads the DocType element (id 0x4282) of the EBML header.
template <idx_t N>
static bool HasMatroskaDocType(const_data_ptr_t input, idx_t size, const char (&doc_type)[N]) {
	if (!HasPrefix(input, size, "\x1a\x45\xdf\xa3")) {
		return false;
	}
	const idx_t window = MinValue<idx_t>(size, 4096);
	idx_t pos = FindBytes(input, window, 0, "\x42\x82", 2);
	if (pos >= window) {
		return false;
	}
	pos += 2;
	if (pos >= size) {
		return false;
	}
	pos += EbmlVintWidth(input[pos]);
	if (pos >= size) {
		return false;
	}
	return HasBytesAt(input, size, pos, doc_type);
}

bool MatchWebm(const_data_ptr_t input, idx_t size) {
	return HasMatroskaDocType(input, size, "webm");
}

bool MatchMkv(const_data_ptr_t input, idx_t size) {
	return HasMatroskaDocType(input, size, "matroska");
}

} // namespace duckdb
