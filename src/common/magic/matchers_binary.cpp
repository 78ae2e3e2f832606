#include "magic/signature_matchers.hpp"
#include "magic/byte_matchers.hpp"

namespace duckdb {

bool MatchAny(const_data_ptr_t, idx_t) {
	return true;
}

// -----------------------------------------------------------------------------
// Documents and images
// -----------------------------------------------------------------------------
bool MatchPdf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "%PDF-");
}

bool MatchFdf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "%FDF-");
}

bool MatchPs(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "%!PS-Adobe-");
}

bool MatchP7s(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "-----BEGIN PKCS7-----");
}

bool MatchXpm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "/* XPM */");
}

bool MatchPsd(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "8BPS");
}

// Netpbm family: "P" followed by the ASCII and binary variant digits.
bool MatchPbm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "P1") || HasPrefix(input, size, "P4");
}

bool MatchPgm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "P2") || HasPrefix(input, size, "P5");
}

bool MatchPpm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "P3") || HasPrefix(input, size, "P6");
}

bool MatchPam(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "P7");
}

bool MatchPng(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x89PNG\r\n\x1a\n");
}

// Animated PNG carries an acTL chunk right after the IHDR chunk.
bool MatchApng(const_data_ptr_t input, idx_t size) {
	return MatchPng(input, size) && HasBytesAt(input, size, 37, "acTL");
}

bool MatchJpg(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xff\xd8\xff");
}

bool MatchJxl(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xff\x0a") || HasPrefix(input, size, "\x00\x00\x00\x0cJXL \x0d\x0a\x87\x0a");
}

// JPEG 2000 family: signature box, then the brand of the ftyp box at offset 20.
static bool MatchJpeg2000(const_data_ptr_t input, idx_t size, const char *brand) {
	if (size < 24) {
		return false;
	}
	if (!HasBytesAt(input, size, 4, "jP  ") && !HasBytesAt(input, size, 4, "jP2 ")) {
		return false;
	}
	return BytesAt(input, size, 20, brand, 4);
}

bool MatchJp2(const_data_ptr_t input, idx_t size) {
	return MatchJpeg2000(input, size, "jp2 ");
}

bool MatchJpx(const_data_ptr_t input, idx_t size) {
	return MatchJpeg2000(input, size, "jpx ");
}

bool MatchJpm(const_data_ptr_t input, idx_t size) {
	return MatchJpeg2000(input, size, "jpm ");
}

bool MatchJxs(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x00\x00\x00\x0c\x4a\x58\x53\x20\x0d\x0a\x87\x0a");
}

bool MatchJxr(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x49\x49\xbc\x01");
}

bool MatchGif(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "GIF87a") || HasPrefix(input, size, "GIF89a");
}

bool MatchWebp(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "RIFF") && HasBytesAt(input, size, 8, "WEBP");
}

bool MatchTiff(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "II*\x00") || HasPrefix(input, size, "MM\x00*");
}

bool MatchBmp(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "BM");
}

bool MatchIco(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x00\x00\x01\x00");
}

bool MatchIcns(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "icns");
}

bool MatchBpg(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "BPG\xfb");
}

bool MatchXcf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "gimp xcf");
}

bool MatchPat(const_data_ptr_t input, idx_t size) {
	return size > 24 && HasBytesAt(input, size, 20, "GPAT");
}

bool MatchGbr(const_data_ptr_t input, idx_t size) {
	return size > 24 && HasBytesAt(input, size, 20, "GIMP");
}

bool MatchHdr(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#?RADIANCE\n");
}

// "AC" followed by one of the known release codes.
bool MatchDwg(const_data_ptr_t input, idx_t size) {
	static const char *const DWG_VERSIONS[] = {"1.40", "1.50", "2.10", "1002", "1003", "1004", "1006", "1009",
	                                           "1012", "1014", "1015", "1018", "1021", "1024", "1032"};
	if (size < 6 || !HasPrefix(input, size, "AC")) {
		return false;
	}
	for (auto version : DWG_VERSIONS) {
		if (BytesAt(input, size, 2, version, 4)) {
			return true;
		}
	}
	return false;
}

bool MatchDxf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "  0\nSECTION\n") || HasPrefix(input, size, "  0\r\nSECTION\r\n") ||
	       HasPrefix(input, size, "0\nSECTION\n") || HasPrefix(input, size, "0\r\nSECTION\r\n");
}

bool MatchDjvu(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "AT&TFORM") && HasBytesAt(input, size, 12, "DJVU");
}

bool MatchFits(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "SIMPLE  =                    T");
}

// DICOM: 128-byte preamble, then "DICM".
bool MatchDcm(const_data_ptr_t input, idx_t size) {
	return HasBytesAt(input, size, 128, "DICM");
}

// WordPerfect: "\xffWPC", product type 1, file type 10.
bool MatchWpd(const_data_ptr_t input, idx_t size) {
	if (size < 10 || !HasPrefix(input, size, "\xffWPC")) {
		return false;
	}
	return input[8] == 1 && input[9] == 10;
}

bool MatchChm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "ITSF\x03\x00\x00\x00");
}

// Palm database header: type and creator at offset 60.
bool MatchMobi(const_data_ptr_t input, idx_t size) {
	return HasBytesAt(input, size, 60, "BOOKMOBI");
}

bool MatchLit(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "ITOLITLS");
}

// -----------------------------------------------------------------------------
// Audio and video
// -----------------------------------------------------------------------------
bool MatchOgg(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "OggS");
}

// The codec identification header of the first Ogg page starts at offset 28.
bool MatchOggAudio(const_data_ptr_t input, idx_t size) {
	if (size < 37) {
		return false;
	}
	return HasBytesAt(input, size, 28, "\x7f" "FLAC") || HasBytesAt(input, size, 28, "\x01vorbis") ||
	       HasBytesAt(input, size, 28, "OpusHead") || HasBytesAt(input, size, 28, "Speex   ");
}

bool MatchOggVideo(const_data_ptr_t input, idx_t size) {
	if (size < 37) {
		return false;
	}
	return HasBytesAt(input, size, 28, "\x80theora") || HasBytesAt(input, size, 28, "fishead\x00") ||
	       HasBytesAt(input, size, 28, "\x01video\x00\x00\x00");
}

// ID3v2 tag, or an MPEG-1/2 layer III frame sync.
bool MatchMp3(const_data_ptr_t input, idx_t size) {
	if (size < 3) {
		return false;
	}
	if (HasPrefix(input, size, "ID3")) {
		return true;
	}
	const uint16_t header = static_cast<uint16_t>(((input[0] << 8) | input[1]) & 0xFFFE);
	return header == 0xFFFA || header == 0xFFF2 || header == 0xFFE2;
}

bool MatchFlac(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "fLaC");
}

bool MatchMidi(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "MThd");
}

bool MatchApe(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "MAC \x96\x0f\x00\x00\x34\x00\x00\x00\x18\x00\x00\x00\x90\xe3");
}

bool MatchMusepack(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "MPCK");
}

bool MatchAmr(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!AMR");
}

bool MatchWav(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "RIFF") && HasBytesAt(input, size, 8, "WAVE");
}

bool MatchAiff(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "FORM") && HasBytesAt(input, size, 8, "AIFF");
}

bool MatchAu(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, ".snd");
}

// ADTS frame sync for MPEG-4 and MPEG-2 AAC.
bool MatchAac(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xff\xf1") || HasPrefix(input, size, "\xff\xf9");
}

bool MatchVoc(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "Creative Voice File");
}

bool MatchM3u(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#EXTM3U");
}

bool MatchQcp(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "RIFF") && HasBytesAt(input, size, 8, "QLCM");
}

// MPEG program stream: start code prefix and a system stream id 0xB0..0xBF.
bool MatchMpeg(const_data_ptr_t input, idx_t size) {
	return size > 3 && HasPrefix(input, size, "\x00\x00\x01") && input[3] >= 0xB0 && input[3] <= 0xBF;
}

bool MatchAvi(const_data_ptr_t input, idx_t size) {
	return size > 16 && HasPrefix(input, size, "RIFF") && HasBytesAt(input, size, 8, "AVI LIST");
}

bool MatchFlv(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "FLV");
}

bool MatchAsf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x30\x26\xb2\x75\x8e\x66\xcf\x11\xa6\xd9\x00\xaa\x00\x62\xce\x6c");
}

bool MatchRmvb(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, ".RMF");
}

// -----------------------------------------------------------------------------
// Archives and compression
// -----------------------------------------------------------------------------
bool MatchSevenZ(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "7z\xbc\xaf\x27\x1c");
}

bool MatchGzip(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x1f\x8b");
}

bool MatchBz2(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "BZ");
}

bool MatchXz(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xfd" "7zXZ\x00");
}

// Zstandard frames (versions 0.2 to 0.8 magic range) and skippable frames.
bool MatchZstd(const_data_ptr_t input, idx_t size) {
	if (size < 4) {
		return false;
	}
	const uint32_t magic = LoadU32LE(input);
	return (magic >= 0xFD2FB522u && magic <= 0xFD2FB528u) || (magic >= 0x184D2A50u && magic <= 0x184D2A5Fu);
}

bool MatchLzip(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "LZIP");
}

bool MatchRar(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "Rar!\x1a\x07\x00") || HasPrefix(input, size, "Rar!\x1a\x07\x01\x00");
}

bool MatchCab(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "MSCF");
}

bool MatchInstallShieldCab(const_data_ptr_t input, idx_t size) {
	if (size <= 7 || !HasPrefix(input, size, "ISc(")) {
		return false;
	}
	return input[6] == 0 && (input[7] == 1 || input[7] == 2 || input[7] == 4);
}

// Binary cpio (old format, either byte order) and the ASCII header variants.
bool MatchCpio(const_data_ptr_t input, idx_t size) {
	if (size < 6) {
		return false;
	}
	const uint16_t magic = LoadU16LE(input);
	if (magic == 070707 || magic == 0xC7C7) {
		return true;
	}
	return HasPrefix(input, size, "070701") || HasPrefix(input, size, "070702") || HasPrefix(input, size, "070707");
}

bool MatchAr(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "!<arch>");
}

// A Debian package is an ar archive whose first member is "debian-binary".
bool MatchDeb(const_data_ptr_t input, idx_t size) {
	return size > 21 && HasBytesAt(input, size, 8, "debian-binary");
}

bool MatchRpm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xed\xab\xee\xdb");
}

bool MatchXar(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "xar!");
}

bool MatchTorrent(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "d8:announce") || HasPrefix(input, size, "d7:comment") ||
	       HasPrefix(input, size, "d4:info");
}

// -----------------------------------------------------------------------------
// Executables and bytecode
// -----------------------------------------------------------------------------
bool MatchExe(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "MZ");
}

bool MatchElf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x7f" "ELF");
}

// e_type is a 16-bit field at offset 16; only the little-endian low byte is used.
static bool MatchElfType(const_data_ptr_t input, idx_t size, data_t type) {
	if (size < 18 || !MatchElf(input, size)) {
		return false;
	}
	return input[16] == type && input[17] == 0;
}

bool MatchElfObj(const_data_ptr_t input, idx_t size) {
	return MatchElfType(input, size, 1);
}

bool MatchElfExe(const_data_ptr_t input, idx_t size) {
	return MatchElfType(input, size, 2);
}

bool MatchElfLib(const_data_ptr_t input, idx_t size) {
	return MatchElfType(input, size, 3);
}

bool MatchElfDump(const_data_ptr_t input, idx_t size) {
	return MatchElfType(input, size, 4);
}

bool MatchMachO(const_data_ptr_t input, idx_t size) {
	if (size < 4) {
		return false;
	}
	const uint32_t magic = LoadU32LE(input);
	return magic == 0xFEEDFACEu || magic == 0xFEEDFACFu || magic == 0xCAFEBABEu || magic == 0xCFFAEDFEu ||
	       magic == 0xCEFAEDFEu;
}

bool MatchClass(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xca\xfe\xba\xbe");
}

bool MatchWasm(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x00" "asm");
}

bool MatchSwf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "FWS") || HasPrefix(input, size, "CWS") || HasPrefix(input, size, "ZWS");
}

bool MatchLnk(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "L\x00\x00\x00\x01\x14\x02\x00");
}

bool MatchNes(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "NES\x1a");
}

// -----------------------------------------------------------------------------
// Fonts
// -----------------------------------------------------------------------------
bool MatchTtf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x00\x01\x00\x00") || HasPrefix(input, size, "true") ||
	       HasPrefix(input, size, "typ1");
}

bool MatchOtf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "OTTO");
}

bool MatchTtc(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "ttcf");
}

bool MatchWoff(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "wOFF");
}

bool MatchWoff2(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "wOF2");
}

// Embedded OpenType: 34 zero bytes of header fields, then the "LP" magic.
bool MatchEot(const_data_ptr_t input, idx_t size) {
	if (size < 36) {
		return false;
	}
	for (idx_t i = 0; i < 34; i++) {
		if (input[i] != 0) {
			return false;
		}
	}
	return HasBytesAt(input, size, 34, "LP");
}

// -----------------------------------------------------------------------------
// Databases, geospatial, models, misc
// -----------------------------------------------------------------------------
bool MatchSqlite(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "SQLite format 3\x00");
}

bool MatchMdb(const_data_ptr_t input, idx_t size) {
	return size >= 32 && HasBytesAt(input, size, 4, "Standard Jet DB");
}

bool MatchAccdb(const_data_ptr_t input, idx_t size) {
	return size >= 32 && HasBytesAt(input, size, 4, "Standard ACE DB");
}

// dBase: a known version byte followed by a binary header (date, record counts).
bool MatchDbf(const_data_ptr_t input, idx_t size) {
	if (size < 32) {
		return false;
	}
	switch (input[0]) {
	case 0x02:
	case 0x03:
	case 0x04:
	case 0x05:
	case 0x30:
	case 0x31:
	case 0x32:
	case 0x83:
	case 0x8B:
	case 0x8E:
	case 0xF5:
		break;
	default:
		return false;
	}
	for (idx_t i = 1; i < 16; i++) {
		if (input[i] >= 0x20 && input[i] <= 0x7E) {
			return false;
		}
	}
	return true;
}

bool MatchLotus123(const_data_ptr_t input, idx_t size) {
	if (size < 8) {
		return false;
	}
	const uint32_t version = LoadU32LE(input + 4);
	return version == 0x00000200u || version == 0x00001a00u;
}

// MARC 21 leader: indicator count and subfield code length are both '2', and the
// entry map at offset 20 is "4500".
bool MatchMarc(const_data_ptr_t input, idx_t size) {
	if (size < 24) {
		return false;
	}
	return input[10] == '2' && input[11] == '2' && HasBytesAt(input, size, 20, "4500");
}

bool MatchHdf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x89HDF\r\n\x1a\n") || HasPrefix(input, size, "\x0e\x03\x13\x01");
}

bool MatchParquet(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "PAR1");
}

// Self-described CBOR tag 55799.
bool MatchCbor(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xd9\xd9\xf7");
}

bool MatchShx(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\x00\x00\x27\x0a");
}

// Shapefile main file: file code 9994 and a full 100-byte header.
bool MatchShp(const_data_ptr_t input, idx_t size) {
	return size >= 100 && LoadU32BE(input) == 9994;
}

bool MatchGlb(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "glTF\x02\x00\x00\x00") || HasPrefix(input, size, "glTF\x01\x00\x00\x00");
}

bool MatchTzif(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "TZif");
}

} // namespace duckdb
