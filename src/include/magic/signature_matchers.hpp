#pragma once

#include "duckdb.hpp"

#include <string>

namespace duckdb {

// Predicates used by the signature table. Each one follows signature_matcher_t: pure,
// bounds-checked, and false on input too short to decide.

// Root fallback, accepts everything.
bool MatchAny(const_data_ptr_t input, idx_t size);

// ---- Text (matchers_text.cpp) ----
bool MatchUtf8(const_data_ptr_t input, idx_t size);
bool MatchUtf8Bom(const_data_ptr_t input, idx_t size);
bool MatchUtf16BE(const_data_ptr_t input, idx_t size);
bool MatchUtf16LE(const_data_ptr_t input, idx_t size);
bool MatchHtml(const_data_ptr_t input, idx_t size);
bool MatchXml(const_data_ptr_t input, idx_t size);
bool MatchRtf(const_data_ptr_t input, idx_t size);
bool MatchPhp(const_data_ptr_t input, idx_t size);
bool MatchJavaScript(const_data_ptr_t input, idx_t size);
bool MatchPython(const_data_ptr_t input, idx_t size);
bool MatchPerl(const_data_ptr_t input, idx_t size);
bool MatchRuby(const_data_ptr_t input, idx_t size);
bool MatchLua(const_data_ptr_t input, idx_t size);
bool MatchShell(const_data_ptr_t input, idx_t size);
bool MatchTcl(const_data_ptr_t input, idx_t size);
bool MatchJson(const_data_ptr_t input, idx_t size);
bool MatchGeoJson(const_data_ptr_t input, idx_t size);
bool MatchNdjson(const_data_ptr_t input, idx_t size);
bool MatchHar(const_data_ptr_t input, idx_t size);
bool MatchGltf(const_data_ptr_t input, idx_t size);
bool MatchCsv(const_data_ptr_t input, idx_t size);
bool MatchTsv(const_data_ptr_t input, idx_t size);
bool MatchSrt(const_data_ptr_t input, idx_t size);
bool MatchVtt(const_data_ptr_t input, idx_t size);
bool MatchVcard(const_data_ptr_t input, idx_t size);
bool MatchICalendar(const_data_ptr_t input, idx_t size);
bool MatchSvg(const_data_ptr_t input, idx_t size);
bool MatchWarc(const_data_ptr_t input, idx_t size);

// XML vocabularies: an XML prolog plus a root element or namespace marker.
bool MatchRss(const_data_ptr_t input, idx_t size);
bool MatchAtom(const_data_ptr_t input, idx_t size);
bool MatchX3d(const_data_ptr_t input, idx_t size);
bool MatchKml(const_data_ptr_t input, idx_t size);
bool MatchXliff(const_data_ptr_t input, idx_t size);
bool MatchCollada(const_data_ptr_t input, idx_t size);
bool MatchGml(const_data_ptr_t input, idx_t size);
bool MatchGpx(const_data_ptr_t input, idx_t size);
bool MatchTcx(const_data_ptr_t input, idx_t size);
bool MatchAmf(const_data_ptr_t input, idx_t size);
bool Match3mf(const_data_ptr_t input, idx_t size);
bool MatchXfdf(const_data_ptr_t input, idx_t size);
bool MatchOwl2(const_data_ptr_t input, idx_t size);
bool MatchXhtml(const_data_ptr_t input, idx_t size);

// Detectors over already decoded UTF-8 text, shared by the UTF-16 variants.
bool DetectHtmlText(const std::string &text);
bool DetectXmlText(const std::string &text);
bool DetectSvgText(const std::string &text);
bool DetectJsonText(const std::string &text);
bool DetectCsvText(const std::string &text);
bool DetectTsvText(const std::string &text);
bool DetectSrtText(const std::string &text);
bool DetectVttText(const std::string &text);
bool DetectVcardText(const std::string &text);
bool DetectICalendarText(const std::string &text);
bool DetectRtfText(const std::string &text);

// Decodes UTF-16 (skipping a byte order mark of the given order) into UTF-8.
// Fails on odd or too short input and on unpaired surrogates.
bool DecodeUtf16(const_data_ptr_t input, idx_t size, bool big_endian, std::string &out);

template <bool BIG_ENDIAN_ORDER, bool (*DETECT)(const std::string &)>
bool MatchUtf16Text(const_data_ptr_t input, idx_t size) {
	std::string text;
	return DecodeUtf16(input, size, BIG_ENDIAN_ORDER, text) && DETECT(text);
}

// ---- Containers: ZIP, OLE, TAR, ISO-BMFF, Matroska (matchers_container.cpp) ----
bool MatchZip(const_data_ptr_t input, idx_t size);
bool MatchDocx(const_data_ptr_t input, idx_t size);
bool MatchXlsx(const_data_ptr_t input, idx_t size);
bool MatchPptx(const_data_ptr_t input, idx_t size);
bool MatchVsdx(const_data_ptr_t input, idx_t size);
bool MatchEpub(const_data_ptr_t input, idx_t size);
bool MatchJar(const_data_ptr_t input, idx_t size);
bool MatchApk(const_data_ptr_t input, idx_t size);
bool MatchOdt(const_data_ptr_t input, idx_t size);
bool MatchOds(const_data_ptr_t input, idx_t size);
bool MatchOdp(const_data_ptr_t input, idx_t size);
bool MatchOdg(const_data_ptr_t input, idx_t size);
bool MatchOdf(const_data_ptr_t input, idx_t size);
bool MatchOdc(const_data_ptr_t input, idx_t size);
bool MatchOtt(const_data_ptr_t input, idx_t size);
bool MatchOts(const_data_ptr_t input, idx_t size);
bool MatchOtp(const_data_ptr_t input, idx_t size);
bool MatchOtg(const_data_ptr_t input, idx_t size);
bool MatchSxc(const_data_ptr_t input, idx_t size);
bool MatchKmz(const_data_ptr_t input, idx_t size);
bool MatchCrx(const_data_ptr_t input, idx_t size);

bool MatchOle(const_data_ptr_t input, idx_t size);
bool MatchMsi(const_data_ptr_t input, idx_t size);
bool MatchAaf(const_data_ptr_t input, idx_t size);
bool MatchMsg(const_data_ptr_t input, idx_t size);
bool MatchXls(const_data_ptr_t input, idx_t size);
bool MatchPub(const_data_ptr_t input, idx_t size);
bool MatchPpt(const_data_ptr_t input, idx_t size);
bool MatchDoc(const_data_ptr_t input, idx_t size);
bool MatchOneNote(const_data_ptr_t input, idx_t size);
bool MatchFasoo(const_data_ptr_t input, idx_t size);
bool MatchPgpNetShare(const_data_ptr_t input, idx_t size);

bool MatchTar(const_data_ptr_t input, idx_t size);

bool MatchMp4(const_data_ptr_t input, idx_t size);
bool MatchAvif(const_data_ptr_t input, idx_t size);
bool Match3gpp(const_data_ptr_t input, idx_t size);
bool Match3gpp2(const_data_ptr_t input, idx_t size);
bool MatchAudioMp4(const_data_ptr_t input, idx_t size);
bool MatchM4a(const_data_ptr_t input, idx_t size);
bool MatchM4v(const_data_ptr_t input, idx_t size);
bool MatchHeic(const_data_ptr_t input, idx_t size);
bool MatchHeicSequence(const_data_ptr_t input, idx_t size);
bool MatchHeif(const_data_ptr_t input, idx_t size);
bool MatchHeifSequence(const_data_ptr_t input, idx_t size);
bool MatchMj2(const_data_ptr_t input, idx_t size);
bool MatchDvb(const_data_ptr_t input, idx_t size);
bool MatchQuickTime(const_data_ptr_t input, idx_t size);
bool MatchMqv(const_data_ptr_t input, idx_t size);

bool MatchWebm(const_data_ptr_t input, idx_t size);
bool MatchMkv(const_data_ptr_t input, idx_t size);

// ---- Fixed-offset binary signatures (matchers_binary.cpp) ----
// Documents and images
bool MatchPdf(const_data_ptr_t input, idx_t size);
bool MatchFdf(const_data_ptr_t input, idx_t size);
bool MatchPs(const_data_ptr_t input, idx_t size);
bool MatchP7s(const_data_ptr_t input, idx_t size);
bool MatchXpm(const_data_ptr_t input, idx_t size);
bool MatchPsd(const_data_ptr_t input, idx_t size);
bool MatchPbm(const_data_ptr_t input, idx_t size);
bool MatchPgm(const_data_ptr_t input, idx_t size);
bool MatchPpm(const_data_ptr_t input, idx_t size);
bool MatchPam(const_data_ptr_t input, idx_t size);
bool MatchPng(const_data_ptr_t input, idx_t size);
bool MatchApng(const_data_ptr_t input, idx_t size);
bool MatchJpg(const_data_ptr_t input, idx_t size);
bool MatchJxl(const_data_ptr_t input, idx_t size);
bool MatchJp2(const_data_ptr_t input, idx_t size);
bool MatchJpx(const_data_ptr_t input, idx_t size);
bool MatchJpm(const_data_ptr_t input, idx_t size);
bool MatchJxs(const_data_ptr_t input, idx_t size);
bool MatchJxr(const_data_ptr_t input, idx_t size);
bool MatchGif(const_data_ptr_t input, idx_t size);
bool MatchWebp(const_data_ptr_t input, idx_t size);
bool MatchTiff(const_data_ptr_t input, idx_t size);
bool MatchBmp(const_data_ptr_t input, idx_t size);
bool MatchIco(const_data_ptr_t input, idx_t size);
bool MatchIcns(const_data_ptr_t input, idx_t size);
bool MatchBpg(const_data_ptr_t input, idx_t size);
bool MatchXcf(const_data_ptr_t input, idx_t size);
bool MatchPat(const_data_ptr_t input, idx_t size);
bool MatchGbr(const_data_ptr_t input, idx_t size);
bool MatchHdr(const_data_ptr_t input, idx_t size);
bool MatchDwg(const_data_ptr_t input, idx_t size);
bool MatchDxf(const_data_ptr_t input, idx_t size);
bool MatchDjvu(const_data_ptr_t input, idx_t size);
bool MatchFits(const_data_ptr_t input, idx_t size);
bool MatchDcm(const_data_ptr_t input, idx_t size);
bool MatchWpd(const_data_ptr_t input, idx_t size);
bool MatchChm(const_data_ptr_t input, idx_t size);
bool MatchMobi(const_data_ptr_t input, idx_t size);
bool MatchLit(const_data_ptr_t input, idx_t size);

// Audio and video
bool MatchOgg(const_data_ptr_t input, idx_t size);
bool MatchOggAudio(const_data_ptr_t input, idx_t size);
bool MatchOggVideo(const_data_ptr_t input, idx_t size);
bool MatchMp3(const_data_ptr_t input, idx_t size);
bool MatchFlac(const_data_ptr_t input, idx_t size);
bool MatchMidi(const_data_ptr_t input, idx_t size);
bool MatchApe(const_data_ptr_t input, idx_t size);
bool MatchMusepack(const_data_ptr_t input, idx_t size);
bool MatchAmr(const_data_ptr_t input, idx_t size);
bool MatchWav(const_data_ptr_t input, idx_t size);
bool MatchAiff(const_data_ptr_t input, idx_t size);
bool MatchAu(const_data_ptr_t input, idx_t size);
bool MatchAac(const_data_ptr_t input, idx_t size);
bool MatchVoc(const_data_ptr_t input, idx_t size);
bool MatchM3u(const_data_ptr_t input, idx_t size);
bool MatchQcp(const_data_ptr_t input, idx_t size);
bool MatchMpeg(const_data_ptr_t input, idx_t size);
bool MatchAvi(const_data_ptr_t input, idx_t size);
bool MatchFlv(const_data_ptr_t input, idx_t size);
bool MatchAsf(const_data_ptr_t input, idx_t size);
bool MatchRmvb(const_data_ptr_t input, idx_t size);

// Archives and compression
bool MatchSevenZ(const_data_ptr_t input, idx_t size);
bool MatchGzip(const_data_ptr_t input, idx_t size);
bool MatchBz2(const_data_ptr_t input, idx_t size);
bool MatchXz(const_data_ptr_t input, idx_t size);
bool MatchZstd(const_data_ptr_t input, idx_t size);
bool MatchLzip(const_data_ptr_t input, idx_t size);
bool MatchRar(const_data_ptr_t input, idx_t size);
bool MatchCab(const_data_ptr_t input, idx_t size);
bool MatchInstallShieldCab(const_data_ptr_t input, idx_t size);
bool MatchCpio(const_data_ptr_t input, idx_t size);
bool MatchAr(const_data_ptr_t input, idx_t size);
bool MatchDeb(const_data_ptr_t input, idx_t size);
bool MatchRpm(const_data_ptr_t input, idx_t size);
bool MatchXar(const_data_ptr_t input, idx_t size);
bool MatchTorrent(const_data_ptr_t input, idx_t size);

// Executables and bytecode
bool MatchExe(const_data_ptr_t input, idx_t size);
bool MatchElf(const_data_ptr_t input, idx_t size);
bool MatchElfObj(const_data_ptr_t input, idx_t size);
bool MatchElfExe(const_data_ptr_t input, idx_t size);
bool MatchElfLib(const_data_ptr_t input, idx_t size);
bool MatchElfDump(const_data_ptr_t input, idx_t size);
bool MatchMachO(const_data_ptr_t input, idx_t size);
bool MatchClass(const_data_ptr_t input, idx_t size);
bool MatchWasm(const_data_ptr_t input, idx_t size);
bool MatchSwf(const_data_ptr_t input, idx_t size);
bool MatchLnk(const_data_ptr_t input, idx_t size);
bool MatchNes(const_data_ptr_t input, idx_t size);

// Fonts
bool MatchTtf(const_data_ptr_t input, idx_t size);
bool MatchOtf(const_data_ptr_t input, idx_t size);
bool MatchTtc(const_data_ptr_t input, idx_t size);
bool MatchWoff(const_data_ptr_t input, idx_t size);
bool MatchWoff2(const_data_ptr_t input, idx_t size);
bool MatchEot(const_data_ptr_t input, idx_t size);

// Databases, geospatial, models, misc
bool MatchSqlite(const_data_ptr_t input, idx_t size);
bool MatchMdb(const_data_ptr_t input, idx_t size);
bool MatchAccdb(const_data_ptr_t input, idx_t size);
bool MatchDbf(const_data_ptr_t input, idx_t size);
bool MatchLotus123(const_data_ptr_t input, idx_t size);
bool MatchMarc(const_data_ptr_t input, idx_t size);
bool MatchHdf(const_data_ptr_t input, idx_t size);
bool MatchParquet(const_data_ptr_t input, idx_t size);
bool MatchCbor(const_data_ptr_t input, idx_t size);
bool MatchShx(const_data_ptr_t input, idx_t size);
bool MatchShp(const_data_ptr_t input, idx_t size);
bool MatchGlb(const_data_ptr_t input, idx_t size);
bool MatchTzif(const_data_ptr_t input, idx_t size);

} // namespace duckdb
