#include "magic/signature_matchers.hpp"
#include "magic/byte_matchers.hpp"
#include "magic/mime_detector.hpp"
#include "utf8proc_compat.hpp"

#include <cstring>

namespace duckdb {

// Open JSON structures are accepted once the input is at least this long, since the
// document continues past the inspected prefix.
static constexpr idx_t JSON_TRUNCATION_SIZE = 512;
// Only the first lines take part in separator counting.
static constexpr idx_t CSV_MAX_LINES = 5;
static constexpr idx_t JS_KEYWORD_WINDOW = 256;

static const_data_ptr_t TextData(const std::string &text) {
	return const_data_ptr_cast(text.data());
}

// -----------------------------------------------------------------------------
// Encodings
// -----------------------------------------------------------------------------
bool MatchUtf8Bom(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xef\xbb\xbf");
}

bool MatchUtf16BE(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xfe\xff");
}

bool MatchUtf16LE(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "\xff\xfe");
}

// Control bytes that never occur in text (WHATWG binary data bytes).
static bool IsBinaryControl(data_t c) {
	return c <= 0x08 || c == 0x0B || (c >= 0x0E && c <= 0x1A) || (c >= 0x1C && c <= 0x1F);
}

// 0 for bytes that never start a sequence: continuation bytes, the overlong leads
// C0 and C1, and F5 and above.
static idx_t Utf8SequenceLength(data_t lead) {
	if (lead < 0x80) {
		return 1;
	}
	if (lead >= 0xC2 && lead <= 0xDF) {
		return 2;
	}
	if ((lead & 0xF0) == 0xE0) {
		return 3;
	}
	if (lead >= 0xF0 && lead <= 0xF4) {
		return 4;
	}
	return 0;
}

// Allowed range of the byte following `lead`.
static bool IsValidSecondByte(data_t lead, data_t second) {
	switch (lead) {
	case 0xE0:
		return second >= 0xA0 && second <= 0xBF;
	case 0xED:
		return second >= 0x80 && second <= 0x9F;
	case 0xF0:
		return second >= 0x90 && second <= 0xBF;
	case 0xF4:
		return second >= 0x80 && second <= 0x8F;
	default:
		return (second & 0xC0) == 0x80;
	}
}

// A multi-byte sequence cut short by the end of the buffer. Only a buffer that fills
// the read limit can have been cut; shorter input is the whole document.
static bool IsTruncatedTail(const_data_ptr_t input, idx_t size, idx_t pos) {
	if (size < MimeDetector::READ_LIMIT) {
		return false;
	}
	const idx_t needed = Utf8SequenceLength(input[pos]);
	if (needed < 2 || pos + needed <= size) {
		return false;
	}
	if (pos + 1 < size && !IsValidSecondByte(input[pos], input[pos + 1])) {
		return false;
	}
	for (idx_t i = pos + 1; i < size; i++) {
		if ((input[i] & 0xC0) != 0x80) {
			return false;
		}
	}
	return true;
}

static bool IsValidUtf8(const_data_ptr_t input, idx_t size) {
	idx_t pos = 0;
	while (pos < size) {
		if (input[pos] < 0x80) {
			pos++;
			continue;
		}
		utf8proc_int32_t codepoint = 0;
		const auto consumed = utf8proc_iterate(input + pos, static_cast<utf8proc_ssize_t>(size - pos), &codepoint);
		if (consumed <= 0) {
			return IsTruncatedTail(input, size, pos);
		}
		pos += static_cast<idx_t>(consumed);
	}
	return true;
}

// Text means: a byte order mark, or valid UTF-8 without binary control bytes.
// Empty input is not text and falls through to the root.
bool MatchUtf8(const_data_ptr_t input, idx_t size) {
	if (size == 0) {
		return false;
	}
	if (MatchUtf8Bom(input, size) || MatchUtf16BE(input, size) || MatchUtf16LE(input, size)) {
		return true;
	}
	for (idx_t i = 0; i < size; i++) {
		if (IsBinaryControl(input[i])) {
			return false;
		}
	}
	return IsValidUtf8(input, size);
}

bool DecodeUtf16(const_data_ptr_t input, idx_t size, bool big_endian, std::string &out) {
	if ((big_endian && MatchUtf16BE(input, size)) || (!big_endian && MatchUtf16LE(input, size))) {
		input += 2;
		size -= 2;
	}
	if (size < 2 || size % 2 != 0) {
		return false;
	}
	auto read_unit = [&](idx_t pos) -> uint32_t {
		return big_endian ? (uint32_t(input[pos]) << 8) | input[pos + 1] : (uint32_t(input[pos + 1]) << 8) | input[pos];
	};

	out.clear();
	out.reserve(size);
	for (idx_t pos = 0; pos < size; pos += 2) {
		uint32_t codepoint = read_unit(pos);
		if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
			if (pos + 4 > size) {
				// high surrogate cut off by the end of the prefix
				break;
			}
			const uint32_t low = read_unit(pos + 2);
			if (low < 0xDC00 || low > 0xDFFF) {
				return false;
			}
			codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
			pos += 2;
		} else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
			return false;
		}
		utf8proc_uint8_t encoded[4];
		const auto written = utf8proc_encode_char(static_cast<utf8proc_int32_t>(codepoint), encoded);
		if (written <= 0) {
			return false;
		}
		out.append(reinterpret_cast<const char *>(encoded), static_cast<size_t>(written));
	}
	return true;
}

// -----------------------------------------------------------------------------
// Markup
// -----------------------------------------------------------------------------
static const char *const HTML_TAGS[] = {"<!doctype html", "<html", "<head", "<script", "<iframe", "<h1",
                                        "<div",           "<font", "<table", "<a",     "<style",  "<title",
                                        "<b",             "<body", "<br",    "<p"};

// Case-insensitive tag at the first non-space byte, terminated by a space, tab,
// newline or '>'.
bool MatchHtml(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	input += start;
	size -= start;
	for (auto tag : HTML_TAGS) {
		const idx_t tag_size = strlen(tag);
		if (size <= tag_size || !HasPrefixIgnoreCase(input, size, tag)) {
			continue;
		}
		const auto next = input[tag_size];
		if (next == ' ' || next == '>' || next == '\t' || next == '\n') {
			return true;
		}
	}
	return false;
}

bool MatchXml(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	return HasPrefix(input + start, size - start, "<?xml");
}

// Bare <svg> root, or an XML document mentioning the svg element or namespace.
bool MatchSvg(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	input += start;
	size -= start;
	if (HasPrefix(input, size, "<?xml")) {
		return ContainsBytes(input, size, "<svg") || ContainsBytes(input, size, "http://www.w3.org/2000/svg");
	}
	return HasPrefix(input, size, "<svg");
}

template <idx_t N>
static bool MatchXmlWithMarker(const_data_ptr_t input, idx_t size, const char (&marker)[N]) {
	return MatchXml(input, size) && ContainsBytes(input, size, marker);
}

bool MatchRss(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<rss");
}

bool MatchAtom(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<feed");
}

bool MatchX3d(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<X3D");
}

bool MatchKml(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<kml");
}

bool MatchXliff(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<xliff");
}

bool MatchCollada(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<COLLADA");
}

bool MatchGml(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<gml");
}

bool MatchGpx(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<gpx");
}

bool MatchTcx(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "TrainingCenterDataba");
}

bool MatchAmf(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<amf");
}

bool Match3mf(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<model");
}

bool MatchXfdf(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "<xfdf");
}

bool MatchOwl2(const_data_ptr_t input, idx_t size) {
	return MatchXml(input, size) && (ContainsBytes(input, size, "<owl") || ContainsBytes(input, size, "<RDF"));
}

bool MatchXhtml(const_data_ptr_t input, idx_t size) {
	return MatchXmlWithMarker(input, size, "http://www.w3.org/1999/xht");
}

bool MatchRtf(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "{\\rtf");
}

// -----------------------------------------------------------------------------
// Scripts
// -----------------------------------------------------------------------------
bool MatchPhp(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "<?php") || HasPrefix(input, size, "<?\n") || HasPrefix(input, size, "<?\r") ||
	       HasPrefix(input, size, "<? ");
}

static bool HasJavaScriptKeyword(const_data_ptr_t input, idx_t size) {
	static const char *const KEYWORDS[] = {"function", "var ", "let ", "const ", "class ", "import ", "export "};
	const idx_t window = MinValue<idx_t>(size, JS_KEYWORD_WINDOW);
	for (auto keyword : KEYWORDS) {
		const idx_t keyword_size = strlen(keyword);
		if (FindBytes(input, window, 0, keyword, keyword_size) < window) {
			return true;
		}
	}
	return false;
}

bool MatchJavaScript(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/usr/bin/env node") || HasPrefix(input, size, "#!/usr/bin/node") ||
	       HasPrefix(input, size, "/*") || HasPrefix(input, size, "//") || HasJavaScriptKeyword(input, size);
}

bool MatchPython(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/usr/bin/env python") || HasPrefix(input, size, "#!/usr/bin/python") ||
	       HasPrefix(input, size, "#!python") || HasPrefix(input, size, "# -*- coding:");
}

bool MatchPerl(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/usr/bin/env perl") || HasPrefix(input, size, "#!/usr/bin/perl") ||
	       HasPrefix(input, size, "#!perl");
}

bool MatchRuby(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/usr/bin/env ruby") || HasPrefix(input, size, "#!/usr/bin/ruby") ||
	       HasPrefix(input, size, "#!ruby");
}

bool MatchLua(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/usr/bin/env lua") || HasPrefix(input, size, "#!/usr/bin/lua") ||
	       HasPrefix(input, size, "#!lua") || HasPrefix(input, size, "\x1bLua");
}

bool MatchShell(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/bin/sh") || HasPrefix(input, size, "#!/bin/bash") ||
	       HasPrefix(input, size, "#!/usr/bin/env bash") || HasPrefix(input, size, "#!/bin/zsh");
}

bool MatchTcl(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "#!/usr/bin/env tclsh") || HasPrefix(input, size, "#!/usr/bin/tclsh") ||
	       HasPrefix(input, size, "#!tclsh");
}

// -----------------------------------------------------------------------------
// Structured text
// -----------------------------------------------------------------------------

// Bracket balance outside of string literals. Never-negative depth is required;
// open structures are tolerated only for inputs long enough to be a prefix.
static bool HasJsonStructure(const_data_ptr_t input, idx_t size) {
	int64_t braces = 0;
	int64_t brackets = 0;
	bool in_string = false;
	bool escape_next = false;
	for (idx_t i = 0; i < size; i++) {
		const auto c = input[i];
		if (escape_next) {
			escape_next = false;
			continue;
		}
		switch (c) {
		case '\\':
			escape_next = in_string;
			break;
		case '"':
			in_string = !in_string;
			break;
		case '{':
			braces += !in_string;
			break;
		case '}':
			braces -= !in_string;
			break;
		case '[':
			brackets += !in_string;
			break;
		case ']':
			brackets -= !in_string;
			break;
		default:
			break;
		}
		if (braces < 0 || brackets < 0) {
			return false;
		}
	}
	if (braces == 0 && brackets == 0) {
		return true;
	}
	return size >= JSON_TRUNCATION_SIZE;
}

bool MatchJson(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	input += start;
	size -= start;
	if (size == 0 || (input[0] != '{' && input[0] != '[')) {
		return false;
	}
	return HasJsonStructure(input, size);
}

bool MatchGeoJson(const_data_ptr_t input, idx_t size) {
	return MatchJson(input, size) && ContainsBytes(input, size, "\"type\"") &&
	       ContainsBytes(input, size, "\"FeatureCollection\"") && ContainsBytes(input, size, "\"features\"");
}

bool MatchHar(const_data_ptr_t input, idx_t size) {
	return MatchJson(input, size) && ContainsBytes(input, size, "\"log\"") && ContainsBytes(input, size, "\"version\"");
}

bool MatchGltf(const_data_ptr_t input, idx_t size) {
	return MatchJson(input, size) && ContainsBytes(input, size, "\"scenes\"") &&
	       ContainsBytes(input, size, "\"nodes\"") && ContainsBytes(input, size, "\"asset\"");
}

// Calls `fn(line, line_size)` for up to `max_lines` lines. A trailing empty segment
// after the final newline is not a line; "\r\n" endings keep the '\r'.
template <class FUNC>
static idx_t ForEachLine(const_data_ptr_t input, idx_t size, idx_t max_lines, FUNC &&fn) {
	idx_t lines = 0;
	idx_t pos = 0;
	while (pos < size && lines < max_lines) {
		idx_t end = pos;
		while (end < size && input[end] != '\n') {
			end++;
		}
		lines++;
		if (!fn(input + pos, end - pos)) {
			break;
		}
		pos = end + 1;
	}
	return lines;
}

// Newline-delimited JSON: the first lines are each a JSON value (blank lines
// allowed), and there are at least two of them.
bool MatchNdjson(const_data_ptr_t input, idx_t size) {
	bool valid = true;
	idx_t values = 0;
	ForEachLine(input, size, 3, [&](const_data_ptr_t line, idx_t line_size) {
		if (line_size == 0) {
			return true;
		}
		if (!MatchJson(line, line_size)) {
			valid = false;
			return false;
		}
		values++;
		return true;
	});
	return valid && values >= 2;
}

// Same non-zero separator count on each of the first lines, two lines minimum.
static bool MatchSeparated(const_data_ptr_t input, idx_t size, data_t separator) {
	idx_t expected = 0;
	bool consistent = true;
	const idx_t lines = ForEachLine(input, size, CSV_MAX_LINES, [&](const_data_ptr_t line, idx_t line_size) {
		const idx_t count = CountByte(line, line_size, separator);
		if (expected == 0) {
			expected = count;
			consistent = count > 0;
			return consistent;
		}
		if (count != expected) {
			consistent = false;
			return false;
		}
		return true;
	});
	return consistent && lines >= 2;
}

bool MatchCsv(const_data_ptr_t input, idx_t size) {
	return MatchSeparated(input, size, ',');
}

bool MatchTsv(const_data_ptr_t input, idx_t size) {
	return MatchSeparated(input, size, '\t');
}

// -----------------------------------------------------------------------------
// Subtitles, contacts, calendars, archives of the web
// -----------------------------------------------------------------------------

// Cue "1" followed by a timing line "00:00:01,000 --> 00:00:02,000".
bool MatchSrt(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	input += start;
	size -= start;
	idx_t timing = 0;
	if (HasPrefix(input, size, "1\n")) {
		timing = 2;
	} else if (HasPrefix(input, size, "1\r\n")) {
		timing = 3;
	} else {
		return false;
	}
	idx_t end = timing;
	while (end < size && input[end] != '\n') {
		end++;
	}
	return FindBytes(input + timing, end - timing, 0, " --> ", 5) < end - timing;
}

bool MatchVtt(const_data_ptr_t input, idx_t size) {
	if (MatchUtf8Bom(input, size)) {
		input += 3;
		size -= 3;
	}
	const idx_t start = SkipWhitespace(input, size);
	input += start;
	size -= start;
	if (!HasPrefix(input, size, "WEBVTT")) {
		return false;
	}
	return size == 6 || StringUtil::CharacterIsSpace(static_cast<char>(input[6]));
}

bool MatchVcard(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	return HasPrefixIgnoreCase(input + start, size - start, "begin:vcard");
}

bool MatchICalendar(const_data_ptr_t input, idx_t size) {
	const idx_t start = SkipWhitespace(input, size);
	return HasPrefixIgnoreCase(input + start, size - start, "begin:vcalendar");
}

bool MatchWarc(const_data_ptr_t input, idx_t size) {
	return HasPrefix(input, size, "WARC/1.0") || HasPrefix(input, size, "WARC/1.1");
}

// -----------------------------------------------------------------------------
// Decoded-text detectors (UTF-16 variants)
// -----------------------------------------------------------------------------
bool DetectHtmlText(const std::string &text) {
	return MatchHtml(TextData(text), text.size());
}

bool DetectXmlText(const std::string &text) {
	return MatchXml(TextData(text), text.size());
}

bool DetectSvgText(const std::string &text) {
	return MatchSvg(TextData(text), text.size());
}

bool DetectJsonText(const std::string &text) {
	return MatchJson(TextData(text), text.size());
}

bool DetectCsvText(const std::string &text) {
	return MatchCsv(TextData(text), text.size());
}

bool DetectTsvText(const std::string &text) {
	return MatchTsv(TextData(text), text.size());
}

bool DetectSrtText(const std::string &text) {
	return MatchSrt(TextData(text), text.size());
}

bool DetectVttText(const std::string &text) {
	return MatchVtt(TextData(text), text.size());
}

bool DetectVcardText(const std::string &text) {
	return MatchVcard(TextData(text), text.size());
}

bool DetectICalendarText(const std::string &text) {
	return MatchICalendar(TextData(text), text.size());
}

bool DetectRtfText(const std::string &text) {
	return MatchRtf(TextData(text), text.size());
}

} // namespace duckdb
