#include "magic/mime_detector.hpp"
#include "magic/signature_matchers.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace duckdb {

// ---- Binary ----
TEST(MatchersTest, PngAndAnimatedPng) {
	auto png = test::PngBytes(false);
	auto apng = test::PngBytes(true);

	EXPECT_TRUE(MatchPng(png.data(), png.size()));
	EXPECT_FALSE(MatchApng(png.data(), png.size()));
	EXPECT_TRUE(MatchApng(apng.data(), apng.size()));
	// acTL beyond the buffer
	EXPECT_FALSE(MatchApng(apng.data(), 39));
}

TEST(MatchersTest, ElfTypeSelectsSubFormat) {
	auto exe = test::ElfBytes(2);
	auto lib = test::ElfBytes(3);

	EXPECT_TRUE(MatchElf(exe.data(), exe.size()));
	EXPECT_TRUE(MatchElfExe(exe.data(), exe.size()));
	EXPECT_FALSE(MatchElfLib(exe.data(), exe.size()));
	EXPECT_TRUE(MatchElfLib(lib.data(), lib.size()));
	EXPECT_FALSE(MatchElfDump(lib.data(), lib.size()));
	// e_type not covered by the buffer
	EXPECT_FALSE(MatchElfExe(exe.data(), 17));
}

// ---- Containers ----
TEST(MatchersTest, OfficeOpenXmlNeedsExpectedFirstEntry) {
	std::vector<data_t> docx;
	test::AppendZipEntry(docx, "[Content_Types].xml");
	test::AppendZipEntry(docx, "word/document.xml");
	EXPECT_TRUE(MatchZip(docx.data(), docx.size()));
	EXPECT_TRUE(MatchDocx(docx.data(), docx.size()));
	EXPECT_FALSE(MatchXlsx(docx.data(), docx.size()));
	EXPECT_FALSE(MatchPptx(docx.data(), docx.size()));

	std::vector<data_t> xlsx;
	test::AppendZipEntry(xlsx, "_rels/.rels");
	test::AppendZipEntry(xlsx, "xl/workbook.xml");
	EXPECT_TRUE(MatchXlsx(xlsx.data(), xlsx.size()));

	std::vector<data_t> unexpected_first;
	test::AppendZipEntry(unexpected_first, "readme.txt");
	test::AppendZipEntry(unexpected_first, "word/document.xml");
	EXPECT_TRUE(MatchZip(unexpected_first.data(), unexpected_first.size()));
	EXPECT_FALSE(MatchDocx(unexpected_first.data(), unexpected_first.size()));
}

TEST(MatchersTest, ZipEntryNameCutByBufferEndsWalk) {
	std::vector<data_t> zip;
	test::AppendZipEntry(zip, "[Content_Types].xml");
	test::AppendZipEntry(zip, "word/document.xml");
	// cut inside the second name: "wo"
	const idx_t truncated = zip.size() - std::string("rd/document.xml").size();
	EXPECT_FALSE(MatchDocx(zip.data(), truncated));
}

TEST(MatchersTest, JarAndApk) {
	std::vector<data_t> jar;
	test::AppendZipEntry(jar, "META-INF/MANIFEST.MF");
	EXPECT_TRUE(MatchJar(jar.data(), jar.size()));
	EXPECT_FALSE(MatchApk(jar.data(), jar.size()));

	std::vector<data_t> apk;
	test::AppendZipEntry(apk, "res/layout.xml");
	test::AppendZipEntry(apk, "classes.dex");
	EXPECT_TRUE(MatchApk(apk.data(), apk.size()));
	EXPECT_FALSE(MatchJar(apk.data(), apk.size()));
}

TEST(MatchersTest, OpenDocumentMimetypeEntry) {
	std::vector<data_t> odt;
	test::AppendZipEntry(odt, "mimetype", "application/vnd.oasis.opendocument.text");
	EXPECT_TRUE(MatchOdt(odt.data(), odt.size()));
	EXPECT_FALSE(MatchOds(odt.data(), odt.size()));
	EXPECT_FALSE(MatchOtt(odt.data(), odt.size()));

	std::vector<data_t> ott;
	test::AppendZipEntry(ott, "mimetype", "application/vnd.oasis.opendocument.text-template");
	EXPECT_TRUE(MatchOdt(ott.data(), ott.size()));
	EXPECT_TRUE(MatchOtt(ott.data(), ott.size()));

	std::vector<data_t> epub;
	test::AppendZipEntry(epub, "mimetype", "application/epub+zip");
	EXPECT_TRUE(MatchEpub(epub.data(), epub.size()));
}

TEST(MatchersTest, TarHeaderChecksum) {
	auto tar = test::TarHeader("hello.txt");
	EXPECT_TRUE(MatchTar(tar.data(), tar.size()));

	tar[0] = 'j';
	EXPECT_FALSE(MatchTar(tar.data(), tar.size()));
	EXPECT_FALSE(MatchTar(tar.data(), 511));
}

TEST(MatchersTest, IsoMediaBrands) {
	auto heic = test::FtypBytes("heic");
	EXPECT_TRUE(MatchMp4(heic.data(), heic.size()));
	EXPECT_TRUE(MatchHeic(heic.data(), heic.size()));
	EXPECT_FALSE(MatchAvif(heic.data(), heic.size()));

	auto avif = test::FtypBytes("avif");
	EXPECT_TRUE(MatchAvif(avif.data(), avif.size()));

	// box size larger than the input
	avif[3] = 0x40;
	EXPECT_FALSE(MatchMp4(avif.data(), avif.size()));
}

// ---- Text ----
static bool Text(bool (*matcher)(const_data_ptr_t, idx_t), const std::string &text) {
	return matcher(reinterpret_cast<const_data_ptr_t>(text.data()), text.size());
}

TEST(MatchersTest, Utf8Classification) {
	EXPECT_TRUE(Text(MatchUtf8, "hello world\n"));
	EXPECT_TRUE(Text(MatchUtf8, "caf\xc3\xa9"));
	// a short input was never cut, so an unfinished sequence is invalid
	EXPECT_FALSE(Text(MatchUtf8, "caf\xe2\x82"));
	EXPECT_FALSE(Text(MatchUtf8, std::string("a\x00" "b", 3)));
	EXPECT_FALSE(Text(MatchUtf8, "bad \xc3\x28 sequence"));
	EXPECT_FALSE(Text(MatchUtf8, ""));
	EXPECT_TRUE(Text(MatchUtf8, std::string("\xff\xfe\x00\x01", 4)));
}

TEST(MatchersTest, Utf8SequenceCutAtTheReadLimit) {
	auto prefix = [](const std::string &tail) {
		return std::string(MimeDetector::READ_LIMIT - tail.size(), 'a') + tail;
	};
	EXPECT_TRUE(Text(MatchUtf8, prefix("\xe2\x82")));
	EXPECT_TRUE(Text(MatchUtf8, prefix("\xf0\x9f\x98")));
	EXPECT_TRUE(Text(MatchUtf8, prefix("\xc3")));
	// leads that never start a valid sequence
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xc0")));
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xc1")));
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xf5")));
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xf7\x80")));
	// overlong or surrogate second bytes
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xe0\x80")));
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xed\xa0")));
	EXPECT_FALSE(Text(MatchUtf8, prefix("\xf4\x90")));
	// a cut sequence is accepted only at the very end
	EXPECT_FALSE(Text(MatchUtf8, "abc\xc0"));
}

TEST(MatchersTest, Html) {
	EXPECT_TRUE(Text(MatchHtml, "<!DOCTYPE html><html></html>"));
	EXPECT_TRUE(Text(MatchHtml, "  \n<HTML>\n"));
	EXPECT_TRUE(Text(MatchHtml, "<p\tclass=x>"));
	EXPECT_FALSE(Text(MatchHtml, "<htmlx>"));
	EXPECT_FALSE(Text(MatchHtml, "<html"));
}

TEST(MatchersTest, XmlAndSvg) {
	EXPECT_TRUE(Text(MatchXml, "<?xml version=\"1.0\"?><root/>"));
	EXPECT_TRUE(Text(MatchSvg, "<svg xmlns=\"http://www.w3.org/2000/svg\"/>"));
	EXPECT_TRUE(Text(MatchSvg, "<?xml version=\"1.0\"?>\n<svg width=\"1\"/>"));
	EXPECT_FALSE(Text(MatchSvg, "<?xml version=\"1.0\"?>\n<note/>"));
	EXPECT_TRUE(Text(MatchRss, "<?xml version=\"1.0\"?>\n<rss version=\"2.0\">"));
}

TEST(MatchersTest, Json) {
	EXPECT_TRUE(Text(MatchJson, "{\"a\": [1, 2, {\"b\": \"}\"}]}"));
	EXPECT_TRUE(Text(MatchJson, "  [1, 2]"));
	EXPECT_FALSE(Text(MatchJson, "{\"a\": 1"));
	EXPECT_FALSE(Text(MatchJson, "{}}"));
	EXPECT_FALSE(Text(MatchJson, "\"just a string\""));

	// a long document cut by the byte budget is still JSON
	std::string open = "{\"items\": [";
	while (open.size() < 600) {
		open += "{\"id\": 1}, ";
	}
	EXPECT_TRUE(Text(MatchJson, open));
}

TEST(MatchersTest, JsonVocabularies) {
	EXPECT_TRUE(Text(MatchGeoJson, "{\"type\": \"FeatureCollection\", \"features\": []}"));
	EXPECT_FALSE(Text(MatchGeoJson, "{\"type\": \"Feature\"}"));
	EXPECT_TRUE(Text(MatchHar, "{\"log\": {\"version\": \"1.2\"}}"));
	EXPECT_TRUE(Text(MatchNdjson, "{\"a\": 1}\n{\"a\": 2}\n{\"a\": 3}\n"));
	EXPECT_FALSE(Text(MatchNdjson, "{\"a\": 1}\n"));
	EXPECT_FALSE(Text(MatchNdjson, "{\"a\": 1}\nnot json\n"));
}

TEST(MatchersTest, SeparatedValues) {
	EXPECT_TRUE(Text(MatchCsv, "a,b,c\n1,2,3\n4,5,6\n"));
	EXPECT_TRUE(Text(MatchCsv, "a,b\r\n1,2\r\n"));
	EXPECT_FALSE(Text(MatchCsv, "a,b\n1,2,3\n"));
	EXPECT_FALSE(Text(MatchCsv, "a,b,c\n"));
	EXPECT_FALSE(Text(MatchCsv, "plain\ntext\n"));
	EXPECT_TRUE(Text(MatchTsv, "a\tb\n1\t2\n"));
	EXPECT_FALSE(Text(MatchTsv, "a,b\n1,2\n"));
}

TEST(MatchersTest, SubtitlesAndContacts) {
	EXPECT_TRUE(Text(MatchSrt, "1\n00:00:01,000 --> 00:00:02,000\nHello\n"));
	EXPECT_FALSE(Text(MatchSrt, "2\n00:00:01,000 --> 00:00:02,000\n"));
	EXPECT_TRUE(Text(MatchVtt, "WEBVTT\n\n00:01.000 --> 00:02.000\n"));
	EXPECT_TRUE(Text(MatchVtt, "\xef\xbb\xbfWEBVTT"));
	EXPECT_FALSE(Text(MatchVtt, "WEBVTTX"));
	EXPECT_TRUE(Text(MatchVcard, "BEGIN:VCARD\r\nVERSION:4.0\r\n"));
	EXPECT_TRUE(Text(MatchICalendar, "\nbegin:vcalendar\n"));
}

TEST(MatchersTest, ScriptShebangs) {
	EXPECT_TRUE(Text(MatchPython, "#!/usr/bin/env python3\nprint(1)\n"));
	EXPECT_TRUE(Text(MatchShell, "#!/bin/sh\necho hi\n"));
	EXPECT_FALSE(Text(MatchShell, "echo hi\n"));
}

// ---- UTF-16 ----
TEST(MatchersTest, DecodeUtf16) {
	std::string out;
	const std::string le("\xff\xfe<\0h\0t\0m\0l\0>\0", 14);
	ASSERT_TRUE(DecodeUtf16(reinterpret_cast<const_data_ptr_t>(le.data()), le.size(), false, out));
	EXPECT_EQ(out, "<html>");

	const std::string be("\xfe\xff\0{\0}", 6);
	ASSERT_TRUE(DecodeUtf16(reinterpret_cast<const_data_ptr_t>(be.data()), be.size(), true, out));
	EXPECT_EQ(out, "{}");

	// U+1F600 as a surrogate pair
	const std::string pair("\x3d\xd8\x00\xde", 4);
	ASSERT_TRUE(DecodeUtf16(reinterpret_cast<const_data_ptr_t>(pair.data()), pair.size(), false, out));
	EXPECT_EQ(out, "\xf0\x9f\x98\x80");

	// high surrogate cut by the end of the prefix
	const std::string cut("A\0\x3d\xd8", 4);
	ASSERT_TRUE(DecodeUtf16(reinterpret_cast<const_data_ptr_t>(cut.data()), cut.size(), false, out));
	EXPECT_EQ(out, "A");

	const std::string lone_low("A\0\x00\xdc", 4);
	EXPECT_FALSE(DecodeUtf16(reinterpret_cast<const_data_ptr_t>(lone_low.data()), lone_low.size(), false, out));

	const std::string odd("A\0B", 3);
	EXPECT_FALSE(DecodeUtf16(reinterpret_cast<const_data_ptr_t>(odd.data()), odd.size(), false, out));
}

TEST(MatchersTest, Utf16TextDetectors) {
	const std::string le_html("\xff\xfe<\0h\0t\0m\0l\0>\0", 14);
	auto data = reinterpret_cast<const_data_ptr_t>(le_html.data());
	EXPECT_TRUE((MatchUtf16Text<false, DetectHtmlText>(data, le_html.size())));
	EXPECT_FALSE((MatchUtf16Text<false, DetectJsonText>(data, le_html.size())));
	EXPECT_FALSE((MatchUtf16Text<true, DetectHtmlText>(data, le_html.size())));
}

// ---- Bounds ----
TEST(MatchersTest, EveryPrefixIsSafe) {
	std::vector<std::vector<data_t>> samples;
	samples.push_back(test::PngBytes(true));
	samples.push_back(test::ElfBytes(3));
	samples.push_back(test::FtypBytes("mif1"));
	samples.push_back(test::TarHeader("a"));
	std::vector<data_t> docx;
	test::AppendZipEntry(docx, "[Content_Types].xml");
	test::AppendZipEntry(docx, "word/document.xml");
	samples.push_back(docx);

	static bool (*const MATCHERS[])(const_data_ptr_t, idx_t) = {
	    MatchPng, MatchApng, MatchElfExe, MatchMp4,  MatchHeif, MatchTar,  MatchDocx, MatchJar,
	    MatchOdt, MatchCrx,  MatchXls,    MatchPpt,  MatchDoc,  MatchUtf8, MatchJson, MatchCsv,
	    MatchSrt, MatchVtt,  MatchHtml,   MatchWebm, MatchMkv,  MatchEpub, MatchKmz,  MatchMsi};
	for (const auto &sample : samples) {
		for (idx_t size = 0; size <= sample.size(); size++) {
			// copy, so that tools like ASan see reads past the prefix
			std::vector<data_t> prefix(sample.begin(), sample.begin() + size);
			for (auto matcher : MATCHERS) {
				matcher(prefix.data(), prefix.size());
			}
		}
	}
}

} // namespace duckdb
