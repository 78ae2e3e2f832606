#include "magic/mime_tree.hpp"
#include "magic/signature_matchers.hpp"

namespace duckdb {

static unique_ptr<MimeType> Node(const char *mime, const char *extension, signature_matcher_t matcher,
                                 MimeKind kind = MimeKind::UNKNOWN) {
	return make_uniq<MimeType>(mime, extension, matcher, kind);
}

// -----------------------------------------------------------------------------
// Containers
// -----------------------------------------------------------------------------

// Each OpenDocument template sits below the document type whose MIME string it
// extends, since the document matcher accepts the template too.
static void AddZipFormats(MimeType &zip) {
	zip.AddChild(Node("application/vnd.openxmlformats-officedocument.wordprocessingml.document",
	                  ".docx", MatchDocx, MimeKind::DOCUMENT));
	zip.AddChild(Node("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
	                  ".xlsx", MatchXlsx, MimeKind::SPREADSHEET));
	zip.AddChild(Node("application/vnd.openxmlformats-officedocument.presentationml.presentation",
	                  ".pptx", MatchPptx, MimeKind::PRESENTATION));
	zip.AddChild(Node("application/vnd.ms-visio.drawing.main+xml", ".vsdx", MatchVsdx, MimeKind::DOCUMENT));
	zip.AddChild(Node("application/epub+zip", ".epub", MatchEpub, MimeKind::DOCUMENT));
	zip.AddChild(Node("application/java-archive", ".jar", MatchJar, MimeKind::APPLICATION))
	    .WithAliases({"application/jar", "application/jar-archive", "application/x-java-archive"});
	zip.AddChild(Node("application/vnd.android.package-archive", ".apk", MatchApk, MimeKind::APPLICATION));
	auto &odt = zip.AddChild(Node("application/vnd.oasis.opendocument.text", ".odt", MatchOdt, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.text"});
	auto &ods = zip.AddChild(Node("application/vnd.oasis.opendocument.spreadsheet",
	                              ".ods", MatchOds, MimeKind::SPREADSHEET))
	    .WithAliases({"application/x-vnd.oasis.opendocument.spreadsheet"});
	auto &odp = zip.AddChild(Node("application/vnd.oasis.opendocument.presentation",
	                              ".odp", MatchOdp, MimeKind::PRESENTATION))
	    .WithAliases({"application/x-vnd.oasis.opendocument.presentation"});
	auto &odg = zip.AddChild(Node("application/vnd.oasis.opendocument.graphics", ".odg", MatchOdg, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.graphics"});
	zip.AddChild(Node("application/vnd.oasis.opendocument.formula", ".odf", MatchOdf, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.formula"});
	zip.AddChild(Node("application/vnd.oasis.opendocument.chart", ".odc", MatchOdc, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.chart"});
	zip.AddChild(Node("application/vnd.sun.xml.calc", ".sxc", MatchSxc, MimeKind::SPREADSHEET));
	zip.AddChild(Node("application/vnd.google-earth.kmz", ".kmz", MatchKmz, MimeKind::DOCUMENT));

	odt.AddChild(Node("application/vnd.oasis.opendocument.text-template", ".ott", MatchOtt, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.text-template"});
	ods.AddChild(Node("application/vnd.oasis.opendocument.spreadsheet-template", ".ots", MatchOts, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.spreadsheet-template"});
	odp.AddChild(Node("application/vnd.oasis.opendocument.presentation-template", ".otp", MatchOtp, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.presentation-template"});
	odg.AddChild(Node("application/vnd.oasis.opendocument.graphics-template", ".otg", MatchOtg, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-vnd.oasis.opendocument.graphics-template"});
}

static void AddOleFormats(MimeType &ole) {
	ole.AddChild(Node("application/x-ms-installer", ".msi", MatchMsi, MimeKind::ARCHIVE));
	ole.AddChild(Node(MIME_OCTET_STREAM, ".aaf", MatchAaf));
	ole.AddChild(Node("application/vnd.ms-outlook", ".msg", MatchMsg, MimeKind::DOCUMENT));
	ole.AddChild(Node("application/vnd.ms-excel", ".xls", MatchXls, MimeKind::SPREADSHEET));
	ole.AddChild(Node("application/vnd.ms-publisher", ".pub", MatchPub, MimeKind::DOCUMENT));
	ole.AddChild(Node("application/vnd.ms-powerpoint", ".ppt", MatchPpt, MimeKind::PRESENTATION));
	ole.AddChild(Node("application/msword", ".doc", MatchDoc, MimeKind::DOCUMENT));
	ole.AddChild(Node("application/onenote", ".one", MatchOneNote, MimeKind::DOCUMENT));
	ole.AddChild(Node("application/x-fasoo", "", MatchFasoo));
	ole.AddChild(Node("application/x-pgp-net-share", "", MatchPgpNetShare));
}

// Major brands of the leading ftyp box.
static void AddIsoMediaFormats(MimeType &mp4) {
	mp4.AddChild(Node("image/avif", ".avif", MatchAvif, MimeKind::IMAGE));
	mp4.AddChild(Node("video/3gpp", ".3gp", Match3gpp, MimeKind::VIDEO))
	    .WithAliases({"video/3gp", "audio/3gpp"});
	mp4.AddChild(Node("video/3gpp2", ".3g2", Match3gpp2, MimeKind::VIDEO))
	    .WithAliases({"video/3g2", "audio/3gpp2"});
	mp4.AddChild(Node("audio/mp4", ".mp4", MatchAudioMp4, MimeKind::AUDIO))
	    .WithAliases({"audio/x-m4a", "audio/x-mp4a"});
	mp4.AddChild(Node("audio/x-m4a", ".m4a", MatchM4a, MimeKind::AUDIO));
	mp4.AddChild(Node("video/x-m4v", ".m4v", MatchM4v, MimeKind::VIDEO));
	mp4.AddChild(Node("image/heic", ".heic", MatchHeic, MimeKind::IMAGE));
	mp4.AddChild(Node("image/heic-sequence", ".heic", MatchHeicSequence, MimeKind::IMAGE));
	mp4.AddChild(Node("image/heif", ".heif", MatchHeif, MimeKind::IMAGE));
	mp4.AddChild(Node("image/heif-sequence", ".heif", MatchHeifSequence, MimeKind::IMAGE));
	mp4.AddChild(Node("video/mj2", ".mj2", MatchMj2));
	mp4.AddChild(Node("video/vnd.dvb.file", ".dvb", MatchDvb, MimeKind::VIDEO));
}

// -----------------------------------------------------------------------------
// Text
// -----------------------------------------------------------------------------
static void AddXmlFormats(MimeType &xml) {
	// An XML prolog in front of an SVG root.
	xml.AddChild(Node("image/svg+xml", ".svg", MatchSvg, MimeKind::IMAGE));
	xml.AddChild(Node("application/rss+xml", ".rss", MatchRss, MimeKind::TEXT))
	    .WithAliases({"text/rss"});
	xml.AddChild(Node("application/atom+xml", ".atom", MatchAtom, MimeKind::TEXT));
	xml.AddChild(Node("model/x3d+xml", ".x3d", MatchX3d, MimeKind::TEXT));
	xml.AddChild(Node("application/vnd.google-earth.kml+xml", ".kml", MatchKml, MimeKind::TEXT));
	xml.AddChild(Node("application/x-xliff+xml", ".xlf", MatchXliff, MimeKind::TEXT));
	xml.AddChild(Node("model/vnd.collada+xml", ".dae", MatchCollada, MimeKind::MODEL));
	xml.AddChild(Node("application/gml+xml", ".gml", MatchGml, MimeKind::TEXT));
	xml.AddChild(Node("application/gpx+xml", ".gpx", MatchGpx, MimeKind::TEXT));
	xml.AddChild(Node("application/vnd.garmin.tcx+xml", ".tcx", MatchTcx, MimeKind::TEXT));
	xml.AddChild(Node("application/x-amf", ".amf", MatchAmf, MimeKind::MODEL));
	xml.AddChild(Node("application/vnd.ms-package.3dmanufacturing-3dmodel+xml", ".3mf", Match3mf, MimeKind::MODEL));
	xml.AddChild(Node("application/vnd.adobe.xfdf", ".xfdf", MatchXfdf, MimeKind::TEXT));
	xml.AddChild(Node("application/owl+xml", ".owl", MatchOwl2, MimeKind::TEXT));
	xml.AddChild(Node("application/xhtml+xml", ".html", MatchXhtml, MimeKind::TEXT));
}

static void AddJsonFormats(MimeType &json) {
	json.AddChild(Node("application/geo+json", ".geojson", MatchGeoJson));
	json.AddChild(Node("application/x-ndjson", ".ndjson", MatchNdjson));
	json.AddChild(Node("application/json", ".har", MatchHar, MimeKind::TEXT));
	json.AddChild(Node("model/gltf+json", ".gltf", MatchGltf, MimeKind::MODEL));
}

static void AddTextFormats(MimeType &utf8) {
	utf8.AddChild(Node("text/html; charset=utf-8", ".html", MatchHtml))
	    .WithExtensionAliases({".htm"});
	auto &xml = utf8.AddChild(Node("text/xml; charset=utf-8", ".xml", MatchXml))
	    .WithAliases({"application/xml"});
	utf8.AddChild(Node("text/rtf", ".rtf", MatchRtf, MimeKind::DOCUMENT))
	    .WithAliases({"application/rtf"});
	utf8.AddChild(Node("text/x-php", ".php", MatchPhp));
	utf8.AddChild(Node("text/javascript", ".js", MatchJavaScript))
	    .WithAliases({"application/javascript"});
	utf8.AddChild(Node("text/x-python", ".py", MatchPython))
	    .WithAliases({"text/x-script.python", "application/x-python"});
	utf8.AddChild(Node("text/x-perl", ".pl", MatchPerl));
	utf8.AddChild(Node("text/x-ruby", ".rb", MatchRuby))
	    .WithAliases({"application/x-ruby"});
	utf8.AddChild(Node("text/x-lua", ".lua", MatchLua));
	utf8.AddChild(Node("text/x-shellscript", ".sh", MatchShell))
	    .WithAliases({"text/x-sh", "application/x-shellscript", "application/x-sh"});
	utf8.AddChild(Node("text/x-tcl", ".tcl", MatchTcl))
	    .WithAliases({"application/x-tcl"});
	auto &json = utf8.AddChild(Node("application/json", ".json", MatchJson));
	utf8.AddChild(Node("text/csv", ".csv", MatchCsv));
	utf8.AddChild(Node("text/tab-separated-values", ".tsv", MatchTsv));
	utf8.AddChild(Node("application/x-subrip", ".srt", MatchSrt, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-srt", "text/x-srt"});
	utf8.AddChild(Node("text/vtt", ".vtt", MatchVtt));
	utf8.AddChild(Node("text/vcard", ".vcf", MatchVcard));
	utf8.AddChild(Node("text/calendar", ".ics", MatchICalendar));
	utf8.AddChild(Node("image/svg+xml", ".svg", MatchSvg, MimeKind::IMAGE));
	utf8.AddChild(Node("application/warc", ".warc", MatchWarc, MimeKind::ARCHIVE));

	AddXmlFormats(xml);
	AddJsonFormats(json);
}

template <bool BIG_ENDIAN_ORDER>
static void AddUtf16Formats(MimeType &parent) {
	parent.AddChild(Node("text/html; charset=utf-16", ".html", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectHtmlText>));
	parent.AddChild(Node("text/xml; charset=utf-16", ".xml", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectXmlText>))
	    .WithAliases({"application/xml; charset=utf-16"});
	parent.AddChild(Node("image/svg+xml; charset=utf-16", ".svg", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectSvgText>));
	parent.AddChild(Node("application/json; charset=utf-16",
	                     ".json", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectJsonText>));
	parent.AddChild(Node("text/csv; charset=utf-16", ".csv", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectCsvText>));
	parent.AddChild(Node("text/tab-separated-values; charset=utf-16",
	                     ".tsv", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectTsvText>));
	parent.AddChild(Node("application/x-subrip; charset=utf-16",
	                     ".srt", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectSrtText>));
	parent.AddChild(Node("text/vtt; charset=utf-16", ".vtt", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectVttText>));
	parent.AddChild(Node("text/vcard; charset=utf-16", ".vcf", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectVcardText>));
	parent.AddChild(Node("text/calendar; charset=utf-16",
	                     ".ics", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectICalendarText>));
	parent.AddChild(Node("text/rtf; charset=utf-16", ".rtf", MatchUtf16Text<BIG_ENDIAN_ORDER, DetectRtfText>));
}

// -----------------------------------------------------------------------------
// Root
// -----------------------------------------------------------------------------

// Binary signatures first, most frequent and most distinctive early. UTF-8 text is
// the last resort before the octet-stream fallback.
static unique_ptr<MimeType> BuildRoot() {
	auto root = make_uniq<MimeType>(MIME_OCTET_STREAM, "", MatchAny);
	root->AddChild(Node("image/x-xpixmap", ".xpm", MatchXpm, MimeKind::IMAGE));
	root->AddChild(Node("application/x-7z-compressed", ".7z", MatchSevenZ, MimeKind::ARCHIVE));
	auto &zip = root->AddChild(Node("application/zip", ".zip", MatchZip, MimeKind::ARCHIVE))
	    .WithAliases({"application/x-zip", "application/x-zip-compressed"})
	    .WithExtensionAliases({".xlsx", ".docx", ".pptx", ".vsdx", ".epub", ".jar", ".odt", ".ods", ".odp", ".odg",
	                           ".odf", ".sxc", ".kmz"});
	root->AddChild(Node("application/pdf", ".pdf", MatchPdf, MimeKind::DOCUMENT))
	    .WithAliases({"application/x-pdf"});
	root->AddChild(Node("application/vnd.fdf", ".fdf", MatchFdf, MimeKind::DOCUMENT));
	auto &ole = root->AddChild(Node("application/x-ole-storage", "", MatchOle, MimeKind::DOCUMENT))
	    .WithExtensionAliases({".xls", ".pub", ".ppt", ".doc", ".chm", ".one"});
	root->AddChild(Node("text/plain; charset=utf-8", ".txt", MatchUtf8Bom, MimeKind::TEXT));
	auto &utf16_be = root->AddChild(Node("text/plain; charset=utf-16be", ".txt", MatchUtf16BE, MimeKind::TEXT));
	auto &utf16_le = root->AddChild(Node("text/plain; charset=utf-16le", ".txt", MatchUtf16LE, MimeKind::TEXT));
	root->AddChild(Node("application/postscript", ".ps", MatchPs, MimeKind::DOCUMENT));
	root->AddChild(Node("image/vnd.adobe.photoshop", ".psd", MatchPsd, MimeKind::IMAGE))
	    .WithAliases({"image/x-psd", "application/photoshop"});
	root->AddChild(Node("image/x-portable-bitmap", ".pbm", MatchPbm, MimeKind::IMAGE));
	root->AddChild(Node("image/x-portable-graymap", ".pgm", MatchPgm, MimeKind::IMAGE));
	root->AddChild(Node("image/x-portable-pixmap", ".ppm", MatchPpm, MimeKind::IMAGE));
	root->AddChild(Node("image/x-portable-arbitrarymap", ".pam", MatchPam, MimeKind::IMAGE));
	root->AddChild(Node("application/pkcs7-signature", ".p7s", MatchP7s, MimeKind::APPLICATION));
	auto &ogg = root->AddChild(Node("application/ogg", ".ogg", MatchOgg, MimeKind::AUDIO))
	    .WithExtensionAliases({".oga", ".opus", ".ogv"});
	auto &png = root->AddChild(Node("image/png", ".png", MatchPng, MimeKind::IMAGE));
	root->AddChild(Node("image/jpeg", ".jpg", MatchJpg, MimeKind::IMAGE))
	    .WithExtensionAliases({".jpeg", ".jpe", ".jif", ".jfif", ".jfi"});
	root->AddChild(Node("image/jxl", ".jxl", MatchJxl, MimeKind::IMAGE));
	root->AddChild(Node("image/jp2", ".jp2", MatchJp2, MimeKind::IMAGE));
	root->AddChild(Node("image/jpx", ".jpx", MatchJpx, MimeKind::IMAGE));
	root->AddChild(Node("image/jpm", ".jpm", MatchJpm, MimeKind::IMAGE))
	    .WithAliases({"video/jpm"});
	root->AddChild(Node("image/jxs", ".jxs", MatchJxs, MimeKind::IMAGE));
	root->AddChild(Node("image/gif", ".gif", MatchGif, MimeKind::IMAGE));
	root->AddChild(Node("image/webp", ".webp", MatchWebp, MimeKind::IMAGE));
	root->AddChild(Node("application/vnd.microsoft.portable-executable", ".exe", MatchExe, MimeKind::EXECUTABLE));
	auto &elf = root->AddChild(Node("application/x-elf", "", MatchElf, MimeKind::EXECUTABLE))
	    .WithExtensionAliases({".so"});
	auto &ar = root->AddChild(Node("application/x-archive", ".a", MatchAr, MimeKind::ARCHIVE))
	    .WithAliases({"application/x-unix-archive"})
	    .WithExtensionAliases({".deb"});
	root->AddChild(Node("application/x-tar", ".tar", MatchTar, MimeKind::ARCHIVE));
	root->AddChild(Node("application/x-xar", ".xar", MatchXar, MimeKind::ARCHIVE));
	root->AddChild(Node("application/x-bzip2", ".bz2", MatchBz2, MimeKind::ARCHIVE));
	root->AddChild(Node("application/fits", ".fits", MatchFits, MimeKind::IMAGE))
	    .WithAliases({"image/fits"});
	root->AddChild(Node("image/tiff", ".tiff", MatchTiff, MimeKind::IMAGE))
	    .WithExtensionAliases({".tif"});
	root->AddChild(Node("image/bmp", ".bmp", MatchBmp, MimeKind::IMAGE))
	    .WithAliases({"image/x-bmp", "image/x-ms-bmp"})
	    .WithExtensionAliases({".dib"});
	root->AddChild(Node("application/vnd.lotus-1-2-3",
	                   ".123", MatchLotus123, MimeKind::SPREADSHEET | MimeKind::DATABASE));
	root->AddChild(Node("image/x-icon", ".ico", MatchIco, MimeKind::IMAGE));
	root->AddChild(Node("audio/mpeg", ".mp3", MatchMp3, MimeKind::AUDIO))
	    .WithAliases({"audio/x-mpeg", "audio/mp3"});
	root->AddChild(Node("audio/flac", ".flac", MatchFlac, MimeKind::AUDIO));
	root->AddChild(Node("audio/midi", ".midi", MatchMidi, MimeKind::AUDIO))
	    .WithAliases({"audio/mid"})
	    .WithExtensionAliases({".mid"});
	root->AddChild(Node("audio/ape", ".ape", MatchApe, MimeKind::AUDIO));
	root->AddChild(Node("audio/musepack", ".mpc", MatchMusepack, MimeKind::AUDIO));
	root->AddChild(Node("audio/amr", ".amr", MatchAmr, MimeKind::AUDIO))
	    .WithAliases({"audio/amr-nb"});
	root->AddChild(Node("audio/wav", ".wav", MatchWav, MimeKind::AUDIO))
	    .WithAliases({"audio/x-wav", "audio/vnd.wave", "audio/wave"});
	root->AddChild(Node("audio/aiff", ".aiff", MatchAiff, MimeKind::AUDIO))
	    .WithExtensionAliases({".aif"});
	root->AddChild(Node("audio/basic", ".au", MatchAu, MimeKind::AUDIO))
	    .WithExtensionAliases({".snd"});
	root->AddChild(Node("video/mpeg", ".mpeg", MatchMpeg, MimeKind::VIDEO));
	root->AddChild(Node("video/quicktime", ".mov", MatchQuickTime, MimeKind::VIDEO));
	root->AddChild(Node("video/quicktime", ".mqv", MatchMqv, MimeKind::VIDEO));
	auto &mp4 = root->AddChild(Node("video/mp4", ".mp4", MatchMp4, MimeKind::VIDEO));
	root->AddChild(Node("video/webm", ".webm", MatchWebm, MimeKind::VIDEO))
	    .WithAliases({"audio/webm"});
	root->AddChild(Node("video/x-msvideo", ".avi", MatchAvi, MimeKind::VIDEO))
	    .WithAliases({"video/avi", "video/msvideo"});
	root->AddChild(Node("video/x-flv", ".flv", MatchFlv, MimeKind::VIDEO));
	root->AddChild(Node("video/x-matroska", ".mkv", MatchMkv, MimeKind::VIDEO))
	    .WithExtensionAliases({".mk3d", ".mka", ".mks"});
	root->AddChild(Node("video/x-ms-asf", ".asf", MatchAsf, MimeKind::VIDEO))
	    .WithAliases({"video/asf", "video/x-ms-wmv"});
	root->AddChild(Node("audio/aac", ".aac", MatchAac, MimeKind::AUDIO));
	root->AddChild(Node("audio/x-unknown", ".voc", MatchVoc, MimeKind::AUDIO));
	root->AddChild(Node("audio/x-mpegurl", ".m3u", MatchM3u, MimeKind::TEXT))
	    .WithAliases({"audio/mpegurl"})
	    .WithExtensionAliases({".m3u8"});
	root->AddChild(Node("application/vnd.rn-realmedia-vbr", ".rmvb", MatchRmvb, MimeKind::VIDEO));
	root->AddChild(Node("application/gzip", ".gz", MatchGzip, MimeKind::ARCHIVE))
	    .WithAliases({"application/x-gzip", "application/x-gunzip", "application/gzipped",
	                  "application/gzip-compressed", "application/x-gzip-compressed", "gzip/document"})
	    .WithExtensionAliases({".tgz", ".taz"});
	root->AddChild(Node("application/x-java-applet; charset=binary", ".class", MatchClass, MimeKind::APPLICATION))
	    .WithAliases({"application/x-java-applet"});
	root->AddChild(Node("application/x-shockwave-flash", ".swf", MatchSwf, MimeKind::APPLICATION));
	root->AddChild(Node("application/x-chrome-extension", ".crx", MatchCrx, MimeKind::APPLICATION));
	root->AddChild(Node("font/ttf", ".ttf", MatchTtf, MimeKind::FONT))
	    .WithAliases({"font/sfnt", "application/x-font-ttf", "application/font-sfnt"});
	root->AddChild(Node("font/woff", ".woff", MatchWoff, MimeKind::FONT));
	root->AddChild(Node("font/woff2", ".woff2", MatchWoff2, MimeKind::FONT));
	root->AddChild(Node("font/otf", ".otf", MatchOtf, MimeKind::FONT));
	root->AddChild(Node("font/collection", ".ttc", MatchTtc, MimeKind::FONT));
	root->AddChild(Node("application/vnd.ms-fontobject", ".eot", MatchEot, MimeKind::FONT));
	root->AddChild(Node("application/wasm", ".wasm", MatchWasm, MimeKind::EXECUTABLE));
	auto &shx = root->AddChild(Node("application/vnd.shx", ".shx", MatchShx));
	root->AddChild(Node("application/x-dbf", ".dbf", MatchDbf, MimeKind::DATABASE));
	root->AddChild(Node("application/dicom", ".dcm", MatchDcm, MimeKind::IMAGE));
	root->AddChild(Node("application/x-rar-compressed", ".rar", MatchRar, MimeKind::ARCHIVE))
	    .WithAliases({"application/x-rar"});
	root->AddChild(Node("image/vnd.djvu", ".djvu", MatchDjvu, MimeKind::IMAGE));
	root->AddChild(Node("application/x-mobipocket-ebook", ".mobi", MatchMobi, MimeKind::DOCUMENT));
	root->AddChild(Node("application/x-ms-reader", ".lit", MatchLit, MimeKind::DOCUMENT));
	root->AddChild(Node("image/bpg", ".bpg", MatchBpg, MimeKind::IMAGE));
	root->AddChild(Node("application/cbor", ".cbor", MatchCbor));
	root->AddChild(Node("application/vnd.sqlite3", ".sqlite", MatchSqlite, MimeKind::DATABASE))
	    .WithAliases({"application/x-sqlite3"});
	root->AddChild(Node("image/vnd.dwg", ".dwg", MatchDwg, MimeKind::IMAGE))
	    .WithAliases({"image/x-dwg", "application/acad", "application/x-acad", "application/autocad_dwg",
	                  "application/dwg", "application/x-dwg", "application/x-autocad", "drawing/dwg"});
	root->AddChild(Node("image/vnd.dxf", ".dxf", MatchDxf, MimeKind::IMAGE));
	root->AddChild(Node("application/vnd.wordperfect", ".wpd", MatchWpd, MimeKind::DOCUMENT));
	root->AddChild(Node("application/vnd.nintendo.snes.rom", ".nes", MatchNes));
	root->AddChild(Node("application/x-ms-shortcut", ".lnk", MatchLnk));
	root->AddChild(Node("application/x-mach-binary", ".macho", MatchMachO, MimeKind::EXECUTABLE));
	root->AddChild(Node("audio/qcelp", ".qcp", MatchQcp, MimeKind::AUDIO));
	root->AddChild(Node("image/x-icns", ".icns", MatchIcns, MimeKind::IMAGE));
	root->AddChild(Node("image/vnd.radiance", ".hdr", MatchHdr, MimeKind::IMAGE));
	root->AddChild(Node("application/x-hdf", ".hdf", MatchHdf, MimeKind::DATABASE));
	root->AddChild(Node("application/marc", ".mrc", MatchMarc, MimeKind::TEXT | MimeKind::DATABASE));
	root->AddChild(Node("application/x-msaccess", ".mdb", MatchMdb, MimeKind::DATABASE));
	root->AddChild(Node("application/x-msaccess", ".accdb", MatchAccdb, MimeKind::DATABASE));
	root->AddChild(Node("application/zstd", ".zst", MatchZstd, MimeKind::ARCHIVE));
	root->AddChild(Node("application/vnd.ms-cab-compressed", ".cab", MatchCab, MimeKind::ARCHIVE));
	root->AddChild(Node("application/vnd.ms-htmlhelp", ".chm", MatchChm, MimeKind::DOCUMENT));
	root->AddChild(Node("application/x-rpm", ".rpm", MatchRpm, MimeKind::ARCHIVE));
	root->AddChild(Node("application/x-xz", ".xz", MatchXz, MimeKind::ARCHIVE));
	root->AddChild(Node("application/lzip", ".lz", MatchLzip, MimeKind::ARCHIVE))
	    .WithAliases({"application/x-lzip"});
	root->AddChild(Node("application/x-bittorrent", ".torrent", MatchTorrent));
	root->AddChild(Node("application/x-cpio", ".cpio", MatchCpio, MimeKind::ARCHIVE));
	root->AddChild(Node("application/tzif", "", MatchTzif));
	root->AddChild(Node("image/x-xcf", ".xcf", MatchXcf, MimeKind::IMAGE));
	root->AddChild(Node("image/x-gimp-pat", ".pat", MatchPat, MimeKind::IMAGE));
	root->AddChild(Node("image/x-gimp-gbr", ".gbr", MatchGbr, MimeKind::IMAGE));
	root->AddChild(Node("model/gltf-binary", ".glb", MatchGlb, MimeKind::MODEL));
	root->AddChild(Node("application/x-installshield", ".cab", MatchInstallShieldCab, MimeKind::ARCHIVE));
	root->AddChild(Node("image/jxr", ".jxr", MatchJxr, MimeKind::IMAGE))
	    .WithAliases({"image/vnd.ms-photo"});
	root->AddChild(Node("application/vnd.apache.parquet", ".parquet", MatchParquet, MimeKind::DATABASE))
	    .WithAliases({"application/x-parquet"});
	auto &utf8 = root->AddChild(Node("text/plain; charset=utf-8", ".txt", MatchUtf8, MimeKind::TEXT))
	    .WithAliases({"text/plain"})
	    .WithExtensionAliases({".pub", ".html", ".htm", ".shtml", ".svg", ".xml", ".rss", ".atom", ".x3d", ".kml",
	                           ".xlf", ".dae", ".gml", ".gpx", ".tcx", ".amf", ".3mf", ".php", ".js", ".lua", ".pl",
	                           ".py", ".json", ".geojson", ".ndjson", ".rtf", ".tcl", ".csv", ".tsv", ".vcf", ".vcard",
	                           ".ics", ".ical", ".icalendar", ".warc"});

	AddZipFormats(zip);
	AddOleFormats(ole);
	AddUtf16Formats<true>(utf16_be);
	AddUtf16Formats<false>(utf16_le);
	ogg.AddChild(Node("audio/ogg", ".oga", MatchOggAudio, MimeKind::AUDIO));
	ogg.AddChild(Node("video/ogg", ".ogv", MatchOggVideo, MimeKind::VIDEO));
	png.AddChild(Node("image/vnd.mozilla.apng", ".apng", MatchApng, MimeKind::IMAGE));
	elf.AddChild(Node("application/x-object", "", MatchElfObj, MimeKind::EXECUTABLE));
	elf.AddChild(Node("application/x-executable", "", MatchElfExe, MimeKind::EXECUTABLE));
	elf.AddChild(Node("application/x-sharedlib", ".so", MatchElfLib, MimeKind::EXECUTABLE));
	elf.AddChild(Node("application/x-coredump", "", MatchElfDump, MimeKind::EXECUTABLE));
	ar.AddChild(Node("application/vnd.debian.binary-package", ".deb", MatchDeb, MimeKind::ARCHIVE));
	AddIsoMediaFormats(mp4);
	shx.AddChild(Node("application/vnd.shp", ".shp", MatchShp));
	AddTextFormats(utf8);
	return root;
}

MimeTree::MimeTree() : root(BuildRoot()) {
	root->Flatten(nodes);
}

const MimeType *MimeTree::Find(const std::string &mime) const {
	for (auto node : nodes) {
		if (node->Is(mime)) {
			return node;
		}
	}
	return nullptr;
}

const MimeTree &MimeTree::Get() {
	static const MimeTree tree;
	return tree;
}

} // namespace duckdb
