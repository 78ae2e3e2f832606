#include "magic/mime_kind.hpp"

#include <utility>

namespace duckdb {

static const std::pair<MimeKind, const char *> KIND_NAMES[] = {
    {MimeKind::ARCHIVE, "ARCHIVE"},         {MimeKind::VIDEO, "VIDEO"},
    {MimeKind::AUDIO, "AUDIO"},             {MimeKind::IMAGE, "IMAGE"},
    {MimeKind::DOCUMENT, "DOCUMENT"},       {MimeKind::TEXT, "TEXT"},
    {MimeKind::FONT, "FONT"},               {MimeKind::EXECUTABLE, "EXECUTABLE"},
    {MimeKind::APPLICATION, "APPLICATION"}, {MimeKind::MODEL, "MODEL"},
    {MimeKind::DATABASE, "DATABASE"},       {MimeKind::SPREADSHEET, "SPREADSHEET"},
    {MimeKind::PRESENTATION, "PRESENTATION"},
};

std::string MimeKindToString(MimeKind kind) {
	std::string out;
	for (const auto &entry : KIND_NAMES) {
		if (!HasKind(kind, entry.first)) {
			continue;
		}
		if (!out.empty()) {
			out += " | ";
		}
		out += entry.second;
	}
	if (out.empty()) {
		return "UNKNOWN";
	}
	return out;
}

} // namespace duckdb
