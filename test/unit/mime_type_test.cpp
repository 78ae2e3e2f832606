#include "magic/mime_type.hpp"
#include "magic/mime_kind.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace duckdb {
namespace {

bool AcceptAll(const_data_ptr_t, idx_t) {
	return true;
}

bool RejectAll(const_data_ptr_t, idx_t) {
	return false;
}

bool StartsWithA(const_data_ptr_t input, idx_t size) {
	return size >= 1 && input[0] == 'A';
}

bool StartsWithAB(const_data_ptr_t input, idx_t size) {
	return size >= 2 && input[0] == 'A' && input[1] == 'B';
}

bool StartsWithAC(const_data_ptr_t input, idx_t size) {
	return size >= 2 && input[0] == 'A' && input[1] == 'C';
}

bool SecondIsC(const_data_ptr_t input, idx_t size) {
	return size >= 2 && input[1] == 'C';
}

const MimeType &Detect(const MimeType &root, const std::string &text) {
	return root.MatchBytes(reinterpret_cast<const_data_ptr_t>(text.data()), text.size());
}

unique_ptr<MimeType> MakeRoot() {
	return make_uniq<MimeType>("application/octet-stream", "", AcceptAll);
}

} // namespace

TEST(MimeTypeTest, FallsBackToRootWhenNothingMatches) {
	auto root = MakeRoot();
	root->AddChild(make_uniq<MimeType>("x/a", ".a", StartsWithA));

	EXPECT_EQ(&Detect(*root, "zzz"), root.get());
	EXPECT_EQ(&Detect(*root, ""), root.get());
}

TEST(MimeTypeTest, DescendsIntoMostSpecificChild) {
	auto root = MakeRoot();
	auto &a = root->AddChild(make_uniq<MimeType>("x/a", ".a", StartsWithA));
	auto &ab = a.AddChild(make_uniq<MimeType>("x/ab", ".ab", StartsWithAB));

	EXPECT_EQ(&Detect(*root, "AB"), &ab);
	EXPECT_EQ(&Detect(*root, "AZ"), &a);
}

TEST(MimeTypeTest, FirstMatchingSiblingWins) {
	auto root = MakeRoot();
	auto &first = root->AddChild(make_uniq<MimeType>("x/first", "", StartsWithA));
	root->AddChild(make_uniq<MimeType>("x/second", "", StartsWithA));

	for (int i = 0; i < 10; i++) {
		EXPECT_EQ(&Detect(*root, "A"), &first);
	}
}

TEST(MimeTypeTest, NeverBacktracksToLaterSiblings) {
	// "AC" satisfies A (then none of A's children) and also the later sibling C.
	auto root = MakeRoot();
	auto &a = root->AddChild(make_uniq<MimeType>("x/a", "", StartsWithA));
	a.AddChild(make_uniq<MimeType>("x/ab", "", StartsWithAB));
	auto &c = root->AddChild(make_uniq<MimeType>("x/c", "", SecondIsC));

	EXPECT_EQ(&Detect(*root, "AC"), &a);
	EXPECT_EQ(&Detect(*root, "ZC"), &c);
}

TEST(MimeTypeTest, RejectingChildIsSkipped) {
	auto root = MakeRoot();
	root->AddChild(make_uniq<MimeType>("x/never", "", RejectAll));
	auto &ac = root->AddChild(make_uniq<MimeType>("x/ac", "", StartsWithAC));

	EXPECT_EQ(&Detect(*root, "AC"), &ac);
}

TEST(MimeTypeTest, AddChildSetsParentAndKeepsOrder) {
	auto root = MakeRoot();
	auto &a = root->AddChild(make_uniq<MimeType>("x/a", "", StartsWithA));
	auto &b = root->AddChild(make_uniq<MimeType>("x/b", "", RejectAll));
	auto &ab = a.AddChild(make_uniq<MimeType>("x/ab", "", StartsWithAB));

	EXPECT_EQ(root->Parent(), nullptr);
	EXPECT_EQ(a.Parent(), root.get());
	EXPECT_EQ(b.Parent(), root.get());
	EXPECT_EQ(ab.Parent(), &a);
	ASSERT_EQ(root->Children().size(), 2u);
	EXPECT_EQ(root->Children()[0].get(), &a);
	EXPECT_EQ(root->Children()[1].get(), &b);

	EXPECT_EQ(root->Depth(), 0u);
	EXPECT_EQ(a.Depth(), 1u);
	EXPECT_EQ(ab.Depth(), 2u);

	std::vector<const MimeType *> flat;
	root->Flatten(flat);
	ASSERT_EQ(flat.size(), 4u);
	EXPECT_EQ(flat[0], root.get());
	EXPECT_EQ(flat[1], &a);
	EXPECT_EQ(flat[2], &ab);
	EXPECT_EQ(flat[3], &b);
}

TEST(MimeTypeTest, KindIsInheritedFromAncestors) {
	auto root = MakeRoot();
	auto &zip = root->AddChild(make_uniq<MimeType>("application/zip", ".zip", StartsWithA, MimeKind::ARCHIVE));
	auto &xlsx = zip.AddChild(make_uniq<MimeType>("x/xlsx", ".xlsx", StartsWithAB, MimeKind::SPREADSHEET));

	EXPECT_EQ(root->Kind(), MimeKind::UNKNOWN);
	EXPECT_EQ(xlsx.OwnKind(), MimeKind::SPREADSHEET);
	EXPECT_TRUE(HasKind(xlsx.Kind(), MimeKind::SPREADSHEET));
	EXPECT_TRUE(HasKind(xlsx.Kind(), MimeKind::ARCHIVE));
	EXPECT_FALSE(HasKind(zip.Kind(), MimeKind::SPREADSHEET));
	EXPECT_EQ(MimeKindToString(xlsx.Kind()), "ARCHIVE | SPREADSHEET");
}

TEST(MimeTypeTest, KindToString) {
	EXPECT_EQ(MimeKindToString(MimeKind::UNKNOWN), "UNKNOWN");
	EXPECT_EQ(MimeKindToString(MimeKind::IMAGE), "IMAGE");
	EXPECT_EQ(MimeKindToString(MimeKind::PRESENTATION | MimeKind::VIDEO), "VIDEO | PRESENTATION");
}

TEST(MimeTypeTest, IsComparesNormalizedMimeAndAliases) {
	MimeType html("text/html; charset=utf-8", ".html", AcceptAll);
	html.WithAliases({"application/xhtml-ish"});

	EXPECT_TRUE(html.Is("text/html"));
	EXPECT_TRUE(html.Is("  text/html ; charset=latin1"));
	EXPECT_TRUE(html.Is("application/xhtml-ish; q=1"));
	EXPECT_FALSE(html.Is("TEXT/HTML"));
	EXPECT_FALSE(html.Is("text/plain"));
}

TEST(MimeTypeTest, NormalizeMime) {
	EXPECT_EQ(NormalizeMime("text/html; charset=utf-8"), "text/html");
	EXPECT_EQ(NormalizeMime("  image/png  "), "image/png");
	EXPECT_EQ(NormalizeMime("; charset=utf-8"), "");
	EXPECT_EQ(NormalizeMime(""), "");
}

} // namespace duckdb
