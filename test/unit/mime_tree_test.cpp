#include "magic/mime_tree.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

namespace duckdb {

TEST(MimeTreeTest, RootIsOctetStream) {
	const auto &root = MimeTree::Get().Root();
	EXPECT_EQ(root.Mime(), MIME_OCTET_STREAM);
	EXPECT_EQ(root.Extension(), "");
	EXPECT_EQ(root.Parent(), nullptr);
	EXPECT_TRUE(root.Matches(nullptr, 0));
}

TEST(MimeTreeTest, TopLevelPriorityOrder) {
	const auto &children = MimeTree::Get().Root().Children();
	ASSERT_GT(children.size(), 10u);
	EXPECT_EQ(children[0]->Mime(), "image/x-xpixmap");
	EXPECT_EQ(children[1]->Mime(), "application/x-7z-compressed");
	EXPECT_EQ(children[2]->Mime(), "application/zip");
	EXPECT_EQ(children[3]->Mime(), "application/pdf");
	// plain UTF-8 text is the last resort
	EXPECT_EQ(children.back()->Mime(), "text/plain; charset=utf-8");
	EXPECT_FALSE(children.back()->Children().empty());
}

TEST(MimeTreeTest, ParentLinksMatchStructure) {
	const auto &tree = MimeTree::Get();
	const auto &nodes = tree.Nodes();
	ASSERT_FALSE(nodes.empty());
	EXPECT_EQ(nodes[0], &tree.Root());

	for (auto node : nodes) {
		for (const auto &child : node->Children()) {
			EXPECT_EQ(child->Parent(), node) << child->Mime();
			EXPECT_EQ(child->Depth(), node->Depth() + 1) << child->Mime();
		}
		if (node != &tree.Root()) {
			EXPECT_NE(node->Parent(), nullptr) << node->Mime();
		}
	}
}

TEST(MimeTreeTest, NodesArePreOrderAndUnique) {
	const auto &nodes = MimeTree::Get().Nodes();
	std::set<const MimeType *> seen(nodes.begin(), nodes.end());
	EXPECT_EQ(seen.size(), nodes.size());

	// every child appears after its parent
	for (idx_t i = 0; i < nodes.size(); i++) {
		if (!nodes[i]->Parent()) {
			continue;
		}
		bool parent_before = false;
		for (idx_t j = 0; j < i; j++) {
			parent_before = parent_before || nodes[j] == nodes[i]->Parent();
		}
		EXPECT_TRUE(parent_before) << nodes[i]->Mime();
	}
}

TEST(MimeTreeTest, ExtensionsCarryLeadingDot) {
	for (auto node : MimeTree::Get().Nodes()) {
		if (!node->Extension().empty()) {
			EXPECT_EQ(node->Extension()[0], '.') << node->Mime();
		}
		for (const auto &alias : node->ExtensionAliases()) {
			ASSERT_FALSE(alias.empty()) << node->Mime();
			EXPECT_EQ(alias[0], '.') << node->Mime();
		}
	}
}

TEST(MimeTreeTest, SubFormatsHangBelowTheirContainer) {
	const auto &tree = MimeTree::Get();

	auto docx = tree.Find("application/vnd.openxmlformats-officedocument.wordprocessingml.document");
	ASSERT_NE(docx, nullptr);
	EXPECT_EQ(docx->Parent()->Mime(), "application/zip");

	auto apng = tree.Find("image/vnd.mozilla.apng");
	ASSERT_NE(apng, nullptr);
	EXPECT_EQ(apng->Parent()->Mime(), "image/png");

	auto deb = tree.Find("application/vnd.debian.binary-package");
	ASSERT_NE(deb, nullptr);
	EXPECT_EQ(deb->Parent()->Mime(), "application/x-archive");

	auto exe = tree.Find("application/x-executable");
	ASSERT_NE(exe, nullptr);
	EXPECT_EQ(exe->Parent()->Mime(), "application/x-elf");

	auto geojson = tree.Find("application/geo+json");
	ASSERT_NE(geojson, nullptr);
	EXPECT_EQ(geojson->Depth(), 3u);
}

TEST(MimeTreeTest, FindUsesAliasesAndNormalization) {
	const auto &tree = MimeTree::Get();

	auto zip = tree.Find("application/x-zip-compressed");
	ASSERT_NE(zip, nullptr);
	EXPECT_EQ(zip->Mime(), "application/zip");

	auto html = tree.Find("text/html");
	ASSERT_NE(html, nullptr);
	EXPECT_EQ(html->Extension(), ".html");

	auto xml = tree.Find(" application/xml ; charset=utf-8");
	ASSERT_NE(xml, nullptr);
	EXPECT_EQ(xml->Extension(), ".xml");

	EXPECT_EQ(tree.Find("application/x-not-a-format"), nullptr);
	EXPECT_EQ(tree.Find(""), nullptr);
}

TEST(MimeTreeTest, ConcurrentFirstAccessSeesOneTree) {
	std::vector<const MimeType *> roots(8, nullptr);
	std::vector<std::thread> threads;
	for (idx_t i = 0; i < roots.size(); i++) {
		threads.emplace_back([&roots, i]() { roots[i] = &MimeTree::Get().Root(); });
	}
	for (auto &thread : threads) {
		thread.join();
	}
	for (auto root : roots) {
		EXPECT_EQ(root, &MimeTree::Get().Root());
	}
}

} // namespace duckdb
