#include <gtest/gtest.h>

#include <ffdl/link_list.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

fs::path temp_file(const std::string &name) {
	auto dir = fs::temp_directory_path() / "ffdl_link_list_test";
	fs::create_directories(dir);
	auto p = dir / name;
	fs::remove(p);
	return p;
}

std::string read_all(const fs::path &p) {
	std::ifstream in(p);
	std::stringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

}  // namespace

TEST(LinkList, SkipsCommentsBlanksAndDuplicates) {
	auto links = ffdl::parse_links(
		"# header\n"
		"https://a.example/1\r\n"
		"\n"
		"   https://b.example/2   \n"
		"  # indented comment\n"
		"https://a.example/1\n"
		"https://c.example/3");
	ASSERT_EQ(links.size(), 3u);
	EXPECT_EQ(links[0], "https://a.example/1");
	EXPECT_EQ(links[1], "https://b.example/2");
	EXPECT_EQ(links[2], "https://c.example/3");
}

TEST(LinkList, IgnoresByteOrderMark) {
	auto links = ffdl::parse_links("\xEF\xBB\xBFhttps://a.example/1\n");
	ASSERT_EQ(links.size(), 1u);
	EXPECT_EQ(links[0], "https://a.example/1");
}

TEST(LinkList, MissingFileIsCreatedWithHeader) {
	auto p = temp_file("missing.txt");
	auto links = ffdl::load_links(p);
	ASSERT_TRUE(links);
	EXPECT_TRUE(links.value().empty());
	ASSERT_TRUE(fs::exists(p));
	EXPECT_EQ(read_all(p), std::string(ffdl::kLinkFileHeader) + "\n");
}

TEST(LinkList, RemoveLinkRewritesFile) {
	auto p = temp_file("remove.txt");
	ASSERT_TRUE(ffdl::save_links(
		p, {"https://a.example/1", "https://b.example/2"}));

	ASSERT_TRUE(ffdl::remove_link(p, "https://a.example/1"));
	auto links = ffdl::load_links(p);
	ASSERT_TRUE(links);
	ASSERT_EQ(links.value().size(), 1u);
	EXPECT_EQ(links.value()[0], "https://b.example/2");
	EXPECT_EQ(read_all(p).rfind(ffdl::kLinkFileHeader, 0), 0u);
}
