#include <gtest/gtest.h>

#include "test_support.hpp"
#include "youtube/continuation_parser.hpp"

namespace ytplaylist::youtube {
namespace {

using test::json;
using test::video_item;

class ContinuationParserTest : public ::testing::Test {
   protected:
	std::shared_ptr<const PlaylistOptions> options =
		std::make_shared<const PlaylistOptions>();
	ContinuationParser parser{options};
};

TEST_F(ContinuationParserTest, InitialShapeWithToken) {
	auto data =
		test::initial_data({video_item("abc12345678", "Song A")}, "TOK1");

	Page page = parser.parse_page(data);

	ASSERT_EQ(page.entries.size(), 1u);
	EXPECT_EQ(page.entries[0].url,
			  "https://www.youtube.com/watch?id=abc12345678");
	EXPECT_EQ(page.entries[0].title, "Song A");
	EXPECT_EQ(page.continuation, ContinuationToken("TOK1"));
}

TEST_F(ContinuationParserTest, InitialShapeWithoutContinuations) {
	auto data = test::initial_data(
		{video_item("abc12345678", "Song A")}, std::nullopt);

	Page page = parser.parse_page(data, ResponseShape::initial);

	ASSERT_EQ(page.entries.size(), 1u);
	EXPECT_FALSE(page.continuation.has_value());
}

TEST_F(ContinuationParserTest, FallsBackToContinuationShape) {
	auto data = json::parse(test::continuation_body(
		{video_item("v1", "One"), video_item("v2", "Two")}, "TOK2"));

	Page page = parser.parse_page(data);

	ASSERT_EQ(page.entries.size(), 2u);
	EXPECT_EQ(page.entries[1].url, "https://www.youtube.com/watch?id=v2");
	EXPECT_EQ(page.continuation, ContinuationToken("TOK2"));
}

TEST_F(ContinuationParserTest, ContinuationShapeWithoutArray) {
	auto envelope = json::parse(
		test::continuation_body({video_item("v1", "One")}, std::nullopt))[1];

	Page page = parser.parse_page(envelope, ResponseShape::continuation);

	ASSERT_EQ(page.entries.size(), 1u);
	EXPECT_FALSE(page.continuation.has_value());
}

TEST_F(ContinuationParserTest, ShapeIsNotGuessedWhenGiven) {
	auto data = test::initial_data({video_item("v1", "One")}, "TOK1");

	Page page = parser.parse_page(data, ResponseShape::continuation);

	EXPECT_TRUE(page.entries.empty());
	EXPECT_FALSE(page.continuation.has_value());
}

TEST_F(ContinuationParserTest, UnknownResponseIsEmptyTerminalPage) {
	for (const auto &data :
		 {json::object(), json::array(), json(nullptr), json("text"),
		  json::parse(R"({"contents": {"twoColumnBrowseResultsRenderer": 1}})")}) {
		Page page = parser.parse_page(data);
		EXPECT_TRUE(page.entries.empty());
		EXPECT_FALSE(page.continuation.has_value());
	}
}

TEST_F(ContinuationParserTest, ParsingIsIdempotent) {
	auto data = test::initial_data(
		{video_item("v1", "One"), video_item("v2", "Two")}, "TOK1");

	Page first = parser.parse_page(data);
	Page second = parser.parse_page(data);

	ASSERT_EQ(first.entries.size(), second.entries.size());
	for (size_t i = 0; i < first.entries.size(); ++i) {
		EXPECT_EQ(first.entries[i].url, second.entries[i].url);
		EXPECT_EQ(first.entries[i].title, second.entries[i].title);
	}
	EXPECT_EQ(first.continuation, second.continuation);
}

TEST_F(ContinuationParserTest, SkipsItemsThatAreNotVideos) {
	std::vector<json> items = {
		video_item("v1", "One"),
		json{{"continuationItemRenderer", json::object()}},
		json{{"playlistVideoRenderer", {{"title", {{"simpleText", "No id"}}}}}},
		json{{"playlistVideoRenderer", {{"videoId", "v9"}}}},  // No title
		json("garbage"),
		video_item("v2", "Two"),
	};
	auto data = test::initial_data(items, std::nullopt);

	Page page = parser.parse_page(data);

	ASSERT_EQ(page.entries.size(), 2u);
	EXPECT_EQ(page.entries[0].title, "One");
	EXPECT_EQ(page.entries[1].title, "Two");
}

TEST_F(ContinuationParserTest, TitleFromRunsAndEntities) {
	json runs_item = {
		{"playlistVideoRenderer",
		 {{"videoId", "r1"},
		  {"title",
		   {{"runs", json::array({{{"text", "Rock "}}, {{"text", "&amp; Roll"}}})}}}}}};
	auto data = test::initial_data(
		{runs_item, video_item("e1", "It&#39;s &quot;fine&quot;")}, std::nullopt);

	Page page = parser.parse_page(data);

	ASSERT_EQ(page.entries.size(), 2u);
	EXPECT_EQ(page.entries[0].title, "Rock & Roll");
	EXPECT_EQ(page.entries[1].title, "It's \"fine\"");
}

TEST_F(ContinuationParserTest, DuplicatesWithinPageKeepFirst) {
	auto data = test::initial_data({video_item("v1", "First"),
									video_item("v2", "Two"),
									video_item("v1", "Again")},
								   std::nullopt);

	Page page = parser.parse_page(data);

	ASSERT_EQ(page.entries.size(), 2u);
	EXPECT_EQ(page.entries[0].title, "First");
	EXPECT_EQ(page.entries[1].url, "https://www.youtube.com/watch?id=v2");
}

TEST_F(ContinuationParserTest, EmptyTokenMeansNoContinuation) {
	auto data = test::initial_data({video_item("v1", "One")}, "");

	EXPECT_FALSE(parser.parse_page(data).continuation.has_value());
}

TEST(ContinuationParser, WatchUrlFollowsOptions) {
	PlaylistOptions opts;
	opts.base_url = "https://yt.example";
	opts.watch_key = "v";
	ContinuationParser parser(std::make_shared<const PlaylistOptions>(opts));

	EXPECT_EQ(parser.watch_url("abc"), "https://yt.example/watch?v=abc");
}

}  // namespace
}  // namespace ytplaylist::youtube
