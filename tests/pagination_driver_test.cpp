#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "test_support.hpp"
#include "youtube/pagination_driver.hpp"

namespace ytplaylist::youtube {
namespace {

using test::continuation_body;
using test::continuation_url;
using test::listing_page;
using test::video_item;

struct Drained {
	std::vector<Page> pages;
	std::optional<std::error_code> error;
	bool finished = false;  // Completed with std::nullopt
};

void drain(const std::shared_ptr<PaginationDriver> &driver, Drained &out) {
	driver->async_next_page([driver, &out](PaginationDriver::PageResult res) {
		if (res.has_error()) {
			out.error = res.error();
			return;
		}
		if (!res.value()) {
			out.finished = true;
			return;
		}
		out.pages.push_back(std::move(*res.value()));
		drain(driver, out);
	});
}

class PaginationDriverTest : public ::testing::Test {
   protected:
	void SetUp() override {
		fetcher = std::make_shared<test::ScriptedFetcher>(ioc.get_executor());
	}

	std::shared_ptr<PaginationDriver> make_driver(std::string html) {
		return std::make_shared<PaginationDriver>(
			fetcher, std::make_shared<const PlaylistOptions>(options), "PLtest",
			std::move(html));
	}

	Drained run(const std::shared_ptr<PaginationDriver> &driver) {
		Drained out;
		drain(driver, out);
		ioc.run();
		return out;
	}

	// Chain TOK1 -> TOK2 -> ... -> TOK<n> -> end, one video per page
	void script_chain(int n) {
		for (int i = 1; i <= n; ++i) {
			std::optional<std::string> next;
			if (i < n) next = "TOK" + std::to_string(i + 1);
			fetcher->respond(
				continuation_url("TOK" + std::to_string(i)),
				continuation_body(
					{video_item("c" + std::to_string(i), "Cont")}, next));
		}
	}

	boost::asio::io_context ioc;
	std::shared_ptr<test::ScriptedFetcher> fetcher;
	PlaylistOptions options;
};

TEST_F(PaginationDriverTest, SinglePageWithoutContinuation) {
	auto driver = make_driver(
		listing_page({video_item("abc12345678", "Song A")}, std::nullopt));

	auto out = run(driver);

	EXPECT_TRUE(out.finished);
	EXPECT_FALSE(out.error);
	ASSERT_EQ(out.pages.size(), 1u);
	EXPECT_EQ(out.pages[0].entries[0].url,
			  "https://www.youtube.com/watch?id=abc12345678");
	EXPECT_TRUE(driver->done());
	EXPECT_EQ(driver->fetch_count(), 0u);
	EXPECT_TRUE(fetcher->requests().empty());
}

TEST_F(PaginationDriverTest, TerminatesAfterExactlyNFetches) {
	script_chain(3);
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	auto out = run(driver);

	EXPECT_TRUE(out.finished);
	EXPECT_FALSE(out.error);
	EXPECT_EQ(out.pages.size(), 4u);
	EXPECT_EQ(driver->fetch_count(), 3u);
	ASSERT_EQ(fetcher->requests().size(), 3u);
	EXPECT_EQ(fetcher->requests()[0].url, continuation_url("TOK1"));
	EXPECT_EQ(fetcher->requests()[2].url, continuation_url("TOK3"));
}

TEST_F(PaginationDriverTest, ContinuationRequestsCarryClientHeaders) {
	script_chain(1);
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	run(driver);

	ASSERT_EQ(fetcher->requests().size(), 1u);
	const auto &headers = fetcher->requests()[0].headers;
	EXPECT_EQ(headers.at("X-YouTube-Client-Name"), "1");
	EXPECT_EQ(headers.at("X-YouTube-Client-Version"), options.client_version);
}

TEST_F(PaginationDriverTest, RepeatedTokenStalls) {
	fetcher->respond(continuation_url("TOK1"),
					 continuation_body({video_item("c1", "Cont")}, "TOK1"));
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	auto out = run(driver);

	// The page that repeated the token is still delivered
	EXPECT_EQ(out.pages.size(), 2u);
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::pagination_stalled);
	EXPECT_EQ(driver->fetch_count(), 1u);
}

TEST_F(PaginationDriverTest, ContinuationCapStops) {
	options.max_continuations = 2;
	script_chain(5);
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	auto out = run(driver);

	EXPECT_EQ(out.pages.size(), 3u);
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::pagination_stalled);
	EXPECT_EQ(fetcher->requests().size(), 2u);
}

TEST_F(PaginationDriverTest, FetchFailureEndsPagination) {
	// TOK2 is not scripted
	fetcher->respond(continuation_url("TOK1"),
					 continuation_body({video_item("c1", "Cont")}, "TOK2"));
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	auto out = run(driver);

	EXPECT_EQ(out.pages.size(), 2u);
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::pagination_fetch_failed);
	EXPECT_TRUE(driver->done());
}

TEST_F(PaginationDriverTest, NonJsonContinuationFails) {
	fetcher->respond(continuation_url("TOK1"),
					 std::string("<html>Sign in</html>"));
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	auto out = run(driver);

	EXPECT_EQ(out.pages.size(), 1u);
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::pagination_fetch_failed);
}

TEST_F(PaginationDriverTest, UnrecognisedContinuationIsEmptyTail) {
	fetcher->respond(continuation_url("TOK1"), std::string("[{}, {}]"));
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	auto out = run(driver);

	EXPECT_TRUE(out.finished);
	EXPECT_FALSE(out.error);
	ASSERT_EQ(out.pages.size(), 2u);
	EXPECT_TRUE(out.pages[1].entries.empty());
}

TEST_F(PaginationDriverTest, MissingInitialDataFailsFirstPage) {
	auto driver = make_driver("<html>consent wall</html>");

	auto out = run(driver);

	EXPECT_TRUE(out.pages.empty());
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::extraction_failed);
}

TEST_F(PaginationDriverTest, MalformedInitialDataFailsFirstPage) {
	auto driver = make_driver(
		"<script>\nwindow[\"ytInitialData\"] = {\"contents\": [;\n</script>");

	auto out = run(driver);

	EXPECT_TRUE(out.pages.empty());
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::malformed_data);
}

TEST_F(PaginationDriverTest, CancelStopsBeforeNextRequest) {
	script_chain(3);
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));

	Drained out;
	driver->async_next_page([&](PaginationDriver::PageResult res) {
		ASSERT_TRUE(res.has_value());
		out.pages.push_back(std::move(*res.value()));
		driver->cancel();
		drain(driver, out);
	});
	ioc.run();

	EXPECT_EQ(out.pages.size(), 1u);
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::cancelled);
	EXPECT_TRUE(fetcher->requests().empty());
}

TEST_F(PaginationDriverTest, CancelDropsPageInFlight) {
	script_chain(3);
	auto driver =
		make_driver(listing_page({video_item("first", "First")}, "TOK1"));
	fetcher->on_request([&](const std::string &) { driver->cancel(); });

	auto out = run(driver);

	EXPECT_EQ(out.pages.size(), 1u);
	ASSERT_TRUE(out.error);
	EXPECT_EQ(*out.error, errc::cancelled);
	EXPECT_EQ(fetcher->requests().size(), 1u);
	EXPECT_TRUE(driver->done());
}

TEST_F(PaginationDriverTest, DoneKeepsReportingEnd) {
	auto driver =
		make_driver(listing_page({video_item("v", "V")}, std::nullopt));
	auto out = run(driver);
	ASSERT_TRUE(out.finished);

	ioc.restart();
	Drained again;
	drain(driver, again);
	ioc.run();

	EXPECT_TRUE(again.finished);
	EXPECT_TRUE(again.pages.empty());
}

}  // namespace
}  // namespace ytplaylist::youtube
