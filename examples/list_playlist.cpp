#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <iostream>
#include <ytplaylist/extractor.hpp>
#include <ytplaylist/fetcher.hpp>
#include <ytplaylist/http_client.hpp>

using namespace ytplaylist;

int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("ytplaylist", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	boost::asio::io_context ioc;

	auto options = std::make_shared<PlaylistOptions>();
	options->watch_key = "v";
	options->max_continuations = 5;

	// Components
	auto http = std::make_shared<net::HttpClient>(ioc.get_executor());
	auto fetcher = std::make_shared<net::HttpPageFetcher>(http, options);
	youtube::PlaylistExtractor extractor(fetcher, options);

	std::string url = argc > 1 ? argv[1]
							   : "https://www.youtube.com/playlist?list="
								 "PLS1QulWo1RIaJECMeUT4LFwJ-ghgoSH6n";

	std::cout << "Listing " << url << "...\n";

	extractor.async_build(url, [](Result<Playlist> res) {
		if (res.has_error()) {
			std::cerr << "Extraction failed: " << res.error().message()
					  << "\n";
			return;
		}

		const auto &playlist = res.value();
		std::cout << playlist.title().value_or(playlist.id()) << ": "
				  << playlist.size() << " video(s)\n";

		// First few entries only
		for (const auto &entry : playlist.slice(0, 10)) {
			std::cout << "  " << entry.url << "  " << entry.title << "\n";
		}
		if (!playlist.complete()) {
			std::cout << "Incomplete: " << playlist.terminal_error()->message()
					  << "\n";
		}
	});

	ioc.run();
	return 0;
}
