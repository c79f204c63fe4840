#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/coroutine/attributes.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <ytplaylist/extractor.hpp>
#include <ytplaylist/fetcher.hpp>
#include <ytplaylist/http_client.hpp>
#include <ytplaylist/playlist.hpp>

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_PARTIAL = 2;

struct CliOptions {
	std::string url;
	bool dump_json = false;
	bool number = false;
	bool reverse = false;
	ytplaylist::PlaylistOptions playlist;
};

void print_playlist(const ytplaylist::Playlist &playlist,
					const CliOptions &opts) {
	if (opts.dump_json) {
		nlohmann::json j = playlist;
		fmt::print("{}\n", j.dump(2));
		return;
	}

	std::vector<std::string> prefixes;
	if (opts.number) { prefixes = playlist.numbered_prefixes(opts.reverse); }

	for (size_t i = 0; i < playlist.size(); ++i) {
		const auto &entry = playlist[i];
		if (opts.number) {
			fmt::print("{} {}\t{}\n", prefixes[i], entry.url, entry.title);
		} else {
			fmt::print("{}\t{}\n", entry.url, entry.title);
		}
	}
}

int run_app(const std::shared_ptr<ytplaylist::net::HttpClient> &http,
			const CliOptions &opts, asio::yield_context yield) {
	auto options =
		std::make_shared<const ytplaylist::PlaylistOptions>(opts.playlist);
	auto fetcher =
		std::make_shared<ytplaylist::net::HttpPageFetcher>(http, options);
	ytplaylist::youtube::PlaylistExtractor extractor(fetcher, options);

	auto result = extractor.async_build(opts.url, yield);
	if (result.has_error()) {
		fmt::print(stderr, "ERROR: Unable to extract playlist: {}\n",
				   result.error().message());
		return EXIT_FAILED;
	}

	const auto &playlist = result.value();
	if (playlist.title()) {
		spdlog::info("Playlist {}: {}", playlist.id(), *playlist.title());
	}
	print_playlist(playlist, opts);

	if (!playlist.complete()) {
		fmt::print(stderr, "WARNING: Playlist is incomplete ({} video(s)): {}\n",
				   playlist.size(), playlist.terminal_error()->message());
		return EXIT_PARTIAL;
	}
	return EXIT_OK;
}

}  // namespace

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[youtube:playlist] %v");

		ytplaylist::PlaylistOptions defaults;

		// Parse command line
		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("url", po::value<std::string>(), "Playlist URL or id")
			("dump-json,j", "Print the playlist as JSON")
			("number,n", "Prefix each entry with its position")
			("reverse", "Number entries from the end of the playlist")
			("max-continuations", po::value<size_t>()->default_value(defaults.max_continuations),
				"Maximum number of continuation pages to fetch")
			("client-version", po::value<std::string>()->default_value(defaults.client_version),
				"Web client version sent with continuation requests")
			("watch-key", po::value<std::string>()->default_value(defaults.watch_key),
				"Query key of generated watch URLs (id or v)")
			("quiet,q", "Only log warnings and errors")
			("verbose,v", "Enable verbose logging");
		// clang-format on

		po::positional_options_description p;
		p.add("url", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: ytplaylist [options] <url-or-id>\n"
					  << desc << "\n";
			return EXIT_OK;
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else if (vm.count("quiet")) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		if (!vm.count("url")) {
			std::cout << "Usage: ytplaylist [options] <url-or-id>\n"
					  << desc << "\n";
			return EXIT_FAILED;
		}

		CliOptions opts;
		opts.url = vm["url"].as<std::string>();
		opts.dump_json = vm.count("dump-json") > 0;
		opts.number = vm.count("number") > 0;
		opts.reverse = vm.count("reverse") > 0;
		opts.playlist.max_continuations = vm["max-continuations"].as<size_t>();
		opts.playlist.client_version = vm["client-version"].as<std::string>();
		opts.playlist.watch_key = vm["watch-key"].as<std::string>();

		if (opts.playlist.watch_key != "id" && opts.playlist.watch_key != "v") {
			fmt::print(stderr, "ERROR: --watch-key must be \"id\" or \"v\"\n");
			return EXIT_FAILED;
		}

		asio::io_context ioc;
		auto http =
			std::make_shared<ytplaylist::net::HttpClient>(ioc.get_executor());

		int exit_code = EXIT_FAILED;

		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				fmt::print(stderr, "\nInterrupted by signal {}.\n", sig);
				http->shutdown();
				ioc.stop();
			}
		});

		// Run the app in a coroutine
		boost::asio::spawn(
			ioc,
			[&](asio::yield_context yield) {
				exit_code = run_app(http, opts, std::move(yield));
				// Cancel signal wait so io_context can exit normally
				signals.cancel();
			},
			boost::coroutines::attributes());

		ioc.run();

		return exit_code;

	} catch (const std::exception &e) {
		fmt::print(stderr, "ERROR: {}\n", e.what());
		return EXIT_FAILED;
	}
}
