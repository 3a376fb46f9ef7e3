#ifndef HLS_DOWNLOADER_H

#define HLS_DOWNLOADER_H

#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "http_client.h"
#include "m3u8_parser.h"
#include "segment_downloader.h"
#include "segment_ledger.h"

namespace asio = boost::asio;

struct downloader_config {
	size_t max_concurrent_downloads = 8;
	std::chrono::milliseconds poll_interval {5000};
	size_t max_attempts = 3;
	std::chrono::milliseconds retry_delay {1000};
	// Directory that receives the per-stream output directory.
	std::string output_root;
};

// Polls a live playlist and downloads every media segment it has not seen yet.
// A master playlist is followed to its first media playlist on every poll.
class hls_downloader {
		struct filter_statistics {
			size_t invalid_url = 0;
			size_t invalid_name = 0;
			size_t downloaded = 0;
		};

		const downloader_config config;
		segment_ledger ledger;
		segment_downloader downloader;
		asio::steady_timer timer;
		std::string playlist_url;
		std::string output_directory;
		boost::system::error_code last_error;
		http_client * const client = nullptr;
		size_t poll_number = 0;
		bool stopped = false;

		void fetch_playlist(const std::string& url, size_t depth);
		void on_cycle_end(const boost::system::error_code& ec);
		void on_playlist_receive(const std::string& url, size_t depth, std::vector<char> *body);
		void poll();
		void timer_handler(const boost::system::error_code& ec);

	public:
		hls_downloader(asio::io_context *io,
			       http_client *c,
			       const downloader_config& cfg = downloader_config {}) :
		    config(cfg),
		    downloader(io,
			       c,
			       cfg.max_concurrent_downloads,
			       cfg.max_attempts,
			       cfg.retry_delay),
		    timer(*io), client(c)
		{
		}

		// Returns the segments of the playlist that have not been dispatched
		// before and records them as dispatched.
		std::vector<std::string> filter_new_segments(const m3u8_playlist& playlist);

		// Creates the output directory and schedules the first poll. Polling
		// continues for as long as the I/O context runs.
		boost::system::error_code start(const std::string_view& url);
		void stop();

		const std::string& get_output_directory() const noexcept
		{
			return output_directory;
		}

		// The outcome of the most recent poll.
		const boost::system::error_code& get_last_error() const noexcept
		{
			return last_error;
		}

		const segment_ledger& get_ledger() const noexcept
		{
			return ledger;
		}
};

#endif // HLS_DOWNLOADER_H
