#include <boost/log/trivial.hpp>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.h"
#include "hls_downloader.h"
#include "output_naming.h"
#include "segment_identity.h"

static const size_t max_playlist_depth = 4;

void hls_downloader::fetch_playlist(const std::string& url, size_t depth)
{
	client->get(url,
		    std::bind(&hls_downloader::on_playlist_receive,
			      this,
			      url,
			      depth,
			      std::placeholders::_1),
		    std::bind(&hls_downloader::on_cycle_end, this, std::placeholders::_1));
}

std::vector<std::string> hls_downloader::filter_new_segments(const m3u8_playlist& playlist)
{
	std::vector<std::string> ret;
	filter_statistics statistics;

	for (size_t i = 0; i < playlist.entries.size(); i++) {
		const auto& url = playlist.entries[i];
		std::string identity;
		boost::system::error_code ec;

		derive_segment_identity(url, playlist.sequence, i, &identity, ec);

		if (ec == make_error_code(errc::invalid_filename)) {
			BOOST_LOG_TRIVIAL(warning) << "Skipped segment with invalid file name [" << i
						   << "]: " << url;
			statistics.invalid_name++;
		}
		else if (ec) {
			BOOST_LOG_TRIVIAL(warning) << "Skipped invalid segment URL [" << i
						   << "]: " << url << " Error code: " << ec.message();
			statistics.invalid_url++;
		}
		else if (ledger.should_download(identity))
			ret.push_back(url);
		else
			statistics.downloaded++;
	}

	BOOST_LOG_TRIVIAL(info) << "Filtered segments: total = " << playlist.entries.size()
				<< " new = " << ret.size()
				<< " invalid URL = " << statistics.invalid_url
				<< " invalid name = " << statistics.invalid_name
				<< " already downloaded = " << statistics.downloaded
				<< " dispatched so far = " << ledger.size();
	return ret;
}

void hls_downloader::on_cycle_end(const boost::system::error_code& ec)
{
	last_error = ec;

	if (ec)
		BOOST_LOG_TRIVIAL(error) << "Poll " << poll_number << " failed: " << ec.message()
					 << " Retrying in " << config.poll_interval.count() << " ms.";

	if (!stopped) {
		timer.expires_after(config.poll_interval);
		timer.async_wait(std::bind(&hls_downloader::timer_handler, this, std::placeholders::_1));
	}
}

void hls_downloader::on_playlist_receive(const std::string& url,
					 size_t depth,
					 std::vector<char> *body)
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8(std::string_view {body->data(), body->size()}, url, &playlist, ec);

	if (ec) {
		BOOST_LOG_TRIVIAL(error) << "Unable to parse playlist: " << url;
		on_cycle_end(ec);
		return;
	}

	if (playlist.is_master) {
		if (playlist.entries.empty())
			on_cycle_end(errc::no_media_playlist);
		else if (depth >= max_playlist_depth)
			on_cycle_end(errc::too_many_redirects);
		else {
			BOOST_LOG_TRIVIAL(info) << "Received master playlist, switching to media playlist: "
						<< playlist.entries.front();
			fetch_playlist(playlist.entries.front(), depth + 1);
		}

		return;
	}

	BOOST_LOG_TRIVIAL(trace) << "Received playlist: target duration = "
				 << playlist.target_duration
				 << " sequence number = " << playlist.sequence
				 << " segments = " << playlist.entries.size();

	if (playlist.end_list)
		BOOST_LOG_TRIVIAL(trace) << "Playlist is complete: " << url;

	const auto segments = filter_new_segments(playlist);

	if (segments.empty()) {
		BOOST_LOG_TRIVIAL(info) << "No new segments.";
		on_cycle_end({});
		return;
	}

	BOOST_LOG_TRIVIAL(info) << "Downloading " << segments.size() << " new segments.";
	downloader.download(
	    segments,
	    output_directory,
	    [this](const boost::system::error_code& ec, const download_summary&) { on_cycle_end(ec); });
}

void hls_downloader::poll()
{
	poll_number++;
	BOOST_LOG_TRIVIAL(trace) << "Poll " << poll_number << ": " << playlist_url;
	fetch_playlist(playlist_url, 0);
}

boost::system::error_code hls_downloader::start(const std::string_view& url)
{
	std::string name;
	boost::system::error_code ec;

	derive_output_directory(url, &name, ec);

	if (ec) {
		BOOST_LOG_TRIVIAL(fatal) << "Unable to determine the output directory: " << url;
		return ec;
	}

	const auto directory = std::filesystem::path {config.output_root} / name;
	std::error_code fs_ec;

	std::filesystem::create_directories(directory, fs_ec);

	if (fs_ec) {
		BOOST_LOG_TRIVIAL(fatal) << "Failed to create output directory: " << directory.string()
					 << " Error code: " << fs_ec.message();
		return boost::system::error_code {fs_ec.value(), boost::system::generic_category()};
	}

	playlist_url = url;
	output_directory = directory.string();
	stopped = false;
	BOOST_LOG_TRIVIAL(info) << "Recording HLS stream: " << playlist_url;
	BOOST_LOG_TRIVIAL(info) << "Output directory: " << output_directory;
	timer.expires_after(std::chrono::milliseconds::zero());
	timer.async_wait(std::bind(&hls_downloader::timer_handler, this, std::placeholders::_1));
	return {};
}

void hls_downloader::stop()
{
	stopped = true;
	timer.cancel();
}

void hls_downloader::timer_handler(const boost::system::error_code& ec)
{
	if (!ec && !stopped)
		poll();
}
