#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <cstdlib>
#include <string_view>

#include "connection_pool.h"
#include "hls_downloader.h"
#include "logging.h"

int main(int argc, char *argv[])
{
	int ret = EXIT_FAILURE;
	std::string_view url;
	bool verbose = false;

	for (int i = 1; i < argc; i++) {
		const std::string_view arg {argv[i]};

		if (arg == "-v")
			verbose = true;
		else
			url = arg;
	}

	init_logging(verbose);

	if (url.empty()) {
		BOOST_LOG_TRIVIAL(info) << "Usage: " << *argv << " [-v] <playlist URL>";
		return EXIT_SUCCESS;
	}

	boost::asio::io_context io;
	boost::asio::signal_set signals {io, SIGINT, SIGTERM};
	downloader_config config;
	connection_pool pool {&io, config.max_concurrent_downloads};
	hls_downloader downloader {&io, &pool, config};

	signals.async_wait([&io](const boost::system::error_code& ec, int signal_number) {
		if (!ec) {
			BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", stopping.";
			io.stop();
		}
	});

	if (!downloader.start(url)) {
		io.run();
		ret = EXIT_SUCCESS;
	}

	return ret;
}
