#ifndef SEGMENT_DOWNLOADER_H

#define SEGMENT_DOWNLOADER_H

#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "http_client.h"

namespace asio = boost::asio;

struct download_summary {
	size_t downloaded = 0;
	size_t failed = 0;
	// The first task that failed, if any.
	std::string failed_url;
	boost::system::error_code failure_cause;
};

// Downloads batches of media segments into a directory with a bounded number
// of transfers in flight. Every segment is attempted up to max_attempts times,
// waiting retry_delay * n after the n-th failed attempt.
class segment_downloader {
	public:
		typedef std::function<void(const boost::system::error_code&, const download_summary&)>
		    on_complete_callback;

	private:
		struct task {
			std::string url;
			std::string path;
			size_t attempt = 0;
		};

		struct batch {
			std::vector<task> tasks;
			on_complete_callback on_complete;
			download_summary summary;
			size_t next_task = 0;
			size_t in_flight = 0;
			size_t finished = 0;
		};

		asio::io_context * const io = nullptr;
		http_client * const client = nullptr;
		const size_t max_concurrent = 0;
		const size_t max_attempts = 0;
		const std::chrono::milliseconds retry_delay;

		void attempt(const std::shared_ptr<batch>& b, size_t index);
		void finish_task(const std::shared_ptr<batch>& b,
				 size_t index,
				 const boost::system::error_code& ec);
		void on_attempt_error(const std::shared_ptr<batch>& b,
				      size_t index,
				      const boost::system::error_code& ec);
		void start_tasks(const std::shared_ptr<batch>& b);
		void write_segment(const std::shared_ptr<batch>& b, size_t index, std::vector<char> *body);

	public:
		segment_downloader(asio::io_context *io_ctx,
				   http_client *c,
				   size_t concurrency,
				   size_t attempts,
				   const std::chrono::milliseconds& delay) :
		    io(io_ctx), client(c), max_concurrent(concurrency ? concurrency : 1),
		    max_attempts(attempts ? attempts : 1), retry_delay(delay)
		{
		}

		// Completes once every segment has been written or has failed. The
		// error is errc::exhausted_retries if at least one segment failed.
		void download(const std::vector<std::string>& urls,
			      const std::string& directory,
			      const on_complete_callback& on_complete);
};

#endif // SEGMENT_DOWNLOADER_H
