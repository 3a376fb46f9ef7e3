#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "error.h"
#include "output_naming.h"
#include "segment_downloader.h"

static const mode_t segment_file_mode = 0644;

void segment_downloader::attempt(const std::shared_ptr<batch>& b, size_t index)
{
	const auto& t = b->tasks[index];
	std::error_code fs_ec;

	if (std::filesystem::exists(t.path, fs_ec)) {
		BOOST_LOG_TRIVIAL(trace) << "Media segment already exists: " << t.path;
		asio::post(*io, [this, b, index]() { finish_task(b, index, {}); });
		return;
	}

	client->get(
	    t.url,
	    std::bind(&segment_downloader::write_segment, this, b, index, std::placeholders::_1),
	    std::bind(&segment_downloader::on_attempt_error, this, b, index, std::placeholders::_1));
}

void segment_downloader::download(const std::vector<std::string>& urls,
				  const std::string& directory,
				  const on_complete_callback& on_complete)
{
	auto b = std::make_shared<batch>();
	const auto timestamp = format_timestamp(std::chrono::system_clock::now());

	b->on_complete = on_complete;
	b->tasks.reserve(urls.size());

	for (size_t i = 0; i < urls.size(); i++) {
		task t;
		std::string name;
		boost::system::error_code ec;

		t.url = urls[i];
		derive_segment_file_name(timestamp, i, t.url, &name, ec);

		if (ec)
			BOOST_LOG_TRIVIAL(error) << "Unable to name media segment: " << t.url
						 << " Error code: " << ec.message();
		else
			t.path = (std::filesystem::path {directory} / name).string();

		b->tasks.push_back(std::move(t));
	}

	if (b->tasks.empty()) {
		asio::post(*io, [b]() { b->on_complete({}, b->summary); });
		return;
	}

	start_tasks(b);
}

void segment_downloader::finish_task(const std::shared_ptr<batch>& b,
				     size_t index,
				     const boost::system::error_code& ec)
{
	auto& summary = b->summary;

	b->in_flight--;
	b->finished++;

	if (ec) {
		if (!summary.failed++) {
			summary.failed_url = b->tasks[index].url;
			summary.failure_cause = ec;
		}
	}
	else
		summary.downloaded++;

	if (b->finished < b->tasks.size()) {
		start_tasks(b);
		return;
	}

	boost::system::error_code batch_ec;

	if (summary.failed) {
		BOOST_LOG_TRIVIAL(error)
		    << "Failed to download " << summary.failed << " of " << b->tasks.size()
		    << " media segments, first failure: " << summary.failed_url
		    << " Error code: " << summary.failure_cause.message();
		batch_ec = errc::exhausted_retries;
	}
	else
		BOOST_LOG_TRIVIAL(trace) << "Downloaded " << summary.downloaded << " media segments.";

	b->on_complete(batch_ec, summary);
}

void segment_downloader::on_attempt_error(const std::shared_ptr<batch>& b,
					  size_t index,
					  const boost::system::error_code& ec)
{
	auto& t = b->tasks[index];

	t.attempt++;

	if (t.attempt >= max_attempts || ec == asio::error::operation_aborted) {
		BOOST_LOG_TRIVIAL(error) << "Failed to download media segment after " << t.attempt
					 << " attempts: " << t.url << " Error code: " << ec.message();
		finish_task(b, index, ec);
		return;
	}

	const auto delay = retry_delay * t.attempt;
	auto timer = std::make_shared<asio::steady_timer>(*io, delay);

	BOOST_LOG_TRIVIAL(warning) << "Attempt " << t.attempt << " of " << max_attempts
				   << " failed: " << t.url << " Error code: " << ec.message()
				   << " Retrying in " << delay.count() << " ms.";
	timer->async_wait([this, b, index, timer](const boost::system::error_code& timer_ec) {
		if (timer_ec)
			finish_task(b, index, timer_ec);
		else
			attempt(b, index);
	});
}

void segment_downloader::start_tasks(const std::shared_ptr<batch>& b)
{
	while (b->in_flight < max_concurrent && b->next_task < b->tasks.size()) {
		const size_t index = b->next_task++;

		b->in_flight++;

		if (b->tasks[index].path.empty())
			asio::post(*io, [this, b, index]() {
				finish_task(b, index, errc::invalid_filename);
			});
		else
			attempt(b, index);
	}
}

void segment_downloader::write_segment(const std::shared_ptr<batch>& b,
				       size_t index,
				       std::vector<char> *body)
{
	const auto& path = b->tasks[index].path;
	auto data = std::make_shared<std::vector<char>>(std::move(*body));
	auto output = std::make_shared<asio::posix::stream_descriptor>(*io);
	boost::system::error_code ec;
	const int fd = ::open(path.c_str(), O_CLOEXEC | O_CREAT | O_TRUNC | O_WRONLY, segment_file_mode);

	if (fd < 0) {
		ec.assign(errno, boost::system::system_category());
		BOOST_LOG_TRIVIAL(error) << "Failed to open output file: " << path;
		on_attempt_error(b, index, ec);
		return;
	}

	output->assign(fd, ec);

	if (ec) {
		::close(fd);
		on_attempt_error(b, index, ec);
		return;
	}

	asio::async_write(
	    *output,
	    asio::buffer(*data),
	    [this, b, index, output, data](const boost::system::error_code& write_ec, size_t size) {
		    const auto& path = b->tasks[index].path;
		    boost::system::error_code close_ec;

		    output->close(close_ec);

		    if (write_ec || size != data->size() || close_ec) {
			    std::error_code remove_ec;

			    BOOST_LOG_TRIVIAL(error) << "Failed to write media segment: " << path
						     << " Error code: " << write_ec.message();
			    std::filesystem::remove(path, remove_ec);
			    on_attempt_error(b,
					     index,
					     write_ec	  ? write_ec
					     : close_ec ? close_ec
							: asio::error::make_error_code(asio::error::eof));
			    return;
		    }

		    BOOST_LOG_TRIVIAL(info) << "Downloaded media segment: " << path << " ("
					    << size << " bytes)";
		    finish_task(b, index, {});
	    });
}
