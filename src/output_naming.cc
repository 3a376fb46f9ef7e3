#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>

#include "error.h"
#include "output_naming.h"
#include "url.h"

static const std::string directory_suffix = "_hls_segments";
static const char name_delimiter = '_';
static const char replacement_character = '_';
static const std::string transport_stream_extension = ".ts";

static bool is_safe(char c)
{
	return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

static bool ends_with(const std::string_view& s, const std::string_view& suffix)
{
	return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

void derive_output_directory(const std::string_view& playlist_url,
			     std::string *directory,
			     boost::system::error_code& ec)
{
	url_parts parts;
	std::string basename;

	if (!parse_url(playlist_url, &parts) || !path_basename(parts, &basename)) {
		ec = errc::invalid_output_directory;
		return;
	}

	std::string name;

	if (basename.empty() || basename == "." || basename == "..") {
		name = authority_host(parts.authority);

		if (name.empty()) {
			ec = errc::invalid_output_directory;
			return;
		}

		std::replace(name.begin(), name.end(), '.', replacement_character);
	}
	else
		name = strip_extension(basename);

	std::replace_if(
	    name.begin(), name.end(), [](char c) { return !is_safe(c); }, replacement_character);
	name.append(directory_suffix);
	*directory = std::move(name);
	ec = {};
}

void derive_segment_file_name(const std::string_view& timestamp,
			      size_t index,
			      const std::string_view& segment_url,
			      std::string *name,
			      boost::system::error_code& ec)
{
	url_parts parts;
	std::string basename;

	if (!parse_url(segment_url, &parts) || !path_basename(parts, &basename)) {
		ec = errc::invalid_url;
		return;
	}

	if (basename.empty() || basename == "." || basename == "..") {
		ec = errc::invalid_filename;
		return;
	}

	if (!ends_with(basename, transport_stream_extension))
		basename.append(transport_stream_extension);

	char number[32];

	std::snprintf(number, sizeof(number), "%05zu", index);

	std::string ret {timestamp};

	ret.push_back(name_delimiter);
	ret.append(number);
	ret.push_back(name_delimiter);
	ret.append(basename);
	*name = std::move(ret);
	ec = {};
}

std::string format_timestamp(const std::chrono::system_clock::time_point& t)
{
	const std::time_t time = std::chrono::system_clock::to_time_t(t);
	std::tm local_time {};
	char buffer[32];

	localtime_r(&time, &local_time);

	const auto len = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local_time);

	return std::string(buffer, len);
}
