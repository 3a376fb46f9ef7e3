#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <utility>

#include "error.h"
#include "m3u8_parser.h"
#include "url.h"

#define END_LIST_TAG "#EXT-X-ENDLIST"
#define MEDIA_SEGMENT_TAG "#EXTINF"
#define MEDIA_SEQUENCE_TAG "#EXT-X-MEDIA-SEQUENCE:"
#define PLAYLIST_TYPE_VOD_TAG "#EXT-X-PLAYLIST-TYPE:VOD"
#define STREAM_INF_TAG "#EXT-X-STREAM-INF"
#define TARGET_DURATION_TAG "#EXT-X-TARGETDURATION:"

static const char line_feed = '\n';
static const char tag_begin = '#';

static bool starts_with(const std::string_view& line, const std::string_view& prefix)
{
	return line.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), line.begin());
}

static std::string_view trim(std::string_view s)
{
	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
		s.remove_prefix(1);

	while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
		s.remove_suffix(1);

	return s;
}

static size_t parse_tag_value(const std::string_view& line, size_t tag_len)
{
	size_t value = 0;
	const char * const first = line.data() + tag_len;

	if (std::from_chars(first, line.data() + line.size(), value).ec != std::errc {})
		return 0;

	return value;
}

static bool resolve_entry(const url_parts& base,
			  const std::string_view& line,
			  std::string *url)
{
	url_parts target;

	if (!resolve_url(base, line, &target))
		return false;

	// Segments of token-protected playlists often omit the token.
	if (target.query.empty() && !base.query.empty()) {
		target.has_query = true;
		target.query = base.query;
	}

	*url = compose_url(target);
	return true;
}

void parse_m3u8(const std::string_view& text,
		const std::string_view& base_url,
		m3u8_playlist *playlist,
		boost::system::error_code& ec)
{
	const bool has_stream_information = text.find(STREAM_INF_TAG) != std::string_view::npos;
	const bool has_media_segments = text.find(MEDIA_SEGMENT_TAG) != std::string_view::npos;

	if (!has_stream_information && !has_media_segments) {
		ec = errc::unrecognized_format;
		return;
	}

	if (has_stream_information && has_media_segments)
		BOOST_LOG_TRIVIAL(warning)
		    << "Playlist contains both master and media tags, treating it as a media "
		       "playlist: "
		    << base_url;

	url_parts base;

	if (!parse_url(base_url, &base) || base.scheme.empty()) {
		ec = errc::invalid_url;
		return;
	}

	m3u8_playlist result;
	bool sequence_found = false;
	std::string_view::size_type line_begin = 0;

	result.is_master = !has_media_segments;

	while (line_begin < text.size()) {
		auto line_end = text.find(line_feed, line_begin);

		if (line_end == std::string_view::npos)
			line_end = text.size();

		const auto line = trim(text.substr(line_begin, line_end - line_begin));

		line_begin = line_end + 1;

		if (line.empty())
			continue;

		if (line.front() == tag_begin) {
			if (!sequence_found && starts_with(line, MEDIA_SEQUENCE_TAG)) {
				result.sequence =
				    parse_tag_value(line, sizeof(MEDIA_SEQUENCE_TAG) - 1);
				sequence_found = true;
			}
			else if (starts_with(line, TARGET_DURATION_TAG))
				result.target_duration =
				    parse_tag_value(line, sizeof(TARGET_DURATION_TAG) - 1);
			else if (starts_with(line, END_LIST_TAG) ||
				 starts_with(line, PLAYLIST_TYPE_VOD_TAG))
				result.end_list = true;

			continue;
		}

		std::string url;

		if (resolve_entry(base, line, &url))
			result.entries.push_back(std::move(url));
		else
			BOOST_LOG_TRIVIAL(warning) << "Unable to resolve playlist entry: " << line;
	}

	*playlist = std::move(result);
	ec = {};
}
