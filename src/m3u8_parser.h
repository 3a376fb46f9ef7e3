#ifndef M3U8_PARSER_H

#define M3U8_PARSER_H

#include <boost/system/error_code.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

struct m3u8_playlist {
	// Absolute URLs in document order: media playlists if is_master is set,
	// media segments otherwise.
	std::vector<std::string> entries;
	size_t sequence = 0;
	size_t target_duration = 0;
	bool is_master = false;
	bool end_list = false;
};

// Parses a playlist fetched from base_url. Lines that cannot be resolved to a
// URL are logged and skipped; the parse fails only if base_url is invalid or
// the document is neither a master nor a media playlist.
void parse_m3u8(const std::string_view& text,
		const std::string_view& base_url,
		m3u8_playlist *playlist,
		boost::system::error_code& ec);

#endif // M3U8_PARSER_H
