#include <catch2/catch.hpp>
#include <string>

#include "error.h"
#include "m3u8_parser.h"

static const std::string media_playlist = "#EXTM3U\r\n"
					  "#EXT-X-VERSION:3\r\n"
					  "#EXT-X-TARGETDURATION:6\r\n"
					  "#EXT-X-MEDIA-SEQUENCE:1042\r\n"
					  "#EXTINF:6.000,\r\n"
					  "segment1042.ts\r\n"
					  "#EXTINF:6.000,\r\n"
					  "  /other/segment1043.ts  \r\n"
					  "\r\n"
					  "#EXTINF:6.000,\r\n"
					  "https://backup.example.com/segment1044.ts\r\n";

static const std::string master_playlist =
    "#EXTM3U\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=1280000,RESOLUTION=640x360\n"
    "low/index.m3u8\n"
    "#EXT-X-STREAM-INF:BANDWIDTH=2560000,RESOLUTION=1280x720\n"
    "high/index.m3u8\n";

TEST_CASE("Media playlists are parsed", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8(media_playlist, "https://cdn.example.com/live/stream.m3u8", &playlist, ec);

	REQUIRE_FALSE(ec);
	CHECK_FALSE(playlist.is_master);
	CHECK_FALSE(playlist.end_list);
	CHECK(playlist.sequence == 1042);
	CHECK(playlist.target_duration == 6);
	REQUIRE(playlist.entries.size() == 3);
	CHECK(playlist.entries[0] == "https://cdn.example.com/live/segment1042.ts");
	CHECK(playlist.entries[1] == "https://cdn.example.com/other/segment1043.ts");
	CHECK(playlist.entries[2] == "https://backup.example.com/segment1044.ts");
}

TEST_CASE("Master playlists list their variants in document order", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8(master_playlist, "https://cdn.example.com/live/master.m3u8", &playlist, ec);

	REQUIRE_FALSE(ec);
	CHECK(playlist.is_master);
	REQUIRE(playlist.entries.size() == 2);
	CHECK(playlist.entries[0] == "https://cdn.example.com/live/low/index.m3u8");
	CHECK(playlist.entries[1] == "https://cdn.example.com/live/high/index.m3u8");
}

TEST_CASE("A master playlist without variants has no entries", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\n", "https://h/master.m3u8", &playlist, ec);

	REQUIRE_FALSE(ec);
	CHECK(playlist.is_master);
	CHECK(playlist.entries.empty());
}

TEST_CASE("Playlists with master and media tags are media playlists", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\n#EXTINF:4,\nsegment7.ts\n",
		   "https://h/p/pl.m3u8",
		   &playlist,
		   ec);

	REQUIRE_FALSE(ec);
	CHECK_FALSE(playlist.is_master);
	REQUIRE(playlist.entries.size() == 1);
	CHECK(playlist.entries[0] == "https://h/p/segment7.ts");
}

TEST_CASE("Documents without playlist tags are rejected", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("<html><body>Not found</body></html>", "https://h/p/pl.m3u8", &playlist, ec);

	CHECK(ec == make_error_code(errc::unrecognized_format));
}

TEST_CASE("An invalid base URL fails the parse", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXTINF:4,\nsegment1.ts\n", "pl.m3u8", &playlist, ec);

	CHECK(ec == make_error_code(errc::invalid_url));
}

TEST_CASE("The media sequence defaults to zero", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXTINF:4,\nsegment1.ts\n", "https://h/p/pl.m3u8", &playlist, ec);
	REQUIRE_FALSE(ec);
	CHECK(playlist.sequence == 0);

	parse_m3u8("#EXTM3U\n#EXT-X-MEDIA-SEQUENCE:-5\n#EXT-X-MEDIA-SEQUENCE:9\n#EXTINF:4,\nsegment1.ts\n",
		   "https://h/p/pl.m3u8",
		   &playlist,
		   ec);
	REQUIRE_FALSE(ec);
	CHECK(playlist.sequence == 0);
}

TEST_CASE("Segments inherit the query of the playlist URL", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXTINF:4,\nseg1.ts\n#EXTINF:4,\nseg1.ts?x=2\n",
		   "https://h/p/pl.m3u8?tok=1",
		   &playlist,
		   ec);

	REQUIRE_FALSE(ec);
	REQUIRE(playlist.entries.size() == 2);
	CHECK(playlist.entries[0] == "https://h/p/seg1.ts?tok=1");
	CHECK(playlist.entries[1] == "https://h/p/seg1.ts?x=2");
}

TEST_CASE("Unresolvable lines are skipped", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXTINF:4,\nseg1.ts\n#EXTINF:4,\nseg%zz.ts\n#EXTINF:4,\nseg3.ts\n",
		   "https://h/p/pl.m3u8",
		   &playlist,
		   ec);

	REQUIRE_FALSE(ec);
	REQUIRE(playlist.entries.size() == 2);
	CHECK(playlist.entries[0] == "https://h/p/seg1.ts");
	CHECK(playlist.entries[1] == "https://h/p/seg3.ts");
}

TEST_CASE("The end of a playlist is detected", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXTINF:4,\nseg1.ts\n#EXT-X-ENDLIST\n", "https://h/p/pl.m3u8", &playlist, ec);

	REQUIRE_FALSE(ec);
	CHECK(playlist.end_list);
}

TEST_CASE("Entries with spaces resolve to escaped URLs", "[m3u8]")
{
	m3u8_playlist playlist;
	boost::system::error_code ec;

	parse_m3u8("#EXTM3U\n#EXTINF:4,\nsegment 1.ts\n", "https://h/p/pl.m3u8?tok=1", &playlist, ec);

	REQUIRE_FALSE(ec);
	REQUIRE(playlist.entries.size() == 1);
	CHECK(playlist.entries[0] == "https://h/p/segment%201.ts?tok=1");
}
