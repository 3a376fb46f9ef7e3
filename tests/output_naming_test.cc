#include <catch2/catch.hpp>
#include <chrono>
#include <string>

#include "error.h"
#include "output_naming.h"

static std::string directory_of(const std::string& url)
{
	std::string directory;
	boost::system::error_code ec;

	derive_output_directory(url, &directory, ec);
	REQUIRE_FALSE(ec);
	return directory;
}

static std::string file_name_of(size_t index, const std::string& url)
{
	std::string name;
	boost::system::error_code ec;

	derive_segment_file_name("20240101_120000", index, url, &name, ec);
	REQUIRE_FALSE(ec);
	return name;
}

TEST_CASE("Output directories are named after the playlist", "[naming]")
{
	CHECK(directory_of("https://cdn.example.com/live/show!.m3u8") == "show__hls_segments");
	CHECK(directory_of("https://cdn.example.com/live/index.m3u8?token=a.b") ==
	      "index_hls_segments");
	CHECK(directory_of("https://cdn.example.com/live/my%20show.m3u8") == "my_show_hls_segments");
}

TEST_CASE("Output directories fall back to the host name", "[naming]")
{
	CHECK(directory_of("https://cdn.example.com/live/") == "cdn_example_com_hls_segments");
	CHECK(directory_of("https://cdn.example.com") == "cdn_example_com_hls_segments");
	CHECK(directory_of("http://user@cdn.example.com:8080/") == "cdn_example_com_hls_segments");
}

TEST_CASE("URLs without a name or host have no output directory", "[naming]")
{
	std::string directory;
	boost::system::error_code ec;

	derive_output_directory("http://", &directory, ec);
	CHECK(ec == make_error_code(errc::invalid_output_directory));

	derive_output_directory("https://h/%zz.m3u8", &directory, ec);
	CHECK(ec == make_error_code(errc::invalid_output_directory));
}

TEST_CASE("Segment file names sort in batch order", "[naming]")
{
	CHECK(file_name_of(7, "https://h/p/seg1.ts?tok=1") == "20240101_120000_00007_seg1.ts");
	CHECK(file_name_of(12345, "https://h/p/seg1.ts") == "20240101_120000_12345_seg1.ts");
	CHECK(file_name_of(0, "https://h/p/chunk") == "20240101_120000_00000_chunk.ts");
	CHECK(file_name_of(1, "https://h/p/audio.aac") == "20240101_120000_00001_audio.aac.ts");
	CHECK(file_name_of(9, "https://h/p/seg1.ts") < file_name_of(10, "https://h/p/seg0.ts"));
}

TEST_CASE("Segments without a file name cannot be named", "[naming]")
{
	std::string name;
	boost::system::error_code ec;

	derive_segment_file_name("20240101_120000", 0, "https://h/p/", &name, ec);
	CHECK(ec == make_error_code(errc::invalid_filename));
}

TEST_CASE("Timestamps have a fixed width", "[naming]")
{
	const auto timestamp = format_timestamp(std::chrono::system_clock::now());

	REQUIRE(timestamp.size() == 15);
	CHECK(timestamp[8] == '_');
}
