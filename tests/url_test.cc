#include <catch2/catch.hpp>
#include <string>

#include "url.h"

static std::string resolve(const std::string& base, const std::string& reference)
{
	url_parts b;
	url_parts target;

	REQUIRE(parse_url(base, &b));
	REQUIRE(resolve_url(b, reference, &target));
	return compose_url(target);
}

TEST_CASE("URL components are split", "[url]")
{
	url_parts parts;

	REQUIRE(parse_url("HTTPS://user@cdn.example.com:8443/live/index.m3u8?token=abc#top", &parts));
	CHECK(parts.scheme == "https");
	CHECK(parts.has_authority);
	CHECK(parts.authority == "user@cdn.example.com:8443");
	CHECK(parts.path == "/live/index.m3u8");
	CHECK(parts.has_query);
	CHECK(parts.query == "token=abc");
	CHECK(parts.has_fragment);
	CHECK(parts.fragment == "top");
	CHECK(authority_host(parts.authority) == "cdn.example.com");
}

TEST_CASE("Malformed references are rejected", "[url]")
{
	url_parts parts;

	CHECK_FALSE(parse_url("segment%zz.ts", &parts));
	CHECK_FALSE(parse_url("segment%4.ts", &parts));
	CHECK_FALSE(parse_url("seg\x01ment.ts", &parts));
	CHECK_FALSE(parse_url("1a:segment.ts", &parts));
	CHECK_FALSE(parse_url("http://example.com:80a/", &parts));
}

TEST_CASE("Characters not allowed in URIs are escaped when recomposed", "[url]")
{
	CHECK(resolve("https://h/p/pl.m3u8", "segment 1.ts") == "https://h/p/segment%201.ts");
	CHECK(resolve("https://h/p/pl.m3u8", "s\xc3\xa9" "ance.ts?name=a b") ==
	      "https://h/p/s%C3%A9ance.ts?name=a%20b");
	CHECK(resolve("https://h/p/pl.m3u8", "segment%201.ts") == "https://h/p/segment%201.ts");
	CHECK(resolve("https://h/p/pl.m3u8", "seg;v=1.ts?a=1&b=[2]") ==
	      "https://h/p/seg;v=1.ts?a=1&b=[2]");
	CHECK(percent_encode("a\"b<c>") == "a%22b%3Cc%3E");
}

TEST_CASE("References are resolved against the base URL", "[url]")
{
	const std::string base = "http://a/b/c/d;p?q";

	CHECK(resolve(base, "g:h") == "g:h");
	CHECK(resolve(base, "g") == "http://a/b/c/g");
	CHECK(resolve(base, "./g") == "http://a/b/c/g");
	CHECK(resolve(base, "g/") == "http://a/b/c/g/");
	CHECK(resolve(base, "/g") == "http://a/g");
	CHECK(resolve(base, "//g") == "http://g");
	CHECK(resolve(base, "?y") == "http://a/b/c/d;p?y");
	CHECK(resolve(base, "g?y") == "http://a/b/c/g?y");
	CHECK(resolve(base, "#s") == "http://a/b/c/d;p?q#s");
	CHECK(resolve(base, "") == "http://a/b/c/d;p?q");
	CHECK(resolve(base, ".") == "http://a/b/c/");
	CHECK(resolve(base, "..") == "http://a/b/");
	CHECK(resolve(base, "../g") == "http://a/b/g");
	CHECK(resolve(base, "../../g") == "http://a/g");
	CHECK(resolve(base, "../../../g") == "http://a/g");
	CHECK(resolve(base, "/./g") == "http://a/g");
	CHECK(resolve(base, "g;x=1/../y") == "http://a/b/c/y");
}

TEST_CASE("A relative base URL cannot resolve references", "[url]")
{
	url_parts base;
	url_parts target;

	REQUIRE(parse_url("live/index.m3u8", &base));
	CHECK_FALSE(resolve_url(base, "segment1.ts", &target));
}

TEST_CASE("Dot segments are removed", "[url]")
{
	CHECK(remove_dot_segments("/a/b/c/./../../g") == "/a/g");
	CHECK(remove_dot_segments("mid/content=5/../6") == "mid/6");
	CHECK(remove_dot_segments("/live/") == "/live/");
}

TEST_CASE("Path basenames are decoded", "[url]")
{
	url_parts parts;
	std::string basename;

	REQUIRE(parse_url("https://h/live/segment%2042.ts?x=1", &parts));
	REQUIRE(path_basename(parts, &basename));
	CHECK(basename == "segment 42.ts");

	REQUIRE(parse_url("https://h/live/", &parts));
	REQUIRE(path_basename(parts, &basename));
	CHECK(basename.empty());

	CHECK(strip_extension("segment42.ts") == "segment42");
	CHECK(strip_extension("archive.tar.gz") == "archive.tar");
	CHECK(strip_extension("segment") == "segment");
}
