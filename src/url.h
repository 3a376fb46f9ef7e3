#ifndef URL_H

#define URL_H

#include <string>
#include <string_view>

#define HTTP_PROTOCOL "http"
#define HTTPS_PROTOCOL "https"

static const char resource_delimiter = '/';

// Components of a URI reference as split by RFC 3986, appendix B. The
// components are kept percent-encoded.
struct url_parts {
	std::string scheme;
	std::string authority;
	std::string path;
	std::string query;
	std::string fragment;
	bool has_authority = false;
	bool has_query = false;
	bool has_fragment = false;
};

bool parse_url(const std::string_view& url, url_parts *parts);
// Recomposes a URL, escaping characters that are not allowed in the path,
// query or fragment.
std::string compose_url(const url_parts& parts);

// Resolves a reference against an absolute base URL (RFC 3986, section 5.2).
bool resolve_url(const url_parts& base, const std::string_view& reference, url_parts *target);
std::string remove_dot_segments(const std::string_view& path);

bool percent_decode(const std::string_view& s, std::string *out);

// Escapes every byte that may not appear in a URI. Existing escapes and
// delimiters are kept.
std::string percent_encode(const std::string_view& s);

// Returns the host of an authority, without user information and port.
std::string_view authority_host(const std::string_view& authority);

// Returns the decoded last segment of the path, which is empty if the path
// ends with a delimiter. Fails on malformed escapes.
bool path_basename(const url_parts& parts, std::string *basename);

// Returns the part of the name before its last '.'.
std::string_view strip_extension(const std::string_view& name);

#endif // URL_H
