#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "url.h"

static const char extension_delimiter = '.';
static const char fragment_delimiter = '#';
static const char port_delimiter = ':';
static const char query_delimiter = '?';
static const char scheme_delimiter = ':';
static const char userinfo_delimiter = '@';
static const char escape_begin = '%';

static bool is_control(char c)
{
	const auto u = static_cast<unsigned char>(c);

	return u < 0x20 || u == 0x7f;
}

static int hex_value(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;

	return -1;
}

static bool is_uri_character(char c)
{
	static const std::string_view allowed = "-._~:/?#[]@!$&'()*+,;=%";

	return std::isalnum(static_cast<unsigned char>(c)) ||
	       allowed.find(c) != std::string_view::npos;
}

static bool has_valid_escapes(const std::string_view& s)
{
	for (std::string_view::size_type i = 0; i < s.size(); i++)
		if (s[i] == escape_begin) {
			if (i + 2 >= s.size())
				return false;
			if (hex_value(s[i + 1]) < 0 || hex_value(s[i + 2]) < 0)
				return false;

			i += 2;
		}

	return true;
}

static bool is_valid_scheme(const std::string_view& scheme)
{
	if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front())))
		return false;

	return std::all_of(scheme.begin(), scheme.end(), [](char c) {
		return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
		       c == '.';
	});
}

static bool is_valid_authority(const std::string_view& authority)
{
	auto host_port = authority;
	const auto userinfo_pos = host_port.rfind(userinfo_delimiter);

	if (userinfo_pos != std::string_view::npos)
		host_port.remove_prefix(userinfo_pos + 1);

	// Skip an IPv6 literal, which contains port delimiters of its own.
	std::string_view::size_type search_from = 0;

	if (!host_port.empty() && host_port.front() == '[') {
		search_from = host_port.find(']');

		if (search_from == std::string_view::npos)
			return false;
	}

	const auto port_pos = host_port.find(port_delimiter, search_from);

	if (port_pos == std::string_view::npos)
		return true;

	const auto port = host_port.substr(port_pos + 1);

	return std::all_of(port.begin(), port.end(), [](char c) {
		return std::isdigit(static_cast<unsigned char>(c));
	});
}

bool parse_url(const std::string_view& url, url_parts *parts)
{
	if (std::any_of(url.begin(), url.end(), is_control) || !has_valid_escapes(url))
		return false;

	url_parts result;
	auto rest = url;
	const auto scheme_end = rest.find_first_of(":/?#");

	if (scheme_end != std::string_view::npos && rest[scheme_end] == scheme_delimiter) {
		const auto scheme = rest.substr(0, scheme_end);

		// A colon in the first segment of a relative path is not allowed.
		if (!is_valid_scheme(scheme))
			return false;

		result.scheme.assign(scheme);
		std::transform(result.scheme.begin(),
			       result.scheme.end(),
			       result.scheme.begin(),
			       [](char c) { return std::tolower(static_cast<unsigned char>(c)); });
		rest.remove_prefix(scheme_end + 1);
	}

	const auto fragment_pos = rest.find(fragment_delimiter);

	if (fragment_pos != std::string_view::npos) {
		result.has_fragment = true;
		result.fragment.assign(rest.substr(fragment_pos + 1));
		rest = rest.substr(0, fragment_pos);
	}

	const auto query_pos = rest.find(query_delimiter);

	if (query_pos != std::string_view::npos) {
		result.has_query = true;
		result.query.assign(rest.substr(query_pos + 1));
		rest = rest.substr(0, query_pos);
	}

	if (rest.size() >= 2 && rest[0] == resource_delimiter && rest[1] == resource_delimiter) {
		rest.remove_prefix(2);

		const auto path_pos = rest.find(resource_delimiter);

		result.has_authority = true;
		result.authority.assign(rest.substr(0, path_pos));

		if (!is_valid_authority(result.authority))
			return false;

		rest = path_pos == std::string_view::npos ? std::string_view {}
							  : rest.substr(path_pos);
	}

	result.path.assign(rest);
	*parts = std::move(result);
	return true;
}

std::string compose_url(const url_parts& parts)
{
	std::string ret;

	if (!parts.scheme.empty()) {
		ret = parts.scheme;
		ret.push_back(scheme_delimiter);
	}

	if (parts.has_authority) {
		ret.append("//");
		ret.append(parts.authority);
	}

	ret.append(percent_encode(parts.path));

	if (parts.has_query) {
		ret.push_back(query_delimiter);
		ret.append(percent_encode(parts.query));
	}

	if (parts.has_fragment) {
		ret.push_back(fragment_delimiter);
		ret.append(percent_encode(parts.fragment));
	}

	return ret;
}

std::string remove_dot_segments(const std::string_view& path)
{
	std::string output;
	auto input = path;

	while (!input.empty()) {
		if (input.substr(0, 3) == "../")
			input.remove_prefix(3);
		else if (input.substr(0, 2) == "./")
			input.remove_prefix(2);
		else if (input.substr(0, 3) == "/./")
			input.remove_prefix(2);
		else if (input == "/.")
			input = "/";
		else if (input.substr(0, 4) == "/../" || input == "/..") {
			input = input.size() == 3 ? std::string_view {"/"} : input.substr(3);

			const auto pos = output.rfind(resource_delimiter);

			output.resize(pos == std::string::npos ? 0 : pos);
		}
		else if (input == "." || input == "..")
			input = {};
		else {
			const auto end = input.find(resource_delimiter, 1);
			const auto segment = input.substr(0, end);

			output.append(segment);
			input.remove_prefix(segment.size());
		}
	}

	return output;
}

static std::string merge_paths(const url_parts& base, const std::string_view& reference_path)
{
	if (base.has_authority && base.path.empty()) {
		std::string ret {resource_delimiter};

		ret.append(reference_path);
		return ret;
	}

	const auto pos = base.path.rfind(resource_delimiter);
	std::string ret {pos == std::string::npos ? std::string {} : base.path.substr(0, pos + 1)};

	ret.append(reference_path);
	return ret;
}

bool resolve_url(const url_parts& base, const std::string_view& reference, url_parts *target)
{
	url_parts r;

	if (base.scheme.empty() || !parse_url(reference, &r))
		return false;

	url_parts t;

	if (!r.scheme.empty()) {
		t = std::move(r);
		t.path = remove_dot_segments(t.path);
	}
	else {
		t.scheme = base.scheme;

		if (r.has_authority) {
			t.has_authority = true;
			t.authority = std::move(r.authority);
			t.path = remove_dot_segments(r.path);
			t.has_query = r.has_query;
			t.query = std::move(r.query);
		}
		else {
			t.has_authority = base.has_authority;
			t.authority = base.authority;

			if (r.path.empty()) {
				t.path = base.path;

				if (r.has_query) {
					t.has_query = true;
					t.query = std::move(r.query);
				}
				else {
					t.has_query = base.has_query;
					t.query = base.query;
				}
			}
			else {
				if (r.path.front() == resource_delimiter)
					t.path = remove_dot_segments(r.path);
				else
					t.path = remove_dot_segments(merge_paths(base, r.path));

				t.has_query = r.has_query;
				t.query = std::move(r.query);
			}
		}

		t.has_fragment = r.has_fragment;
		t.fragment = std::move(r.fragment);
	}

	*target = std::move(t);
	return true;
}

bool percent_decode(const std::string_view& s, std::string *out)
{
	std::string ret;

	ret.reserve(s.size());

	for (std::string_view::size_type i = 0; i < s.size(); i++) {
		if (s[i] != escape_begin) {
			ret.push_back(s[i]);
			continue;
		}

		if (i + 2 >= s.size())
			return false;

		const int high = hex_value(s[i + 1]);
		const int low = hex_value(s[i + 2]);

		if (high < 0 || low < 0)
			return false;

		ret.push_back(static_cast<char>(high << 4 | low));
		i += 2;
	}

	*out = std::move(ret);
	return true;
}

std::string percent_encode(const std::string_view& s)
{
	static const char hex_digits[] = "0123456789ABCDEF";
	std::string ret;

	ret.reserve(s.size());

	for (const char c : s) {
		if (is_uri_character(c)) {
			ret.push_back(c);
			continue;
		}

		const auto u = static_cast<unsigned char>(c);

		ret.push_back(escape_begin);
		ret.push_back(hex_digits[u >> 4]);
		ret.push_back(hex_digits[u & 0x0f]);
	}

	return ret;
}

std::string_view authority_host(const std::string_view& authority)
{
	auto host = authority;
	const auto userinfo_pos = host.rfind(userinfo_delimiter);

	if (userinfo_pos != std::string_view::npos)
		host.remove_prefix(userinfo_pos + 1);

	if (!host.empty() && host.front() == '[') {
		const auto end = host.find(']');

		return end == std::string_view::npos ? host : host.substr(0, end + 1);
	}

	return host.substr(0, host.find(port_delimiter));
}

bool path_basename(const url_parts& parts, std::string *basename)
{
	std::string path;

	if (!percent_decode(parts.path, &path))
		return false;

	const auto pos = path.rfind(resource_delimiter);

	*basename = pos == std::string::npos ? path : path.substr(pos + 1);
	return true;
}

std::string_view strip_extension(const std::string_view& name)
{
	const auto pos = name.rfind(extension_delimiter);

	return pos == std::string_view::npos ? name : name.substr(0, pos);
}
