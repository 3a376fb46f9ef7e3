#include <boost/beast.hpp>
#include <boost/log/trivial.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "connection.h"
#include "connection_pool.h"
#include "error.h"
#include "url.h"

static const std::string http_port = "80";
static const std::string https_port = "443";
static const size_t max_redirects = 10;

static bool is_redirect(http::status status)
{
	switch (status) {
	case http::status::moved_permanently:
	case http::status::found:
	case http::status::see_other:
	case http::status::temporary_redirect:
	case http::status::permanent_redirect:
		return true;
	default:
		return false;
	}
}

void connection_pool::get(request&& r, size_t retry_number)
{
	std::shared_ptr<connection> c;
	const std::string h {r.host};

	if (connections[h].empty()) {
		if (num_connections[h] >= max_connections) {
			requests[h].push_back(std::move(r));
			return;
		}

		c = r.is_https
			? std::static_pointer_cast<connection>(std::make_shared<https_connection>(
			      sequence_number, h, io, &resolver, &tls_context))
			: std::static_pointer_cast<connection>(
			      std::make_shared<http_connection>(sequence_number, h, io, &resolver));
		num_connections[h]++;
		sequence_number++;
	}
	else {
		c = connections[h].back();
		connections[h].pop_back();
		// The server may have closed an idle connection in the meantime.
		retry_number++;
	}

	const std::string resource {r.resource};
	auto on_error_wrapper = [r, retry_number, this](const std::string& host,
							 const beast::error_code& ec) mutable {
		num_connections[host]--;

		if (retry_number)
			get(std::move(r), retry_number - 1);
		else {
			BOOST_LOG_TRIVIAL(error) << "Failed to get: " << r.url << " Error code: " << ec.message();
			r.on_error(ec);
		}

		next_request(host);
	};
	auto on_receive_wrapper = [r, this](const std::shared_ptr<connection>& connection,
					    http_response *response) {
		const std::string host {connection->get_host()};
		const bool keep_alive = response->keep_alive();

		on_response(r, response);

		if (keep_alive)
			connections[host].push_back(connection);
		else
			num_connections[host]--;

		next_request(host);
	};

	c->get(resource, on_receive_wrapper, on_error_wrapper);
}

void connection_pool::get(const std::string_view& url,
			  const on_receive_callback& on_receive,
			  const on_error_callback& on_error,
			  size_t redirect_number)
{
	request r;

	if (!parse_url(url, &r.is_https, &r.host, &r.resource)) {
		BOOST_LOG_TRIVIAL(error) << "Invalid URL: " << url;
		asio::post(*io, [on_error]() { on_error(make_error_code(errc::invalid_url)); });
		return;
	}

	r.url = url;
	r.on_receive = on_receive;
	r.on_error = on_error;
	r.redirect_number = redirect_number;
	get(std::move(r));
}

void connection_pool::get(const std::string_view& url,
			  const on_receive_callback& on_receive,
			  const on_error_callback& on_error)
{
	get(url, on_receive, on_error, 0);
}

void connection_pool::next_request(const std::string& host)
{
	auto& pending = requests[host];

	if (!pending.empty()) {
		auto r = std::move(pending.front());

		pending.pop_front();
		get(std::move(r));
	}
}

void connection_pool::on_response(const request& r, http_response *response)
{
	const auto status = response->result_int();

	if (status >= 200 && status < 300) {
		r.on_receive(&response->body());
		return;
	}

	if (is_redirect(response->result())) {
		const auto location = response->base()[http::field::location];
		url_parts base;
		url_parts target;

		if (r.redirect_number >= max_redirects) {
			BOOST_LOG_TRIVIAL(error) << "Too many redirects: " << r.url;
			r.on_error(errc::too_many_redirects);
			return;
		}

		if (!location.empty() && ::parse_url(r.url, &base) &&
		    resolve_url(base, std::string_view {location.data(), location.size()}, &target)) {
			target.has_fragment = false;

			const auto u = compose_url(target);

			BOOST_LOG_TRIVIAL(trace) << "Redirected from: " << r.url << " to: " << u;
			get(u, r.on_receive, r.on_error, r.redirect_number + 1);
			return;
		}
	}

	BOOST_LOG_TRIVIAL(error) << "Invalid " << status << " response: " << r.url;
	r.on_error(errc::bad_status);
}

bool connection_pool::parse_url(const std::string_view& url,
				bool *is_https,
				std::string *host,
				std::string *resource)
{
	url_parts parts;

	if (!::parse_url(url, &parts) || !parts.has_authority)
		return false;

	*is_https = parts.scheme == HTTPS_PROTOCOL;

	if (!*is_https && parts.scheme != HTTP_PROTOCOL)
		return false;

	std::string_view authority {parts.authority};
	const auto userinfo_pos = authority.rfind('@');

	if (userinfo_pos != std::string_view::npos)
		authority.remove_prefix(userinfo_pos + 1);

	if (authority.empty() || authority.front() == port_delimiter)
		return false;

	std::string h {authority};
	const auto port_pos = h.rfind(port_delimiter);
	const auto ipv6_end = h.rfind(']');

	if (port_pos == std::string::npos ||
	    (ipv6_end != std::string::npos && port_pos < ipv6_end)) {
		h.push_back(port_delimiter);
		h.append(*is_https ? https_port : http_port);
	}
	else if (port_pos + 1 == h.size())
		h.append(*is_https ? https_port : http_port);

	std::string r {parts.path.empty() ? std::string {resource_delimiter}
					  : percent_encode(parts.path)};

	if (parts.has_query) {
		r.push_back('?');
		r.append(percent_encode(parts.query));
	}

	*host = std::move(h);
	*resource = std::move(r);
	return true;
}
