#include "BeastRequestLayer.hpp"

#include <cctype>
#include <regex>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include "fmt/core.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {
	UploadError NoResponse(const std::string& what, const beast::error_code& ec)
	{
		return MakeError(UploadErrorKind::TransientNetworkFailure, fmt::format("{}: {}", what, ec.message()));
	}

	std::tuple<bool, http::verb, UploadError> ResolveVerb(const std::string& method)
	{
		const http::verb verb = http::string_to_verb(method);
		if (verb == http::verb::unknown)
			return { false, verb, MakeError(UploadErrorKind::InvalidConfiguration, "unknown HTTP method " + method) };

		return { true, verb, OkError() };
	}

	// Runs one asynchronous operation to completion so the stream's expiry
	// applies to it. Synchronous Beast calls ignore tcp_stream timeouts.
	template <class Start>
	beast::error_code Await(net::io_context& ioc, Start&& start)
	{
		beast::error_code result = net::error::would_block;

		start([&result](beast::error_code ec, auto&&...) { result = ec; });

		ioc.restart();
		ioc.run();

		return result;
	}

	// Writes the request and reads the whole response on an already connected stream.
	template <class Stream>
	std::tuple<bool, HttpResponse, UploadError> RoundTrip(net::io_context& ioc, Stream& stream,
							      const http::request<http::string_body>& req)
	{
		beast::error_code ec = Await(ioc, [&](auto handler) {
			http::async_write(stream, req, std::move(handler));
		});
		if (ec)
			return { false, HttpResponse{}, NoResponse("write", ec) };

		beast::flat_buffer buffer;
		http::response_parser<http::string_body> parser;
		parser.body_limit(64 * 1024 * 1024);

		ec = Await(ioc, [&](auto handler) {
			http::async_read(stream, buffer, parser, std::move(handler));
		});
		if (ec)
			return { false, HttpResponse{}, NoResponse("read", ec) };

		auto res = parser.release();

		return { true, HttpResponse{ static_cast<int>(res.result_int()), std::move(res.body()) }, OkError() };
	}
}

std::tuple<bool, BaseUrl, UploadError> ParseBaseUrl(const std::string& url)
{
	static const std::regex kUrl(R"(^(https?)://([^/:?#]+)(?::(\d+))?(/[^?#]*)?$)", std::regex::icase);

	std::smatch match;
	if (!std::regex_match(url, match, kUrl))
		return { false, BaseUrl{}, MakeError(UploadErrorKind::InvalidConfiguration, "invalid base url: " + url) };

	BaseUrl base;

	std::string scheme = match.str(1);
	for (auto& c : scheme)
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

	base.tls = scheme == "https";
	base.host = match.str(2);
	base.port = match[3].matched ? match.str(3) : (base.tls ? "443" : "80");
	base.path = match[4].matched ? match.str(4) : "";

	while (!base.path.empty() && base.path.back() == '/')
		base.path.pop_back();

	return { true, std::move(base), OkError() };
}

BeastRequestLayer::BeastRequestLayer(BaseUrl base, Credentials credentials, std::chrono::seconds timeout)
	: RequestLayer(std::move(credentials))
	, base_(std::move(base))
	, timeout_(timeout)
{
}

std::tuple<bool, HttpResponse, UploadError> BeastRequestLayer::Transport(const HttpRequest& request)
{
	const auto [ok_verb, verb, verr] = ResolveVerb(request.method);
	if (!ok_verb)
		return { false, HttpResponse{}, verr };

	http::request<http::string_body> req{ verb, base_.path + request.target, 11 };
	req.set(http::field::host, base_.host);
	req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
	if (!request.content_type.empty())
		req.set(http::field::content_type, request.content_type);
	for (const auto& [name, value] : request.headers)
		req.set(name, value);
	req.body() = request.body;
	req.prepare_payload();

	try {
		net::io_context ioc;
		beast::error_code ec;

		tcp::resolver resolver(ioc);
		const auto results = resolver.resolve(base_.host, base_.port, ec);
		if (ec)
			return { false, HttpResponse{}, NoResponse("resolve " + base_.host, ec) };

		if (!base_.tls) {
			beast::tcp_stream stream(ioc);
			stream.expires_after(timeout_);

			ec = Await(ioc, [&](auto handler) {
				stream.async_connect(results, std::move(handler));
			});
			if (ec)
				return { false, HttpResponse{}, NoResponse("connect " + base_.host, ec) };

			auto result = RoundTrip(ioc, stream, req);

			stream.socket().shutdown(tcp::socket::shutdown_both, ec);

			return result;
		}

		ssl::context ctx(ssl::context::tlsv12_client);
		ctx.set_default_verify_paths();
		ctx.set_verify_mode(ssl::verify_peer);

		beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
		if (!SSL_set_tlsext_host_name(stream.native_handle(), base_.host.c_str()))
			return { false, HttpResponse{}, MakeError(UploadErrorKind::TransientNetworkFailure, "failed to set TLS server name") };
		stream.set_verify_callback(ssl::host_name_verification(base_.host));

		beast::get_lowest_layer(stream).expires_after(timeout_);
		ec = Await(ioc, [&](auto handler) {
			beast::get_lowest_layer(stream).async_connect(results, std::move(handler));
		});
		if (ec)
			return { false, HttpResponse{}, NoResponse("connect " + base_.host, ec) };

		ec = Await(ioc, [&](auto handler) {
			stream.async_handshake(ssl::stream_base::client, std::move(handler));
		});
		if (ec)
			return { false, HttpResponse{}, NoResponse("TLS handshake", ec) };

		auto result = RoundTrip(ioc, stream, req);

		// Peers routinely drop the connection without close_notify.
		(void)Await(ioc, [&](auto handler) {
			stream.async_shutdown(std::move(handler));
		});

		return result;
	}
	catch (const std::exception& e) {
		return { false, HttpResponse{}, MakeError(UploadErrorKind::TransientNetworkFailure, e.what()) };
	}
}
