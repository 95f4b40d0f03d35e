#pragma once

#include <chrono>
#include <string>
#include <tuple>

#include "RequestLayer.hpp"

struct BaseUrl {
	bool tls = false;
	std::string host;
	std::string port;
	// Prefix prepended to every request target, without a trailing slash.
	std::string path;
};

std::tuple<bool, BaseUrl, UploadError> ParseBaseUrl(const std::string& url);

// HTTP/1.1 over Boost.Beast. One connection per request, so concurrent calls
// for different sessions share nothing.
class BeastRequestLayer final : public RequestLayer
{
public:
	BeastRequestLayer(BaseUrl base, Credentials credentials, std::chrono::seconds timeout);

protected:
	std::tuple<bool, HttpResponse, UploadError> Transport(const HttpRequest& request) override;

private:
	const BaseUrl base_;
	const std::chrono::seconds timeout_;
};
