#pragma once

#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "ClientConfig.hpp"
#include "UploadError.hpp"

struct HttpRequest {
	std::string method;
	std::string target;
	std::vector<std::pair<std::string, std::string>> headers;
	std::string content_type;
	std::string body;
};

struct HttpResponse {
	int status = 0;
	std::string body;
};

// Authenticated request layer shared by the HTTP binding. Subclasses move
// bytes; this class attaches identity headers and turns every non-2xx answer
// into an UploadError carrying the status and the server's message.
class RequestLayer
{
public:
	explicit RequestLayer(Credentials credentials);
	virtual ~RequestLayer() = default;

	RequestLayer(const RequestLayer&) = delete;
	RequestLayer& operator=(const RequestLayer&) = delete;

public:
	std::tuple<bool, HttpResponse, UploadError> Execute(HttpRequest request);

	const Credentials& GetCredentials() const noexcept;

public:
	// Percent-encodes everything outside the RFC 3986 unreserved set.
	static std::string EscapePathSegment(std::string_view segment);

protected:
	// Fails only when no HTTP response was received at all.
	virtual std::tuple<bool, HttpResponse, UploadError> Transport(const HttpRequest& request) = 0;

private:
	const Credentials credentials_;
};
