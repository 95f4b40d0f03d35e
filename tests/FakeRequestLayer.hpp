#pragma once

#include <string>
#include <tuple>
#include <vector>

#include "FakeUploadBackend.hpp"
#include "RequestLayer.hpp"

// Serves the JSON upload API from a FakeUploadBackend without a socket.
// Every request that reaches the transport is recorded with its headers.
class FakeRequestLayer final : public RequestLayer
{
public:
	FakeRequestLayer(FakeUploadBackend& backend, Credentials credentials = {});

public:
	const std::vector<HttpRequest>& Requests() const noexcept;
	std::vector<HttpRequest> RequestsTo(const std::string& method, const std::string& fragment) const;

	// The next `count` requests get no response at all.
	void DropNextRequests(int count);

	// The next request whose target ends with `suffix` gets no response.
	void DropRequestTo(std::string suffix);

	// Overrides the answer of every request whose target ends with `suffix`.
	void ForceResponse(std::string suffix, HttpResponse response);

public:
	static std::string HeaderValue(const HttpRequest& request, const std::string& name);

protected:
	std::tuple<bool, HttpResponse, UploadError> Transport(const HttpRequest& request) override;

private:
	HttpResponse Route(const HttpRequest& request);

	HttpResponse HandleInit(const HttpRequest& request);
	HttpResponse HandleChunk(const HttpRequest& request, const std::string& session_id, std::uint64_t index);
	HttpResponse HandleStatus(const std::string& session_id);
	HttpResponse HandleComplete(const std::string& session_id);
	HttpResponse HandleCancel(const std::string& session_id);

private:
	FakeUploadBackend& backend_;
	std::vector<HttpRequest> requests_;
	std::vector<std::pair<std::string, HttpResponse>> forced_;
	std::vector<std::string> drop_targets_;
	int drop_ = 0;
};
