#include <gtest/gtest.h>

#include "BeastRequestLayer.hpp"
#include "FakeRequestLayer.hpp"

namespace {
	HttpRequest StatusRequest()
	{
		HttpRequest request;
		request.method = "GET";
		request.target = "/api/upload/none/status";
		return request;
	}
}

TEST(RequestLayerTest, ApiKeyWinsOverToken)
{
	FakeUploadBackend backend;
	FakeRequestLayer requests(backend, Credentials{ "key-1", "jwt-1", "proj-1" });

	(void)requests.Execute(StatusRequest());

	ASSERT_EQ(requests.Requests().size(), 1u);
	const HttpRequest& sent = requests.Requests().front();
	EXPECT_EQ(FakeRequestLayer::HeaderValue(sent, "X-API-Key"), "key-1");
	EXPECT_EQ(FakeRequestLayer::HeaderValue(sent, "Authorization"), "");
	EXPECT_EQ(FakeRequestLayer::HeaderValue(sent, "X-Project-ID"), "proj-1");
}

TEST(RequestLayerTest, TokenBecomesBearerAuthorization)
{
	FakeUploadBackend backend;
	FakeRequestLayer requests(backend, Credentials{ "", "jwt-1", "" });

	(void)requests.Execute(StatusRequest());

	const HttpRequest& sent = requests.Requests().front();
	EXPECT_EQ(FakeRequestLayer::HeaderValue(sent, "Authorization"), "Bearer jwt-1");
	EXPECT_EQ(FakeRequestLayer::HeaderValue(sent, "X-API-Key"), "");
	EXPECT_EQ(FakeRequestLayer::HeaderValue(sent, "X-Project-ID"), "");
}

TEST(RequestLayerTest, NonSuccessStatusMapsToErrorKind)
{
	const std::vector<std::pair<int, UploadErrorKind>> cases = {
		{ 400, UploadErrorKind::RemoteRejected },
		{ 401, UploadErrorKind::Unauthorized },
		{ 403, UploadErrorKind::Forbidden },
		{ 404, UploadErrorKind::RemoteRejected },
		{ 413, UploadErrorKind::RemoteRejected },
		{ 500, UploadErrorKind::TransientNetworkFailure },
		{ 503, UploadErrorKind::TransientNetworkFailure },
	};

	for (const auto& [status, kind] : cases) {
		FakeUploadBackend backend;
		FakeRequestLayer requests(backend);
		requests.ForceResponse("/status", HttpResponse{ status, R"({"error":"nope"})" });

		const auto [ok, response, err] = requests.Execute(StatusRequest());
		EXPECT_FALSE(ok);
		EXPECT_EQ(err.kind, kind) << status;
		EXPECT_EQ(err.status, status);
		EXPECT_EQ(err.message, "nope");
		EXPECT_EQ(response.status, status);
	}
}

TEST(RequestLayerTest, MissingResponseIsTransient)
{
	FakeUploadBackend backend;
	FakeRequestLayer requests(backend);
	requests.DropNextRequests(1);

	const auto [ok, response, err] = requests.Execute(StatusRequest());
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, UploadErrorKind::TransientNetworkFailure);
	EXPECT_EQ(response.status, 0);
}

TEST(RequestLayerTest, RejectedApiKeyIsUnauthorized)
{
	FakeUploadBackend backend;
	backend.SetRequiredApiKey("right");
	FakeRequestLayer requests(backend, Credentials{ "wrong", "", "" });

	const auto [ok, response, err] = requests.Execute(StatusRequest());
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, UploadErrorKind::Unauthorized);
	EXPECT_EQ(err.message, "invalid api key");
}

TEST(RequestLayerTest, EscapePathSegment)
{
	EXPECT_EQ(RequestLayer::EscapePathSegment("abc-123_~."), "abc-123_~.");
	EXPECT_EQ(RequestLayer::EscapePathSegment("a/b c"), "a%2Fb%20c");
	EXPECT_EQ(RequestLayer::EscapePathSegment("\xff?"), "%FF%3F");
}

TEST(BeastRequestLayerTest, ParseBaseUrl)
{
	const auto [ok, base, err] = ParseBaseUrl("https://api.example.test/v1/");
	ASSERT_TRUE(ok) << err.message;
	EXPECT_TRUE(base.tls);
	EXPECT_EQ(base.host, "api.example.test");
	EXPECT_EQ(base.port, "443");
	EXPECT_EQ(base.path, "/v1");

	const auto [ok_plain, plain, err_plain] = ParseBaseUrl("http://localhost:8080");
	ASSERT_TRUE(ok_plain) << err_plain.message;
	EXPECT_FALSE(plain.tls);
	EXPECT_EQ(plain.host, "localhost");
	EXPECT_EQ(plain.port, "8080");
	EXPECT_EQ(plain.path, "");

	for (const char* bad : { "", "ftp://host", "localhost:8080", "http://", "http://host:port" }) {
		const auto [ok_bad, b, err_bad] = ParseBaseUrl(bad);
		EXPECT_FALSE(ok_bad) << bad;
		EXPECT_EQ(err_bad.kind, UploadErrorKind::InvalidConfiguration);
	}
}

TEST(BeastRequestLayerTest, RefusedConnectionIsTransient)
{
	const auto [ok_url, base, uerr] = ParseBaseUrl("http://127.0.0.1:1");
	ASSERT_TRUE(ok_url) << uerr.message;

	BeastRequestLayer requests(base, Credentials{}, std::chrono::seconds(2));

	const auto [ok, response, err] = requests.Execute(StatusRequest());
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, UploadErrorKind::TransientNetworkFailure);
}
