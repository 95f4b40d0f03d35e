#include <gtest/gtest.h>

#include "FakeRequestLayer.hpp"
#include "HttpChunkTransmitter.hpp"

class HttpChunkTransmitterTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		SessionOpenRequest request;
		request.filename = "data.bin";
		request.total_size = 1000;
		request.chunk_size = 300;

		OpenedSession opened;
		ASSERT_TRUE(backend_.Open(request, opened).Ok());
		session_id_ = opened.session_id;
	}

	FakeUploadBackend backend_;
	FakeRequestLayer requests_{ backend_ };
	std::string session_id_;
	const std::string chunk_ = std::string(300, 'x');
};

TEST_F(HttpChunkTransmitterTest, MultipartBodyLayout)
{
	const std::string body = HttpChunkTransmitter::BuildMultipartBody("BOUNDARY", 3, "abc");

	EXPECT_EQ(body,
		"--BOUNDARY\r\n"
		"Content-Disposition: form-data; name=\"chunk\"; filename=\"chunk_3.bin\"\r\n"
		"Content-Type: application/octet-stream\r\n"
		"\r\n"
		"abc\r\n"
		"--BOUNDARY--\r\n");
}

TEST_F(HttpChunkTransmitterTest, BoundariesDiffer)
{
	const std::string a = HttpChunkTransmitter::MakeBoundary();
	const std::string b = HttpChunkTransmitter::MakeBoundary();

	EXPECT_NE(a, b);
	EXPECT_EQ(a.rfind("----chunked-upload-", 0), 0u);
}

TEST_F(HttpChunkTransmitterTest, MultipartSendIsAccepted)
{
	HttpChunkTransmitter transmitter(requests_);

	const auto [ok, ack, err] = transmitter.Send(session_id_, 1, chunk_);
	ASSERT_TRUE(ok) << UploadErrorToString(err);
	EXPECT_TRUE(ack.accepted);
	EXPECT_DOUBLE_EQ(ack.progress, 25.0);

	const auto sent = requests_.RequestsTo("POST", "/chunk/1");
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0].target, "/api/upload/" + session_id_ + "/chunk/1");
	EXPECT_EQ(sent[0].content_type.rfind("multipart/form-data; boundary=", 0), 0u);

	const auto stored = backend_.GetSession(session_id_);
	ASSERT_TRUE(stored);
	EXPECT_EQ(stored->chunks.at(1), chunk_);
}

TEST_F(HttpChunkTransmitterTest, RawEncodingsUseTheirMethod)
{
	HttpChunkTransmitter put(requests_, WireEncoding::RawPut);
	HttpChunkTransmitter post(requests_, WireEncoding::RawPost);

	const auto [ok_put, ack_put, err_put] = put.Send(session_id_, 0, chunk_);
	ASSERT_TRUE(ok_put) << UploadErrorToString(err_put);

	const auto [ok_post, ack_post, err_post] = post.Send(session_id_, 3, std::string(100, 'z'));
	ASSERT_TRUE(ok_post) << UploadErrorToString(err_post);

	const auto puts = requests_.RequestsTo("PUT", "/chunk/0");
	ASSERT_EQ(puts.size(), 1u);
	EXPECT_EQ(puts[0].content_type, "application/octet-stream");
	EXPECT_EQ(puts[0].body, chunk_);

	const auto posts = requests_.RequestsTo("POST", "/chunk/3");
	ASSERT_EQ(posts.size(), 1u);
	EXPECT_EQ(posts[0].body, std::string(100, 'z'));
}

TEST_F(HttpChunkTransmitterTest, DuplicateChunkConflictIsAccepted)
{
	backend_.SetDuplicateStatus(409);
	HttpChunkTransmitter transmitter(requests_);

	ASSERT_TRUE(std::get<0>(transmitter.Send(session_id_, 2, chunk_)));

	const auto [ok, ack, err] = transmitter.Send(session_id_, 2, chunk_);
	EXPECT_TRUE(ok) << UploadErrorToString(err);
	EXPECT_TRUE(ack.accepted);
}

TEST_F(HttpChunkTransmitterTest, ServerErrorIsTransientAndTagged)
{
	backend_.FailChunkOnce(0, 503);
	HttpChunkTransmitter transmitter(requests_);

	const auto [ok, ack, err] = transmitter.Send(session_id_, 0, chunk_);
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, UploadErrorKind::TransientNetworkFailure);
	EXPECT_EQ(err.status, 503);
	EXPECT_EQ(err.session_id, session_id_);
}

TEST_F(HttpChunkTransmitterTest, WrongChunkLengthIsRejected)
{
	HttpChunkTransmitter transmitter(requests_);

	const auto [ok, ack, err] = transmitter.Send(session_id_, 0, "short");
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, UploadErrorKind::RemoteRejected);
	EXPECT_EQ(err.status, 400);
}
