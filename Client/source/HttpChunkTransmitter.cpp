#include "HttpChunkTransmitter.hpp"

#include <random>

#include <spdlog/spdlog.h>

#include "fmt/core.h"

#include "WireJson.hpp"

namespace {
	constexpr const char* kOctetStream = "application/octet-stream";
}

HttpChunkTransmitter::HttpChunkTransmitter(RequestLayer& requests, WireEncoding encoding)
    : requests_(requests)
    , encoding_(encoding)
{
}

WireEncoding HttpChunkTransmitter::GetEncoding() const noexcept
{
    return encoding_;
}

std::tuple<bool, ChunkAck, UploadError>
HttpChunkTransmitter::Send(const std::string& session_id, std::uint64_t index, std::string_view bytes)
{
    HttpRequest req;
    req.target = fmt::format("/api/upload/{}/chunk/{}", RequestLayer::EscapePathSegment(session_id), index);

    switch (encoding_) {
    case WireEncoding::Multipart: {
        const std::string boundary = MakeBoundary();
        req.method = "POST";
        req.content_type = "multipart/form-data; boundary=" + boundary;
        req.body = BuildMultipartBody(boundary, index, bytes);
        break;
    }
    case WireEncoding::RawPut:
        req.method = "PUT";
        req.content_type = kOctetStream;
        req.body.assign(bytes.data(), bytes.size());
        break;
    case WireEncoding::RawPost:
        req.method = "POST";
        req.content_type = kOctetStream;
        req.body.assign(bytes.data(), bytes.size());
        break;
    }

    auto [ok, res, err] = requests_.Execute(std::move(req));
    if (!ok) {
        if (res.status == 409) {
            spdlog::debug("chunk {} of session {} was already delivered", index, session_id);

            ChunkAck ack;
            ack.accepted = true;
            ack.message = ErrorMessageFromBody(res.body);
            return { true, std::move(ack), OkError() };
        }

        err.session_id = session_id;
        return { false, ChunkAck{}, err };
    }

    auto [ok_ack, ack, aerr] = DecodeChunkAck(res.body);
    if (!ok_ack) {
        aerr.session_id = session_id;
        return { false, ChunkAck{}, aerr };
    }

    spdlog::debug("chunk {} of session {} sent ({} bytes, {}): {}",
                  index, session_id, bytes.size(), WireEncodingName(encoding_), ack.message);

    return { true, std::move(ack), OkError() };
}

std::string HttpChunkTransmitter::MakeBoundary()
{
    static const char* kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

    thread_local std::mt19937_64 engine{ std::random_device{}() };
    std::uniform_int_distribution<int> pick(0, 35);

    std::string boundary = "----chunked-upload-";
    for (int i = 0; i < 32; ++i)
        boundary.push_back(kAlphabet[pick(engine)]);

    return boundary;
}

std::string HttpChunkTransmitter::BuildMultipartBody(const std::string& boundary, std::uint64_t index, std::string_view bytes)
{
    std::string body;
    body.reserve(bytes.size() + boundary.size() * 2 + 192);

    body += "--" + boundary + "\r\n";
    body += fmt::format("Content-Disposition: form-data; name=\"chunk\"; filename=\"chunk_{}.bin\"\r\n", index);
    body += "Content-Type: application/octet-stream\r\n";
    body += "\r\n";
    body.append(bytes.data(), bytes.size());
    body += "\r\n--" + boundary + "--\r\n";

    return body;
}
