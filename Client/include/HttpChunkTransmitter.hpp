#pragma once

#include <string>
#include <string_view>

#include "ChunkTransmitter.hpp"
#include "RequestLayer.hpp"

class HttpChunkTransmitter final : public ChunkTransmitter
{
public:
	explicit HttpChunkTransmitter(RequestLayer& requests, WireEncoding encoding = WireEncoding::Multipart);

public:
	std::tuple<bool, ChunkAck, UploadError>
	Send(const std::string& session_id, std::uint64_t index, std::string_view bytes) override;

	WireEncoding GetEncoding() const noexcept;

public:
	static std::string MakeBoundary();

	// multipart/form-data body with a single file field "chunk" named chunk_<index>.bin.
	static std::string BuildMultipartBody(const std::string& boundary, std::uint64_t index, std::string_view bytes);

private:
	RequestLayer& requests_;
	const WireEncoding encoding_;
};
