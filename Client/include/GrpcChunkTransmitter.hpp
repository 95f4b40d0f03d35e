#pragma once

#include "chunked_upload.grpc.pb.h"

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "ChunkTransmitter.hpp"
#include "ClientConfig.hpp"

class GrpcChunkTransmitter final : public ChunkTransmitter
{
public:
	GrpcChunkTransmitter(std::shared_ptr<grpc::Channel> channel, Credentials credentials, std::chrono::seconds timeout);

public:
	std::tuple<bool, ChunkAck, UploadError>
	Send(const std::string& session_id, std::uint64_t index, std::string_view bytes) override;

private:
	std::unique_ptr<ChunkedUploadService::Stub> stub_;
	const Credentials credentials_;
	const std::chrono::seconds timeout_;
};
