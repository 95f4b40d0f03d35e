#pragma once

#include "chunked_upload.grpc.pb.h"

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "ClientConfig.hpp"
#include "SessionCoordinator.hpp"

// Identity metadata and deadline for one call of the gRPC binding.
void PrepareCallContext(grpc::ClientContext& ctx, const Credentials& credentials, std::chrono::seconds timeout);

class GrpcSessionCoordinator final : public SessionCoordinator
{
public:
	GrpcSessionCoordinator(std::shared_ptr<grpc::Channel> channel, Credentials credentials, std::chrono::seconds timeout);

public:
	std::tuple<bool, SessionState, UploadError> Status(const std::string& session_id) override;
	std::optional<UploadError> Cancel(const std::string& session_id) override;

protected:
	std::tuple<bool, OpenedSession, UploadError> OpenSession(const SessionOpenRequest& request) override;
	std::tuple<bool, CompletedFile, UploadError> Finalize(const std::string& session_id) override;

private:
	std::unique_ptr<ChunkedUploadService::Stub> stub_;
	const Credentials credentials_;
	const std::chrono::seconds timeout_;
};
