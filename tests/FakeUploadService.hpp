#pragma once

#include "chunked_upload.grpc.pb.h"

#include <map>
#include <mutex>
#include <string>

#include "FakeUploadBackend.hpp"

// gRPC front end of FakeUploadBackend. Also records the identity metadata of
// the last call.
class FakeUploadService final : public ChunkedUploadService::Service
{
public:
	explicit FakeUploadService(FakeUploadBackend& backend);

public:
	std::map<std::string, std::string> LastMetadata() const;

private:
	grpc::Status InitUpload(grpc::ServerContext* context, const InitUploadRequest* request, InitUploadResponse* response) override;
	grpc::Status UploadChunk(grpc::ServerContext* context, const UploadChunkRequest* request, UploadChunkResponse* response) override;
	grpc::Status GetUploadStatus(grpc::ServerContext* context, const UploadStatusRequest* request, UploadStatusResponse* response) override;
	grpc::Status CompleteUpload(grpc::ServerContext* context, const CompleteUploadRequest* request, CompleteUploadResponse* response) override;
	grpc::Status CancelUpload(grpc::ServerContext* context, const CancelUploadRequest* request, CancelUploadResponse* response) override;

private:
	// Records metadata and checks the api key.
	grpc::Status Admit(grpc::ServerContext* context);

private:
	FakeUploadBackend& backend_;

	mutable std::mutex mutex_;
	std::map<std::string, std::string> last_metadata_;
};
