#pragma once

#include <tuple>

#include <grpcpp/support/status.h>

#include "chunked_upload.pb.h"

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Message conversions of the gRPC binding.

InitUploadRequest ToInitUploadRequest(const SessionOpenRequest& request);

OpenedSession FromInitUploadResponse(const InitUploadResponse& response);
ChunkAck FromUploadChunkResponse(const UploadChunkResponse& response);
std::tuple<bool, SessionState, UploadError> FromUploadStatusResponse(const UploadStatusResponse& response);
CompletedFile FromCompleteUploadResponse(const CompleteUploadResponse& response);

UploadErrorKind KindFromGrpcStatus(grpc::StatusCode code) noexcept;
UploadError MakeGrpcError(const grpc::Status& status);
