#include "WireProto.hpp"

#include <spdlog/spdlog.h>

InitUploadRequest ToInitUploadRequest(const SessionOpenRequest& request)
{
    InitUploadRequest out;

    out.set_filename(request.filename);
    out.set_total_size(request.total_size);
    out.set_chunk_size(request.chunk_size);
    out.set_project_id(request.project_id);

    if (request.content_type)
        out.set_content_type(*request.content_type);
    if (request.checksum)
        out.set_checksum(*request.checksum);

    return out;
}

OpenedSession FromInitUploadResponse(const InitUploadResponse& response)
{
    return OpenedSession{ response.session_id(), response.total_chunks() };
}

ChunkAck FromUploadChunkResponse(const UploadChunkResponse& response)
{
    ChunkAck ack;

    ack.accepted = true;
    ack.progress = response.progress();
    ack.message = response.message();

    return ack;
}

std::tuple<bool, SessionState, UploadError> FromUploadStatusResponse(const UploadStatusResponse& response)
{
    SessionState state;

    if (const auto parsed = ParseSessionStatus(response.status())) {
        state.status = *parsed;
    } else {
        spdlog::warn("unknown session status '{}', treating it as uploading", response.status());
        state.status = SessionStatus::Uploading;
    }

    state.delivered.assign(response.uploaded_chunks().begin(), response.uploaded_chunks().end());
    state.missing.assign(response.missing_chunks().begin(), response.missing_chunks().end());
    state.total_chunks = response.total_chunks();
    state.chunk_size = response.chunk_size();
    state.total_size = response.total_size();

    if (state.chunk_size <= 0)
        return { false, SessionState{}, MakeError(UploadErrorKind::MalformedResponse, "status reports a non-positive chunk size") };

    return { true, std::move(state), OkError() };
}

CompletedFile FromCompleteUploadResponse(const CompleteUploadResponse& response)
{
    CompletedFile file;

    file.url = response.url();
    file.file_id = response.file_id();
    if (response.has_filename())
        file.filename = response.filename();
    if (response.has_size())
        file.size = response.size();
    file.raw = response.DebugString();

    return file;
}

UploadErrorKind KindFromGrpcStatus(grpc::StatusCode code) noexcept
{
    switch (code) {
    case grpc::StatusCode::OK:
        return UploadErrorKind::None;
    case grpc::StatusCode::UNAUTHENTICATED:
        return UploadErrorKind::Unauthorized;
    case grpc::StatusCode::PERMISSION_DENIED:
        return UploadErrorKind::Forbidden;
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::DEADLINE_EXCEEDED:
    case grpc::StatusCode::INTERNAL:
    case grpc::StatusCode::UNKNOWN:
    case grpc::StatusCode::ABORTED:
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
        return UploadErrorKind::TransientNetworkFailure;
    default:
        return UploadErrorKind::RemoteRejected;
    }
}

UploadError MakeGrpcError(const grpc::Status& status)
{
    return MakeError(KindFromGrpcStatus(status.error_code()), status.error_message(),
                     static_cast<int>(status.error_code()));
}
