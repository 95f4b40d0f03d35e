#include "GrpcSessionCoordinator.hpp"

#include <spdlog/spdlog.h>

#include "WireProto.hpp"

void PrepareCallContext(grpc::ClientContext& ctx, const Credentials& credentials, std::chrono::seconds timeout)
{
    if (!credentials.api_key.empty())
        ctx.AddMetadata("x-api-key", credentials.api_key);
    else if (!credentials.token.empty())
        ctx.AddMetadata("authorization", "Bearer " + credentials.token);

    if (!credentials.project_id.empty())
        ctx.AddMetadata("x-project-id", credentials.project_id);

    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

GrpcSessionCoordinator::GrpcSessionCoordinator(std::shared_ptr<grpc::Channel> channel,
                                               Credentials credentials,
                                               std::chrono::seconds timeout)
    : stub_(ChunkedUploadService::NewStub(std::move(channel)))
    , credentials_(std::move(credentials))
    , timeout_(timeout)
{
}

std::tuple<bool, OpenedSession, UploadError>
GrpcSessionCoordinator::OpenSession(const SessionOpenRequest& request)
{
    grpc::ClientContext ctx;
    PrepareCallContext(ctx, credentials_, timeout_);

    InitUploadResponse resp;
    const grpc::Status st = stub_->InitUpload(&ctx, ToInitUploadRequest(request), &resp);
    if (!st.ok())
        return { false, OpenedSession{}, MakeGrpcError(st) };

    if (resp.session_id().empty())
        return { false, OpenedSession{}, MakeError(UploadErrorKind::MalformedResponse, "server returned an empty session id") };

    return { true, FromInitUploadResponse(resp), OkError() };
}

std::tuple<bool, SessionState, UploadError>
GrpcSessionCoordinator::Status(const std::string& session_id)
{
    grpc::ClientContext ctx;
    PrepareCallContext(ctx, credentials_, timeout_);

    UploadStatusRequest req;
    req.set_session_id(session_id);

    UploadStatusResponse resp;
    const grpc::Status st = stub_->GetUploadStatus(&ctx, req, &resp);
    if (!st.ok())
        return { false, SessionState{}, MakeGrpcError(st) };

    return FromUploadStatusResponse(resp);
}

std::tuple<bool, CompletedFile, UploadError>
GrpcSessionCoordinator::Finalize(const std::string& session_id)
{
    grpc::ClientContext ctx;
    PrepareCallContext(ctx, credentials_, timeout_);

    CompleteUploadRequest req;
    req.set_session_id(session_id);

    CompleteUploadResponse resp;
    const grpc::Status st = stub_->CompleteUpload(&ctx, req, &resp);
    if (!st.ok()) {
        auto err = MakeGrpcError(st);
        if (st.error_code() == grpc::StatusCode::ALREADY_EXISTS)
            err.kind = UploadErrorKind::AlreadyCompleted;

        return { false, CompletedFile{}, err };
    }

    return { true, FromCompleteUploadResponse(resp), OkError() };
}

std::optional<UploadError> GrpcSessionCoordinator::Cancel(const std::string& session_id)
{
    grpc::ClientContext ctx;
    PrepareCallContext(ctx, credentials_, timeout_);

    CancelUploadRequest req;
    req.set_session_id(session_id);

    CancelUploadResponse resp;
    const grpc::Status st = stub_->CancelUpload(&ctx, req, &resp);
    if (!st.ok()) {
        if (st.error_code() == grpc::StatusCode::NOT_FOUND) {
            spdlog::info("upload session {} already gone", session_id);
            return std::nullopt;
        }

        auto err = MakeGrpcError(st);
        err.session_id = session_id;
        return err;
    }

    spdlog::info("upload session {} cancelled", session_id);

    return std::nullopt;
}
