#include "GrpcChunkTransmitter.hpp"

#include <spdlog/spdlog.h>

#include "GrpcSessionCoordinator.hpp"
#include "WireProto.hpp"

GrpcChunkTransmitter::GrpcChunkTransmitter(std::shared_ptr<grpc::Channel> channel,
                                           Credentials credentials,
                                           std::chrono::seconds timeout)
    : stub_(ChunkedUploadService::NewStub(std::move(channel)))
    , credentials_(std::move(credentials))
    , timeout_(timeout)
{
}

std::tuple<bool, ChunkAck, UploadError>
GrpcChunkTransmitter::Send(const std::string& session_id, std::uint64_t index, std::string_view bytes)
{
    grpc::ClientContext ctx;
    PrepareCallContext(ctx, credentials_, timeout_);

    UploadChunkRequest req;
    req.set_session_id(session_id);
    req.set_chunk_index(index);
    req.set_data(bytes.data(), bytes.size());

    UploadChunkResponse resp;
    const grpc::Status st = stub_->UploadChunk(&ctx, req, &resp);
    if (!st.ok()) {
        if (st.error_code() == grpc::StatusCode::ALREADY_EXISTS) {
            spdlog::debug("chunk {} of session {} was already delivered", index, session_id);

            ChunkAck ack;
            ack.accepted = true;
            ack.message = st.error_message();
            return { true, std::move(ack), OkError() };
        }

        auto err = MakeGrpcError(st);
        err.session_id = session_id;
        return { false, ChunkAck{}, err };
    }

    spdlog::debug("chunk {} of session {} sent ({} bytes, grpc): {}", index, session_id, bytes.size(), resp.message());

    return { true, FromUploadChunkResponse(resp), OkError() };
}
