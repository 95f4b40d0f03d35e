#include "FakeUploadService.hpp"

namespace {
	SessionOpenRequest ToOpenRequest(const InitUploadRequest& request)
	{
		SessionOpenRequest out;

		out.filename = request.filename();
		out.total_size = request.total_size();
		out.chunk_size = request.chunk_size();
		out.project_id = request.project_id();

		if (request.has_content_type())
			out.content_type = request.content_type();
		if (request.has_checksum())
			out.checksum = request.checksum();

		return out;
	}

	void FillStatusResponse(const SessionState& state, UploadStatusResponse* response)
	{
		response->set_status(SessionStatusName(state.status));
		for (const auto index : state.delivered)
			response->add_uploaded_chunks(index);
		for (const auto index : state.missing)
			response->add_missing_chunks(index);
		response->set_total_chunks(state.total_chunks);
		response->set_chunk_size(state.chunk_size);
		response->set_total_size(state.total_size);
	}

	grpc::Status ToStatus(const FakeUploadBackend::Result& result)
	{
		if (result.Ok())
			return grpc::Status::OK;

		switch (result.status) {
		case 400: return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, result.message);
		case 401: return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, result.message);
		case 403: return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, result.message);
		case 404: return grpc::Status(grpc::StatusCode::NOT_FOUND, result.message);
		case 409: return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, result.message);
		default:  return grpc::Status(grpc::StatusCode::UNAVAILABLE, result.message);
		}
	}
}

FakeUploadService::FakeUploadService(FakeUploadBackend& backend)
	: backend_(backend)
{
}

std::map<std::string, std::string> FakeUploadService::LastMetadata() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return last_metadata_;
}

grpc::Status FakeUploadService::Admit(grpc::ServerContext* context)
{
	std::map<std::string, std::string> metadata;
	for (const auto& [key, value] : context->client_metadata()) {
		const std::string name(key.data(), key.size());
		if (name == "x-api-key" || name == "authorization" || name == "x-project-id")
			metadata[name] = std::string(value.data(), value.size());
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		last_metadata_ = metadata;
	}

	if (!backend_.Authorized(metadata["x-api-key"]))
		return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "invalid api key");

	return grpc::Status::OK;
}

grpc::Status FakeUploadService::InitUpload(grpc::ServerContext* context, const InitUploadRequest* request, InitUploadResponse* response)
{
	if (auto st = Admit(context); !st.ok())
		return st;

	OpenedSession opened;
	const auto result = backend_.Open(ToOpenRequest(*request), opened);
	if (!result.Ok())
		return ToStatus(result);

	response->set_session_id(opened.session_id);
	response->set_total_chunks(opened.total_chunks);

	return grpc::Status::OK;
}

grpc::Status FakeUploadService::UploadChunk(grpc::ServerContext* context, const UploadChunkRequest* request, UploadChunkResponse* response)
{
	if (auto st = Admit(context); !st.ok())
		return st;

	double progress = 0.0;
	const auto result = backend_.Accept(request->session_id(), request->chunk_index(), request->data(), progress);
	if (!result.Ok())
		return ToStatus(result);

	response->set_message(result.message);
	response->set_progress(progress);

	return grpc::Status::OK;
}

grpc::Status FakeUploadService::GetUploadStatus(grpc::ServerContext* context, const UploadStatusRequest* request, UploadStatusResponse* response)
{
	if (auto st = Admit(context); !st.ok())
		return st;

	SessionState state;
	const auto result = backend_.Status(request->session_id(), state);
	if (!result.Ok())
		return ToStatus(result);

	FillStatusResponse(state, response);

	return grpc::Status::OK;
}

grpc::Status FakeUploadService::CompleteUpload(grpc::ServerContext* context, const CompleteUploadRequest* request, CompleteUploadResponse* response)
{
	if (auto st = Admit(context); !st.ok())
		return st;

	CompletedFile file;
	const auto result = backend_.Complete(request->session_id(), file);
	if (!result.Ok())
		return ToStatus(result);

	response->set_url(file.url);
	response->set_file_id(file.file_id);
	if (file.filename)
		response->set_filename(*file.filename);
	if (file.size)
		response->set_size(*file.size);

	return grpc::Status::OK;
}

grpc::Status FakeUploadService::CancelUpload(grpc::ServerContext* context, const CancelUploadRequest* request, CancelUploadResponse* response)
{
	if (auto st = Admit(context); !st.ok())
		return st;

	return ToStatus(backend_.Cancel(request->session_id()));
}
