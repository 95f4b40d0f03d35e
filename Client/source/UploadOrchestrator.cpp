#include "UploadOrchestrator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "fmt/core.h"

#include "FileStream.hpp"

namespace {
	UploadError WithSession(UploadError err, const std::string& session_id)
	{
		if (err.session_id.empty())
			err.session_id = session_id;

		return err;
	}

	UploadError SourceNotFound(const std::filesystem::path& source, const FileStream::Error& err)
	{
		return MakeError(UploadErrorKind::SourceNotFound,
				 fmt::format("cannot open {}: {}", source.string(), err.message));
	}

	auto MakeFileReader(FileStream& stream)
	{
		return [&stream](const ChunkRange& range) -> std::tuple<bool, std::string, UploadError> {
			auto [ok, data, err] = stream.ReadAt(range.offset, range.length);
			if (!ok)
				return { false, {}, MakeError(UploadErrorKind::LocalIoFailure,
					fmt::format("failed to read chunk {}: {}", range.index, err.message)) };

			return { true, std::move(data), OkError() };
		};
	}
}

UploadOrchestrator::UploadOrchestrator(SessionCoordinator& coordinator, ChunkTransmitter& transmitter)
	: coordinator_(coordinator)
	, transmitter_(transmitter)
{
}

std::tuple<bool, CompletedFile, UploadError>
UploadOrchestrator::Upload(const std::filesystem::path& source, const std::string& project_id,
			   const Options& options, const ProgressCallback& on_progress)
{
	if (const auto [ok, count, err] = ChunkCount(0, options.chunk_size); !ok)
		return { false, CompletedFile{}, err };

	FileStream stream(source);
	if (auto err = stream.Open())
		return { false, CompletedFile{}, SourceNotFound(source, *err) };

	SessionOpenRequest request;
	request.filename = source.filename().string();
	request.total_size = stream.GetSize();
	request.chunk_size = options.chunk_size;
	request.project_id = project_id;
	request.content_type = options.content_type;

	if (options.verify_checksum) {
		auto [ok, digest, herr] = hasher_.Digest(source);
		if (!ok)
			return { false, CompletedFile{}, MakeError(UploadErrorKind::LocalIoFailure,
				"failed to compute checksum: " + herr.message) };

		spdlog::debug("sha256 of {}: {}", source.string(), digest);
		request.checksum = std::move(digest);
	}

	auto result = RunFresh(request, MakeFileReader(stream), on_progress);

	if (auto err = stream.Close())
		spdlog::warn("failed to close {}: {}", source.string(), err->message);

	return result;
}

std::tuple<bool, CompletedFile, UploadError>
UploadOrchestrator::UploadBytes(std::string_view bytes, const std::string& filename, const std::string& project_id,
				const Options& options, const ProgressCallback& on_progress)
{
	if (const auto [ok, count, err] = ChunkCount(0, options.chunk_size); !ok)
		return { false, CompletedFile{}, err };

	SessionOpenRequest request;
	request.filename = filename;
	request.total_size = bytes.size();
	request.chunk_size = options.chunk_size;
	request.project_id = project_id;
	request.content_type = options.content_type;

	if (options.verify_checksum) {
		auto [ok, digest, herr] = hasher_.Digest(bytes);
		if (!ok)
			return { false, CompletedFile{}, MakeError(UploadErrorKind::LocalIoFailure,
				"failed to compute checksum: " + herr.message) };

		request.checksum = std::move(digest);
	}

	const ChunkReader read = [bytes](const ChunkRange& range) -> std::tuple<bool, std::string, UploadError> {
		return { true, std::string(bytes.substr(static_cast<size_t>(range.offset), static_cast<size_t>(range.length))), OkError() };
	};

	return RunFresh(request, read, on_progress);
}

std::tuple<bool, CompletedFile, UploadError>
UploadOrchestrator::Resume(const std::string& session_id, const std::filesystem::path& source,
			   const ProgressCallback& on_progress)
{
	auto [ok_status, state, serr] = coordinator_.Status(session_id);
	if (!ok_status)
		return { false, CompletedFile{}, WithSession(serr, session_id) };

	if (state.status == SessionStatus::Completed)
		return { false, CompletedFile{}, WithSession(MakeError(UploadErrorKind::AlreadyCompleted,
			"upload already completed"), session_id) };

	if (state.status == SessionStatus::Cancelled)
		return { false, CompletedFile{}, WithSession(MakeError(UploadErrorKind::SessionCancelled,
			"upload was cancelled"), session_id) };

	auto [ok_session, session, verr] = UploadSession::FromState(session_id, state);
	if (!ok_session)
		return { false, CompletedFile{}, WithSession(verr, session_id) };

	if (auto err = session.TransitionTo(SessionStatus::Uploading))
		return { false, CompletedFile{}, *err };

	const std::vector<std::uint64_t> missing = session.GetMissing();
	if (missing.empty()) {
		spdlog::info("upload session {} has every chunk, completing", session_id);
		return Finish(session);
	}

	FileStream stream(source);
	if (auto err = stream.Open())
		return { false, CompletedFile{}, WithSession(SourceNotFound(source, *err), session_id) };

	if (stream.GetSize() != session.GetTotalSize())
		return { false, CompletedFile{}, WithSession(MakeError(UploadErrorKind::SizeMismatch,
			fmt::format("{} has {} bytes but the session expects {}",
				    source.string(), stream.GetSize(), session.GetTotalSize())), session_id) };

	spdlog::info("resuming upload session {}: {} of {} chunks missing",
		     session_id, missing.size(), session.GetTotalChunks());

	if (auto err = TransmitChunks(session, missing, MakeFileReader(stream), on_progress))
		return { false, CompletedFile{}, *err };

	if (auto err = stream.Close())
		spdlog::warn("failed to close {}: {}", source.string(), err->message);

	return Finish(session);
}

std::optional<UploadError> UploadOrchestrator::Cancel(const std::string& session_id)
{
	return coordinator_.Cancel(session_id);
}

std::tuple<bool, CompletedFile, UploadError>
UploadOrchestrator::RunFresh(const SessionOpenRequest& request, const ChunkReader& read,
			     const ProgressCallback& on_progress)
{
	auto [ok_open, opened, oerr] = coordinator_.Open(request);
	if (!ok_open)
		return { false, CompletedFile{}, oerr };

	auto [ok_session, session, cerr] = UploadSession::Create(opened.session_id, request.total_size, request.chunk_size);
	if (!ok_session)
		return { false, CompletedFile{}, WithSession(cerr, opened.session_id) };

	if (session.GetTotalChunks() != opened.total_chunks)
		return { false, CompletedFile{}, WithSession(MakeError(UploadErrorKind::MalformedResponse,
			fmt::format("server expects {} chunks, local layout has {}",
				    opened.total_chunks, session.GetTotalChunks())), opened.session_id) };

	if (auto err = session.TransitionTo(SessionStatus::Uploading))
		return { false, CompletedFile{}, *err };

	if (auto err = TransmitChunks(session, session.GetMissing(), read, on_progress))
		return { false, CompletedFile{}, *err };

	return Finish(session);
}

std::optional<UploadError>
UploadOrchestrator::TransmitChunks(UploadSession& session, const std::vector<std::uint64_t>& indices,
				   const ChunkReader& read, const ProgressCallback& on_progress)
{
	std::vector<std::uint64_t> ordered(indices);
	std::sort(ordered.begin(), ordered.end());
	ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());

	for (const auto index : ordered) {
		auto fail = [&session](UploadError err) {
			(void)session.TransitionTo(SessionStatus::Failed);
			err = WithSession(std::move(err), session.GetSessionId());
			spdlog::error("upload session {} stopped at chunk {}: {}",
				      session.GetSessionId(), session.GetDeliveredCount(), UploadErrorToString(err));
			return err;
		};

		const auto [ok_range, range, rerr] = ChunkRangeAt(index, session.GetTotalSize(), session.GetChunkSize());
		if (!ok_range)
			return fail(rerr);

		auto [ok_read, bytes, ierr] = read(range);
		if (!ok_read)
			return fail(ierr);

		auto [ok_send, ack, terr] = transmitter_.Send(session.GetSessionId(), index, bytes);
		if (!ok_send)
			return fail(terr);

		if (auto err = session.MarkDelivered(index))
			return fail(*err);

		if (on_progress)
			on_progress(session.Progress());
	}

	return std::nullopt;
}

std::tuple<bool, CompletedFile, UploadError> UploadOrchestrator::Finish(UploadSession& session)
{
	if (!session.IsFinalizable())
		return { false, CompletedFile{}, WithSession(MakeError(UploadErrorKind::IncompleteUpload,
			fmt::format("{} of {} chunks still missing",
				    session.GetTotalChunks() - session.GetDeliveredCount(), session.GetTotalChunks())),
			session.GetSessionId()) };

	auto [ok, file, err] = coordinator_.Complete(session.GetSessionId());
	if (!ok)
		return { false, CompletedFile{}, WithSession(err, session.GetSessionId()) };

	if (auto terr = session.TransitionTo(SessionStatus::Completed))
		return { false, CompletedFile{}, *terr };

	return { true, std::move(file), OkError() };
}
