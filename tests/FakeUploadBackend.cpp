#include "FakeUploadBackend.hpp"

#include "fmt/core.h"

#include "ChunkLayout.hpp"

FakeUploadBackend::Result FakeUploadBackend::Open(const SessionOpenRequest& request, OpenedSession& out)
{
	std::lock_guard<std::mutex> lock(mutex_);
	++open_calls_;

	if (request.filename.empty())
		return { 400, "filename is required" };

	const auto [ok, count, err] = ChunkCount(request.total_size, request.chunk_size);
	if (!ok)
		return { 400, "chunk_size must be positive" };

	Session session;
	session.request = request;
	session.total_chunks = total_chunks_override_.value_or(count);
	session.status = SessionStatus::Uploading;

	out.session_id = fmt::format("session-{}", next_id_++);
	out.total_chunks = session.total_chunks;

	sessions_.emplace(out.session_id, std::move(session));

	return {};
}

FakeUploadBackend::Result FakeUploadBackend::Accept(const std::string& session_id, std::uint64_t index,
						    const std::string& data, double& progress)
{
	std::lock_guard<std::mutex> lock(mutex_);
	sent_.push_back(index);

	const auto it = sessions_.find(session_id);
	if (it == sessions_.end())
		return { 404, "upload session not found" };

	Session& session = it->second;
	if (session.status == SessionStatus::Completed || session.status == SessionStatus::Cancelled)
		return { 400, "upload session is closed" };

	if (const auto fail = failures_.find(index); fail != failures_.end()) {
		const int status = fail->second;
		failures_.erase(fail);
		return { status, "injected failure" };
	}

	const auto [ok, range, err] = ChunkRangeAt(index, session.request.total_size, session.request.chunk_size);
	if (!ok)
		return { 400, "invalid chunk index" };

	if (data.size() != range.length)
		return { 400, fmt::format("chunk {} must be {} bytes, got {}", index, range.length, data.size()) };

	if (session.chunks.count(index) != 0) {
		progress = 100.0 * session.chunks.size() / session.total_chunks;
		return { duplicate_status_, "chunk already uploaded" };
	}

	session.chunks.emplace(index, data);
	progress = 100.0 * session.chunks.size() / session.total_chunks;

	return { 200, fmt::format("chunk {} uploaded", index) };
}

FakeUploadBackend::Result FakeUploadBackend::Status(const std::string& session_id, SessionState& out) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	const auto it = sessions_.find(session_id);
	if (it == sessions_.end())
		return { 404, "upload session not found" };

	const Session& session = it->second;

	out.status = session.status;
	out.total_chunks = session.total_chunks;
	out.chunk_size = session.request.chunk_size;
	out.total_size = session.request.total_size;
	out.delivered.clear();
	out.missing.clear();

	for (std::uint64_t i = 0; i < session.total_chunks; ++i) {
		if (session.chunks.count(i) != 0)
			out.delivered.push_back(i);
		else
			out.missing.push_back(i);
	}

	return {};
}

FakeUploadBackend::Result FakeUploadBackend::Complete(const std::string& session_id, CompletedFile& out)
{
	std::lock_guard<std::mutex> lock(mutex_);
	++complete_calls_;

	const auto it = sessions_.find(session_id);
	if (it == sessions_.end())
		return { 404, "upload session not found" };

	Session& session = it->second;
	if (session.status == SessionStatus::Completed)
		return { 409, "upload already completed" };

	if (session.chunks.size() != session.total_chunks)
		return { 400, "missing chunks" };

	session.status = SessionStatus::Completed;

	out.url = "https://files.example.test/" + session_id + "/" + session.request.filename;
	out.file_id = "file-" + session_id;
	out.filename = session.request.filename;
	out.size = session.request.total_size;

	return {};
}

FakeUploadBackend::Result FakeUploadBackend::Cancel(const std::string& session_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	const auto it = sessions_.find(session_id);
	if (it == sessions_.end())
		return { 404, "upload session not found" };

	sessions_.erase(it);

	return {};
}

void FakeUploadBackend::FailChunkOnce(std::uint64_t index, int status)
{
	std::lock_guard<std::mutex> lock(mutex_);
	failures_[index] = status;
}

void FakeUploadBackend::SetDuplicateStatus(int status)
{
	std::lock_guard<std::mutex> lock(mutex_);
	duplicate_status_ = status;
}

void FakeUploadBackend::OverrideTotalChunks(std::uint64_t total_chunks)
{
	std::lock_guard<std::mutex> lock(mutex_);
	total_chunks_override_ = total_chunks;
}

void FakeUploadBackend::ForceCompleted(const std::string& session_id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	const auto it = sessions_.find(session_id);
	if (it != sessions_.end())
		it->second.status = SessionStatus::Completed;
}

void FakeUploadBackend::SetRequiredApiKey(std::string key)
{
	std::lock_guard<std::mutex> lock(mutex_);
	required_key_ = std::move(key);
}

bool FakeUploadBackend::Authorized(const std::string& api_key) const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return required_key_.empty() || api_key == required_key_;
}

std::optional<FakeUploadBackend::Session> FakeUploadBackend::GetSession(const std::string& session_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	const auto it = sessions_.find(session_id);
	if (it == sessions_.end())
		return std::nullopt;

	return it->second;
}

std::string FakeUploadBackend::Assembled(const std::string& session_id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::string out;
	const auto it = sessions_.find(session_id);
	if (it == sessions_.end())
		return out;

	for (const auto& [index, data] : it->second.chunks)
		out += data;

	return out;
}

std::vector<std::uint64_t> FakeUploadBackend::SentIndices() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return sent_;
}

int FakeUploadBackend::OpenCalls() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return open_calls_;
}

int FakeUploadBackend::CompleteCalls() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return complete_calls_;
}
