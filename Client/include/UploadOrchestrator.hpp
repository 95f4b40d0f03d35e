#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "ChunkLayout.hpp"
#include "ChunkTransmitter.hpp"
#include "IntegrityHasher.hpp"
#include "SessionCoordinator.hpp"
#include "UploadError.hpp"
#include "UploadSession.hpp"
#include "UploadTypes.hpp"

// Drives fresh uploads and resumes. Chunks go out one at a time in ascending
// index order; the progress callback runs on the caller's thread after each
// acknowledged chunk. A failed upload is never cancelled here: the returned
// error carries the session id to resume with.
//
// A session must not be driven by two calls at once. Distinct sessions may
// run concurrently on separate orchestrators.
class UploadOrchestrator
{
public:
	struct Options {
		std::int64_t chunk_size = kDefaultChunkSize;
		bool verify_checksum = true;
		std::optional<std::string> content_type;
	};

public:
	UploadOrchestrator(SessionCoordinator& coordinator, ChunkTransmitter& transmitter);

public:
	std::tuple<bool, CompletedFile, UploadError>
	Upload(const std::filesystem::path& source, const std::string& project_id,
	       const Options& options, const ProgressCallback& on_progress = nullptr);

	std::tuple<bool, CompletedFile, UploadError>
	UploadBytes(std::string_view bytes, const std::string& filename, const std::string& project_id,
		    const Options& options, const ProgressCallback& on_progress = nullptr);

	std::tuple<bool, CompletedFile, UploadError>
	Resume(const std::string& session_id, const std::filesystem::path& source,
	       const ProgressCallback& on_progress = nullptr);

	std::optional<UploadError> Cancel(const std::string& session_id);

private:
	using ChunkReader = std::function<std::tuple<bool, std::string, UploadError>(const ChunkRange&)>;

	std::tuple<bool, CompletedFile, UploadError>
	RunFresh(const SessionOpenRequest& request, const ChunkReader& read, const ProgressCallback& on_progress);

	std::optional<UploadError>
	TransmitChunks(UploadSession& session, const std::vector<std::uint64_t>& indices,
		       const ChunkReader& read, const ProgressCallback& on_progress);

	std::tuple<bool, CompletedFile, UploadError> Finish(UploadSession& session);

private:
	SessionCoordinator& coordinator_;
	ChunkTransmitter& transmitter_;
	IntegrityHasher hasher_;
};
