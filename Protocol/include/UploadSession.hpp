#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Client-side mirror of a remote upload session, alive for one upload or
// resume call. The server stays the source of truth; this object enforces
// the local invariants while the loop runs.
class UploadSession
{
public:
	static std::tuple<bool, UploadSession, UploadError>
	Create(std::string session_id, std::uint64_t total_size, std::int64_t chunk_size);

	// Seeds the delivered set from a status query.
	static std::tuple<bool, UploadSession, UploadError>
	FromState(std::string session_id, const SessionState& state);

public:
	const std::string& GetSessionId() const noexcept;
	SessionStatus GetStatus() const noexcept;
	std::uint64_t GetTotalSize() const noexcept;
	std::int64_t GetChunkSize() const noexcept;
	std::uint64_t GetTotalChunks() const noexcept;
	std::uint64_t GetDeliveredCount() const noexcept;

	bool IsDelivered(std::uint64_t index) const noexcept;
	std::vector<std::uint64_t> GetMissing() const;
	bool IsFinalizable() const noexcept;

public:
	std::optional<UploadError> TransitionTo(SessionStatus next);
	std::optional<UploadError> MarkDelivered(std::uint64_t index);

	UploadProgress Progress() const;

public:
	static bool CanTransition(SessionStatus from, SessionStatus to) noexcept;

private:
	UploadSession(std::string session_id, std::uint64_t total_size,
		      std::int64_t chunk_size, std::uint64_t total_chunks);

private:
	std::string session_id_;
	SessionStatus status_;
	std::uint64_t total_size_;
	std::int64_t chunk_size_;
	std::uint64_t total_chunks_;
	std::vector<bool> delivered_;
	std::uint64_t delivered_count_;
};
