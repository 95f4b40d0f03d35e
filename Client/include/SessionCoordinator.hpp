#pragma once

#include <optional>
#include <string>
#include <tuple>

#include "UploadError.hpp"
#include "UploadTypes.hpp"

// Remote session lifecycle: open, query, finalize, discard.
class SessionCoordinator
{
public:
	virtual ~SessionCoordinator() = default;

public:
	// Rejects a non-positive chunk size before any network call.
	std::tuple<bool, OpenedSession, UploadError> Open(const SessionOpenRequest& request);

	virtual std::tuple<bool, SessionState, UploadError> Status(const std::string& session_id) = 0;

	// Finalizes only a session the server reports as fully delivered:
	// AlreadyCompleted for a finalized session, IncompleteUpload while chunks
	// are still missing.
	std::tuple<bool, CompletedFile, UploadError> Complete(const std::string& session_id);

	// Idempotent. Discarding an unknown session succeeds.
	virtual std::optional<UploadError> Cancel(const std::string& session_id) = 0;

protected:
	virtual std::tuple<bool, OpenedSession, UploadError> OpenSession(const SessionOpenRequest& request) = 0;
	virtual std::tuple<bool, CompletedFile, UploadError> Finalize(const std::string& session_id) = 0;
};
