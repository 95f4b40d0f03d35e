#pragma once

#include <string>
#include <string_view>

enum class UploadErrorKind {
	None = 0,
	InvalidConfiguration,
	SourceNotFound,
	SizeMismatch,
	AlreadyCompleted,
	IncompleteUpload,
	SessionCancelled,
	RemoteRejected,
	TransientNetworkFailure,
	Unauthorized,
	Forbidden,
	MalformedResponse,
	LocalIoFailure
};

struct UploadError {
	UploadErrorKind kind = UploadErrorKind::None;

	// HTTP status, gRPC status code, or 0 for failures detected locally.
	int status = 0;
	std::string message;

	// Set once a session exists, so the caller can resume instead of restarting.
	std::string session_id;

	bool Ok() const noexcept { return kind == UploadErrorKind::None; }
};

UploadError OkError();
UploadError MakeError(UploadErrorKind kind, std::string message, int status = 0);

// 401/403 keep their own kinds, 5xx and status 0 (no response) are transient,
// any other non-2xx is a rejection.
UploadErrorKind KindFromHttpStatus(int status) noexcept;
UploadError MakeHttpError(int status, std::string message);

const char* UploadErrorKindName(UploadErrorKind kind) noexcept;
std::string UploadErrorToString(const UploadError& error);
