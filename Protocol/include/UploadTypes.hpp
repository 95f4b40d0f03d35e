#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// 5 MiB keeps a single chunk request well inside common proxy timeouts.
constexpr std::int64_t kDefaultChunkSize = 5 * 1024 * 1024;

enum class SessionStatus {
	Pending = 0,
	Uploading,
	Completed,
	Failed,
	Cancelled
};

const char* SessionStatusName(SessionStatus status) noexcept;
std::optional<SessionStatus> ParseSessionStatus(const std::string& name) noexcept;

// How chunk bytes travel over HTTP. All three are acknowledged identically.
enum class WireEncoding {
	Multipart = 0,
	RawPut,
	RawPost
};

const char* WireEncodingName(WireEncoding encoding) noexcept;
std::optional<WireEncoding> ParseWireEncoding(const std::string& name) noexcept;

struct SessionOpenRequest {
	std::string filename;
	std::uint64_t total_size = 0;
	std::int64_t chunk_size = kDefaultChunkSize;
	std::string project_id;
	std::optional<std::string> content_type;
	std::optional<std::string> checksum;
};

struct OpenedSession {
	std::string session_id;
	std::uint64_t total_chunks = 0;
};

struct ChunkAck {
	bool accepted = false;
	double progress = 0.0;
	std::string message;
};

struct SessionState {
	SessionStatus status = SessionStatus::Pending;
	std::vector<std::uint64_t> delivered;
	std::vector<std::uint64_t> missing;
	std::uint64_t total_chunks = 0;
	std::int64_t chunk_size = 0;
	std::uint64_t total_size = 0;
};

struct CompletedFile {
	std::string url;
	std::string file_id;
	std::optional<std::string> filename;
	std::optional<std::uint64_t> size;

	// Response body as received, for fields this client does not model.
	std::string raw;
};

std::string CompletedFileToString(const CompletedFile& file);

struct UploadProgress {
	std::string session_id;
	std::uint64_t delivered = 0;
	std::uint64_t total_chunks = 0;
	double fraction = 0.0;
	SessionStatus status = SessionStatus::Uploading;

	bool IsComplete() const noexcept { return delivered == total_chunks; }
	std::string ToString() const;
};

using ProgressCallback = std::function<void(const UploadProgress&)>;
