#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <tuple>

// Read-only view of a local file. The handle is owned by the object and
// released by Close() or the destructor, whichever comes first.
class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	explicit FileStream(const std::filesystem::path& path);
	virtual ~FileStream();

	FileStream(const FileStream&) = delete;
	FileStream& operator=(const FileStream&) = delete;

public:
	const std::filesystem::path& GetPath() const noexcept;
	bool IsOpen() const noexcept;

	// Size captured at Open() time.
	std::uint64_t GetSize() const noexcept;

public:
	virtual std::optional<Error> Open() noexcept;

	// Sequential read from the current position. A zero length means end of file.
	virtual std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;

	// Reads exactly `length` bytes starting at `offset`.
	virtual std::tuple<bool, std::string, Error> ReadAt(std::uint64_t offset, std::uint64_t length) noexcept;

	virtual std::optional<Error> Close() noexcept;

private:
	Error stream_error(const char* context) const noexcept;

private:
	const std::filesystem::path path_;
	std::ifstream stream_;
	std::uint64_t size_;
};
