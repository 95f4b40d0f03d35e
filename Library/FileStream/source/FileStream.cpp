#include "FileStream.hpp"

#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>
#include <system_error>

FileStream::FileStream(const std::filesystem::path& path)
    : path_(path)
    , size_(0)
{
}

FileStream::~FileStream()
{
    if (stream_.is_open())
        stream_.close();
}

const std::filesystem::path& FileStream::GetPath() const noexcept
{
    return path_;
}

bool FileStream::IsOpen() const noexcept
{
    return stream_.is_open();
}

std::uint64_t FileStream::GetSize() const noexcept
{
    return size_;
}

std::optional<FileStream::Error> FileStream::Open() noexcept
{
    if (stream_.is_open())
        stream_.close();

    stream_.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec))
        return Error{ ENOENT, "open: not a regular file, path=" + path_.string() };

    const auto size = std::filesystem::file_size(path_, ec);
    if (ec)
        return Error{ ec.value(), "open: " + ec.message() + ", path=" + path_.string() };

    errno = 0;
    stream_.open(path_, std::ios::binary | std::ios::in);
    if (!stream_.is_open() || stream_.fail() || stream_.bad())
        return stream_error("open");

    size_ = static_cast<std::uint64_t>(size);

    return std::nullopt;
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::Read(char* data, std::streamsize size) noexcept
{
    if (!stream_.is_open())
        return { false, 0, Error{ -1, "read: stream is not open"} };

    if (size < 0)
        return { false, 0, Error{ -1, "read: invalid size"} };

    if (size == 0)
        return { true, 0, Error{} };

    if (!data)
        return { false, 0, Error{ -1, "read: null buffer with non-zero size"} };

    stream_.read(data, size);
    const std::streamsize n = stream_.gcount();

    if (stream_.eof()) {
        stream_.clear(stream_.rdstate() & ~(std::ios::eofbit | std::ios::failbit));
        return { true, n, Error{} };
    }

    if (stream_.bad() || stream_.fail())
        return { false, n, stream_error("read") };

    return { true, n, Error{} };
}

std::tuple<bool, std::string, FileStream::Error> FileStream::ReadAt(std::uint64_t offset, std::uint64_t length) noexcept
{
    if (!stream_.is_open())
        return { false, {}, Error{ -1, "read: stream is not open"} };

    if (offset > size_ || length > size_ - offset)
        return { false, {}, Error{ -1, "read: range exceeds file size, path=" + path_.string() } };

    if (length > static_cast<std::uint64_t>(std::numeric_limits<std::streamsize>::max()))
        return { false, {}, Error{ -1, "read: range too large"} };

    std::string data;
    try {
        data.resize(static_cast<size_t>(length));
    }
    catch (const std::bad_alloc&) {
        return { false, {}, Error{ ENOMEM, "read: cannot allocate chunk buffer"} };
    }

    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (stream_.fail())
        return { false, {}, stream_error("seek") };

    size_t filled = 0;
    while (filled < data.size()) {
        const auto [ok, n, err] = Read(data.data() + filled, static_cast<std::streamsize>(data.size() - filled));
        if (!ok)
            return { false, {}, err };

        if (n <= 0)
            return { false, {}, Error{ -1, "read: unexpected end of file, path=" + path_.string() } };

        filled += static_cast<size_t>(n);
    }

    return { true, std::move(data), Error{} };
}

std::optional<FileStream::Error> FileStream::Close() noexcept
{
    if (!stream_.is_open())
        return std::nullopt;

    stream_.close();

    if (stream_.fail() || stream_.bad())
        return stream_error("close");

    return std::nullopt;
}

FileStream::Error FileStream::stream_error(const char* context) const noexcept
{
    const auto state = stream_.rdstate();

    std::ostringstream oss;
    oss << (context ? context : "stream")
        << ": iostate=0x" << std::hex << static_cast<unsigned int>(state);

    if ((state & std::ios::badbit) != 0)  oss << " (badbit)";
    if ((state & std::ios::failbit) != 0) oss << " (failbit)";
    if ((state & std::ios::eofbit) != 0)  oss << " (eofbit)";

    if (errno != 0)
        oss << ", errno=" << std::dec << errno << " (" << std::strerror(errno) << ")";

    oss << ", path=" << path_.string();

    return Error{ static_cast<int>(state), oss.str() };
}
