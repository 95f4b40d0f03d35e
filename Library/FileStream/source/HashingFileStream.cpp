#include "HashingFileStream.hpp"

#include <sstream>

HashingFileStream::HashingFileStream(const std::filesystem::path& path, Hasher::Type type)
    : file_(path)
    , hasher_(type)
{
}

const std::filesystem::path& HashingFileStream::GetPath() const noexcept
{
    return file_.GetPath();
}

std::uint64_t HashingFileStream::GetSize() const noexcept
{
    return file_.GetSize();
}

std::optional<HashingFileStream::Error> HashingFileStream::Open() noexcept
{
    digest_.reset();

    if (auto err = file_.Open())
        return err;

    if (auto herr = hasher_.Initialize()) {
        (void)file_.Close();
        return ConvertHasherError(*herr);
    }

    return std::nullopt;
}

std::tuple<bool, std::streamsize, HashingFileStream::Error>
HashingFileStream::Read(char* data, std::streamsize size) noexcept
{
    auto [ok, n, err] = file_.Read(data, size);
    if (!ok)
        return { false, n, err };

    if (n <= 0)
        return { true, n, Error{} };

    if (auto herr = hasher_.Update(data, static_cast<size_t>(n)))
        return { false, n, ConvertHasherError(*herr) };

    return { true, n, Error{} };
}

std::optional<HashingFileStream::Error> HashingFileStream::Close() noexcept
{
    auto [ok, digest, herr] = hasher_.Finalize();
    if (!ok) {
        (void)file_.Close();
        return ConvertHasherError(herr);
    }

    digest_ = std::move(digest);
    if (auto err = file_.Close())
        return err;

    return std::nullopt;
}

std::optional<std::vector<uint8_t>> HashingFileStream::GetHash() const noexcept
{
    return digest_;
}

std::optional<std::string> HashingFileStream::GetHashHex() const
{
    if (!digest_.has_value())
        return std::nullopt;

    return Hasher::ToHex(*digest_);
}

HashingFileStream::Error HashingFileStream::ConvertHasherError(const Hasher::Error& e)
{
    std::ostringstream oss;
    oss << "hasher: (" << e.code << ") " << e.message;
    return Error{ e.code, oss.str() };
}
