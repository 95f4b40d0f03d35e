#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "FileStream.hpp"
#include "Hasher.hpp"

// FileStream that feeds every byte read through a Hasher. The digest is
// available after Close().
class HashingFileStream final
{
public:
    using Error = FileStream::Error;

public:
    HashingFileStream(const std::filesystem::path& path, Hasher::Type type);

public:
    const std::filesystem::path& GetPath() const noexcept;
    std::uint64_t GetSize() const noexcept;

public:
    std::optional<Error> Open() noexcept;
    std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;
    std::optional<Error> Close() noexcept;

public:
    std::optional<std::vector<uint8_t>> GetHash() const noexcept;
    std::optional<std::string> GetHashHex() const;

private:
    static Error ConvertHasherError(const Hasher::Error& e);

private:
    FileStream file_;
    Hasher hasher_;
    std::optional<std::vector<uint8_t>> digest_;
};
