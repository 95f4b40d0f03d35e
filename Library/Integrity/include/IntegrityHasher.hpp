#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>

#include "Hasher.hpp"

// End-to-end content digest of an upload source, rendered as lowercase hex.
// Files are consumed in kBlockSize blocks, so memory use does not depend on
// the file size.
class IntegrityHasher
{
public:
	using Error = Hasher::Error;

	static constexpr std::size_t kBlockSize = 64 * 1024;

public:
	explicit IntegrityHasher(Hasher::Type type = Hasher::Type::SHA256);

public:
	std::tuple<bool, std::string, Error> Digest(std::string_view data) const;
	std::tuple<bool, std::string, Error> Digest(const std::filesystem::path& path) const;

private:
	Hasher::Type type_;
};
