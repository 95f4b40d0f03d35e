#include "IntegrityHasher.hpp"

#include <vector>

#include "HashingFileStream.hpp"

IntegrityHasher::IntegrityHasher(Hasher::Type type)
	: type_(type)
{
}

std::tuple<bool, std::string, IntegrityHasher::Error>
IntegrityHasher::Digest(std::string_view data) const
{
	Hasher hasher(type_);

	if (auto err = hasher.Initialize())
		return { false, {}, *err };

	if (auto err = hasher.Update(data))
		return { false, {}, *err };

	auto [ok, digest, err] = hasher.Finalize();
	if (!ok)
		return { false, {}, err };

	return { true, Hasher::ToHex(digest), Error{0, ""} };
}

std::tuple<bool, std::string, IntegrityHasher::Error>
IntegrityHasher::Digest(const std::filesystem::path& path) const
{
	HashingFileStream stream(path, type_);
	if (auto err = stream.Open())
		return { false, {}, Error{ err->code, "failed to open " + path.string() + ": " + err->message } };

	std::vector<char> buffer(kBlockSize);

	while (true) {
		const auto [ok, len, err] = stream.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		if (!ok) {
			(void)stream.Close();
			return { false, {}, Error{ err.code, "failed to read " + path.string() + ": " + err.message } };
		}

		if (len <= 0)
			break;
	}

	if (auto err = stream.Close())
		return { false, {}, Error{ err->code, "failed to close " + path.string() + ": " + err->message } };

	return { true, *stream.GetHashHex(), Error{0, ""} };
}
